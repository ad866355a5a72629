#pragma once

#include "../types.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace pn::HD5 {

using Handle = int64_t;

template <size_t N> using Shape = std::array<Index, N>;
template <size_t N> using DNames = std::array<std::string, N>;

namespace Keys {
std::string const Data = "data";
std::string const Log = "log";
std::string const Matrix = "matrix";
std::string const Measurements = "measurements";
} // namespace Keys

// Labels in Eigen order, they are reversed on disk along with the dimensions
namespace Dims {
DNames<1> const Signal = {"sample"};
DNames<1> const Measurements = {"measurement"};
DNames<2> const Matrix = {"measurement", "sample"};
} // namespace Dims

void Init();
template <typename T> auto Type() -> Handle; // float, or Cx as the compound {r, i}
auto StringType() -> Handle;                 // Variable length UTF-8, caller closes
auto Exists(Handle const parent, std::string const &name) -> bool;
auto LastError() -> std::string;
void Check(int const status, std::string const &what);

// Open dataset, closed on destruction
struct Dataset
{
  Dataset(Handle const file, std::string const &name);
  ~Dataset();
  Dataset(Dataset const &) = delete;
  auto operator=(Dataset const &) -> Dataset & = delete;

  auto shape() const -> std::vector<Index>; // Eigen order

  Handle      id;
  std::string name;
};

} // namespace pn::HD5
