#pragma once

#include "hd5-core.hpp"

namespace pn::HD5 {

// Creates (truncates) a file and writes labelled datasets into it
struct Writer
{
  Writer(std::string const &fname);
  ~Writer();
  Writer(Writer const &) = delete;

  template <typename Scalar, size_t N>
  void writeTensor(std::string const &label, Shape<N> const &shape, Scalar const *data, DNames<N> const &dims);
  void writeStrings(std::string const &label, std::vector<std::string> const &strings);

private:
  Handle handle_;
};

} // namespace pn::HD5
