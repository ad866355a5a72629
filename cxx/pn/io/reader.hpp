#pragma once

#include "hd5-core.hpp"

namespace pn::HD5 {

/*
 * Reads the inputs of the null initializer. Real datasets are promoted to complex when a complex matrix is requested.
 */
struct Reader
{
  Reader(std::string const &fname);
  ~Reader();
  Reader(Reader const &) = delete;

  auto exists(std::string const &label) const -> bool;
  auto dimensions(std::string const &label) const -> std::vector<Index>;

  auto readMatrix(std::string const &label = Keys::Matrix) const -> CxMatrix;
  auto readMeasurements(std::string const &label = Keys::Measurements) const -> ReVector;
  auto readStrings(std::string const &label = Keys::Log) const -> std::vector<std::string>;

private:
  Handle handle_;
};

} // namespace pn::HD5
