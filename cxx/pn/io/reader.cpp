#include "reader.hpp"

#include "../log/log.hpp"

#include <filesystem>
#include <hdf5.h>

namespace pn::HD5 {

Reader::Reader(std::string const &fname)
{
  if (!std::filesystem::exists(fname)) { throw Log::Failure("HD5", "File does not exist: {}", fname); }
  Init();
  handle_ = H5Fopen(fname.c_str(), H5F_ACC_RDONLY, H5P_DEFAULT);
  if (handle_ < 0) { throw Log::Failure("HD5", "Could not open {}: {}", fname, LastError()); }
  Log::Print("HD5", "Reading {}", fname);
}

Reader::~Reader() { H5Fclose(handle_); }

auto Reader::exists(std::string const &label) const -> bool { return Exists(handle_, label); }

auto Reader::dimensions(std::string const &label) const -> std::vector<Index> { return Dataset(handle_, label).shape(); }

auto Reader::readMatrix(std::string const &label) const -> CxMatrix
{
  Dataset const ds(handle_, label);
  auto const    dims = ds.shape();
  if (dims.size() != 2) { throw Log::Failure("HD5", "{} has {} dimensions, a matrix needs 2", label, dims.size()); }
  CxMatrix A(dims[0], dims[1]);
  Check(H5Dread(ds.id, Type<Cx>(), H5S_ALL, H5S_ALL, H5P_DEFAULT, A.data()), fmt::format("reading {}", label));
  Log::Debug("HD5", "Read {} [{},{}]", label, A.rows(), A.cols());
  return A;
}

auto Reader::readMeasurements(std::string const &label) const -> ReVector
{
  Dataset const ds(handle_, label);
  auto const    dims = ds.shape();
  if (dims.size() != 1) { throw Log::Failure("HD5", "{} has {} dimensions, measurements need 1", label, dims.size()); }
  ReVector b(dims[0]);
  Check(H5Dread(ds.id, Type<float>(), H5S_ALL, H5S_ALL, H5P_DEFAULT, b.data()), fmt::format("reading {}", label));
  Log::Debug("HD5", "Read {} [{}]", label, b.rows());
  return b;
}

auto Reader::readStrings(std::string const &label) const -> std::vector<std::string>
{
  Dataset const       ds(handle_, label);
  auto const          dims = ds.shape();
  std::vector<char *> raw(dims.empty() ? 0 : dims[0]);
  hid_t const         t = StringType();
  hid_t const         space = H5Dget_space(ds.id);
  herr_t              status = H5Dread(ds.id, t, H5S_ALL, H5S_ALL, H5P_DEFAULT, raw.data());
  std::vector<std::string> strings;
  if (status >= 0) {
    strings.assign(raw.begin(), raw.end());
    status = H5Dvlen_reclaim(t, space, H5P_DEFAULT, raw.data());
  }
  H5Sclose(space);
  H5Tclose(t);
  Check(status, fmt::format("reading strings {}", label));
  return strings;
}

} // namespace pn::HD5
