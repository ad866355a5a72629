#include "writer.hpp"

#include "../log/log.hpp"

#include <fmt/ranges.h>
#include <hdf5.h>
#include <hdf5_hl.h>

namespace pn::HD5 {

Writer::Writer(std::string const &fname)
{
  Init();
  handle_ = H5Fcreate(fname.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT);
  if (handle_ < 0) { throw Log::Failure("HD5", "Could not create {}: {}", fname, LastError()); }
  Log::Print("HD5", "Writing {}", fname);
}

Writer::~Writer() { H5Fclose(handle_); }

template <typename Scalar, size_t N>
void Writer::writeTensor(std::string const &label, Shape<N> const &shape, Scalar const *data, DNames<N> const &dims)
{
  hsize_t disk[N];
  for (size_t ii = 0; ii < N; ii++) {
    if (shape[ii] < 1) { throw Log::Failure("HD5", "{} has an empty dimension, shape {}", label, shape); }
    disk[ii] = shape[N - 1 - ii];
  }
  hid_t const space = H5Screate_simple(N, disk, nullptr);
  hid_t const dset = H5Dcreate2(handle_, label.c_str(), Type<Scalar>(), space, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
  H5Sclose(space);
  if (dset < 0) { throw Log::Failure("HD5", "Could not create {}: {}", label, LastError()); }
  herr_t status = H5Dwrite(dset, Type<Scalar>(), H5S_ALL, H5S_ALL, H5P_DEFAULT, data);
  for (size_t ii = 0; ii < N && status >= 0; ii++) {
    status = H5DSset_label(dset, ii, dims[N - 1 - ii].c_str());
  }
  H5Dclose(dset);
  Check(status, fmt::format("writing {}", label));
  Log::Debug("HD5", "Wrote {} {}", label, shape);
}

template void Writer::writeTensor<float, 1>(std::string const &, Shape<1> const &, float const *, DNames<1> const &);
template void Writer::writeTensor<float, 2>(std::string const &, Shape<2> const &, float const *, DNames<2> const &);
template void Writer::writeTensor<Cx, 1>(std::string const &, Shape<1> const &, Cx const *, DNames<1> const &);
template void Writer::writeTensor<Cx, 2>(std::string const &, Shape<2> const &, Cx const *, DNames<2> const &);

void Writer::writeStrings(std::string const &label, std::vector<std::string> const &strings)
{
  std::vector<char const *> ptrs;
  for (auto const &s : strings) {
    ptrs.push_back(s.c_str());
  }
  hsize_t const dim[1] = {strings.size()};
  hid_t const   space = H5Screate_simple(1, dim, nullptr);
  hid_t const   t = StringType();
  hid_t const   dset = H5Dcreate2(handle_, label.c_str(), t, space, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
  herr_t        status = dset < 0 ? -1 : 0;
  if (dset >= 0) {
    status = H5Dwrite(dset, t, H5S_ALL, H5S_ALL, H5P_DEFAULT, ptrs.data());
    H5Dclose(dset);
  }
  H5Tclose(t);
  H5Sclose(space);
  Check(status, fmt::format("writing strings {}", label));
}

} // namespace pn::HD5
