#include "hd5-core.hpp"

#include "../log/log.hpp"

#include <algorithm>
#include <hdf5.h>

namespace pn::HD5 {

namespace {
hid_t complexType = -1;

// Promotes a real dataset into complex storage. The buffer is converted in place, so walk backwards.
herr_t RealToComplex(hid_t, hid_t, H5T_cdata_t *cdata, size_t n, size_t, size_t, void *buf, void *, hid_t)
{
  if (cdata->command != H5T_CONV_CONV) { return 0; }
  auto const *re = static_cast<float const *>(buf);
  auto       *cx = static_cast<Cx *>(buf);
  for (size_t ii = n; ii > 0; ii--) {
    cx[ii - 1] = Cx(re[ii - 1], 0.f);
  }
  return 0;
}
} // namespace

void Init()
{
  if (complexType >= 0) { return; }
  Check(H5open(), "initialising library");
  Check(H5Eset_auto2(H5E_DEFAULT, nullptr, nullptr), "silencing error stack");
  hid_t const t = H5Tcreate(H5T_COMPOUND, sizeof(Cx));
  Check(H5Tinsert(t, "r", 0, H5T_NATIVE_FLOAT), "inserting r");
  Check(H5Tinsert(t, "i", sizeof(float), H5T_NATIVE_FLOAT), "inserting i");
  Check(H5Tregister(H5T_PERS_HARD, "float->complex", H5T_NATIVE_FLOAT, t, RealToComplex), "registering conversion");
  complexType = t;
  Log::Debug("HD5", "Initialised HDF5");
}

template <> auto Type<float>() -> Handle { return H5T_NATIVE_FLOAT; }
template <> auto Type<Cx>() -> Handle
{
  Init();
  return complexType;
}

auto StringType() -> Handle
{
  hid_t const t = H5Tcopy(H5T_C_S1);
  Check(H5Tset_size(t, H5T_VARIABLE), "setting string size");
  Check(H5Tset_cset(t, H5T_CSET_UTF8), "setting string encoding");
  return t;
}

auto Exists(Handle const parent, std::string const &name) -> bool { return H5Lexists(parent, name.c_str(), H5P_DEFAULT) > 0; }

auto LastError() -> std::string
{
  std::string msg;
  H5Ewalk2(
    H5E_DEFAULT, H5E_WALK_DOWNWARD,
    [](unsigned n, H5E_error2_t const *err, void *data) -> herr_t {
      if (n == 0) { *static_cast<std::string *>(data) = err->desc; }
      return 0;
    },
    &msg);
  return msg;
}

void Check(int const status, std::string const &what)
{
  if (status < 0) { throw Log::Failure("HD5", "Failed {}: {}", what, LastError()); }
}

Dataset::Dataset(Handle const file, std::string const &n)
  : id{H5Dopen2(file, n.c_str(), H5P_DEFAULT)}
  , name{n}
{
  if (id < 0) { throw Log::Failure("HD5", "Could not open dataset {}", name); }
}

Dataset::~Dataset() { H5Dclose(id); }

auto Dataset::shape() const -> std::vector<Index>
{
  hid_t const          space = H5Dget_space(id);
  int const            N = H5Sget_simple_extent_ndims(space);
  std::vector<hsize_t> dims(std::max(N, 0));
  H5Sget_simple_extent_dims(space, dims.data(), nullptr);
  H5Sclose(space);
  if (N < 0) { throw Log::Failure("HD5", "Could not query the shape of {}", name); }
  return std::vector<Index>(dims.rbegin(), dims.rend());
}

} // namespace pn::HD5
