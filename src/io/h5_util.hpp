#pragma once

#include <hdf5.h>

#include <algorithm>
#include <complex>
#include <string>
#include <utility>
#include <vector>

#include "bpcal/config.h"
#include "bpcal/exceptions.hpp"

namespace bpcal {
namespace h5 {

class IdWrapper {
public:
  IdWrapper(hid_t identifier, herr_t (*close)(hid_t)) noexcept : id_(identifier), close_(close) {}

  IdWrapper() noexcept = default;

  IdWrapper(const IdWrapper&) = delete;
  IdWrapper(IdWrapper&& s) noexcept { *this = std::move(s); }

  auto operator=(const IdWrapper&) -> IdWrapper& = delete;

  auto operator=(IdWrapper&& s) noexcept -> IdWrapper& {
    if (id_ != H5I_INVALID_HID) {
      close_(id_);
    }
    id_ = s.id_;
    close_ = s.close_;
    s.id_ = H5I_INVALID_HID;
    s.close_ = nullptr;
    return *this;
  }

  ~IdWrapper() noexcept {
    if (id_ != H5I_INVALID_HID) {
      close_(id_);
    }
  }

  inline auto id() const noexcept -> const hid_t& { return id_; }

private:
  hid_t id_ = H5I_INVALID_HID;
  herr_t (*close_)(hid_t) = nullptr;
};

class Group {
public:
  Group(hid_t identifier) noexcept : wrapper_(identifier, H5Gclose) {}

  Group() = default;

  inline auto id() const noexcept -> hid_t { return wrapper_.id(); }

private:
  IdWrapper wrapper_;
};

class DataSet {
public:
  DataSet(hid_t identifier) noexcept : wrapper_(identifier, H5Dclose) {}

  DataSet() = default;

  inline auto id() const noexcept -> hid_t { return wrapper_.id(); }

private:
  IdWrapper wrapper_;
};

class DataSpace {
public:
  DataSpace(hid_t identifier) noexcept : wrapper_(identifier, H5Sclose) {}

  DataSpace() = default;

  inline auto id() const noexcept -> hid_t { return wrapper_.id(); }

private:
  IdWrapper wrapper_;
};

class DataType {
public:
  DataType(hid_t identifier) noexcept : wrapper_(identifier, H5Tclose) {}

  DataType() = default;

  inline auto id() const noexcept -> hid_t { return wrapper_.id(); }

private:
  IdWrapper wrapper_;
};

class Property {
public:
  Property(hid_t identifier) noexcept : wrapper_(identifier, H5Pclose) {}

  Property() = default;

  inline auto id() const noexcept -> hid_t { return wrapper_.id(); }

private:
  IdWrapper wrapper_;
};

class File {
public:
  File(hid_t identifier) noexcept : wrapper_(identifier, H5Fclose) {}

  File() = default;

  inline auto id() const noexcept -> hid_t { return wrapper_.id(); }

private:
  IdWrapper wrapper_;
};

inline auto check(hid_t h) -> hid_t {
  if (h < 0) {
    throw HDF5Error();
  }
  return h;
}

inline auto check(herr_t h) -> herr_t {
  if (h < 0) {
    throw HDF5Error();
  }
  return h;
}

// Memory and file type of std::complex<double>, stored as compound {r, i} for numpy
// compatibility
inline auto create_complex_type() -> DataType {
  DataType type = check(H5Tcreate(H5T_COMPOUND, sizeof(std::complex<double>)));
  check(H5Tinsert(type.id(), "r", 0, H5T_NATIVE_DOUBLE));
  check(H5Tinsert(type.id(), "i", sizeof(double), H5T_NATIVE_DOUBLE));
  return type;
}

inline auto create_group(hid_t hid, const std::string& name) -> hid_t {
  Property lcpl = check(H5Pcreate(H5P_LINK_CREATE));
  check(H5Pset_create_intermediate_group(lcpl.id(), 1));
  return check(H5Gcreate(hid, name.data(), lcpl.id(), H5P_DEFAULT, H5P_DEFAULT));
}

inline auto create_fixed_space(hid_t fd, const std::string& name, hid_t type,
                               const std::vector<hsize_t>& dims) -> hid_t {
  DataSpace dataspace =
      check(H5Screate_simple(static_cast<int>(dims.size()), dims.data(), dims.data()));

  auto arr = check(
      H5Dcreate(fd, name.data(), type, dataspace.id(), H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT));

  return arr;
}

inline auto dataset_dims(hid_t dset) -> std::vector<hsize_t> {
  DataSpace dspace = check(H5Dget_space(dset));
  const auto rank = H5Sget_simple_extent_ndims(dspace.id());
  if (rank < 0) throw HDF5Error();
  std::vector<hsize_t> dims(rank);
  if (rank) check(H5Sget_simple_extent_dims(dspace.id(), dims.data(), nullptr));
  return dims;
}

// Fixed length, null padded strings. The width is the length of the longest string.
inline auto create_string_dataset(hid_t fd, const std::string& name,
                                  const std::vector<std::string>& values) -> void {
  std::size_t width = 1;
  for (const auto& v : values) width = std::max(width, v.size());

  DataType type = check(H5Tcopy(H5T_C_S1));
  check(H5Tset_size(type.id(), width));
  check(H5Tset_strpad(type.id(), H5T_STR_NULLPAD));

  DataSet dset = create_fixed_space(fd, name, type.id(), {values.size()});

  if (values.empty()) return;

  std::vector<char> buffer(width * values.size(), '\0');
  for (std::size_t i = 0; i < values.size(); ++i) {
    std::copy(values[i].begin(), values[i].end(), buffer.begin() + i * width);
  }

  check(H5Dwrite(dset.id(), type.id(), H5S_ALL, H5S_ALL, H5P_DEFAULT, buffer.data()));
}

inline auto read_string_dataset(hid_t fd, const std::string& name) -> std::vector<std::string> {
  DataSet dset = check(H5Dopen(fd, name.data(), H5P_DEFAULT));

  const auto dims = dataset_dims(dset.id());
  if (dims.size() != 1) {
    throw FileError("Invalid rank of string dataset " + name + ". Expected one dimension.");
  }

  DataType fileType = check(H5Dget_type(dset.id()));
  if (H5Tget_class(fileType.id()) != H5T_STRING || H5Tis_variable_str(fileType.id()) > 0) {
    throw FileError("Dataset " + name + " does not hold fixed length strings.");
  }
  const auto width = H5Tget_size(fileType.id());
  if (width == 0) throw HDF5Error();

  DataType memType = check(H5Tcopy(H5T_C_S1));
  check(H5Tset_size(memType.id(), width));
  check(H5Tset_strpad(memType.id(), H5T_STR_NULLPAD));

  std::vector<std::string> values;
  if (dims[0] == 0) return values;

  std::vector<char> buffer(width * dims[0], '\0');
  check(H5Dread(dset.id(), memType.id(), H5S_ALL, H5S_ALL, H5P_DEFAULT, buffer.data()));

  values.reserve(dims[0]);
  for (hsize_t i = 0; i < dims[0]; ++i) {
    const char* begin = buffer.data() + i * width;
    values.emplace_back(begin, std::find(begin, begin + width, '\0'));
  }
  return values;
}

inline auto link_names(hid_t group) -> std::vector<std::string> {
  std::vector<std::string> names;
  auto gather = [](hid_t, const char* name, const H5L_info_t*, void* opData) -> herr_t {
    static_cast<std::vector<std::string>*>(opData)->emplace_back(name);
    return 0;
  };
  check(H5Literate(group, H5_INDEX_NAME, H5_ITER_INC, nullptr, gather, &names));
  return names;
}

}  // namespace h5
}  // namespace bpcal
