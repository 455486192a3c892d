#pragma once

#include <cstddef>
#include <filesystem>
#include <hdf5.h>
#include <stdexcept>
#include <string>

namespace fixcap::h5 {

// Error checking helpers
namespace detail {

inline hid_t check_id(hid_t id, const char *func) {
    if (id < 0) {
        throw std::runtime_error(std::string(func) + " failed");
    }
    return id;
}

inline herr_t check_err(herr_t err, const char *func) {
    if (err < 0) {
        throw std::runtime_error(std::string(func) + " failed");
    }
    return err;
}

} // namespace detail

// RAII wrapper for owned HDF5 type IDs
class TypeId {
  public:
    explicit TypeId(hid_t id) : id_(id) {}

    ~TypeId() {
        if (id_ >= 0)
            H5Tclose(id_);
    }

    TypeId(const TypeId &) = delete;
    TypeId &operator=(const TypeId &) = delete;

    TypeId(TypeId &&other) noexcept : id_(other.id_) { other.id_ = -1; }

    TypeId &operator=(TypeId &&other) noexcept {
        if (this != &other) {
            if (id_ >= 0)
                H5Tclose(id_);
            id_ = other.id_;
            other.id_ = -1;
        }
        return *this;
    }

    hid_t get() const { return id_; }

    hid_t release() {
        hid_t temp = id_;
        id_ = -1;
        return temp;
    }

  private:
    hid_t id_;
};

// Helper trait to get HDF5 type from C++ type.
// Specializations return owned type IDs; callers must H5Tclose() the
// result.
template <typename T> struct hdf5_type_traits;

#define H5_NATIVE_TYPE_TRAIT(CppType, H5Type)                                  \
    template <> struct hdf5_type_traits<CppType> {                             \
        static hid_t get() {                                                   \
            return detail::check_id(H5Tcopy(H5Type), "H5Tcopy");               \
        }                                                                      \
    };

H5_NATIVE_TYPE_TRAIT(int, H5T_NATIVE_INT)
H5_NATIVE_TYPE_TRAIT(double, H5T_NATIVE_DOUBLE)

#undef H5_NATIVE_TYPE_TRAIT

// Fixed-length, null-padded strings
template <std::size_t N> struct hdf5_type_traits<char[N]> {
    static hid_t get() {
        hid_t str_type = detail::check_id(H5Tcopy(H5T_C_S1), "H5Tcopy");
        detail::check_err(H5Tset_size(str_type, N), "H5Tset_size");
        detail::check_err(H5Tset_strpad(str_type, H5T_STR_NULLPAD),
                          "H5Tset_strpad");
        return str_type;
    }
};

// Insert a member into a compound type, managing the member type lifetime
template <typename MemberType>
void add_member(hid_t compound, const char *name, std::size_t offset) {
    hid_t member_type = hdf5_type_traits<MemberType>::get();
    herr_t err = H5Tinsert(compound, name, offset, member_type);
    H5Tclose(member_type);
    detail::check_err(err, "H5Tinsert");
}

class File {
  public:
    enum class Mode { TRUNCATE, APPEND };

    explicit File(const std::string &filename, Mode mode = Mode::TRUNCATE) {
        if (mode == Mode::APPEND && std::filesystem::exists(filename) &&
            H5Fis_hdf5(filename.c_str()) > 0) {
            file_ = detail::check_id(
                H5Fopen(filename.c_str(), H5F_ACC_RDWR, H5P_DEFAULT),
                "H5Fopen");
        } else {
            file_ = detail::check_id(H5Fcreate(filename.c_str(), H5F_ACC_TRUNC,
                                               H5P_DEFAULT, H5P_DEFAULT),
                                     "H5Fcreate");
        }
    }

    ~File() {
        if (file_ >= 0)
            H5Fclose(file_);
    }

    File(const File &) = delete;
    File &operator=(const File &) = delete;

    void flush() {
        detail::check_err(H5Fflush(file_, H5F_SCOPE_GLOBAL), "H5Fflush");
    }

    hid_t get() const { return file_; }

  private:
    hid_t file_;
};

// One-dimensional, chunked, unlimited dataset of T. Every append is written
// and flushed before it returns; there is no row buffer.
template <typename T> class Dataset {
  public:
    Dataset(hid_t parent_id, const std::string &name, hsize_t chunk_rows = 64)
        : rows_(0) {
        TypeId type(hdf5_type_traits<T>::get());

        hsize_t max_dims[1] = {H5S_UNLIMITED};
        hsize_t initial_dims[1] = {0};
        hid_t space = detail::check_id(
            H5Screate_simple(1, initial_dims, max_dims), "H5Screate_simple");

        hid_t props = H5Pcreate(H5P_DATASET_CREATE);
        hsize_t chunks[1] = {chunk_rows};
        herr_t chunked = H5Pset_chunk(props, 1, chunks);

        dataset_ = chunked < 0 ? chunked
                               : H5Dcreate2(parent_id, name.c_str(), type.get(),
                                            space, H5P_DEFAULT, props,
                                            H5P_DEFAULT);
        H5Pclose(props);
        H5Sclose(space);
        detail::check_id(dataset_, "H5Dcreate2");
        type_id_ = type.release();
    }

    ~Dataset() {
        H5Dclose(dataset_);
        H5Tclose(type_id_);
    }

    Dataset(const Dataset &) = delete;
    Dataset &operator=(const Dataset &) = delete;

    // Extends the dataset by one row and flushes it to the file
    void append(const T &value) {
        hsize_t new_size[1] = {rows_ + 1};
        detail::check_err(H5Dset_extent(dataset_, new_size), "H5Dset_extent");

        hid_t space = detail::check_id(H5Dget_space(dataset_), "H5Dget_space");
        hsize_t offset[1] = {rows_};
        hsize_t count[1] = {1};
        herr_t err = H5Sselect_hyperslab(space, H5S_SELECT_SET, offset,
                                         nullptr, count, nullptr);
        hid_t memspace = H5Screate_simple(1, count, nullptr);
        if (err >= 0) {
            err = H5Dwrite(dataset_, type_id_, memspace, space, H5P_DEFAULT,
                           &value);
        }
        H5Sclose(memspace);
        H5Sclose(space);
        detail::check_err(err, "H5Dwrite");
        detail::check_err(H5Dflush(dataset_), "H5Dflush");

        ++rows_;
    }

    hsize_t size() const { return rows_; }

    template <typename A> void set_attr(const char *name, const A &value) {
        TypeId attr_type(hdf5_type_traits<A>::get());
        write_attr_(name, attr_type.get(), &value);
    }

    void set_attr(const char *name, const std::string &value) {
        TypeId attr_type(detail::check_id(H5Tcopy(H5T_C_S1), "H5Tcopy"));
        detail::check_err(H5Tset_size(attr_type.get(), value.size() + 1),
                          "H5Tset_size");
        write_attr_(name, attr_type.get(), value.c_str());
    }

  private:
    void write_attr_(const char *name, hid_t type, const void *data) {
        hid_t space = H5Screate(H5S_SCALAR);
        hid_t attr = H5Acreate2(dataset_, name, type, space, H5P_DEFAULT,
                                H5P_DEFAULT);
        H5Sclose(space);
        detail::check_id(attr, "H5Acreate2");
        herr_t err = H5Awrite(attr, type, data);
        H5Aclose(attr);
        detail::check_err(err, "H5Awrite");
    }

    hid_t dataset_;
    hid_t type_id_;
    hsize_t rows_;
};

class Group {
  public:
    Group(hid_t parent, const std::string &name) {
        group_ = detail::check_id(
            H5Gcreate2(parent, name.c_str(), H5P_DEFAULT, H5P_DEFAULT,
                       H5P_DEFAULT),
            "H5Gcreate2");
    }

    ~Group() {
        if (group_ >= 0)
            H5Gclose(group_);
    }

    Group(const Group &) = delete;
    Group &operator=(const Group &) = delete;
    Group(Group &&other) noexcept : group_(other.group_) { other.group_ = -1; }
    Group &operator=(Group &&other) noexcept {
        if (this != &other) {
            if (group_ >= 0)
                H5Gclose(group_);
            group_ = other.group_;
            other.group_ = -1;
        }
        return *this;
    }

    hid_t get() const { return group_; }

  private:
    hid_t group_;
};

} // namespace fixcap::h5

#define H5_AUTO_FIELD(field_name)                                              \
    fixcap::h5::add_member<decltype(Type::field_name)>(                        \
        type_id.get(), #field_name, offsetof(Type, field_name));

#define H5_DEFINE_TYPE(TypeArg, ...)                                           \
    namespace fixcap::h5 {                                                     \
    template <> struct hdf5_type_traits<TypeArg> {                             \
        static hid_t get() {                                                   \
            using Type = TypeArg;                                              \
            TypeId type_id(detail::check_id(                                   \
                H5Tcreate(H5T_COMPOUND, sizeof(Type)), "H5Tcreate"));          \
            __VA_ARGS__                                                        \
            return type_id.release();                                          \
        }                                                                      \
    };                                                                         \
    }

#include "vec2.hpp"

H5_DEFINE_TYPE(fixcap::vec2<int>,
    H5_AUTO_FIELD(x)
    H5_AUTO_FIELD(y)
)
