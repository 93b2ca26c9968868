#pragma once

#include "celio/core/type.hpp"
#include "celio/core/error.hpp"
#include "celio/core/macros.hpp"

#include <hdf5.h>

#include <string>
#include <utility>
#include <vector>

// =============================================================================
// FILE: celio/io/hdf5.hpp
// BRIEF: RAII wrapper over the HDF5 C API
//
// Every handle owns exactly one hid_t and closes it on destruction. Failed
// calls raise IOError carrying the HDF5 error stack.
// =============================================================================

namespace celio::h5 {

namespace detail {

inline void check_h5(herr_t err, const char* context) {
    if (err < 0) {
        std::string msg = std::string("HDF5: ") + context;

        struct ErrorWalker {
            std::string* msg;
        } walker{&msg};

        herr_t walk_err = H5Ewalk2(H5E_DEFAULT, H5E_WALK_DOWNWARD,
            [](unsigned, const H5E_error2_t* err, void* data) -> herr_t {
                auto* w = static_cast<ErrorWalker*>(data);
                if (err->desc) {
                    *w->msg += "\n  " + std::string(err->desc);
                }
                return 0;
            }, &walker);

        if (walk_err < 0) {
            msg += " (failed to retrieve error details)";
        }
        H5Eclear2(H5E_DEFAULT);
        throw IOError(msg);
    }
}

inline void check_id(hid_t id, const std::string& context) {
    if (id < 0) {
        H5Eclear2(H5E_DEFAULT);
        throw IOError("HDF5 invalid ID: " + context);
    }
}

/// Suppress the automatic HDF5 error printer for the current scope.
class SilenceErrors {
public:
    SilenceErrors() noexcept {
        H5Eget_auto2(H5E_DEFAULT, &func_, &data_);
        H5Eset_auto2(H5E_DEFAULT, nullptr, nullptr);
    }
    ~SilenceErrors() { H5Eset_auto2(H5E_DEFAULT, func_, data_); }

    SilenceErrors(const SilenceErrors&) = delete;
    SilenceErrors& operator=(const SilenceErrors&) = delete;

private:
    H5E_auto2_t func_ = nullptr;
    void* data_ = nullptr;
};

} // namespace detail

// =============================================================================
// Object - Base Class for All HDF5 Handles
// =============================================================================

class Object {
protected:
    hid_t _id;
    herr_t (*_closer)(hid_t);

    explicit Object(hid_t id, herr_t (*closer)(hid_t)) noexcept
        : _id(id), _closer(closer) {}

    Object() noexcept : _id(H5I_INVALID_HID), _closer(nullptr) {}

public:
    virtual ~Object() noexcept { close(); }

    void close() noexcept {
        if (is_valid() && _closer) {
            _closer(_id);
            _id = H5I_INVALID_HID;
        }
    }

    Object(Object&& other) noexcept
        : _id(other._id), _closer(other._closer)
    {
        other._id = H5I_INVALID_HID;
        other._closer = nullptr;
    }

    Object& operator=(Object&& other) noexcept {
        if (this != &other) {
            close();
            _id = other._id;
            _closer = other._closer;
            other._id = H5I_INVALID_HID;
            other._closer = nullptr;
        }
        return *this;
    }

    Object(const Object&) = delete;
    Object& operator=(const Object&) = delete;

    CELIO_NODISCARD hid_t id() const noexcept { return _id; }

    CELIO_NODISCARD bool is_valid() const noexcept {
        return _id >= 0 && _id != H5I_INVALID_HID;
    }

    /// Absolute path of the object in its file.
    std::string get_name() const {
        ssize_t size = H5Iget_name(_id, nullptr, 0);
        if (size < 0) return "";
        std::string name(static_cast<size_t>(size), '\0');
        H5Iget_name(_id, name.data(), static_cast<size_t>(size) + 1);
        return name;
    }
};

// =============================================================================
// Dataspace
// =============================================================================

class Dataspace : public Object {
public:
    explicit Dataspace(const std::vector<hsize_t>& dims,
                       const std::vector<hsize_t>& maxdims = {})
        : Object(H5Screate_simple(static_cast<int>(dims.size()), dims.data(),
                                  maxdims.empty() ? nullptr : maxdims.data()),
                 H5Sclose)
    {
        detail::check_id(_id, "H5Screate_simple");
    }

    static Dataspace adopt(hid_t space_id) {
        detail::check_id(space_id, "dataspace");
        return Dataspace(space_id, adopt_tag{});
    }

    static Dataspace scalar() {
        return adopt(H5Screate(H5S_SCALAR));
    }

    CELIO_NODISCARD int get_rank() const {
        return H5Sget_simple_extent_ndims(_id);
    }

    CELIO_NODISCARD bool is_scalar() const {
        return H5Sget_simple_extent_type(_id) == H5S_SCALAR;
    }

    std::vector<hsize_t> get_dims() const {
        int rank = get_rank();
        if (rank <= 0) return {};
        std::vector<hsize_t> dims(static_cast<size_t>(rank));
        H5Sget_simple_extent_dims(_id, dims.data(), nullptr);
        return dims;
    }

    CELIO_NODISCARD hssize_t get_num_elements() const {
        return H5Sget_simple_extent_npoints(_id);
    }

    void select_hyperslab(
        const std::vector<hsize_t>& start,
        const std::vector<hsize_t>& count,
        const std::vector<hsize_t>& stride = {},
        H5S_seloper_t op = H5S_SELECT_SET
    ) {
        detail::check_h5(
            H5Sselect_hyperslab(
                _id, op,
                start.data(),
                stride.empty() ? nullptr : stride.data(),
                count.data(),
                nullptr
            ),
            "H5Sselect_hyperslab"
        );
    }

    void select_none() {
        detail::check_h5(H5Sselect_none(_id), "H5Sselect_none");
    }

    CELIO_NODISCARD hssize_t get_select_npoints() const {
        return H5Sget_select_npoints(_id);
    }

private:
    struct adopt_tag {};
    Dataspace(hid_t id, adopt_tag) : Object(id, H5Sclose) {}
};

// =============================================================================
// Datatype
// =============================================================================

class Datatype : public Object {
public:
    /// Copy of a predefined or existing type.
    static Datatype copy_of(hid_t type_id) {
        hid_t id = H5Tcopy(type_id);
        detail::check_id(id, "H5Tcopy");
        return adopt(id);
    }

    static Datatype adopt(hid_t type_id) {
        detail::check_id(type_id, "datatype");
        return Datatype(type_id);
    }

    /// Native memory type for a numeric dtype. Bool uses the h5py enum.
    static Datatype native(DType dtype) {
        switch (dtype) {
            case DType::Bool:    return bool_enum();
            case DType::Int8:    return copy_of(H5T_NATIVE_INT8);
            case DType::Int16:   return copy_of(H5T_NATIVE_INT16);
            case DType::Int32:   return copy_of(H5T_NATIVE_INT32);
            case DType::Int64:   return copy_of(H5T_NATIVE_INT64);
            case DType::UInt8:   return copy_of(H5T_NATIVE_UINT8);
            case DType::UInt16:  return copy_of(H5T_NATIVE_UINT16);
            case DType::UInt32:  return copy_of(H5T_NATIVE_UINT32);
            case DType::UInt64:  return copy_of(H5T_NATIVE_UINT64);
            case DType::Float32: return copy_of(H5T_NATIVE_FLOAT);
            case DType::Float64: return copy_of(H5T_NATIVE_DOUBLE);
            case DType::String:
            case DType::Object:  return string_vlen();
        }
        throw TypeError("Unsupported HDF5 type");
    }

    /// int8 enum {FALSE = 0, TRUE = 1}, the layout h5py uses for numpy bools.
    static Datatype bool_enum() {
        hid_t id = H5Tenum_create(H5T_NATIVE_INT8);
        detail::check_id(id, "H5Tenum_create");
        Datatype t = adopt(id);
        const std::int8_t f = 0;
        const std::int8_t tr = 1;
        detail::check_h5(H5Tenum_insert(id, "FALSE", &f), "H5Tenum_insert");
        detail::check_h5(H5Tenum_insert(id, "TRUE", &tr), "H5Tenum_insert");
        return t;
    }

    static Datatype string_vlen() {
        Datatype t = copy_of(H5T_C_S1);
        detail::check_h5(H5Tset_size(t.id(), H5T_VARIABLE), "H5Tset_size");
        detail::check_h5(H5Tset_cset(t.id(), H5T_CSET_UTF8), "H5Tset_cset");
        return t;
    }

    static Datatype string_fixed(size_t len) {
        Datatype t = copy_of(H5T_C_S1);
        detail::check_h5(H5Tset_size(t.id(), len == 0 ? 1 : len), "H5Tset_size");
        return t;
    }

    static Datatype compound(size_t size) {
        return adopt(H5Tcreate(H5T_COMPOUND, size));
    }

    void insert(const std::string& name, size_t offset, const Datatype& member) {
        detail::check_h5(H5Tinsert(_id, name.c_str(), offset, member.id()), "H5Tinsert");
    }

    CELIO_NODISCARD size_t get_size() const {
        return H5Tget_size(_id);
    }

    CELIO_NODISCARD H5T_class_t get_class() const {
        return H5Tget_class(_id);
    }

    CELIO_NODISCARD bool is_variable_str() const {
        return H5Tis_variable_str(_id) > 0;
    }

    CELIO_NODISCARD H5T_str_t get_strpad() const {
        return H5Tget_strpad(_id);
    }

    CELIO_NODISCARD int get_nmembers() const {
        return H5Tget_nmembers(_id);
    }

    std::string member_name(unsigned idx) const {
        char* raw = H5Tget_member_name(_id, idx);
        if (!raw) throw IOError("HDF5: H5Tget_member_name");
        std::string name(raw);
        H5free_memory(raw);
        return name;
    }

    Datatype member_type(unsigned idx) const {
        return adopt(H5Tget_member_type(_id, idx));
    }

    /// Map a stored type onto the closest celio dtype.
    DType to_dtype() const {
        switch (get_class()) {
            case H5T_INTEGER: {
                const bool is_signed = H5Tget_sign(_id) == H5T_SGN_2;
                switch (get_size()) {
                    case 1: return is_signed ? DType::Int8 : DType::UInt8;
                    case 2: return is_signed ? DType::Int16 : DType::UInt16;
                    case 4: return is_signed ? DType::Int32 : DType::UInt32;
                    default: return is_signed ? DType::Int64 : DType::UInt64;
                }
            }
            case H5T_FLOAT:
                return get_size() <= 4 ? DType::Float32 : DType::Float64;
            case H5T_ENUM:
                if (is_bool_enum()) return DType::Bool;
                throw TypeError("HDF5 enum types other than bool are not supported");
            case H5T_STRING:
                return DType::String;
            default:
                break;
        }
        throw TypeError("unsupported HDF5 type class " + std::to_string(static_cast<int>(get_class())));
    }

    CELIO_NODISCARD bool is_bool_enum() const {
        if (get_class() != H5T_ENUM || H5Tget_nmembers(_id) != 2) return false;
        std::int8_t value = 0;
        return H5Tenum_valueof(_id, "TRUE", &value) >= 0 && value == 1;
    }

private:
    explicit Datatype(hid_t id) : Object(id, H5Tclose) {}
};

// =============================================================================
// PropertyList
// =============================================================================

class DatasetCreateProps : public Object {
public:
    DatasetCreateProps() : Object(H5Pcreate(H5P_DATASET_CREATE), H5Pclose) {
        detail::check_id(_id, "H5Pcreate");
    }

    DatasetCreateProps& chunked(const std::vector<hsize_t>& chunk_dims) {
        detail::check_h5(
            H5Pset_chunk(_id, static_cast<int>(chunk_dims.size()), chunk_dims.data()),
            "H5Pset_chunk"
        );
        return *this;
    }

    DatasetCreateProps& deflate(unsigned level = 4) {
        detail::check_h5(H5Pset_deflate(_id, level), "H5Pset_deflate");
        return *this;
    }

    DatasetCreateProps& shuffle() {
        detail::check_h5(H5Pset_shuffle(_id), "H5Pset_shuffle");
        return *this;
    }
};

// =============================================================================
// Attribute
// =============================================================================

class Attribute : public Object {
public:
    Attribute(hid_t loc_id, const std::string& name)
        : Object(H5Aopen(loc_id, name.c_str(), H5P_DEFAULT), H5Aclose)
    {
        detail::check_id(_id, "H5Aopen: " + name);
    }

    static Attribute create(hid_t loc_id, const std::string& name,
                            const Datatype& type, const Dataspace& space) {
        hid_t id = H5Acreate(loc_id, name.c_str(), type.id(), space.id(),
                             H5P_DEFAULT, H5P_DEFAULT);
        detail::check_id(id, "H5Acreate: " + name);
        return Attribute(id, adopt_tag{});
    }

    Dataspace get_space() const {
        return Dataspace::adopt(H5Aget_space(_id));
    }

    Datatype get_type() const {
        return Datatype::adopt(H5Aget_type(_id));
    }

    void read(const Datatype& mem_type, void* buffer) const {
        detail::check_h5(H5Aread(_id, mem_type.id(), buffer), "H5Aread");
    }

    void write(const Datatype& mem_type, const void* buffer) {
        detail::check_h5(H5Awrite(_id, mem_type.id(), buffer), "H5Awrite");
    }

private:
    struct adopt_tag {};
    Attribute(hid_t id, adopt_tag) : Object(id, H5Aclose) {}
};

// =============================================================================
// AttrHost - objects carrying attributes (groups, files, datasets)
// =============================================================================

class AttrHost : public Object {
protected:
    using Object::Object;
    AttrHost() = default;

public:
    CELIO_NODISCARD bool has_attr(const std::string& name) const {
        return H5Aexists(_id, name.c_str()) > 0;
    }

    Attribute open_attr(const std::string& name) const {
        return Attribute(_id, name);
    }

    void delete_attr(const std::string& name) {
        detail::check_h5(H5Adelete(_id, name.c_str()), "H5Adelete");
    }

    /// Replace-or-create. Existing attributes are deleted first so that a
    /// new shape or type never conflicts with the old one.
    Attribute recreate_attr(const std::string& name, const Datatype& type,
                            const Dataspace& space) {
        if (has_attr(name)) delete_attr(name);
        return Attribute::create(_id, name, type, space);
    }

    std::vector<std::string> attr_names() const {
        std::vector<std::string> names;
        auto collect = [](hid_t, const char* name, const H5A_info_t*, void* op_data) -> herr_t {
            static_cast<std::vector<std::string>*>(op_data)->emplace_back(name);
            return 0;
        };
        detail::check_h5(
            H5Aiterate2(_id, H5_INDEX_NAME, H5_ITER_INC, nullptr, collect, &names),
            "H5Aiterate2"
        );
        return names;
    }

    /// Resolve an object reference to the absolute path it points at.
    std::string dereference_name(const hobj_ref_t& ref) const {
        ssize_t size = H5Rget_name(_id, H5R_OBJECT, &ref, nullptr, 0);
        if (size < 0) throw IOError("HDF5: H5Rget_name failed");
        std::string name(static_cast<size_t>(size), '\0');
        H5Rget_name(_id, H5R_OBJECT, &ref, name.data(), static_cast<size_t>(size) + 1);
        return name;
    }
};

// =============================================================================
// Dataset
// =============================================================================

class Dataset : public AttrHost {
public:
    Dataset(hid_t loc_id, const std::string& name)
        : AttrHost(H5Dopen(loc_id, name.c_str(), H5P_DEFAULT), H5Dclose)
    {
        detail::check_id(_id, "H5Dopen: " + name);
    }

    static Dataset create(hid_t loc_id, const std::string& name,
                          const Datatype& type, const Dataspace& space,
                          const DatasetCreateProps& props) {
        hid_t id = H5Dcreate(loc_id, name.c_str(), type.id(), space.id(),
                             H5P_DEFAULT, props.id(), H5P_DEFAULT);
        detail::check_id(id, "H5Dcreate: " + name);
        return Dataset(id, adopt_tag{});
    }

    Dataspace get_space() const {
        return Dataspace::adopt(H5Dget_space(_id));
    }

    Datatype get_type() const {
        return Datatype::adopt(H5Dget_type(_id));
    }

    void read(const Datatype& mem_type, void* buffer) const {
        detail::check_h5(
            H5Dread(_id, mem_type.id(), H5S_ALL, H5S_ALL, H5P_DEFAULT, buffer),
            "H5Dread"
        );
    }

    void read(const Datatype& mem_type, const Dataspace& mem_space,
              const Dataspace& file_space, void* buffer) const {
        detail::check_h5(
            H5Dread(_id, mem_type.id(), mem_space.id(), file_space.id(), H5P_DEFAULT, buffer),
            "H5Dread"
        );
    }

    void write(const Datatype& mem_type, const void* buffer) {
        detail::check_h5(
            H5Dwrite(_id, mem_type.id(), H5S_ALL, H5S_ALL, H5P_DEFAULT, buffer),
            "H5Dwrite"
        );
    }

    /// Release memory HDF5 allocated for variable-length elements.
    static void reclaim(const Datatype& mem_type, const Dataspace& space, void* buffer) {
        detail::check_h5(H5Dvlen_reclaim(mem_type.id(), space.id(), H5P_DEFAULT, buffer),
                         "H5Dvlen_reclaim");
    }

private:
    struct adopt_tag {};
    Dataset(hid_t id, adopt_tag) : AttrHost(id, H5Dclose) {}
};

// =============================================================================
// Group
// =============================================================================

enum class ObjectType {
    Unknown,
    Group,
    Dataset,
};

class Group : public AttrHost {
public:
    Group(hid_t loc_id, const std::string& name)
        : AttrHost(H5Gopen(loc_id, name.c_str(), H5P_DEFAULT), H5Gclose)
    {
        detail::check_id(_id, "H5Gopen: " + name);
    }

    static Group create(hid_t loc_id, const std::string& name) {
        hid_t id = H5Gcreate(loc_id, name.c_str(), H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
        detail::check_id(id, "H5Gcreate: " + name);
        return Group(id, adopt_tag{});
    }

    CELIO_NODISCARD bool exists(const std::string& name) const {
        detail::SilenceErrors quiet;
        return H5Lexists(_id, name.c_str(), H5P_DEFAULT) > 0;
    }

    CELIO_NODISCARD ObjectType get_object_type(const std::string& name) const {
        detail::SilenceErrors quiet;
        hid_t obj = H5Oopen(_id, name.c_str(), H5P_DEFAULT);
        if (obj < 0) {
            H5Eclear2(H5E_DEFAULT);
            return ObjectType::Unknown;
        }
        const H5I_type_t type = H5Iget_type(obj);
        H5Oclose(obj);
        switch (type) {
            case H5I_GROUP: return ObjectType::Group;
            case H5I_DATASET: return ObjectType::Dataset;
            default: return ObjectType::Unknown;
        }
    }

    /// Link names in name order (the iteration order h5py exposes).
    std::vector<std::string> list_objects() const {
        H5G_info_t info;
        detail::check_h5(H5Gget_info(_id, &info), "H5Gget_info");
        std::vector<std::string> names;
        names.reserve(static_cast<size_t>(info.nlinks));
        for (hsize_t i = 0; i < info.nlinks; ++i) {
            ssize_t size = H5Lget_name_by_idx(_id, ".", H5_INDEX_NAME, H5_ITER_INC, i,
                                              nullptr, 0, H5P_DEFAULT);
            if (size < 0) continue;
            std::string name(static_cast<size_t>(size), '\0');
            H5Lget_name_by_idx(_id, ".", H5_INDEX_NAME, H5_ITER_INC, i,
                               name.data(), static_cast<size_t>(size) + 1, H5P_DEFAULT);
            names.push_back(std::move(name));
        }
        return names;
    }

    void unlink(const std::string& name) {
        detail::check_h5(H5Ldelete(_id, name.c_str(), H5P_DEFAULT), "H5Ldelete");
    }

protected:
    struct adopt_tag {};
    Group(hid_t id, adopt_tag) : AttrHost(id, H5Gclose) {}
};

// =============================================================================
// File
// =============================================================================

class File : public Object {
public:
    enum class Mode {
        ReadOnly,
        ReadWrite,
        Truncate,
    };

    File(const std::string& path, Mode mode)
        : Object(open_or_create(path, mode), H5Fclose) {}

    Group root() const {
        return Group(_id, "/");
    }

    void flush() {
        detail::check_h5(H5Fflush(_id, H5F_SCOPE_GLOBAL), "H5Fflush");
    }

private:
    static hid_t open_or_create(const std::string& path, Mode mode) {
        hid_t id = H5I_INVALID_HID;
        switch (mode) {
            case Mode::ReadOnly:
                id = H5Fopen(path.c_str(), H5F_ACC_RDONLY, H5P_DEFAULT);
                break;
            case Mode::ReadWrite:
                id = H5Fopen(path.c_str(), H5F_ACC_RDWR, H5P_DEFAULT);
                break;
            case Mode::Truncate:
                id = H5Fcreate(path.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT);
                break;
        }
        detail::check_id(id, "H5Fopen: " + path);
        return id;
    }
};

} // namespace celio::h5
