#include "io/ArrayFile.hpp"
#include "Errors.hpp"
#include "Log.hpp"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <functional>
#include <numeric>
#include <string>
#include <vector>

#include <hdf5.h>

namespace seriesio::io
{
namespace fs = std::filesystem;

/// \cond DOXYGEN_EXCLUDE

namespace
{

constexpr const char* kDimGroup = "dimensions";
constexpr const char* kVarGroup = "variables";
constexpr const char* kDimAttr = "dimensions";

// Scoped HDF5 identifier.
class H5Id
{
  public:
    H5Id() = default;
    H5Id(hid_t id, herr_t (*closer)(hid_t)) : id_(id), closer_(closer) {}
    H5Id(const H5Id&) = delete;
    H5Id& operator=(const H5Id&) = delete;
    H5Id(H5Id&& o) noexcept : id_(o.id_), closer_(o.closer_) { o.id_ = -1; }
    ~H5Id()
    {
        if (id_ >= 0 && closer_)
            closer_(id_);
    }

    bool valid() const noexcept { return id_ >= 0; }
    hid_t get() const noexcept { return id_; }

  private:
    hid_t id_ = -1;
    herr_t (*closer_)(hid_t) = nullptr;
};

herr_t collect_error(unsigned n, const H5E_error2_t* err, void* data)
{
    auto* out = static_cast<std::string*>(data);
    if (n == 0 && err && err->desc)
        *out = err->desc;
    return 0;
}

// Most specific message on the HDF5 error stack; clears the stack.
std::string h5_error_text()
{
    std::string msg;
    H5Ewalk2(H5E_DEFAULT, H5E_WALK_UPWARD, collect_error, &msg);
    H5Eclear2(H5E_DEFAULT);
    return msg.empty() ? std::string("HDF5 call failed") : msg;
}

std::string join_dims(const std::vector<std::string>& dims)
{
    std::string s = "(";
    for (std::size_t i = 0; i < dims.size(); ++i)
        s += (i ? ", " : "") + dims[i];
    return s + ")";
}

void check_name(const std::string& name, const std::string& what)
{
    if (name.empty() || name.find('/') != std::string::npos || name == ".")
        throw Error(ErrorKind::InvalidArgument, "Invalid " + what + " name `" + name + "`.");
}

H5Id char_type()
{
    H5Id t(H5Tcopy(H5T_C_S1), H5Tclose);
    H5Tset_size(t.get(), 1);
    H5Tset_strpad(t.get(), H5T_STR_NULLPAD);
    return t;
}

H5Id string_type(std::size_t width)
{
    H5Id t(H5Tcopy(H5T_C_S1), H5Tclose);
    H5Tset_size(t.get(), std::max<std::size_t>(width, 1));
    H5Tset_strpad(t.get(), H5T_STR_NULLPAD);
    return t;
}

herr_t collect_attr_name(hid_t, const char* name, const H5A_info_t*, void* data)
{
    static_cast<std::vector<std::string>*>(data)->emplace_back(name);
    return 0;
}

std::size_t product(const std::vector<std::size_t>& shape)
{
    return std::accumulate(shape.begin(), shape.end(), std::size_t(1), std::multiplies<>());
}

} // namespace

struct ArrayFile::Impl
{
    std::string path;
    Mode mode = Mode::Read;
    hid_t file = -1;
    hid_t dims = -1; // group
    hid_t vars = -1; // group

    // Closes groups and file; returns false if any close failed.
    bool release() noexcept
    {
        bool ok = true;
        if (vars >= 0)
        {
            ok = H5Gclose(vars) >= 0 && ok;
            vars = -1;
        }
        if (dims >= 0)
        {
            ok = H5Gclose(dims) >= 0 && ok;
            dims = -1;
        }
        if (file >= 0)
        {
            ok = H5Fclose(file) >= 0 && ok;
            file = -1;
        }
        return ok;
    }

    ~Impl()
    {
        if (!release())
            LOGW("closing file `%s` reported an HDF5 error\n", path.c_str());
    }

    H5Id open_dataset(const std::string& name) const
    {
        check_name(name, "variable");
        if (H5Lexists(vars, name.c_str(), H5P_DEFAULT) <= 0)
            throw Error(ErrorKind::MissingVariable,
                        "File `" + path + "` does not contain variable `" + name + "`.");
        H5Id d(H5Dopen2(vars, name.c_str(), H5P_DEFAULT), H5Dclose);
        if (!d.valid())
            throw Error(ErrorKind::Io, "While trying to open variable `" + name + "` of file `" +
                                           path + "`: " + h5_error_text());
        return d;
    }

    std::vector<std::size_t> shape_of(hid_t dset, const std::string& name) const
    {
        H5Id space(H5Dget_space(dset), H5Sclose);
        const int rank = space.valid() ? H5Sget_simple_extent_ndims(space.get()) : -1;
        if (rank < 0)
            throw Error(ErrorKind::Io, "While trying to query the shape of variable `" + name +
                                           "` of file `" + path + "`: " + h5_error_text());
        std::vector<hsize_t> hd(std::size_t(rank), 0);
        if (rank > 0)
            H5Sget_simple_extent_dims(space.get(), hd.data(), nullptr);
        return std::vector<std::size_t>(hd.begin(), hd.end());
    }
};

/// \endcond

const char* to_string(DType t) noexcept
{
    return t == DType::Float64 ? "f8" : "S1";
}

ArrayFile::ArrayFile(std::string path, Mode mode) : impl_(std::make_unique<Impl>())
{
    // Errors are reported through exceptions; keep HDF5 from printing its own stack.
    H5Eset_auto2(H5E_DEFAULT, nullptr, nullptr);

    impl_->path = std::move(path);
    impl_->mode = mode;
    const std::string& p = impl_->path;

    if (mode == Mode::Write)
    {
        impl_->file = H5Fcreate(p.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT);
        if (impl_->file < 0)
            throw Error(ErrorKind::Io, "Cannot create file `" + p + "`: " + h5_error_text());

        H5Id gcpl(H5Pcreate(H5P_GROUP_CREATE), H5Pclose);
        H5Pset_link_creation_order(gcpl.get(), H5P_CRT_ORDER_TRACKED | H5P_CRT_ORDER_INDEXED);
        H5Pset_attr_creation_order(gcpl.get(), H5P_CRT_ORDER_TRACKED | H5P_CRT_ORDER_INDEXED);
        impl_->dims = H5Gcreate2(impl_->file, kDimGroup, H5P_DEFAULT, gcpl.get(), H5P_DEFAULT);
        impl_->vars = H5Gcreate2(impl_->file, kVarGroup, H5P_DEFAULT, gcpl.get(), H5P_DEFAULT);
        if (impl_->dims < 0 || impl_->vars < 0)
            throw Error(ErrorKind::Io,
                        "Cannot initialise the layout of file `" + p + "`: " + h5_error_text());
    }
    else
    {
        if (!fs::exists(p))
            throw Error(ErrorKind::Io, "File `" + p + "` does not exist.");
        impl_->file = H5Fopen(p.c_str(), H5F_ACC_RDONLY, H5P_DEFAULT);
        if (impl_->file < 0)
            throw Error(ErrorKind::Io, "Cannot open file `" + p + "`: " + h5_error_text());
        if (H5Lexists(impl_->file, kDimGroup, H5P_DEFAULT) <= 0 ||
            H5Lexists(impl_->file, kVarGroup, H5P_DEFAULT) <= 0)
            throw Error(ErrorKind::Io, "File `" + p + "` lacks the `" + kDimGroup + "` or `" +
                                           kVarGroup + "` group of a series array file.");
        impl_->dims = H5Gopen2(impl_->file, kDimGroup, H5P_DEFAULT);
        impl_->vars = H5Gopen2(impl_->file, kVarGroup, H5P_DEFAULT);
        if (impl_->dims < 0 || impl_->vars < 0)
            throw Error(ErrorKind::Io,
                        "Cannot open the groups of file `" + p + "`: " + h5_error_text());
    }
    LOGD("opened `%s` for %s\n", p.c_str(), mode == Mode::Write ? "writing" : "reading");
}

ArrayFile::~ArrayFile() = default;
ArrayFile::ArrayFile(ArrayFile&&) noexcept = default;
ArrayFile& ArrayFile::operator=(ArrayFile&&) noexcept = default;

const std::string& ArrayFile::path() const noexcept
{
    return impl_->path;
}

bool ArrayFile::is_open() const noexcept
{
    return impl_ && impl_->file >= 0;
}

void ArrayFile::close()
{
    if (!impl_->release())
        throw Error(ErrorKind::Io, "While trying to close file `" + impl_->path +
                                       "`: " + h5_error_text());
    LOGD("closed `%s`\n", impl_->path.c_str());
}

// ---------------- dimensions ----------------

void ArrayFile::create_dimension(const std::string& name, std::size_t length)
{
    const std::string context = "While trying to add dimension `" + name + "` with length `" +
                                std::to_string(length) + "` to file `" + impl_->path + "`";
    check_name(name, "dimension");
    if (H5Aexists(impl_->dims, name.c_str()) > 0)
        throw Error(ErrorKind::NameCollision,
                    context + ", the following error occurred: name already in use");

    H5Id space(H5Screate(H5S_SCALAR), H5Sclose);
    H5Id attr(H5Acreate2(impl_->dims, name.c_str(), H5T_STD_I64LE, space.get(), H5P_DEFAULT,
                         H5P_DEFAULT),
              H5Aclose);
    const std::int64_t value = std::int64_t(length);
    if (!attr.valid() || H5Awrite(attr.get(), H5T_NATIVE_INT64, &value) < 0)
        throw Error(ErrorKind::Io, context + ", the following error occurred: " + h5_error_text());
}

bool ArrayFile::has_dimension(const std::string& name) const
{
    check_name(name, "dimension");
    return H5Aexists(impl_->dims, name.c_str()) > 0;
}

std::size_t ArrayFile::dimension_length(const std::string& name) const
{
    if (!has_dimension(name))
        throw Error(ErrorKind::MissingDimension,
                    "File `" + impl_->path + "` does not contain dimension `" + name + "`.");
    H5Id attr(H5Aopen(impl_->dims, name.c_str(), H5P_DEFAULT), H5Aclose);
    std::int64_t value = 0;
    if (!attr.valid() || H5Aread(attr.get(), H5T_NATIVE_INT64, &value) < 0)
        throw Error(ErrorKind::Io, "While trying to read dimension `" + name + "` of file `" +
                                       impl_->path + "`: " + h5_error_text());
    return std::size_t(value);
}

std::vector<std::string> ArrayFile::dimension_names() const
{
    std::vector<std::string> names;
    hsize_t idx = 0;
    if (H5Aiterate2(impl_->dims, H5_INDEX_CRT_ORDER, H5_ITER_INC, &idx, collect_attr_name,
                    &names) < 0)
        throw Error(ErrorKind::Io, "While trying to list the dimensions of file `" +
                                       impl_->path + "`: " + h5_error_text());
    return names;
}

// ---------------- variables ----------------

void ArrayFile::create_variable(const std::string& name, DType dtype,
                                const std::vector<std::string>& dimensions, double fill_value)
{
    const std::string context = "While trying to add variable `" + name + "` with datatype `" +
                                to_string(dtype) + "` and dimensions `" +
                                join_dims(dimensions) + "` to file `" + impl_->path + "`";
    check_name(name, "variable");
    if (H5Lexists(impl_->vars, name.c_str(), H5P_DEFAULT) > 0)
        throw Error(ErrorKind::NameCollision,
                    context + ", the following error occurred: name already in use");

    std::vector<hsize_t> hd;
    hd.reserve(dimensions.size());
    for (const auto& d : dimensions)
    {
        if (d.empty() || d.find('/') != std::string::npos || H5Aexists(impl_->dims, d.c_str()) <= 0)
            throw Error(ErrorKind::MissingDimension,
                        context + ", the following error occurred: cannot find dimension `" + d +
                            "`");
        hd.push_back(hsize_t(dimension_length(d)));
    }

    H5Id space(hd.empty() ? H5Screate(H5S_SCALAR)
                          : H5Screate_simple(int(hd.size()), hd.data(), nullptr),
               H5Sclose);
    H5Id dcpl(H5Pcreate(H5P_DATASET_CREATE), H5Pclose);
    H5Id ftype = dtype == DType::Float64 ? H5Id(H5Tcopy(H5T_IEEE_F64LE), H5Tclose) : char_type();
    if (dtype == DType::Float64)
        H5Pset_fill_value(dcpl.get(), H5T_NATIVE_DOUBLE, &fill_value);

    H5Id dset(H5Dcreate2(impl_->vars, name.c_str(), ftype.get(), space.get(), H5P_DEFAULT,
                         dcpl.get(), H5P_DEFAULT),
              H5Dclose);
    if (!dset.valid())
        throw Error(ErrorKind::Io, context + ", the following error occurred: " + h5_error_text());

    // dimension names, fixed-width strings
    std::size_t width = 1;
    for (const auto& d : dimensions)
        width = std::max(width, d.size());
    std::vector<char> buf(dimensions.size() * width, '\0');
    for (std::size_t i = 0; i < dimensions.size(); ++i)
        std::memcpy(buf.data() + i * width, dimensions[i].data(), dimensions[i].size());
    const hsize_t n = dimensions.size();
    H5Id aspace(H5Screate_simple(1, &n, nullptr), H5Sclose);
    H5Id stype = string_type(width);
    H5Id attr(H5Acreate2(dset.get(), kDimAttr, stype.get(), aspace.get(), H5P_DEFAULT,
                         H5P_DEFAULT),
              H5Aclose);
    if (!attr.valid() || (n > 0 && H5Awrite(attr.get(), stype.get(), buf.data()) < 0))
        throw Error(ErrorKind::Io, context + ", the following error occurred: " + h5_error_text());
}

bool ArrayFile::has_variable(const std::string& name) const
{
    check_name(name, "variable");
    return H5Lexists(impl_->vars, name.c_str(), H5P_DEFAULT) > 0;
}

std::vector<std::string> ArrayFile::variable_names() const
{
    H5G_info_t info{};
    if (H5Gget_info(impl_->vars, &info) < 0)
        throw Error(ErrorKind::Io, "While trying to list the variables of file `" + impl_->path +
                                       "`: " + h5_error_text());
    std::vector<std::string> names;
    names.reserve(std::size_t(info.nlinks));
    for (hsize_t i = 0; i < info.nlinks; ++i)
    {
        const ssize_t len = H5Lget_name_by_idx(impl_->vars, ".", H5_INDEX_CRT_ORDER, H5_ITER_INC,
                                               i, nullptr, 0, H5P_DEFAULT);
        if (len < 0)
            throw Error(ErrorKind::Io, "While trying to list the variables of file `" +
                                           impl_->path + "`: " + h5_error_text());
        std::string name(std::size_t(len) + 1, '\0');
        H5Lget_name_by_idx(impl_->vars, ".", H5_INDEX_CRT_ORDER, H5_ITER_INC, i, name.data(),
                           name.size(), H5P_DEFAULT);
        name.resize(std::size_t(len));
        names.push_back(std::move(name));
    }
    return names;
}

DType ArrayFile::variable_dtype(const std::string& name) const
{
    H5Id dset = impl_->open_dataset(name);
    H5Id type(H5Dget_type(dset.get()), H5Tclose);
    const H5T_class_t cls = type.valid() ? H5Tget_class(type.get()) : H5T_NO_CLASS;
    if (cls == H5T_FLOAT)
        return DType::Float64;
    if (cls == H5T_STRING)
        return DType::Char;
    throw Error(ErrorKind::InvalidArgument, "Variable `" + name + "` of file `" + impl_->path +
                                                "` has an unsupported datatype.");
}

std::vector<std::string> ArrayFile::variable_dimensions(const std::string& name) const
{
    H5Id dset = impl_->open_dataset(name);
    const std::string context =
        "While trying to read the dimensions of variable `" + name + "` of file `" + impl_->path +
        "`";
    if (H5Aexists(dset.get(), kDimAttr) <= 0)
        throw Error(ErrorKind::MissingDimension,
                    context + ", the following error occurred: no dimension names stored");
    H5Id attr(H5Aopen(dset.get(), kDimAttr, H5P_DEFAULT), H5Aclose);
    H5Id type(attr.valid() ? H5Aget_type(attr.get()) : -1, H5Tclose);
    H5Id space(attr.valid() ? H5Aget_space(attr.get()) : -1, H5Sclose);
    if (!type.valid() || !space.valid())
        throw Error(ErrorKind::Io, context + ", the following error occurred: " + h5_error_text());
    const std::size_t width = H5Tget_size(type.get());
    const hssize_t n = H5Sget_simple_extent_npoints(space.get());
    std::vector<char> buf(std::size_t(std::max<hssize_t>(n, 0)) * width, '\0');
    if (n > 0 && H5Aread(attr.get(), type.get(), buf.data()) < 0)
        throw Error(ErrorKind::Io, context + ", the following error occurred: " + h5_error_text());
    std::vector<std::string> out;
    for (hssize_t i = 0; i < n; ++i)
    {
        const char* p = buf.data() + std::size_t(i) * width;
        out.emplace_back(p, strnlen(p, width));
    }
    return out;
}

std::vector<std::size_t> ArrayFile::variable_shape(const std::string& name) const
{
    H5Id dset = impl_->open_dataset(name);
    return impl_->shape_of(dset.get(), name);
}

void ArrayFile::write_doubles(const std::string& name, std::span<const double> values)
{
    H5Id dset = impl_->open_dataset(name);
    const auto shape = impl_->shape_of(dset.get(), name);
    if (values.size() != product(shape))
        throw Error(ErrorKind::InvalidArgument,
                    "While trying to write " + std::to_string(values.size()) +
                        " values to variable `" + name + "` of file `" + impl_->path +
                        "`, the following error occurred: the variable holds " +
                        std::to_string(product(shape)) + " values");
    if (values.empty())
        return;
    if (H5Dwrite(dset.get(), H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, values.data()) < 0)
        throw Error(ErrorKind::Io, "While trying to write variable `" + name + "` to file `" +
                                       impl_->path + "`: " + h5_error_text());
}

std::vector<double> ArrayFile::read_doubles(const std::string& name) const
{
    if (variable_dtype(name) != DType::Float64)
        throw Error(ErrorKind::InvalidArgument, "Variable `" + name + "` of file `" +
                                                    impl_->path + "` is not a float variable.");
    H5Id dset = impl_->open_dataset(name);
    std::vector<double> out(product(impl_->shape_of(dset.get(), name)));
    if (!out.empty() &&
        H5Dread(dset.get(), H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, out.data()) < 0)
        throw Error(ErrorKind::Io, "While trying to read variable `" + name + "` from file `" +
                                       impl_->path + "`: " + h5_error_text());
    return out;
}

void ArrayFile::write_chars(const std::string& name, std::span<const char> values)
{
    H5Id dset = impl_->open_dataset(name);
    const auto shape = impl_->shape_of(dset.get(), name);
    if (values.size() != product(shape))
        throw Error(ErrorKind::InvalidArgument,
                    "While trying to write " + std::to_string(values.size()) +
                        " characters to variable `" + name + "` of file `" + impl_->path +
                        "`, the following error occurred: the variable holds " +
                        std::to_string(product(shape)) + " characters");
    if (values.empty())
        return;
    H5Id mtype = char_type();
    if (H5Dwrite(dset.get(), mtype.get(), H5S_ALL, H5S_ALL, H5P_DEFAULT, values.data()) < 0)
        throw Error(ErrorKind::Io, "While trying to write variable `" + name + "` to file `" +
                                       impl_->path + "`: " + h5_error_text());
}

std::vector<char> ArrayFile::read_chars(const std::string& name) const
{
    if (variable_dtype(name) != DType::Char)
        throw Error(ErrorKind::InvalidArgument, "Variable `" + name + "` of file `" +
                                                    impl_->path + "` is not a character variable.");
    H5Id dset = impl_->open_dataset(name);
    std::vector<char> out(product(impl_->shape_of(dset.get(), name)), '\0');
    H5Id mtype = char_type();
    if (!out.empty() &&
        H5Dread(dset.get(), mtype.get(), H5S_ALL, H5S_ALL, H5P_DEFAULT, out.data()) < 0)
        throw Error(ErrorKind::Io, "While trying to read variable `" + name + "` from file `" +
                                       impl_->path + "`: " + h5_error_text());
    return out;
}

// ---------------- attributes ----------------

void ArrayFile::set_attribute(const std::string& variable, const std::string& attribute,
                              const std::string& value)
{
    H5Id dset = impl_->open_dataset(variable);
    const std::string context = "While trying to set attribute `" + attribute +
                                "` of variable `" + variable + "` in file `" + impl_->path + "`";
    if (attribute == kDimAttr)
        throw Error(ErrorKind::NameCollision,
                    context + ", the following error occurred: name reserved for dimensions");
    if (H5Aexists(dset.get(), attribute.c_str()) > 0 &&
        H5Adelete(dset.get(), attribute.c_str()) < 0)
        throw Error(ErrorKind::Io, context + ", the following error occurred: " + h5_error_text());
    H5Id type = string_type(value.size());
    H5Id space(H5Screate(H5S_SCALAR), H5Sclose);
    H5Id attr(H5Acreate2(dset.get(), attribute.c_str(), type.get(), space.get(), H5P_DEFAULT,
                         H5P_DEFAULT),
              H5Aclose);
    std::vector<char> buf(std::max<std::size_t>(value.size(), 1), '\0');
    std::memcpy(buf.data(), value.data(), value.size());
    if (!attr.valid() || H5Awrite(attr.get(), type.get(), buf.data()) < 0)
        throw Error(ErrorKind::Io, context + ", the following error occurred: " + h5_error_text());
}

bool ArrayFile::has_attribute(const std::string& variable, const std::string& attribute) const
{
    H5Id dset = impl_->open_dataset(variable);
    return H5Aexists(dset.get(), attribute.c_str()) > 0;
}

std::string ArrayFile::attribute(const std::string& variable, const std::string& attribute) const
{
    H5Id dset = impl_->open_dataset(variable);
    const std::string context = "While trying to read attribute `" + attribute +
                                "` of variable `" + variable + "` from file `" + impl_->path + "`";
    if (H5Aexists(dset.get(), attribute.c_str()) <= 0)
        throw Error(ErrorKind::InvalidArgument,
                    context + ", the following error occurred: the variable has no such "
                              "attribute");
    H5Id attr(H5Aopen(dset.get(), attribute.c_str(), H5P_DEFAULT), H5Aclose);
    H5Id type(attr.valid() ? H5Aget_type(attr.get()) : -1, H5Tclose);
    if (!type.valid() || H5Tget_class(type.get()) != H5T_STRING)
        throw Error(ErrorKind::InvalidArgument,
                    context + ", the following error occurred: not a fixed-width string");
    const std::size_t width = H5Tget_size(type.get());
    std::vector<char> buf(width, '\0');
    if (H5Aread(attr.get(), type.get(), buf.data()) < 0)
        throw Error(ErrorKind::Io, context + ", the following error occurred: " + h5_error_text());
    return std::string(buf.data(), strnlen(buf.data(), width));
}

} // namespace seriesio::io
