#pragma once
#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <vector>

/**
 * @file ArrayFile.hpp
 * @brief Self-describing array file (HDF5) with named dimensions and variables.
 *
 * @details
 * A thin netCDF-like layer over HDF5. Dimensions are named lengths; variables are datasets whose
 * shape is given by an ordered list of dimension names. On disk:
 *
 * - `/dimensions` : group holding one int64 attribute per dimension (creation order tracked)
 * - `/variables/<name>` : one dataset per variable, with a `dimensions` string-array attribute and
 *   free-form string attributes such as `units`
 *
 * Every failure is raised as :cpp:class:`seriesio::Error` with the file path, the dimension or
 * variable name and (for creations) the requested datatype/dimensions in the message.
 *
 * The handle is scoped: the destructor closes the file on every exit path. Call `close()`
 * explicitly where a failed close must be reported.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   ArrayFile f("out/model.h5", ArrayFile::Mode::Write);
 *   f.create_dimension("stations", 2);
 *   f.create_dimension("time", 4);
 *   f.create_variable("flux", DType::Float64, {"stations", "time"}, -999.0);
 *   f.write_doubles("flux", values);   // 8 values, row-major
 *   f.close();
 * @endrst
 */

namespace seriesio::io
{

enum class DType
{
    Float64,
    Char
};

const char* to_string(DType t) noexcept; // "f8" | "S1"

class ArrayFile
{
  public:
    enum class Mode
    {
        Read,
        Write // create, truncating an existing file
    };

    ArrayFile(std::string path, Mode mode);
    ~ArrayFile();

    ArrayFile(const ArrayFile&) = delete;
    ArrayFile& operator=(const ArrayFile&) = delete;
    ArrayFile(ArrayFile&&) noexcept;
    ArrayFile& operator=(ArrayFile&&) noexcept;

    const std::string& path() const noexcept;
    bool is_open() const noexcept;
    void close();

    // dimensions
    void create_dimension(const std::string& name, std::size_t length);
    bool has_dimension(const std::string& name) const;
    std::size_t dimension_length(const std::string& name) const;
    std::vector<std::string> dimension_names() const;

    // variables; `fill_value` applies to Float64 variables only
    void create_variable(const std::string& name, DType dtype,
                         const std::vector<std::string>& dimensions, double fill_value);
    bool has_variable(const std::string& name) const;
    std::vector<std::string> variable_names() const;
    DType variable_dtype(const std::string& name) const;
    std::vector<std::string> variable_dimensions(const std::string& name) const;
    std::vector<std::size_t> variable_shape(const std::string& name) const;

    // whole-variable block I/O, row-major
    void write_doubles(const std::string& name, std::span<const double> values);
    std::vector<double> read_doubles(const std::string& name) const;
    void write_chars(const std::string& name, std::span<const char> values);
    std::vector<char> read_chars(const std::string& name) const;

    // string attributes of variables
    void set_attribute(const std::string& variable, const std::string& attribute,
                       const std::string& value);
    bool has_attribute(const std::string& variable, const std::string& attribute) const;
    std::string attribute(const std::string& variable, const std::string& attribute) const;

  private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace seriesio::io
