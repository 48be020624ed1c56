#pragma once
#include "io/IoConfig.hpp"
#include "io/Variable.hpp"
#include "series/Series.hpp"

#include <memory>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @file File.hpp
 * @brief One physical array file and the variables stored in it.
 *
 * @details
 * A File routes logged series to its :cpp:class:`Variable` objects, keyed by quantity name (plus
 * `"_<kind>"` for aggregated arrays), and owns the time axis shared by them. Its path follows from
 * its name: names containing `"node"` live in `paths.node`, all others are read from
 * `paths.input` and written to `paths.output`.
 *
 * `read()` and `write()` open exactly one :cpp:class:`ArrayFile` for the whole operation. Every
 * failure is re-raised with the file path prepended, keeping its :cpp:enum:`ErrorKind`.
 */

namespace seriesio::io
{

class File
{
  public:
    File(std::string name, bool flatten, bool isolate, IoConfig cfg);

    const std::string& name() const noexcept { return name_; }

    void log(series::ISeries& handle, std::optional<series::LoggedArray> array = std::nullopt);

    std::string filepath_read() const;
    std::string filepath_write() const;

    void read();
    void write(const std::string& timeunit, std::span<const double> timepoints);

    std::vector<std::string> variablenames() const;
    Variable& variable(const std::string& key);
    const Variable& variable(const std::string& key) const;
    Variable* find_variable(const std::string& key) noexcept;
    const Variable* find_variable(const std::string& key) const noexcept;

  private:
    std::string filepath(const std::string& base) const;

    std::string name_;
    bool flatten_;
    bool isolate_;
    IoConfig cfg_;

    std::vector<std::unique_ptr<Variable>> variables_; // registration order
    std::unordered_map<std::string, std::size_t> idx_;
};

} // namespace seriesio::io
