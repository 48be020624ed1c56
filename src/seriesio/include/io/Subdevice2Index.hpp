#pragma once
#include <cstddef>
#include <string>
#include <unordered_map>

/**
 * @file Subdevice2Index.hpp
 * @brief Row-label to row-index lookup built from a file's coordinate variable.
 *
 * @details
 * Built once per Variable read by :cpp:func:`Variable::query_subdevice2index`. The variable name
 * and file path are kept only to produce a useful message when a logged (sub)device has no row.
 */

namespace seriesio::io
{

class Subdevice2Index
{
  public:
    Subdevice2Index(std::unordered_map<std::string, std::size_t> rows, std::string variable,
                    std::string filepath);

    /// Row of `name`; throws ErrorKind::MissingDeviceData when the file has none.
    std::size_t get(const std::string& name) const;
    bool contains(const std::string& name) const noexcept { return rows_.count(name) != 0; }
    std::size_t size() const noexcept { return rows_.size(); }

  private:
    std::unordered_map<std::string, std::size_t> rows_;
    std::string variable_;
    std::string filepath_;
};

} // namespace seriesio::io
