#pragma once
#include "io/IoConfig.hpp"
#include "io/Subdevice2Index.hpp"
#include "series/Series.hpp"
#include "time/Timegrid.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @file Variable.hpp
 * @brief One logical quantity stored as a single array variable, for many devices.
 *
 * @details
 * A Variable collects the (device, series) pairs of one quantity and lays them out as one block
 * of an :cpp:class:`ArrayFile`. The layout depends on the kind fixed at construction:
 *
 * - **Deep**: one row per device, `(devices, time, max n1, ..., max nR)`; devices with smaller
 *   extents are padded with the fill value. A device of lower rank occupies index 0 along the
 *   trailing axes it lacks.
 * - **Agg**: one row per device, `(devices, time)`, holding pre-aggregated arrays. Write-only.
 * - **Flat**: one row per spatial cell, `(cells, time)`; rows of a rank-R device are labelled
 *   `"<device>_<i1>_..._<iR>"` in row-major order, rank-0 rows carry the plain device name.
 *
 * Row labels go to a character-matrix coordinate variable `<prefix><station_names>`. The prefix
 * is `"<name>_"` unless the variable is isolated in its own file, so several quantities can share
 * one file without colliding dimension names.
 *
 * Handles are borrowed: logged :cpp:class:`series::ISeries` objects must outlive the session.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   Variable v("flux_nkor", Variable::Kind::Flat, false, cfg.names);
 *   v.log(element1_nkor);           // rank 1, extent 2 -> rows element1_0, element1_1
 *   v.log(element2_nkor);
 *   v.write(file);                  // `flux_nkor_station_names`, `flux_nkor`
 * @endrst
 */

namespace seriesio::io
{

class ArrayFile;

class Variable
{
  public:
    enum class Kind
    {
        Deep,
        Agg,
        Flat
    };

    struct Entry
    {
        series::ISeries* handle = nullptr;
        std::optional<series::LoggedArray> array;
    };

    Variable(std::string name, Kind kind, bool isolate, NameMapping names);

    const std::string& name() const noexcept { return name_; }
    Kind kind() const noexcept { return kind_; }
    bool isolate() const noexcept { return isolate_; }

    /// Record `handle` (and an optional array to write instead of its series) under its device
    /// name. A later log for the same device replaces the earlier one.
    void log(series::ISeries& handle, std::optional<series::LoggedArray> array = std::nullopt);

    std::vector<std::string> devicenames() const;
    const Entry& entry(const std::string& device) const;
    const Entry* find(const std::string& device) const noexcept;

    std::string prefix() const;

    std::vector<std::string> subdevicenames() const;
    std::vector<std::string> dimensions() const;
    std::vector<std::size_t> shape() const;
    /// Dense row-major block of shape(); cells outside a device's extents hold the fill value.
    std::vector<double> array() const;

    void insert_subdevicenames(ArrayFile& file) const;
    std::vector<std::string> query_subdevicenames(const ArrayFile& file) const;
    Subdevice2Index query_subdevice2index(const ArrayFile& file) const;

    void read(const ArrayFile& file, const time::Timegrid& window);
    void write(ArrayFile& file) const;

  private:
    std::size_t max_rank() const;

    std::string name_;
    Kind kind_;
    bool isolate_;
    NameMapping names_;

    std::vector<std::string> order_; // device names, first-log order
    std::unordered_map<std::string, Entry> entries_;
};

const char* to_string(Variable::Kind kind) noexcept;

} // namespace seriesio::io
