#pragma once
#include "time/Timegrid.hpp"
#include <optional>
#include <string>

/**
 * @file IoConfig.hpp
 * @brief Naming, path and time configuration shared by one I/O session.
 *
 * @details
 * `NameMapping` translates the logical axis/variable roles (time points, (sub)devices, name
 * characters) to the names used inside the files, and fixes the fill value for padded cells.
 * `PathConfig` selects the base directory of every file: files whose key contains `"node"` live in
 * `node`; all others are read from `input` and written to `output`.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   IoConfig cfg;
 *   cfg.names.dims.subdevices = "location";  // "<var>_location" instead of "<var>_stations"
 *   cfg.names.fill_value      = -777.0;
 *   cfg.paths.output          = "out/series";
 *   cfg.sim_window            = Timegrid(first, last, std::chrono::hours{1});
 * @endrst
 */

namespace seriesio::io
{

struct DimensionNames
{
    std::string timepoints = "time";
    std::string subdevices = "stations";
    std::string characters = "char_leng_name";
};

struct VariableNames
{
    std::string timepoints = "time";
    std::string subdevices = "station_names";
};

struct NameMapping
{
    DimensionNames dims;
    VariableNames vars;
    double fill_value = -999.0;
};

struct PathConfig
{
    std::string node = "nodes";
    std::string input = "input";
    std::string output = "output";
    std::string extension = "h5";
};

struct IoConfig
{
    NameMapping names;
    PathConfig paths;
    std::string time_unit = "hours"; // unit of the time variable written by Interface::write
    std::optional<time::Timegrid> sim_window;
    bool atomic_write = true; // write to "<path>.part" and rename on success
};

} // namespace seriesio::io
