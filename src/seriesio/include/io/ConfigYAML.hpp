#pragma once
#include "Errors.hpp"
#include "Log.hpp"
#include "io/IoConfig.hpp"
#include "time/Timegrid.hpp"

#include <cctype>
#include <optional>
#include <string>
#include <yaml-cpp/yaml.h>

/**
 * @file   ConfigYAML.hpp
 * @brief  YAML → AppConfig loader for series I/O sessions.
 *
 * @details
 * @rst
 * This file defines:
 *
 * - :cpp:struct:`AppConfig`: the I/O configuration plus the session layout policy
 * - :cpp:func:`load_config_from_yaml`: parses a YAML file into :cpp:struct:`AppConfig`
 *
 * **Schema**
 *
 * .. code-block:: yaml
 *
 *    paths:
 *      node: nodes                  # files whose name contains "node"
 *      input: input                 # all other files, read
 *      output: output               # all other files, written
 *      extension: h5
 *
 *    names:
 *      dimensions:
 *        timepoints: time
 *        subdevices: stations
 *        characters: char_leng_name
 *      variables:
 *        timepoints: time
 *        subdevices: station_names
 *      fill_value: -999.0
 *
 *    time:
 *      unit: hours                  # seconds | minutes | hours | days
 *      window:                      # optional; required for writing
 *        first: "2000-01-01 00:00:00"
 *        last:  "2000-01-05 00:00:00"
 *        step: 1d                   # <n>s | <n>m | <n>h | <n>d
 *
 *    policy:
 *      flatten: false
 *      isolate: false
 *      atomic_write: true           # write "<file>.part", rename on success
 *
 *    log:
 *      level: warn                  # quiet | error | warn | info | debug
 *
 * Missing keys keep their defaults. A malformed date, step or unit raises
 * :cpp:class:`seriesio::Error`; YAML syntax errors propagate as ``YAML::Exception``.
 * @endrst
 */

namespace seriesio::io
{

struct AppConfig
{
    IoConfig io;
    bool flatten = false;
    bool isolate = false;
    std::optional<logx::Level> log_level; // unset: SERIESIO_LOG decides
};

static inline std::string to_lower(std::string s)
{
    for (auto& c : s)
        c = (char) std::tolower((unsigned char) c);
    return s;
}

inline AppConfig load_config_from_yaml(const std::string& path)
{
    AppConfig cfg;
    YAML::Node root = YAML::LoadFile(path);

    if (auto P = root["paths"])
    {
        if (auto n = P["node"])
            cfg.io.paths.node = n.as<std::string>();
        if (auto n = P["input"])
            cfg.io.paths.input = n.as<std::string>();
        if (auto n = P["output"])
            cfg.io.paths.output = n.as<std::string>();
        if (auto n = P["extension"])
        {
            auto ext = n.as<std::string>();
            if (!ext.empty() && ext.front() == '.')
                ext.erase(0, 1);
            cfg.io.paths.extension = ext;
        }
    }

    if (auto N = root["names"])
    {
        if (auto D = N["dimensions"])
        {
            if (auto n = D["timepoints"])
                cfg.io.names.dims.timepoints = n.as<std::string>();
            if (auto n = D["subdevices"])
                cfg.io.names.dims.subdevices = n.as<std::string>();
            if (auto n = D["characters"])
                cfg.io.names.dims.characters = n.as<std::string>();
        }
        if (auto V = N["variables"])
        {
            if (auto n = V["timepoints"])
                cfg.io.names.vars.timepoints = n.as<std::string>();
            if (auto n = V["subdevices"])
                cfg.io.names.vars.subdevices = n.as<std::string>();
        }
        if (auto n = N["fill_value"])
            cfg.io.names.fill_value = n.as<double>();
    }

    if (auto T = root["time"])
    {
        if (auto n = T["unit"])
        {
            const auto unit = to_lower(n.as<std::string>());
            time::unit_seconds(unit); // validate
            cfg.io.time_unit = unit;
        }
        if (auto W = T["window"])
        {
            if (!W["first"] || !W["last"] || !W["step"])
                throw Error(ErrorKind::InvalidArgument,
                            "Config `" + path +
                                "`: time.window requires the keys `first`, `last` and `step`.");
            cfg.io.sim_window = time::Timegrid(time::parse_date(W["first"].as<std::string>()),
                                               time::parse_date(W["last"].as<std::string>()),
                                               time::parse_stepsize(W["step"].as<std::string>()));
        }
    }

    if (auto P = root["policy"])
    {
        if (auto n = P["flatten"])
            cfg.flatten = n.as<bool>();
        if (auto n = P["isolate"])
            cfg.isolate = n.as<bool>();
        if (auto n = P["atomic_write"])
            cfg.io.atomic_write = n.as<bool>();
    }

    if (auto L = root["log"])
    {
        if (auto n = L["level"])
        {
            const auto name = n.as<std::string>();
            cfg.log_level = logx::parse_level(name);
            if (!cfg.log_level)
                throw Error(ErrorKind::InvalidArgument,
                            "Config `" + path + "`: unknown log level `" + name + "`.");
        }
    }

    return cfg;
}

} // namespace seriesio::io
