#pragma once
#include "io/IoConfig.hpp"
#include "time/Timegrid.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

// Fresh scratch directory below the system temp dir; removed on scope exit.
struct TempDir
{
    fs::path path;

    explicit TempDir(const std::string& stem)
        : path(fs::temp_directory_path() / (stem + "_" + std::to_string(std::rand())))
    {
        fs::remove_all(path);
        fs::create_directories(path);
    }
    ~TempDir()
    {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    std::string file(const std::string& name) const { return (path / name).string(); }
};

// 2000-01-01 .. 2000-01-05, daily: 4 time points.
inline seriesio::time::Timegrid four_days()
{
    using namespace seriesio::time;
    return Timegrid(parse_date("2000-01-01 00:00:00"), parse_date("2000-01-05 00:00:00"),
                    std::chrono::hours{24});
}

// Reading and writing share one directory so written files can be read back.
inline seriesio::io::IoConfig config_in(const TempDir& dir)
{
    seriesio::io::IoConfig cfg;
    cfg.paths.node = (dir.path / "nodes").string();
    cfg.paths.input = (dir.path / "series").string();
    cfg.paths.output = (dir.path / "series").string();
    cfg.time_unit = "days";
    cfg.sim_window = four_days();
    return cfg;
}
