#include "Errors.hpp"
#include "Log.hpp"
#include "io/ArrayFile.hpp"
#include "io/CharMatrix.hpp"
#include "io/ConfigYAML.hpp"
#include "time/Timegrid.hpp"

#include <iostream>
#include <string>
#include <vector>

using seriesio::io::AppConfig;
using seriesio::io::ArrayFile;
using seriesio::io::DType;
using seriesio::io::load_config_from_yaml;

static std::string join(const std::vector<std::string>& v)
{
    std::string s = "(";
    for (std::size_t i = 0; i < v.size(); ++i)
        s += (i ? ", " : "") + v[i];
    return s + ")";
}

static std::string join(const std::vector<std::size_t>& v)
{
    std::string s = "(";
    for (std::size_t i = 0; i < v.size(); ++i)
        s += (i ? ", " : "") + std::to_string(v[i]);
    return s + ")";
}

static bool ends_with(const std::string& s, const std::string& suffix)
{
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

/* ---------------- array file listing ---------------- */
static int inspect_file(const std::string& path)
{
    ArrayFile f(path, ArrayFile::Mode::Read);

    std::cout << "file: " << path << "\n";
    std::cout << "dimensions:\n";
    for (const auto& d : f.dimension_names())
        std::cout << "  " << d << " = " << f.dimension_length(d) << "\n";

    std::cout << "variables:\n";
    const auto names = f.variable_names();
    for (const auto& v : names)
    {
        std::cout << "  " << v << " : " << seriesio::io::to_string(f.variable_dtype(v)) << " "
                  << join(f.variable_dimensions(v)) << " shape=" << join(f.variable_shape(v));
        if (f.has_attribute(v, "units"))
            std::cout << " units=\"" << f.attribute(v, "units") << "\"";
        std::cout << "\n";
    }

    for (const auto& v : names)
    {
        if (!ends_with(v, "station_names") || f.variable_dtype(v) != DType::Char)
            continue;
        const auto shape = f.variable_shape(v);
        if (shape.size() != 2)
            continue;
        std::cout << v << ":\n";
        for (const auto& label : seriesio::io::chars2str(f.read_chars(v), shape[0], shape[1]))
            std::cout << "  " << label << "\n";
    }
    f.close();
    return 0;
}

/* ---------------- configuration echo ---------------- */
static int inspect_config(const std::string& path)
{
    const AppConfig cfg = load_config_from_yaml(path);
    const auto& io = cfg.io;
    if (cfg.log_level)
        seriesio::logx::set_level(*cfg.log_level);
    std::cout << "config: " << path << "\n"
              << "  paths: node=" << io.paths.node << " input=" << io.paths.input
              << " output=" << io.paths.output << " extension=" << io.paths.extension << "\n"
              << "  dimensions: timepoints=" << io.names.dims.timepoints
              << " subdevices=" << io.names.dims.subdevices
              << " characters=" << io.names.dims.characters << "\n"
              << "  variables: timepoints=" << io.names.vars.timepoints
              << " subdevices=" << io.names.vars.subdevices << "\n"
              << "  fill_value: " << io.names.fill_value << "\n"
              << "  policy: flatten=" << std::boolalpha << cfg.flatten
              << " isolate=" << cfg.isolate << " atomic_write=" << io.atomic_write << "\n"
              << "  time unit: " << io.time_unit << "\n"
              << "  window: " << (io.sim_window ? io.sim_window->to_string() : "<none>") << "\n"
              << "  log level: " << seriesio::logx::level_name(seriesio::logx::level()) << "\n";
    return 0;
}

int main(int argc, char** argv)
{
    // SERIESIO_LOG=quiet|error|warn|info|debug overrides the level
    seriesio::logx::init();

    const std::vector<std::string> args(argv + 1, argv + argc);
    const bool config_mode = args.size() == 2 && args[0] == "--config";
    if (!config_mode && args.size() != 1)
    {
        std::cerr << "usage: " << argv[0] << " <file>\n"
                  << "       " << argv[0] << " --config <yaml>\n";
        return 2;
    }

    try
    {
        return config_mode ? inspect_config(args[1]) : inspect_file(args[0]);
    }
    catch (const seriesio::Error& e)
    {
        LOGE("%s error: %s\n", seriesio::to_string(e.kind()), e.what());
        return 1;
    }
    catch (const std::exception& e)
    {
        LOGE("%s\n", e.what());
        return 1;
    }
}
