#include "io/File.hpp"
#include "Errors.hpp"
#include "Log.hpp"
#include "io/ArrayFile.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

namespace seriesio::io
{
namespace fs = std::filesystem;

File::File(std::string name, bool flatten, bool isolate, IoConfig cfg)
    : name_(std::move(name)), flatten_(flatten), isolate_(isolate), cfg_(std::move(cfg))
{
}

void File::log(series::ISeries& handle, std::optional<series::LoggedArray> array)
{
    const bool aggregated = array && array->aggregated();
    std::string key = handle.name();
    if (aggregated)
        key += "_" + array->kind;
    const Variable::Kind kind = aggregated ? Variable::Kind::Agg
                                : flatten_ ? Variable::Kind::Flat
                                           : Variable::Kind::Deep;

    Variable* var = find_variable(key);
    if (!var)
    {
        idx_.emplace(key, variables_.size());
        variables_.push_back(std::make_unique<Variable>(key, kind, isolate_, cfg_.names));
        var = variables_.back().get();
    }
    else if (var->kind() != kind)
    {
        throw Error(ErrorKind::InvalidArgument,
                    "Variable `" + key + "` of file `" + name_ + "` was created as a " +
                        to_string(var->kind()) + " variable and cannot store " +
                        to_string(kind) + " data of device `" + handle.device_name() + "`.");
    }
    var->log(handle, std::move(array));
}

std::string File::filepath(const std::string& base) const
{
    return (fs::path(base) / (name_ + "." + cfg_.paths.extension)).string();
}

std::string File::filepath_read() const
{
    return filepath(name_.find("node") != std::string::npos ? cfg_.paths.node : cfg_.paths.input);
}

std::string File::filepath_write() const
{
    return filepath(name_.find("node") != std::string::npos ? cfg_.paths.node
                                                            : cfg_.paths.output);
}

void File::read()
{
    const std::string path = filepath_read();
    try
    {
        ArrayFile f(path, ArrayFile::Mode::Read);
        const std::string& tvar = cfg_.names.vars.timepoints;
        const auto points = f.read_doubles(tvar);
        const auto cf = time::parse_cfunits(f.attribute(tvar, "units"));
        const auto window = time::Timegrid::from_timepoints(points, cf.refdate, cf.unit);
        for (auto& v : variables_)
            v->read(f, window);
        f.close();
        LOGI("read %zu variable(s) from `%s` over %s\n", variables_.size(), path.c_str(),
             window.to_string().c_str());
    }
    catch (const std::exception&)
    {
        rethrow_with_context("While trying to read data from file `" + path + "`");
    }
}

void File::write(const std::string& timeunit, std::span<const double> timepoints)
{
    const std::string path = filepath_write();
    const std::string target = cfg_.atomic_write ? path + ".part" : path;
    try
    {
        const fs::path parent = fs::path(path).parent_path();
        if (!parent.empty())
            fs::create_directories(parent);

        ArrayFile f(target, ArrayFile::Mode::Write);
        const std::string& tdim = cfg_.names.dims.timepoints;
        const std::string& tvar = cfg_.names.vars.timepoints;
        f.create_dimension(tdim, timepoints.size());
        f.create_variable(tvar, DType::Float64, {tdim}, cfg_.names.fill_value);
        f.write_doubles(tvar, timepoints);
        f.set_attribute(tvar, "units", timeunit);
        for (const auto& v : variables_)
            v->write(f);
        f.close();

        if (cfg_.atomic_write)
            fs::rename(target, path);
        LOGI("wrote %zu variable(s) to `%s`\n", variables_.size(), path.c_str());
    }
    catch (const std::exception&)
    {
        if (cfg_.atomic_write)
        {
            std::error_code ec;
            fs::remove(target, ec);
        }
        rethrow_with_context("While trying to write data to file `" + path + "`");
    }
}

std::vector<std::string> File::variablenames() const
{
    std::vector<std::string> out;
    out.reserve(variables_.size());
    for (const auto& v : variables_)
        out.push_back(v->name());
    return out;
}

Variable& File::variable(const std::string& key)
{
    return const_cast<Variable&>(std::as_const(*this).variable(key));
}

const Variable& File::variable(const std::string& key) const
{
    if (const Variable* v = find_variable(key))
        return *v;
    throw Error(ErrorKind::NotRegistered,
                "The file `" + name_ + "` does not handle a variable named `" + key + "`.");
}

Variable* File::find_variable(const std::string& key) noexcept
{
    return const_cast<Variable*>(std::as_const(*this).find_variable(key));
}

const Variable* File::find_variable(const std::string& key) const noexcept
{
    auto it = idx_.find(key);
    return it == idx_.end() ? nullptr : variables_[it->second].get();
}

} // namespace seriesio::io
