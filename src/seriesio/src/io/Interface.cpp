#include "io/Interface.hpp"
#include "Errors.hpp"
#include "Log.hpp"

#include <utility>

namespace seriesio::io
{

Interface::Interface(IoConfig cfg, bool flatten, bool isolate)
    : cfg_(std::move(cfg)), flatten_(flatten), isolate_(isolate)
{
}

void Interface::log(series::ISeries& handle, std::optional<series::LoggedArray> array)
{
    std::string key = handle.node_anchored() ? std::string("node") : handle.category();
    if (isolate_)
    {
        key += "_" + handle.name();
        if (array && array->aggregated())
            key += "_" + array->kind;
    }

    File* f = find_file(key);
    if (!f)
    {
        idx_.emplace(key, files_.size());
        files_.push_back(std::make_unique<File>(key, flatten_, isolate_, cfg_));
        f = files_.back().get();
    }
    f->log(handle, std::move(array));
}

void Interface::read()
{
    for (auto& f : files_)
        f->read();
}

void Interface::write()
{
    if (files_.empty())
        return;
    if (!cfg_.sim_window)
        throw Error(ErrorKind::NoGlobalWindow,
                    "Writing series data requires a simulation time window, but none is "
                    "configured.");
    const time::Timegrid& window = *cfg_.sim_window;
    const std::string timeunit = time::to_cfunits(window.first(), cfg_.time_unit);
    const std::vector<double> timepoints = window.to_timepoints(cfg_.time_unit);
    LOGD("writing %zu file(s), time unit `%s`\n", files_.size(), timeunit.c_str());
    for (auto& f : files_)
        f->write(timeunit, timepoints);
}

std::vector<std::string> Interface::filenames() const
{
    std::vector<std::string> out;
    out.reserve(files_.size());
    for (const auto& f : files_)
        out.push_back(f->name());
    return out;
}

File& Interface::file(const std::string& key)
{
    return const_cast<File&>(std::as_const(*this).file(key));
}

const File& Interface::file(const std::string& key) const
{
    if (const File* f = find_file(key))
        return *f;
    throw Error(ErrorKind::NotRegistered,
                "The current interface does not handle a file named `" + key + "`.");
}

File* Interface::find_file(const std::string& key) noexcept
{
    return const_cast<File*>(std::as_const(*this).find_file(key));
}

const File* Interface::find_file(const std::string& key) const noexcept
{
    auto it = idx_.find(key);
    return it == idx_.end() ? nullptr : files_[it->second].get();
}

} // namespace seriesio::io
