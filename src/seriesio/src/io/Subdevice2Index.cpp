#include "io/Subdevice2Index.hpp"
#include "Errors.hpp"

namespace seriesio::io
{

Subdevice2Index::Subdevice2Index(std::unordered_map<std::string, std::size_t> rows,
                                 std::string variable, std::string filepath)
    : rows_(std::move(rows)), variable_(std::move(variable)), filepath_(std::move(filepath))
{
}

std::size_t Subdevice2Index::get(const std::string& name) const
{
    auto it = rows_.find(name);
    if (it == rows_.end())
        throw Error(ErrorKind::MissingDeviceData,
                    "No data for sequence `" + variable_ + "` and (sub)device `" + name +
                        "` in file `" + filepath_ + "` available.");
    return it->second;
}

} // namespace seriesio::io
