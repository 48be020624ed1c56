#include "series/Series.hpp"
#include "Errors.hpp"
#include "Log.hpp"

#include <algorithm>
#include <functional>
#include <limits>
#include <numeric>

namespace seriesio::series
{

std::size_t cells_of(const std::vector<std::size_t>& shape) noexcept
{
    return std::accumulate(shape.begin(), shape.end(), std::size_t(1), std::multiplies<>());
}

SeriesHandle::SeriesHandle(std::string device, std::string name, std::string category,
                           bool node_anchored, std::vector<std::size_t> shape,
                           time::Timegrid window)
    : device_(std::move(device)), name_(std::move(name)), category_(std::move(category)),
      node_anchored_(node_anchored), shape_(std::move(shape)), window_(window),
      values_(window_.size() * cells_of(shape_), std::numeric_limits<double>::quiet_NaN())
{
}

void SeriesHandle::set_series(std::vector<double> values)
{
    if (values.size() != values_.size())
        throw Error(ErrorKind::InvalidArgument,
                    "Series of `" + name_ + "` for device `" + device_ + "` requires " +
                        std::to_string(values_.size()) + " values, got " +
                        std::to_string(values.size()) + ".");
    values_ = std::move(values);
}

void SeriesHandle::adjust(const time::Timegrid& file_window, std::vector<double> values)
{
    const std::size_t cells = cells_of(shape_);
    if (values.size() != file_window.size() * cells)
        throw Error(ErrorKind::InvalidArgument,
                    "Data for `" + name_ + "` of device `" + device_ + "` holds " +
                        std::to_string(values.size()) + " values but the file window " +
                        file_window.to_string() + " requires " +
                        std::to_string(file_window.size() * cells) + ".");
    if (file_window.step() != window_.step())
        throw Error(ErrorKind::InvalidArgument,
                    "The step size of the file window " + file_window.to_string() +
                        " does not match the step size of the target window " +
                        window_.to_string() + " of `" + name_ + "` for device `" + device_ + "`.");
    if ((window_.first() - file_window.first()) % window_.step() != time::Seconds{0})
        throw Error(ErrorKind::InvalidArgument,
                    "The file window " + file_window.to_string() +
                        " is not aligned with the target window " + window_.to_string() + ".");

    const std::ptrdiff_t shift =
        std::ptrdiff_t((window_.first() - file_window.first()) / window_.step());
    const std::ptrdiff_t nfile = std::ptrdiff_t(file_window.size());
    std::vector<double> out(window_.size() * cells, std::numeric_limits<double>::quiet_NaN());
    std::size_t missing = 0;
    for (std::size_t t = 0; t < window_.size(); ++t)
    {
        const std::ptrdiff_t k = std::ptrdiff_t(t) + shift;
        if (k < 0 || k >= nfile)
        {
            ++missing;
            continue;
        }
        std::copy_n(values.begin() + k * std::ptrdiff_t(cells), cells,
                    out.begin() + std::ptrdiff_t(t * cells));
    }
    if (missing)
        LOGW("%zu of %zu time points of `%s` for device `%s` are not covered by the file "
             "window %s and are set to NaN\n",
             missing, window_.size(), name_.c_str(), device_.c_str(),
             file_window.to_string().c_str());
    values_ = std::move(out);
}

LoggedArray aggregate(const ISeries& s, std::string_view mode)
{
    if (mode != "mean")
        throw Error(ErrorKind::InvalidArgument,
                    "Aggregation mode `" + std::string(mode) + "` is not supported for `" +
                        s.name() + "` (use `mean`).");
    const std::size_t cells = cells_of(s.shape());
    const auto data = s.series();
    LoggedArray out;
    out.kind = std::string(mode);
    out.values.resize(s.timepoints());
    for (std::size_t t = 0; t < out.values.size(); ++t)
    {
        double sum = 0.0;
        for (std::size_t c = 0; c < cells; ++c)
            sum += data[t * cells + c];
        out.values[t] = sum / double(cells);
    }
    return out;
}

} // namespace seriesio::series
