#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * @file Timegrid.hpp
 * @brief Simulation time windows and CF-style unit strings ("hours since 2000-01-01 00:00:00").
 *
 * @details
 * A :cpp:class:`Timegrid` is a half-open interval `[first, last)` divided into equal steps. The
 * window is what :cpp:class:`seriesio::io::Interface` writes into every file's time variable and
 * what :cpp:class:`seriesio::io::File` reconstructs from it on read.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   using namespace seriesio::time;
 *   Timegrid tg(parse_date("2000-01-01"), parse_date("2000-01-05"), std::chrono::days{1});
 *   const std::string units = to_cfunits(tg.first(), "hours"); // "hours since 2000-01-01 00:00:00"
 *   const auto points = tg.to_timepoints("hours");             // 0, 24, 48, 72
 *   Timegrid back = Timegrid::from_timepoints(points, tg.first(), "hours");
 * @endrst
 */

namespace seriesio::time
{

using Seconds = std::chrono::seconds;
using TimePoint = std::chrono::sys_seconds;

// "YYYY-MM-DD[ T]HH:MM[:SS][Z|+HH:MM|-HH:MM]", time of day optional; result is UTC.
TimePoint parse_date(std::string_view text);
std::string format_date(TimePoint t); // "YYYY-MM-DD HH:MM:SS"

// seconds | minutes | hours | days (singular forms accepted)
Seconds unit_seconds(std::string_view unit);

// "1d", "6h", "30m", "15s" or a plain number of seconds
Seconds parse_stepsize(std::string_view text);

std::string to_cfunits(TimePoint refdate, std::string_view unit);

struct CfUnits
{
    std::string unit;
    TimePoint refdate;
};
CfUnits parse_cfunits(std::string_view text);

class Timegrid
{
  public:
    Timegrid(TimePoint first, TimePoint last, Seconds step);

    TimePoint first() const noexcept { return first_; }
    TimePoint last() const noexcept { return last_; }
    Seconds step() const noexcept { return step_; }

    /// Number of steps (= number of time points).
    std::size_t size() const noexcept { return std::size_t((last_ - first_) / step_); }

    TimePoint at(std::size_t i) const { return first_ + step_ * std::int64_t(i); }

    /// Offsets of all time points relative to `first()`, expressed in `unit`.
    std::vector<double> to_timepoints(std::string_view unit) const;

    /// Inverse of `to_timepoints`; needs at least two equally spaced points.
    static Timegrid from_timepoints(std::span<const double> points, TimePoint refdate,
                                    std::string_view unit);

    bool operator==(const Timegrid&) const = default;

    std::string to_string() const;

  private:
    TimePoint first_;
    TimePoint last_;
    Seconds step_;
};

} // namespace seriesio::time
