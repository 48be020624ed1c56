#pragma once
#include "time/Timegrid.hpp"
#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * @file Series.hpp
 * @brief Device-scoped time series handles and the arrays logged for writing.
 *
 * @details
 * :cpp:class:`ISeries` is what the I/O layer sees of a device's quantity: its identity
 * (device, quantity name, category), its spatial extents, and a row-major value block of shape
 * `(ntime, n1, ..., nR)`. Storage is owned by the device model; the I/O layer only keeps
 * non-owning pointers for the lifetime of one session.
 *
 * :cpp:func:`ISeries::adjust` receives values read from a file together with the file's own
 * time window and is responsible for aligning them to the handle's target window.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   SeriesHandle nkor("element2", "flux_nkor", "lland_v1", false, {2}, window);
 *   nkor.values()[0] = 16.0;                      // (t=0, hru=0)
 *   LoggedArray mean = aggregate(nkor, "mean");   // write-only spatial mean
 * @endrst
 */

namespace seriesio::series
{

inline constexpr const char* kUnmodified = "unmodified";

class ISeries
{
  public:
    virtual ~ISeries() = default;

    virtual const std::string& device_name() const = 0;
    virtual const std::string& name() const = 0;     // quantity base name, e.g. "flux_nkor"
    virtual const std::string& category() const = 0; // e.g. the owning model's name
    virtual bool node_anchored() const = 0;

    virtual const std::vector<std::size_t>& shape() const = 0; // spatial extents only
    virtual std::size_t timepoints() const = 0;
    virtual std::span<const double> series() const = 0;

    /// Replace the series with `values` (shape `(file_window.size(), shape()...)`), realigned
    /// to this handle's own window.
    virtual void adjust(const time::Timegrid& file_window, std::vector<double> values) = 0;

    std::size_t ndim() const { return shape().size(); }
};

/// Number of values per time point (1 for rank 0).
std::size_t cells_of(const std::vector<std::size_t>& shape) noexcept;

/// Concrete handle owning its values over a target window (NaN-initialised).
class SeriesHandle final : public ISeries
{
  public:
    SeriesHandle(std::string device, std::string name, std::string category, bool node_anchored,
                 std::vector<std::size_t> shape, time::Timegrid window);

    const std::string& device_name() const override { return device_; }
    const std::string& name() const override { return name_; }
    const std::string& category() const override { return category_; }
    bool node_anchored() const override { return node_anchored_; }
    const std::vector<std::size_t>& shape() const override { return shape_; }
    std::size_t timepoints() const override { return window_.size(); }
    std::span<const double> series() const override { return values_; }

    void adjust(const time::Timegrid& file_window, std::vector<double> values) override;

    const time::Timegrid& window() const noexcept { return window_; }
    std::vector<double>& values() noexcept { return values_; }
    void set_series(std::vector<double> values);

  private:
    std::string device_;
    std::string name_;
    std::string category_;
    bool node_anchored_;
    std::vector<std::size_t> shape_;
    time::Timegrid window_;
    std::vector<double> values_;
};

struct LoggedArray
{
    std::string kind = kUnmodified;
    std::vector<double> values;

    bool aggregated() const noexcept { return kind != kUnmodified; }
};

/// Reduce the spatial axes of `s` per time point. Only "mean" is supported.
LoggedArray aggregate(const ISeries& s, std::string_view mode);

} // namespace seriesio::series
