#pragma once
#include "io/File.hpp"
#include "io/IoConfig.hpp"
#include "series/Series.hpp"

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @file Interface.hpp
 * @brief Session object distributing logged series over array files.
 *
 * @details
 * An Interface lives for one read or one write session. Series are logged one by one; each goes
 * to the :cpp:class:`File` named after its device category (or `"node"` for node-anchored
 * series). With `isolate` set, the quantity name and, for aggregated arrays, the aggregation
 * kind are appended, so every quantity gets a file of its own.
 *
 * `write()` derives one time unit (`"<unit> since <first date>"`) and one array of time points
 * from the configured simulation window and hands both to every file. `read()` reads every file,
 * each using the window stored in the file itself.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   Interface io(cfg, false, false);          // no flatten, no isolate
 *   io.log(nkor);                              // -> file "lland_v1", variable "flux_nkor"
 *   io.log(nkor, aggregate(nkor, "mean"));     // -> variable "flux_nkor_mean"
 *   io.log(sim);                               // -> file "node", variable "sim_q"
 *   io.write();
 * @endrst
 */

namespace seriesio::io
{

class Interface
{
  public:
    Interface(IoConfig cfg, bool flatten, bool isolate);

    bool flatten() const noexcept { return flatten_; }
    bool isolate() const noexcept { return isolate_; }
    const IoConfig& config() const noexcept { return cfg_; }

    void log(series::ISeries& handle, std::optional<series::LoggedArray> array = std::nullopt);

    void read();
    void write();

    std::vector<std::string> filenames() const;
    File& file(const std::string& key);
    const File& file(const std::string& key) const;
    File* find_file(const std::string& key) noexcept;
    const File* find_file(const std::string& key) const noexcept;

  private:
    IoConfig cfg_;
    bool flatten_;
    bool isolate_;

    std::vector<std::unique_ptr<File>> files_; // registration order
    std::unordered_map<std::string, std::size_t> idx_;
};

} // namespace seriesio::io
