#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "model/Metric.hpp"
#include "store/RingBuffer.hpp"

namespace skynode::store {

// Per-metric bounded history. The map lock is held only to find or create a
// series; each series has its own lock, so writers of different metrics never
// contend.
class TimeSeriesStore {
public:
  explicit TimeSeriesStore(size_t default_capacity = 86400);
  TimeSeriesStore(const TimeSeriesStore&) = delete;
  TimeSeriesStore& operator=(const TimeSeriesStore&) = delete;

  // Capacity for one metric. Applies to an existing series (newest samples kept)
  // or to the series created by the first append.
  void set_capacity(std::string_view metric, size_t capacity);
  [[nodiscard]] size_t capacity_of(std::string_view metric) const;

  void append(const model::MetricSample& s);

  // Most recent min(max_points, len) samples, oldest first. Unknown metric: empty.
  [[nodiscard]] std::vector<model::MetricSample> query(std::string_view metric, size_t max_points) const;

  [[nodiscard]] std::optional<model::MetricSample> latest(std::string_view metric) const;

  // Latest sample of every metric, ordered by name.
  [[nodiscard]] std::vector<model::MetricSample> latest_all() const;

  [[nodiscard]] std::vector<std::string> metric_names() const;

  // Mean of the last n samples; nullopt for an unknown or empty metric.
  [[nodiscard]] std::optional<double> average(std::string_view metric, size_t last_n) const;

  // Drop samples stamped before cutoff. Returns the number removed.
  size_t cleanup_older_than(util::TimePoint cutoff);

  // Full copy of every series, ordered by name.
  [[nodiscard]] std::map<std::string, std::vector<model::MetricSample>> snapshot() const;

private:
  struct Series {
    explicit Series(size_t capacity) : ring(capacity) {}
    mutable std::mutex mu;
    RingBuffer<model::MetricSample> ring;
  };

  [[nodiscard]] Series* find(std::string_view metric) const;

  size_t default_capacity_;
  mutable std::shared_mutex map_mu_;
  std::unordered_map<std::string, std::unique_ptr<Series>> series_;
  std::unordered_map<std::string, size_t> capacities_;
};

} // namespace skynode::store
