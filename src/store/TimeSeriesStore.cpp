#include "store/TimeSeriesStore.hpp"

#include <algorithm>

namespace skynode::store {

TimeSeriesStore::TimeSeriesStore(size_t default_capacity)
    : default_capacity_(std::max<size_t>(1, default_capacity)) {}

void TimeSeriesStore::set_capacity(std::string_view metric, size_t capacity) {
  capacity = std::max<size_t>(1, capacity);
  std::unique_lock lk(map_mu_);
  capacities_[std::string(metric)] = capacity;
  auto it = series_.find(std::string(metric));
  if (it == series_.end()) return;
  std::scoped_lock slk(it->second->mu);
  it->second->ring.set_capacity(capacity);
}

size_t TimeSeriesStore::capacity_of(std::string_view metric) const {
  std::shared_lock lk(map_mu_);
  auto it = capacities_.find(std::string(metric));
  return it != capacities_.end() ? it->second : default_capacity_;
}

TimeSeriesStore::Series* TimeSeriesStore::find(std::string_view metric) const {
  std::shared_lock lk(map_mu_);
  auto it = series_.find(std::string(metric));
  return it != series_.end() ? it->second.get() : nullptr;
}

void TimeSeriesStore::append(const model::MetricSample& s) {
  Series* series = find(s.metric_name);
  if (!series) {
    std::unique_lock lk(map_mu_);
    auto cap_it = capacities_.find(s.metric_name);
    size_t cap = cap_it != capacities_.end() ? cap_it->second : default_capacity_;
    auto [it, inserted] = series_.try_emplace(s.metric_name, nullptr);
    if (inserted) it->second = std::make_unique<Series>(cap);
    series = it->second.get();
  }
  // Series are never erased, so the pointer outlives the map lock.
  std::scoped_lock lk(series->mu);
  series->ring.push(s);
}

std::vector<model::MetricSample> TimeSeriesStore::query(std::string_view metric, size_t max_points) const {
  Series* series = find(metric);
  if (!series) return {};
  std::scoped_lock lk(series->mu);
  return series->ring.tail(max_points);
}

std::optional<model::MetricSample> TimeSeriesStore::latest(std::string_view metric) const {
  Series* series = find(metric);
  if (!series) return std::nullopt;
  std::scoped_lock lk(series->mu);
  if (series->ring.empty()) return std::nullopt;
  return series->ring.back();
}

std::vector<model::MetricSample> TimeSeriesStore::latest_all() const {
  std::vector<model::MetricSample> out;
  {
    std::shared_lock lk(map_mu_);
    out.reserve(series_.size());
    for (const auto& [name, series] : series_) {
      std::scoped_lock slk(series->mu);
      if (!series->ring.empty()) out.push_back(series->ring.back());
    }
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b){ return a.metric_name < b.metric_name; });
  return out;
}

std::vector<std::string> TimeSeriesStore::metric_names() const {
  std::vector<std::string> out;
  {
    std::shared_lock lk(map_mu_);
    out.reserve(series_.size());
    for (const auto& [name, series] : series_) out.push_back(name);
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::optional<double> TimeSeriesStore::average(std::string_view metric, size_t last_n) const {
  Series* series = find(metric);
  if (!series) return std::nullopt;
  std::scoped_lock lk(series->mu);
  size_t n = std::min(last_n, series->ring.size());
  if (n == 0) return std::nullopt;
  double sum = 0.0;
  for (size_t i = series->ring.size() - n; i < series->ring.size(); ++i) sum += series->ring.at(i).value;
  return sum / static_cast<double>(n);
}

size_t TimeSeriesStore::cleanup_older_than(util::TimePoint cutoff) {
  size_t removed = 0;
  std::shared_lock lk(map_mu_);
  for (auto& [name, series] : series_) {
    std::scoped_lock slk(series->mu);
    removed += series->ring.drop_front_while([&](const model::MetricSample& s){ return s.timestamp < cutoff; });
  }
  return removed;
}

std::map<std::string, std::vector<model::MetricSample>> TimeSeriesStore::snapshot() const {
  std::map<std::string, std::vector<model::MetricSample>> out;
  std::shared_lock lk(map_mu_);
  for (const auto& [name, series] : series_) {
    std::scoped_lock slk(series->mu);
    out.emplace(name, series->ring.tail(series->ring.size()));
  }
  return out;
}

} // namespace skynode::store
