#pragma once

#include <deque>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "model/Alert.hpp"
#include "util/Error.hpp"

namespace skynode::store { class StateStore; }

namespace skynode::app {

// Bounded, insertion-ordered log of alert records. Oldest records are evicted
// once max_records is reached.
class AlertHistory {
public:
  explicit AlertHistory(size_t max_records = 1000, store::StateStore* store = nullptr);
  AlertHistory(const AlertHistory&) = delete;
  AlertHistory& operator=(const AlertHistory&) = delete;

  // Restores persisted records, keeping the newest max_records.
  [[nodiscard]] util::Result<void> load();

  // Appends an unacknowledged record with a fresh id.
  model::AlertRecord record(const model::AlertEvent& event);

  // Idempotent. RecordNotFound when the id is not in the log.
  [[nodiscard]] util::Result<void> acknowledge(std::string_view id);

  void clear();

  [[nodiscard]] std::vector<model::AlertRecord> list() const;
  [[nodiscard]] std::vector<model::AlertRecord> unacknowledged() const;
  [[nodiscard]] std::optional<model::AlertRecord> find(std::string_view id) const;
  [[nodiscard]] size_t size() const;
  [[nodiscard]] size_t max_records() const { return max_records_; }

  // True while an Error/Critical record from this node is unacknowledged.
  [[nodiscard]] bool has_unacknowledged_severe(std::string_view source_node_id) const;

  // Pretty JSON array of every record, oldest first.
  [[nodiscard]] std::string export_json() const;

private:
  size_t max_records_;
  store::StateStore* store_;
  mutable std::shared_mutex mu_;
  std::deque<model::AlertRecord> records_;
};

} // namespace skynode::app
