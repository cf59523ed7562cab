#include "app/AlertHistory.hpp"
#include "model/Json.hpp"
#include "store/StateStore.hpp"
#include "util/HostInfo.hpp"

#include <algorithm>
#include <cstdio>
#include <mutex>

namespace skynode::app {

AlertHistory::AlertHistory(size_t max_records, store::StateStore* store)
    : max_records_(std::max<size_t>(1, max_records)), store_(store) {}

util::Result<void> AlertHistory::load() {
  if (!store_) return {};
  auto loaded = store_->load_records();
  if (!loaded) return std::unexpected(loaded.error());
  std::unique_lock lk(mu_);
  records_.clear();
  for (auto& r : *loaded) {
    if (records_.size() == max_records_) {
      if (auto d = store_->delete_record(records_.front().id); !d)
        std::fprintf(stderr, "skynode: history: %s\n", d.error().message.c_str());
      records_.pop_front();
    }
    records_.push_back(std::move(r));
  }
  return {};
}

model::AlertRecord AlertHistory::record(const model::AlertEvent& event) {
  model::AlertRecord rec;
  rec.id = util::make_uuid();
  rec.event = event;
  rec.acknowledged = false;
  // Store writes happen under mu_ so they land in the same order as the
  // in-memory changes.
  std::unique_lock lk(mu_);
  if (records_.size() >= max_records_) {
    if (store_) {
      if (auto r = store_->delete_record(records_.front().id); !r)
        std::fprintf(stderr, "skynode: history: %s\n", r.error().message.c_str());
    }
    records_.pop_front();
  }
  records_.push_back(rec);
  if (store_) {
    if (auto r = store_->save_record(rec); !r)
      std::fprintf(stderr, "skynode: history: cannot save record: %s\n", r.error().message.c_str());
  }
  return rec;
}

util::Result<void> AlertHistory::acknowledge(std::string_view id) {
  std::unique_lock lk(mu_);
  auto it = std::find_if(records_.begin(), records_.end(), [&](const auto& r){ return r.id == id; });
  if (it == records_.end())
    return util::fail(util::Errc::RecordNotFound, "no alert record '" + std::string(id) + "'");
  if (it->acknowledged) return {};
  it->acknowledged = true;
  if (store_) {
    if (auto r = store_->save_record(*it); !r)
      std::fprintf(stderr, "skynode: history: cannot save acknowledgment: %s\n", r.error().message.c_str());
  }
  return {};
}

void AlertHistory::clear() {
  std::unique_lock lk(mu_);
  records_.clear();
  if (store_) {
    if (auto r = store_->clear_records(); !r)
      std::fprintf(stderr, "skynode: history: %s\n", r.error().message.c_str());
  }
}

std::vector<model::AlertRecord> AlertHistory::list() const {
  std::shared_lock lk(mu_);
  return {records_.begin(), records_.end()};
}

std::vector<model::AlertRecord> AlertHistory::unacknowledged() const {
  std::shared_lock lk(mu_);
  std::vector<model::AlertRecord> out;
  for (const auto& r : records_)
    if (!r.acknowledged) out.push_back(r);
  return out;
}

std::optional<model::AlertRecord> AlertHistory::find(std::string_view id) const {
  std::shared_lock lk(mu_);
  for (const auto& r : records_)
    if (r.id == id) return r;
  return std::nullopt;
}

size_t AlertHistory::size() const {
  std::shared_lock lk(mu_);
  return records_.size();
}

bool AlertHistory::has_unacknowledged_severe(std::string_view source_node_id) const {
  std::shared_lock lk(mu_);
  return std::any_of(records_.begin(), records_.end(), [&](const auto& r){
    return !r.acknowledged && model::is_severe(r.event.severity) && r.event.source_node_id == source_node_id;
  });
}

std::string AlertHistory::export_json() const {
  return model::write_pretty(model::records_to_json(list()));
}

} // namespace skynode::app
