#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "model/Node.hpp"

namespace skynode::app {

struct DirectoryOptions {
  std::chrono::seconds liveness_timeout{30};  // silence before a peer goes Offline
  std::chrono::seconds expire_after{3600};    // silence before an Offline peer is dropped
};

// Answers whether a node is the source of a currently unacknowledged
// Error/Critical alert.
using AlertingQuery = std::function<bool(std::string_view node_id)>;

// Soft-state peer table fed by discovery announcements. Self is kept apart
// and never appears among the peers. Alerting is not stored: a live peer
// reads as Alerting whenever the query says so.
class NodeDirectory {
public:
  explicit NodeDirectory(model::Node self, DirectoryOptions opts = {}, AlertingQuery alerting = {});

  [[nodiscard]] const model::Node& self() const { return self_; }

  // Insert or refresh; false (and no change) when node is self.
  bool upsert(model::Node node, util::TimePoint now);

  struct SweepResult { size_t marked_offline{0}; size_t expired{0}; };
  SweepResult sweep(util::TimePoint now);

  bool remove(std::string_view id);
  void clear();

  [[nodiscard]] std::vector<model::Node> peers() const;
  [[nodiscard]] std::vector<model::Node> live_peers() const;  // status != Offline
  [[nodiscard]] std::optional<model::Node> find(std::string_view id) const;
  [[nodiscard]] size_t size() const;

private:
  // Stored status is Online or Offline; Alerting is layered on at read time.
  [[nodiscard]] model::Node present(const model::Node& n) const;

  model::Node self_;
  DirectoryOptions opts_;
  AlertingQuery alerting_;
  mutable std::shared_mutex mu_;
  std::map<std::string, model::Node, std::less<>> peers_;
};

} // namespace skynode::app
