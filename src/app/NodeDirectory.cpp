#include "app/NodeDirectory.hpp"

#include <cstdio>
#include <mutex>

namespace skynode::app {

NodeDirectory::NodeDirectory(model::Node self, DirectoryOptions opts, AlertingQuery alerting)
    : self_(std::move(self)), opts_(opts), alerting_(std::move(alerting)) {}

model::Node NodeDirectory::present(const model::Node& n) const {
  model::Node out = n;
  if (out.status != model::NodeStatus::Offline && alerting_ && alerting_(out.id))
    out.status = model::NodeStatus::Alerting;
  return out;
}

bool NodeDirectory::upsert(model::Node node, util::TimePoint now) {
  if (node.id.empty() || node.id == self_.id) return false;
  node.last_seen = now;
  node.status = model::NodeStatus::Online;
  std::unique_lock lk(mu_);
  auto it = peers_.find(node.id);
  if (it == peers_.end()) {
    std::fprintf(stderr, "skynode: directory: discovered %s (%s) at %s\n",
                 node.name.c_str(), node.id.c_str(), node.api_url().c_str());
    auto id = node.id;
    peers_.emplace(std::move(id), std::move(node));
    return true;
  }
  if (it->second.status == model::NodeStatus::Offline)
    std::fprintf(stderr, "skynode: directory: %s is back online\n", node.name.c_str());
  it->second = std::move(node);
  return true;
}

NodeDirectory::SweepResult NodeDirectory::sweep(util::TimePoint now) {
  SweepResult res;
  std::unique_lock lk(mu_);
  for (auto it = peers_.begin(); it != peers_.end();) {
    auto silence = now - it->second.last_seen;
    if (silence > opts_.expire_after) {
      std::fprintf(stderr, "skynode: directory: forgetting %s after %llds of silence\n",
                   it->second.name.c_str(),
                   static_cast<long long>(std::chrono::duration_cast<std::chrono::seconds>(silence).count()));
      it = peers_.erase(it);
      ++res.expired;
      continue;
    }
    if (silence > opts_.liveness_timeout && it->second.status != model::NodeStatus::Offline) {
      it->second.status = model::NodeStatus::Offline;
      ++res.marked_offline;
      std::fprintf(stderr, "skynode: directory: %s went offline\n", it->second.name.c_str());
    }
    ++it;
  }
  return res;
}

bool NodeDirectory::remove(std::string_view id) {
  std::unique_lock lk(mu_);
  auto it = peers_.find(id);
  if (it == peers_.end()) return false;
  peers_.erase(it);
  return true;
}

void NodeDirectory::clear() {
  std::unique_lock lk(mu_);
  peers_.clear();
}

std::vector<model::Node> NodeDirectory::peers() const {
  std::shared_lock lk(mu_);
  std::vector<model::Node> out;
  out.reserve(peers_.size());
  for (const auto& [id, n] : peers_) out.push_back(present(n));
  return out;
}

std::vector<model::Node> NodeDirectory::live_peers() const {
  std::shared_lock lk(mu_);
  std::vector<model::Node> out;
  for (const auto& [id, n] : peers_)
    if (n.status != model::NodeStatus::Offline) out.push_back(present(n));
  return out;
}

std::optional<model::Node> NodeDirectory::find(std::string_view id) const {
  std::shared_lock lk(mu_);
  auto it = peers_.find(id);
  if (it == peers_.end()) return std::nullopt;
  return present(it->second);
}

size_t NodeDirectory::size() const {
  std::shared_lock lk(mu_);
  return peers_.size();
}

} // namespace skynode::app
