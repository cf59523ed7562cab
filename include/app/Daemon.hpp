#pragma once

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "app/AlertHistory.hpp"
#include "app/ApiBackend.hpp"
#include "app/ApiServer.hpp"
#include "app/Config.hpp"
#include "app/MetricSampler.hpp"
#include "app/NodeDirectory.hpp"
#include "app/NotificationBroadcaster.hpp"
#include "app/RuleEngine.hpp"
#include "net/DiscoveryService.hpp"
#include "store/StateStore.hpp"
#include "store/TimeSeriesStore.hpp"

namespace skynode::app {

// One monitoring node: sensors feed the time series and the rule engine,
// fired alerts are recorded and fanned out to live peers, and the HTTP API
// and discovery run alongside. Constructed once from the resolved config.
class Daemon : public ApiBackend {
public:
  // transport null: libcurl.
  explicit Daemon(AppConfig cfg, std::unique_ptr<PeerTransport> transport = nullptr);
  ~Daemon() override;
  Daemon(const Daemon&) = delete;
  Daemon& operator=(const Daemon&) = delete;

  // Identity, persisted state and sensor registration. No threads yet.
  [[nodiscard]] util::Result<void> init();
  // Sampler, dispatcher, housekeeping, API server and discovery.
  [[nodiscard]] util::Result<void> start();
  void stop();

  // Sample path: store, evaluate, record, queue for broadcast.
  void ingest(const model::MetricSample& s);
  // Broadcast every queued alert on the calling thread; returns alerts sent.
  size_t drain_notifications();
  // Peer liveness sweep and time-series retention.
  void housekeeping(util::TimePoint now);

  [[nodiscard]] NodeDirectory& directory() { return *directory_; }
  [[nodiscard]] const AppConfig& config() const { return cfg_; }
  [[nodiscard]] uint16_t api_port() const;

  // ApiBackend
  [[nodiscard]] model::Node self_node() const override;
  [[nodiscard]] std::vector<model::MetricSample> hardware_snapshot() const override;
  [[nodiscard]] std::vector<model::MetricSample> metric_history(std::string_view metric, size_t max_points) const override;
  [[nodiscard]] std::vector<model::Node> peers() const override;
  bool forget_peer(std::string_view id) override;
  [[nodiscard]] std::vector<model::AlertRule> rules() const override;
  [[nodiscard]] util::Result<void> add_rule(model::AlertRule rule) override;
  [[nodiscard]] util::Result<void> toggle_rule(std::string_view id, bool enabled) override;
  [[nodiscard]] util::Result<void> remove_rule(std::string_view id) override;
  [[nodiscard]] std::vector<model::AlertRecord> history(bool unacknowledged_only) const override;
  [[nodiscard]] util::Result<void> acknowledge(std::string_view record_id) override;
  void clear_history() override;
  [[nodiscard]] std::string export_history() const override;
  [[nodiscard]] util::Result<void> receive_notification(model::AlertEvent event) override;

private:
  struct Pending {
    model::AlertEvent event;
    std::vector<std::string> notify_nodes;
  };

  [[nodiscard]] std::string resolve_node_id() const;
  void open_state();
  void register_sources();
  void size_series();
  void dispatch_loop(std::stop_token st);
  void housekeeping_loop(std::stop_token st);
  void dispatch(const Pending& p);

  AppConfig cfg_;
  std::unique_ptr<PeerTransport> transport_;
  model::Node self_;

  std::unique_ptr<store::StateStore> state_;
  store::TimeSeriesStore series_;
  std::unique_ptr<RuleEngine> rules_;
  std::unique_ptr<AlertHistory> history_;
  std::unique_ptr<NodeDirectory> directory_;
  std::unique_ptr<NotificationBroadcaster> broadcaster_;
  MetricSampler sampler_;

  std::unique_ptr<ApiServer> server_;
  std::unique_ptr<net::DiscoveryService> discovery_;

  std::mutex queue_mu_;
  std::condition_variable_any queue_cv_;
  std::deque<Pending> queue_;

  std::mutex wait_mu_;
  std::condition_variable_any wait_cv_;

  std::jthread dispatch_thread_;
  std::jthread housekeeping_thread_;
};

} // namespace skynode::app
