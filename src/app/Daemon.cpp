#include "app/Daemon.hpp"
#include "app/Version.hpp"
#include "collectors/CpuCollector.hpp"
#include "collectors/FanCollector.hpp"
#include "collectors/FsCollector.hpp"
#include "collectors/GpuCollector.hpp"
#include "collectors/MemoryCollector.hpp"
#include "collectors/ThermalCollector.hpp"
#include "net/CurlTransport.hpp"
#include "util/Env.hpp"
#include "util/HostInfo.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>

namespace skynode::app {

namespace fs = std::filesystem;

static constexpr std::chrono::seconds kHousekeepingEvery{5};

Daemon::Daemon(AppConfig cfg, std::unique_ptr<PeerTransport> transport)
    : cfg_(std::move(cfg)),
      transport_(std::move(transport)),
      series_(static_cast<size_t>(std::max<int64_t>(1, cfg_.retention.count()))),
      sampler_([this](const model::MetricSample& s){ ingest(s); }) {
  if (!transport_) transport_ = std::make_unique<net::CurlTransport>();
  if (cfg_.data_dir.empty()) cfg_.data_dir = util::default_data_dir();
}

Daemon::~Daemon() { stop(); }

std::string Daemon::resolve_node_id() const {
  const fs::path file = fs::path(cfg_.data_dir) / "node_id";
  {
    std::ifstream in(file);
    std::string id;
    if (in && std::getline(in, id) && !id.empty()) return id;
  }
  std::string id = util::make_uuid();
  std::error_code ec;
  fs::create_directories(file.parent_path(), ec);
  std::ofstream out(file, std::ios::trunc);
  if (!ec && out && (out << id << '\n'))
    return id;
  std::fprintf(stderr, "skynode: daemon: cannot persist node id to %s, it changes on restart\n", file.c_str());
  return id;
}

void Daemon::open_state() {
  const fs::path db_path = fs::path(cfg_.data_dir) / "skynode.db";
  if (auto st = store::StateStore::open(db_path)) {
    state_ = std::move(*st);
  } else {
    std::fprintf(stderr, "skynode: daemon: %s; rules and alert history are kept in memory only\n",
                 st.error().message.c_str());
  }

  rules_ = std::make_unique<RuleEngine>(state_.get());
  history_ = std::make_unique<AlertHistory>(cfg_.history_max_records, state_.get());
  auto rl = rules_->load();
  auto hl = rl ? history_->load() : util::Result<void>{};
  if (!rl || !hl) {
    std::fprintf(stderr, "skynode: daemon: cannot restore state: %s; continuing in memory\n",
                 (!rl ? rl.error() : hl.error()).message.c_str());
    state_.reset();
    rules_ = std::make_unique<RuleEngine>(nullptr);
    history_ = std::make_unique<AlertHistory>(cfg_.history_max_records, nullptr);
    if (auto r = rules_->load(); !r)
      std::fprintf(stderr, "skynode: daemon: %s\n", r.error().message.c_str());
  }
  rules_->set_source(self_.id, self_.name);
}

void Daemon::register_sources() {
  using model::MetricFamily;
  for (auto f : model::kAllFamilies) {
    if (!cfg_.is_enabled(f)) continue;
    std::unique_ptr<collectors::ISensorSource> src;
    switch (f) {
      case MetricFamily::Cpu:         src = std::make_unique<collectors::CpuCollector>(); break;
      case MetricFamily::Memory:      src = std::make_unique<collectors::MemoryCollector>(); break;
      case MetricFamily::Disk:        src = std::make_unique<collectors::FsCollector>(); break;
      case MetricFamily::Temperature: src = std::make_unique<collectors::ThermalCollector>(); break;
      case MetricFamily::Gpu:         src = std::make_unique<collectors::GpuCollector>(); break;
      case MetricFamily::Fan:         src = std::make_unique<collectors::FanCollector>(cfg_.fan_slow_rpm); break;
    }
    sampler_.add_source(std::move(src), cfg_.interval_of(f));
  }
}

// One retention window of samples per metric at its family's cadence.
void Daemon::size_series() {
  const auto retention_ms = std::chrono::duration_cast<std::chrono::milliseconds>(cfg_.retention).count();
  for (const auto& m : model::kMetricCatalog) {
    auto interval = std::max<int64_t>(1, cfg_.interval_of(m.family).count());
    series_.set_capacity(m.name, static_cast<size_t>(std::max<int64_t>(1, retention_ms / interval)));
  }
}

util::Result<void> Daemon::init() {
  self_.id = resolve_node_id();
  self_.name = cfg_.node_name.empty() ? util::host_name() : cfg_.node_name;
  self_.ip_address = util::primary_ipv4();
  self_.api_port = cfg_.api_port;
  self_.os_info = util::os_info();
  self_.version = kVersion;
  self_.status = model::NodeStatus::Online;
  self_.last_seen = util::Clock::now();

  open_state();
  directory_ = std::make_unique<NodeDirectory>(
    self_, DirectoryOptions{cfg_.liveness_timeout, cfg_.expire_after},
    [this](std::string_view id) { return history_->has_unacknowledged_severe(id); });
  broadcaster_ = std::make_unique<NotificationBroadcaster>(*transport_, cfg_.broadcast_timeout);
  size_series();
  register_sources();

  std::fprintf(stderr, "skynode: daemon: node %s (%s) v%s, data in %s\n",
               self_.name.c_str(), self_.id.c_str(), kVersion, cfg_.data_dir.c_str());
  return {};
}

util::Result<void> Daemon::start() {
  if (!directory_) return util::fail(util::Errc::BadRequest, "daemon started before init");

  server_ = std::make_unique<ApiServer>(*this, cfg_.api_port, cfg_.bind_address);
  if (auto r = server_->start(); !r) {
    server_.reset();
    return r;
  }
  if (cfg_.discovery_enabled) {
    net::DiscoveryOptions dopts;
    dopts.udp_port = cfg_.udp_port;
    dopts.interval = cfg_.discovery_interval;
    // Peers need the real port when 0 asked for an ephemeral one.
    model::Node announced = self_;
    announced.api_port = server_->bound_port();
    discovery_ = std::make_unique<net::DiscoveryService>(std::move(announced), dopts, [this](model::Node peer) {
      directory_->upsert(std::move(peer), util::Clock::now());
    });
    if (auto r = discovery_->start(); !r) {
      std::fprintf(stderr, "skynode: daemon: discovery disabled: %s\n", r.error().message.c_str());
      discovery_.reset();
    }
  }

  dispatch_thread_ = std::jthread([this](std::stop_token st){ dispatch_loop(st); });
  housekeeping_thread_ = std::jthread([this](std::stop_token st){ housekeeping_loop(st); });
  sampler_.start();
  return {};
}

void Daemon::stop() {
  sampler_.stop();
  if (discovery_) discovery_->stop();
  if (server_) server_->stop();
  for (auto* t : {&dispatch_thread_, &housekeeping_thread_})
    if (t->joinable()) t->request_stop();
  queue_cv_.notify_all();
  wait_cv_.notify_all();
  for (auto* t : {&dispatch_thread_, &housekeeping_thread_})
    if (t->joinable()) t->join();
}

uint16_t Daemon::api_port() const {
  return server_ ? server_->bound_port() : cfg_.api_port;
}

void Daemon::ingest(const model::MetricSample& s) {
  series_.append(s);
  auto events = rules_->evaluate(s);
  if (events.empty()) return;
  std::vector<Pending> fired;
  fired.reserve(events.size());
  for (auto& ev : events) {
    history_->record(ev);
    std::fprintf(stderr, "skynode: alerts: [%s] %s\n", model::to_string(ev.severity), ev.message.c_str());
    auto rule = rules_->find(ev.rule_id);
    fired.push_back(Pending{std::move(ev), rule ? rule->notify_nodes : std::vector<std::string>{}});
  }
  {
    std::scoped_lock lk(queue_mu_);
    for (auto& p : fired) queue_.push_back(std::move(p));
  }
  queue_cv_.notify_one();
}

void Daemon::dispatch(const Pending& p) {
  auto report = broadcaster_->broadcast(p.event, directory_->live_peers(), p.notify_nodes);
  if (report.attempted > 0)
    std::fprintf(stderr, "skynode: broadcast: %s delivered to %zu of %zu peers\n",
                 p.event.rule_id.c_str(), report.delivered, report.attempted);
}

size_t Daemon::drain_notifications() {
  size_t sent = 0;
  while (true) {
    Pending p;
    {
      std::scoped_lock lk(queue_mu_);
      if (queue_.empty()) break;
      p = std::move(queue_.front());
      queue_.pop_front();
    }
    dispatch(p);
    ++sent;
  }
  return sent;
}

void Daemon::dispatch_loop(std::stop_token st) {
  while (!st.stop_requested()) {
    {
      std::unique_lock lk(queue_mu_);
      if (!queue_cv_.wait(lk, st, [this]{ return !queue_.empty(); })) return;
    }
    drain_notifications();
  }
}

void Daemon::housekeeping(util::TimePoint now) {
  auto swept = directory_->sweep(now);
  if (swept.marked_offline || swept.expired)
    std::fprintf(stderr, "skynode: directory: %zu peer(s) offline, %zu expired\n", swept.marked_offline, swept.expired);
  series_.cleanup_older_than(now - cfg_.retention);
}

void Daemon::housekeeping_loop(std::stop_token st) {
  while (!st.stop_requested()) {
    {
      std::unique_lock lk(wait_mu_);
      wait_cv_.wait_for(lk, st, kHousekeepingEvery, []{ return false; });
    }
    if (st.stop_requested()) return;
    housekeeping(util::Clock::now());
  }
}

model::Node Daemon::self_node() const {
  model::Node n = self_;
  n.last_seen = util::Clock::now();
  n.status = history_->has_unacknowledged_severe(self_.id) ? model::NodeStatus::Alerting : model::NodeStatus::Online;
  if (server_) n.api_port = server_->bound_port();
  return n;
}

std::vector<model::MetricSample> Daemon::hardware_snapshot() const { return series_.latest_all(); }

std::vector<model::MetricSample> Daemon::metric_history(std::string_view metric, size_t max_points) const {
  return series_.query(metric, max_points);
}

std::vector<model::Node> Daemon::peers() const { return directory_->peers(); }

bool Daemon::forget_peer(std::string_view id) { return directory_->remove(id); }

std::vector<model::AlertRule> Daemon::rules() const { return rules_->list(); }

util::Result<void> Daemon::add_rule(model::AlertRule rule) { return rules_->add(std::move(rule)); }

util::Result<void> Daemon::toggle_rule(std::string_view id, bool enabled) { return rules_->toggle(id, enabled); }

util::Result<void> Daemon::remove_rule(std::string_view id) { return rules_->remove(id); }

std::vector<model::AlertRecord> Daemon::history(bool unacknowledged_only) const {
  return unacknowledged_only ? history_->unacknowledged() : history_->list();
}

util::Result<void> Daemon::acknowledge(std::string_view record_id) { return history_->acknowledge(record_id); }

void Daemon::clear_history() { history_->clear(); }

std::string Daemon::export_history() const { return history_->export_json(); }

util::Result<void> Daemon::receive_notification(model::AlertEvent event) {
  std::fprintf(stderr, "skynode: alerts: received [%s] from %s: %s\n", model::to_string(event.severity),
               event.source_node_name.c_str(), event.message.c_str());
  history_->record(event);
  return {};
}

} // namespace skynode::app
