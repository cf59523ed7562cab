#include "app/MetricSampler.hpp"

#include <cmath>
#include <cstdio>

namespace skynode::app {

// Repeated read errors are logged on the first failure and then every Nth.
static constexpr uint64_t kLogEveryNthFailure = 60;

MetricSampler::MetricSampler(SampleSink sink) : sink_(std::move(sink)) {}

MetricSampler::~MetricSampler() { stop(); }

void MetricSampler::add_source(std::unique_ptr<collectors::ISensorSource> source, std::chrono::milliseconds interval) {
  auto slot = std::make_unique<Slot>();
  slot->source = std::move(source);
  slot->interval = interval < std::chrono::milliseconds(10) ? std::chrono::milliseconds(10) : interval;
  slots_.push_back(std::move(slot));
}

util::Result<std::vector<model::MetricSample>> MetricSampler::sample(collectors::ISensorSource& source,
                                                                     util::TimePoint now) {
  auto readings = source.read();
  if (!readings) return std::unexpected(readings.error());
  std::vector<model::MetricSample> out;
  out.reserve(readings->size());
  for (auto& r : *readings) {
    if (!std::isfinite(r.value)) continue;
    out.push_back(model::MetricSample{std::move(r.metric_name), r.value, now});
  }
  return out;
}

bool MetricSampler::poll(Slot& slot) {
  std::scoped_lock lk(slot.mu);
  if (!slot.active.load()) return false;
  auto* src = slot.source.get();
  if (!slot.initialized) {
    slot.initialized = true;
    if (auto r = src->init(); !r) {
      if (r.error().code == util::Errc::SensorUnavailable) {
        slot.active.store(false);
        std::fprintf(stderr, "skynode: sampler: %s sensors unavailable, skipping: %s\n",
                     src->name(), r.error().message.c_str());
        return false;
      }
      // anything else at init is treated like a failed read; retried next tick
      std::fprintf(stderr, "skynode: sampler: %s init: %s\n", src->name(), r.error().message.c_str());
    }
  }

  auto samples = sample(*src, util::Clock::now());
  if (!samples) {
    if (samples.error().code == util::Errc::SensorUnavailable) {
      slot.active.store(false);
      std::fprintf(stderr, "skynode: sampler: %s sensors went away, skipping: %s\n",
                   src->name(), samples.error().message.c_str());
      return false;
    }
    auto n = ++slot.consecutive_failures;
    if (n == 1 || n % kLogEveryNthFailure == 0)
      std::fprintf(stderr, "skynode: sampler: %s read failed (%llu in a row): %s\n", src->name(),
                   static_cast<unsigned long long>(n), samples.error().message.c_str());
    return true;
  }
  slot.consecutive_failures.store(0);
  for (const auto& s : *samples) {
    ++slot.samples;
    if (sink_) sink_(s);
  }
  return true;
}

void MetricSampler::run(Slot& slot, std::stop_token st) {
  while (!st.stop_requested()) {
    auto next = std::chrono::steady_clock::now() + slot.interval;
    if (!poll(slot)) return;
    std::unique_lock lk(wait_mu_);
    // wakes early only when stop is requested
    wait_cv_.wait_until(lk, st, next, []{ return false; });
  }
}

void MetricSampler::start() {
  for (auto& slot : slots_) {
    if (slot->thread.joinable() || !slot->active.load()) continue;
    Slot* s = slot.get();
    slot->thread = std::jthread([this, s](std::stop_token st){ run(*s, st); });
  }
}

void MetricSampler::stop() {
  for (auto& slot : slots_) {
    if (!slot->thread.joinable()) continue;
    slot->thread.request_stop();
  }
  for (auto& slot : slots_) {
    if (slot->thread.joinable()) slot->thread.join();
  }
}

size_t MetricSampler::sample_once() {
  size_t before = 0, after = 0;
  for (auto& slot : slots_) before += slot->samples.load();
  for (auto& slot : slots_) poll(*slot);
  for (auto& slot : slots_) after += slot->samples.load();
  return after - before;
}

std::vector<SourceStatus> MetricSampler::status() const {
  std::vector<SourceStatus> out;
  for (const auto& slot : slots_) {
    SourceStatus s;
    s.name = slot->source->name();
    s.family = slot->source->family();
    s.interval = slot->interval;
    s.active = slot->active.load();
    s.samples = slot->samples.load();
    s.consecutive_failures = slot->consecutive_failures.load();
    out.push_back(std::move(s));
  }
  return out;
}

} // namespace skynode::app
