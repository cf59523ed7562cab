#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "collectors/ISensorSource.hpp"
#include "model/Metric.hpp"
#include "util/Error.hpp"

namespace skynode::app {

using SampleSink = std::function<void(const model::MetricSample&)>;

struct SourceStatus {
  std::string name;
  model::MetricFamily family{};
  std::chrono::milliseconds interval{};
  bool active{true};
  uint64_t samples{0};
  uint64_t consecutive_failures{0};
};

// Polls each registered sensor source on its own jthread and cadence, stamps
// the readings and hands every sample to the sink on that thread, so one
// metric's samples reach the sink in production order.
class MetricSampler {
public:
  explicit MetricSampler(SampleSink sink);
  ~MetricSampler();
  MetricSampler(const MetricSampler&) = delete;
  MetricSampler& operator=(const MetricSampler&) = delete;

  void add_source(std::unique_ptr<collectors::ISensorSource> source, std::chrono::milliseconds interval);

  void start();
  void stop();

  // Stamp one source's readings. Errors are the source's own.
  [[nodiscard]] static util::Result<std::vector<model::MetricSample>> sample(collectors::ISensorSource& source,
                                                                             util::TimePoint now);

  // Poll every active source once on the calling thread; returns samples delivered.
  size_t sample_once();

  [[nodiscard]] std::vector<SourceStatus> status() const;

private:
  struct Slot {
    std::unique_ptr<collectors::ISensorSource> source;
    std::chrono::milliseconds interval{};
    bool initialized{false};
    std::atomic<bool> active{true};
    std::atomic<uint64_t> samples{0};
    std::atomic<uint64_t> consecutive_failures{0};
    std::mutex mu;  // one poll at a time per source
    std::jthread thread;
  };

  // Returns false once the source is disabled.
  bool poll(Slot& slot);
  void run(Slot& slot, std::stop_token st);

  SampleSink sink_;
  std::vector<std::unique_ptr<Slot>> slots_;
  std::mutex wait_mu_;
  std::condition_variable_any wait_cv_;
};

} // namespace skynode::app
