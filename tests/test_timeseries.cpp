#include "minitest.hpp"
#include "store/RingBuffer.hpp"
#include "store/TimeSeriesStore.hpp"
#include <chrono>
#include <string>

using skynode::model::MetricSample;
using skynode::store::RingBuffer;
using skynode::store::TimeSeriesStore;
using namespace std::chrono_literals;

static const skynode::util::TimePoint t0 = skynode::util::from_epoch_ms(1'700'000'000'000LL);

TEST(ring_buffer_overwrites_oldest) {
  RingBuffer<int> rb(3);
  for (int i = 1; i <= 5; ++i) rb.push(i);
  ASSERT_EQ(rb.size(), 3u);
  ASSERT_EQ(rb.at(0), 3);
  ASSERT_EQ(rb.back(), 5);
  auto t = rb.tail(2);
  ASSERT_EQ(t.size(), 2u);
  ASSERT_EQ(t[0], 4);
  ASSERT_EQ(t[1], 5);
  ASSERT_EQ(rb.tail(10).size(), 3u);
}

TEST(ring_buffer_shrink_keeps_newest) {
  RingBuffer<int> rb(5);
  for (int i = 1; i <= 5; ++i) rb.push(i);
  rb.set_capacity(2);
  ASSERT_EQ(rb.capacity(), 2u);
  ASSERT_EQ(rb.size(), 2u);
  ASSERT_EQ(rb.at(0), 4);
  ASSERT_EQ(rb.at(1), 5);
  ASSERT_EQ(rb.drop_front_while([](int v){ return v < 5; }), 1u);
  ASSERT_EQ(rb.at(0), 5);
}

TEST(timeseries_bounded_history_is_chronological) {
  TimeSeriesStore store;
  store.set_capacity("cpu_usage", 60);
  for (int i = 0; i < 100; ++i)
    store.append(MetricSample{"cpu_usage", static_cast<double>(i), t0 + std::chrono::seconds(i)});

  auto all = store.query("cpu_usage", 1000);
  ASSERT_EQ(all.size(), 60u);
  ASSERT_EQ(all.front().value, 40.0);
  ASSERT_EQ(all.back().value, 99.0);
  for (size_t i = 1; i < all.size(); ++i) ASSERT_TRUE(all[i - 1].timestamp < all[i].timestamp);

  auto last10 = store.query("cpu_usage", 10);
  ASSERT_EQ(last10.size(), 10u);
  ASSERT_EQ(last10.front().value, 90.0);
  ASSERT_EQ(store.query("cpu_usage", 0).size(), 0u);
}

TEST(timeseries_one_past_capacity_drops_the_oldest) {
  TimeSeriesStore store(60);
  for (int i = 1; i <= 61; ++i)
    store.append(MetricSample{"memory_usage_percent", static_cast<double>(i), t0 + std::chrono::seconds(i)});

  auto got = store.query("memory_usage_percent", 60);
  ASSERT_EQ(got.size(), 60u);
  for (size_t i = 0; i < got.size(); ++i) ASSERT_EQ(got[i].value, static_cast<double>(i + 2));
}

TEST(timeseries_unknown_metric_is_empty) {
  TimeSeriesStore store;
  ASSERT_TRUE(store.query("nope", 10).empty());
  ASSERT_TRUE(!store.latest("nope").has_value());
  ASSERT_TRUE(!store.average("nope", 5).has_value());
}

TEST(timeseries_latest_average_and_names) {
  TimeSeriesStore store(100);
  for (int i = 0; i < 20; ++i)
    store.append(MetricSample{"memory_usage_percent", static_cast<double>(i), t0 + std::chrono::seconds(i)});
  store.append(MetricSample{"cpu_usage", 12.5, t0});

  auto latest = store.latest("memory_usage_percent");
  ASSERT_TRUE(latest.has_value());
  ASSERT_EQ(latest->value, 19.0);
  auto avg = store.average("memory_usage_percent", 10);
  ASSERT_TRUE(avg.has_value());
  ASSERT_NEAR(*avg, 14.5, 1e-9);

  auto names = store.metric_names();
  ASSERT_EQ(names.size(), 2u);
  auto all = store.latest_all();
  ASSERT_EQ(all.size(), 2u);
  ASSERT_EQ(all[0].metric_name, std::string("cpu_usage"));
  ASSERT_EQ(all[1].metric_name, std::string("memory_usage_percent"));
}

TEST(timeseries_cleanup_drops_old_samples) {
  TimeSeriesStore store;
  for (int i = 0; i < 100; ++i)
    store.append(MetricSample{"cpu_usage", static_cast<double>(i), t0 + std::chrono::seconds(i)});
  auto removed = store.cleanup_older_than(t0 + 50s);
  ASSERT_EQ(removed, 50u);
  auto rest = store.query("cpu_usage", 1000);
  ASSERT_EQ(rest.size(), 50u);
  ASSERT_EQ(rest.front().value, 50.0);
}

TEST(timeseries_capacity_change_applies_to_existing_series) {
  TimeSeriesStore store(10);
  for (int i = 0; i < 10; ++i)
    store.append(MetricSample{"gpu_usage", static_cast<double>(i), t0 + std::chrono::seconds(i)});
  ASSERT_EQ(store.capacity_of("gpu_usage"), 10u);
  store.set_capacity("gpu_usage", 4);
  ASSERT_EQ(store.capacity_of("gpu_usage"), 4u);
  auto q = store.query("gpu_usage", 100);
  ASSERT_EQ(q.size(), 4u);
  ASSERT_EQ(q.front().value, 6.0);
}
