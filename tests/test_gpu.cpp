#include "minitest.hpp"
#include "collectors/GpuCollector.hpp"
#include <filesystem>
#include <fstream>
#include <map>
#include <unistd.h>

namespace fs = std::filesystem;

static fs::path make_root(const char* tag) {
  auto root = fs::temp_directory_path() / fs::path(std::string("skynode_test_gpu_") + tag) / fs::path(std::to_string(::getpid()));
  fs::remove_all(root);
  fs::create_directories(root / "sys/class/drm");
  setenv("SKYNODE_PROC_ROOT", root.c_str(), 1);
  setenv("SKYNODE_SYS_ROOT", root.c_str(), 1);
  return root;
}

TEST(gpu_collector_reads_drm_sysfs) {
  auto root = make_root("drm");
  auto dev = root / "sys/class/drm/card0/device";
  fs::create_directories(dev / "hwmon/hwmon5");
  fs::create_directories(root / "sys/class/drm/card0-DP-1");
  std::ofstream(dev / "uevent") << "DRIVER=amdgpu\nPCI_ID=1002:73BF\n";
  std::ofstream(dev / "gpu_busy_percent") << 37 << "\n";
  std::ofstream(dev / "mem_info_vram_total") << 8589934592LL << "\n";
  std::ofstream(dev / "mem_info_vram_used") << 2147483648LL << "\n";
  std::ofstream(dev / "hwmon/hwmon5/temp1_input") << 60000 << "\n";
  std::ofstream(dev / "hwmon/hwmon5/temp1_label") << "edge\n";
  std::ofstream(dev / "hwmon/hwmon5/temp2_input") << 75000 << "\n";
  std::ofstream(dev / "hwmon/hwmon5/temp2_label") << "junction\n";

  skynode::collectors::GpuCollector g;
  skynode::model::GpuSnapshot s{};
  ASSERT_TRUE(g.sample(s));
  ASSERT_EQ(s.devices.size(), 1u);
  ASSERT_EQ(s.devices[0].name, std::string("amdgpu (1002:73BF)"));
  ASSERT_EQ(s.devices[0].vram_total_mb, 8192u);

  auto r = g.read();
  ASSERT_TRUE(r.has_value());
  std::map<std::string, double> m;
  for (const auto& x : *r) m[x.metric_name] = x.value;
  ASSERT_NEAR(m["gpu_usage"], 37.0, 0.001);
  ASSERT_NEAR(m["gpu_memory_usage_percent"], 25.0, 0.001);
  ASSERT_NEAR(m["gpu_temperature"], 60.0, 0.001);
}

TEST(gpu_collector_without_devices_is_unavailable) {
  make_root("none");
  skynode::collectors::GpuCollector g;
  auto r = g.init();
  ASSERT_TRUE(!r);
  ASSERT_TRUE(r.error().code == skynode::util::Errc::SensorUnavailable);
}
