#include "app/Config.hpp"
#include "app/Daemon.hpp"
#include "app/Version.hpp"
#include "net/CurlTransport.hpp"
#include "util/Env.hpp"

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <string>
#include <thread>

static std::atomic<bool> g_stop{false};

static void on_signal(int) { g_stop.store(true); }

static void usage() {
  std::cout << "Usage: skynode [--config PATH] [--port N] [--data-dir DIR] [--name NAME] [--no-discovery]\n";
  std::cout << "Notes: runs until SIGINT/SIGTERM. Config defaults to $XDG_CONFIG_HOME/skynode/config.toml.\n";
}

static bool parse_port(const char* s, uint16_t& out) {
  unsigned v = 0;
  const char* end = s + std::strlen(s);
  auto [ptr, ec] = std::from_chars(s, end, v);
  if (ec != std::errc{} || ptr != end || v > 65535) return false;
  out = static_cast<uint16_t>(v);
  return true;
}

int main(int argc, char** argv) {
  std::string config_path = skynode::util::config_file_path();
  std::string data_dir, name;
  uint16_t port = 0;
  bool have_port = false, no_discovery = false;

  // --config is needed before the file is read, the rest override it afterwards
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--config" && i + 1 < argc) config_path = argv[++i];
    else if (a == "--port" && i + 1 < argc) {
      if (!parse_port(argv[++i], port)) {
        std::fprintf(stderr, "skynode: invalid --port '%s'\n", argv[i]);
        return 2;
      }
      have_port = true;
    }
    else if (a == "--data-dir" && i + 1 < argc) data_dir = argv[++i];
    else if (a == "--name" && i + 1 < argc) name = argv[++i];
    else if (a == "--no-discovery") no_discovery = true;
    else if (a == "-h" || a == "--help") { usage(); return 0; }
    else if (a == "--version") { std::cout << "skynode " << skynode::app::kVersion << "\n"; return 0; }
    else {
      std::fprintf(stderr, "skynode: unknown argument '%s'\n", a.c_str());
      usage();
      return 2;
    }
  }

  auto cfg = skynode::app::load_config(config_path);
  if (have_port) cfg.api_port = port;
  if (!data_dir.empty()) cfg.data_dir = data_dir;
  if (!name.empty()) cfg.node_name = name;
  if (no_discovery) cfg.discovery_enabled = false;

  skynode::net::CurlGlobal curl;
  if (!curl.ok()) {
    std::fprintf(stderr, "skynode: curl_global_init failed\n");
    return 1;
  }

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);
  std::signal(SIGPIPE, SIG_IGN);

  skynode::app::Daemon daemon(std::move(cfg));
  if (auto r = daemon.init(); !r) {
    std::fprintf(stderr, "skynode: %s\n", r.error().message.c_str());
    return 1;
  }
  if (auto r = daemon.start(); !r) {
    std::fprintf(stderr, "skynode: %s\n", r.error().message.c_str());
    return 1;
  }

  while (!g_stop.load()) std::this_thread::sleep_for(std::chrono::milliseconds(200));

  std::fprintf(stderr, "skynode: shutting down\n");
  daemon.stop();
  return 0;
}
