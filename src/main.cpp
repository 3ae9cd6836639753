#include "app/Agent.hpp"

#include <spdlog/spdlog.h>
#include <curl/curl.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

using namespace std::chrono_literals;

static std::atomic<bool> g_stop{false};
static void on_signal(int){ g_stop.store(true); }

// curl_global_init is not thread-safe; do it once before any worker exists
struct CurlGlobal {
  bool ok{false};
  CurlGlobal() { ok = (curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK); }
  ~CurlGlobal() { if (ok) curl_global_cleanup(); }
};

static void print_usage() {
  std::cout << "Usage: vigil [--config PATH] [--register | --scan | --daemon]\n";
  std::cout << "  --config PATH  configuration file (default ./agent-config.json, created if missing)\n";
  std::cout << "  --register     register with the server (even if an agent id is stored) and exit\n";
  std::cout << "  --scan         run one detection cycle, upload, and exit\n";
  std::cout << "  --daemon       run until SIGINT/SIGTERM (default)\n";
  std::cout << "Environment: VIGIL_SERVER_URL, VIGIL_LOG_LEVEL, VIGIL_REGISTRATION_KEY\n";
}

int main(int argc, char** argv) {
  std::string config_path = "./agent-config.json";
  enum class Mode { Daemon, Register, Scan } mode = Mode::Daemon;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--config" && i + 1 < argc) config_path = argv[++i];
    else if (a == "--register") mode = Mode::Register;
    else if (a == "--scan") mode = Mode::Scan;
    else if (a == "--daemon") mode = Mode::Daemon;
    else if (a == "-h" || a == "--help") { print_usage(); return 0; }
    else {
      std::cerr << "vigil: unknown argument '" << a << "'\n";
      print_usage();
      return 1;
    }
  }

  CurlGlobal curl;
  if (!curl.ok) {
    std::cerr << "vigil: libcurl initialization failed\n";
    return 1;
  }

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  vigil::app::Agent agent(config_path);
  if (!agent.initialize(mode == Mode::Register)) {
    std::cerr << "vigil: initialization failed: " << agent.last_error() << "\n";
    return 1;
  }
  if (g_stop.load()) {
    agent.stop();
    return 0;
  }

  if (mode == Mode::Register) {
    std::cout << "vigil: registered as " << agent.config().agent_id << "\n";
    agent.stop();
    return 0;
  }

  if (mode == Mode::Scan) {
    // scan on a worker so a signal can cancel the polls in flight
    std::atomic<bool> done{false};
    bool ok = false;
    std::jthread scan([&](std::stop_token st){
      ok = agent.scan_once(st);
      done.store(true);
    });
    while (!done.load()) {
      if (g_stop.load()) scan.request_stop();
      std::this_thread::sleep_for(50ms);
    }
    scan.join();
    if (g_stop.load()) {
      spdlog::info("vigil: signal received, scan cancelled");
      return 0;
    }
    if (!ok) {
      std::cerr << "vigil: scan failed: " << agent.last_error() << "\n";
      return 1;
    }
    return 0;
  }

  if (!agent.start()) {
    std::cerr << "vigil: start failed: " << agent.last_error() << "\n";
    agent.stop();
    return 1;
  }
  // stop() takes locks and joins threads, so it runs here rather than in the handler
  while (!g_stop.load()) std::this_thread::sleep_for(200ms);
  spdlog::info("vigil: signal received, shutting down");
  agent.stop();
  return 0;
}
