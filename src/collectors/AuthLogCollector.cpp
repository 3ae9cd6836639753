#include "collectors/AuthLogCollector.hpp"
#include "util/Procfs.hpp"

#include <algorithm>
#include <fstream>
#include <regex>
#include <spdlog/spdlog.h>

namespace vigil::collectors {

using vigil::model::EventType;
using vigil::model::Severity;

AuthLogCollector::AuthLogCollector(std::string path, std::chrono::milliseconds tail_interval)
  : path_(std::move(path)), tail_interval_(tail_interval) {}

AuthLogCollector::~AuthLogCollector() { stop(); }

bool AuthLogCollector::start() {
  if (started_) return true;
  auto size = vigil::util::file_size(path_);
  if (!size) {
    set_error("cannot stat " + path_);
    return false;
  }
  // Only lines written after startup are reported
  offset_ = *size;
  started_ = true;
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
  return true;
}

void AuthLogCollector::stop() {
  if (!thread_.joinable()) return;
  thread_.request_stop();
  thread_.join();
  started_ = false;
}

bool AuthLogCollector::poll(vigil::model::SnapshotSet&, std::stop_token) {
  return true;
}

void AuthLogCollector::run(std::stop_token st) {
  while (!st.stop_requested()) {
    drain_once();
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait_for(lk, st, tail_interval_, []{ return false; });
  }
}

int AuthLogCollector::record_failure(const std::string& ip, TimePoint now) {
  auto it = sources_.find(ip);
  if (it == sources_.end()) {
    if (sources_.size() >= kMaxTrackedSources) {
      auto oldest = std::min_element(sources_.begin(), sources_.end(),
                                     [](const auto& a, const auto& b){ return a.second.last_seen < b.second.last_seen; });
      sources_.erase(oldest);
    }
    it = sources_.emplace(ip, SourceFailures{}).first;
  }
  auto& s = it->second;
  s.last_seen = now;
  while (!s.times.empty() && now - s.times.front() > kBruteForceWindow) s.times.pop_front();
  s.times.push_back(now);
  if (static_cast<int>(s.times.size()) < kBruteForceThreshold) return 0;
  // start counting afresh so a persistent source is reported again later
  int n = static_cast<int>(s.times.size());
  s.times.clear();
  return n;
}

void AuthLogCollector::prune_sources(TimePoint now) {
  for (auto it = sources_.begin(); it != sources_.end();) {
    if (now - it->second.last_seen > kBruteForceWindow) it = sources_.erase(it);
    else ++it;
  }
}

int AuthLogCollector::drain_once() {
  int pushed = 0;
  prune_sources(std::chrono::steady_clock::now());
  auto size = vigil::util::file_size(path_);
  if (!size) return 0;
  if (*size < offset_) {
    spdlog::info("AuthLog: {} truncated or rotated, rereading from start", path_);
    offset_ = 0;
  }
  if (*size == offset_) return 0;
  std::ifstream in(vigil::util::map_host_path(path_), std::ios::binary);
  if (!in) return 0;
  in.seekg(static_cast<std::streamoff>(offset_));
  std::string line;
  uint64_t consumed = offset_;
  while (std::getline(in, line)) {
    // A trailing partial line is picked up on the next drain
    if (in.eof()) break;
    consumed += line.size() + 1;
    handle_line(line, pushed);
  }
  offset_ = consumed;
  return pushed;
}

void AuthLogCollector::handle_line(const std::string& line, int& pushed) {
  static const std::regex failed_pw(R"(Failed password for (invalid user )?(\S+) from (\S+))");
  static const std::regex invalid_user(R"(Invalid user (\S+) from (\S+))");
  static const std::regex sudo_fail(R"(sudo:\s+(\S+) : .*incorrect password attempt)");
  static const std::regex auth_fail(R"(authentication failure;.*rhost=(\S*).*user=(\S*))");
  std::smatch m;

  auto emit = [&](Severity sev, std::string msg, nlohmann::json details, std::string key){
    details["line"] = line;
    push_event(vigil::model::make_event(EventType::Auth, sev, std::move(msg), std::move(details), std::move(key)));
    ++pushed;
  };
  auto note_failure = [&](const std::string& ip){
    if (ip.empty()) return;
    if (int n = record_failure(ip, std::chrono::steady_clock::now())) {
      emit(Severity::High, "Possible brute force from " + ip,
           {{"sourceIp", ip}, {"failures", n},
            {"windowSeconds", std::chrono::duration_cast<std::chrono::seconds>(kBruteForceWindow).count()}},
           "auth:bruteforce:" + ip);
    }
  };

  if (std::regex_search(line, m, failed_pw)) {
    std::string user = m[2].str(), ip = m[3].str();
    emit(Severity::Medium, "Failed login for " + user + " from " + ip,
         {{"user", user}, {"sourceIp", ip}, {"invalidUser", m[1].matched}}, "");
    note_failure(ip);
  } else if (std::regex_search(line, m, invalid_user)) {
    std::string user = m[1].str(), ip = m[2].str();
    emit(Severity::Low, "Login attempt for unknown user " + user + " from " + ip,
         {{"user", user}, {"sourceIp", ip}}, "");
  } else if (std::regex_search(line, m, sudo_fail)) {
    std::string user = m[1].str();
    emit(Severity::High, "sudo authentication failure for " + user,
         {{"user", user}}, "");
  } else if (std::regex_search(line, m, auth_fail)) {
    std::string ip = m[1].str(), user = m[2].str();
    emit(Severity::Medium, "Authentication failure for " + (user.empty() ? std::string("?") : user),
         {{"user", user}, {"sourceIp", ip}}, "");
    note_failure(ip);
  }
}

} // namespace vigil::collectors
