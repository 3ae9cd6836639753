#include "app/Pipeline.hpp"
#include "app/Differ.hpp"

#include <utility>
#include <spdlog/spdlog.h>

namespace vigil::app {

using nlohmann::json;
using namespace vigil::model;

static json process_json(const ProcessItem& p) {
  return json{{"pid", p.pid}, {"ppid", p.ppid}, {"name", p.name}, {"path", p.exe_path},
              {"user", p.user}, {"commandLine", p.cmdline}, {"cpuPercent", p.cpu_pct},
              {"rssKb", p.rss_kb}, {"signing", to_string(p.signing)}};
}

static json connection_json(const ConnectionItem& c) {
  return json{{"protocol", c.protocol}, {"localAddress", c.local_ip}, {"localPort", c.local_port},
              {"remoteAddress", c.remote_ip}, {"remotePort", c.remote_port}, {"state", c.state},
              {"pid", c.pid}, {"processName", c.process_name}};
}

// Event payloads carry at most this much autorun content
static constexpr size_t kPayloadContent = 4096;

static std::string excerpt(const std::string& s) {
  return s.size() > kPayloadContent ? s.substr(0, kPayloadContent) : s;
}

static json file_json(const FileArtifact& f) {
  return json{{"path", f.path}, {"size", f.size}, {"mtime", f.mtime}, {"mode", f.mode}, {"tags", f.tags}};
}

Pipeline::Pipeline(std::shared_ptr<vigil::collectors::ICollector> collector,
                   std::shared_ptr<const DetectionRules> rules,
                   std::shared_ptr<EventQueue> queue)
  : collector_(std::move(collector)), rules_(std::move(rules)), queue_(std::move(queue)) {}

template <typename Fn>
Verdict Pipeline::safe_classify(const char* what, Fn&& fn) {
  try {
    return fn();
  } catch (const std::exception& e) {
    // a rule failure never escalates; the item counts as clean
    classify_failures_.fetch_add(1);
    spdlog::error("Pipeline {}: classifying {} failed: {}", name(), what, e.what());
    return Verdict{};
  }
}

void Pipeline::emit(const Verdict& v, std::string message, json details, std::string dedup_key) {
  details["reasons"] = v.reasons;
  if (v.confidence) details["confidence"] = *v.confidence;
  if (!v.cves.empty()) details["cves"] = v.cves;
  auto e = make_event(v.type, v.severity, std::move(message), std::move(details), std::move(dedup_key));
  spdlog::info("Pipeline {}: [{}] {}", name(), to_string(e.severity), e.message);
  if (queue_->enqueue(std::move(e))) events_.fetch_add(1);
}

bool Pipeline::run_cycle(std::stop_token st) {
  {
    std::lock_guard<std::mutex> lk(cycle_mu_);
    if (closed_) return false;
    in_cycle_ = true;
  }
  bool ok = false;
  try {
    ok = poll_and_process(st);
  } catch (const std::exception& e) {
    spdlog::error("Pipeline {}: cycle failed: {}", name(), e.what());
  }
  bool stop_now = false;
  {
    std::lock_guard<std::mutex> lk(cycle_mu_);
    in_cycle_ = false;
    stop_now = std::exchange(stop_deferred_, false);
  }
  if (stop_now) {
    spdlog::info("Pipeline {}: poll returned after shutdown, stopping collector", name());
    stop_collector_now();
  }
  return ok;
}

bool Pipeline::stop_collector() {
  {
    std::lock_guard<std::mutex> lk(cycle_mu_);
    closed_ = true;
    if (in_cycle_) {
      stop_deferred_ = true;
      return false;
    }
  }
  stop_collector_now();
  return true;
}

void Pipeline::stop_collector_now() {
  try {
    collector_->stop();
  } catch (const std::exception& e) {
    spdlog::error("Pipeline {}: collector threw on stop: {}", name(), e.what());
  }
}

bool Pipeline::poll_and_process(std::stop_token st) {
  cycles_.fetch_add(1);
  SnapshotSet current;
  bool ok = false;
  try {
    ok = collector_->poll(current, st);
  } catch (const std::exception& e) {
    spdlog::error("Pipeline {}: poll threw: {}", name(), e.what());
    ok = false;
  }
  if (!ok) {
    poll_failures_.fetch_add(1);
    if (st.stop_requested()) spdlog::debug("Pipeline {}: poll cancelled", name());
    else spdlog::warn("Pipeline {}: poll failed: {}", name(), collector_->last_error());
    return false;
  }
  process_delta(current);
  previous_ = std::move(current);
  have_previous_ = true;
  return true;
}

void Pipeline::process_delta(const SnapshotSet& current) {
  const DetectionRules& r = *rules_;
  const bool baseline = !have_previous_;
  auto note_dups = [&](size_t dups){
    if (dups == 0) return;
    duplicate_keys_.fetch_add(dups);
    spdlog::warn("Pipeline {}: {} duplicate identity key(s) in snapshot, later entries kept", name(), dups);
  };

  switch (category()) {
    case Category::Process: {
      auto d = diff_processes(previous_.processes, current.processes);
      note_dups(d.duplicates);
      auto check = [&](const ProcessItem& p){
        auto v = safe_classify("process", [&]{ return classify_process(p, r); });
        if (!v.suspicious) return;
        emit(v, "Suspicious process detected: " + p.name + " (pid " + std::to_string(p.pid) + ")",
             process_json(p), "process:" + std::to_string(p.pid) + ":" + std::to_string(p.start_time));
      };
      for (const auto& p : d.added) check(p);
      // a changed start time means the pid was reused by a new process
      for (const auto& ch : d.changed) check(ch.second);
      for (const auto& p : d.removed) spdlog::info("Pipeline process: terminated {} (pid {})", p.name, p.pid);
      break;
    }
    case Category::Network: {
      auto d = diff_connections(previous_.connections, current.connections);
      note_dups(d.duplicates);
      for (const auto& c : d.added) {
        auto v = safe_classify("connection", [&]{ return classify_connection(c, r); });
        if (!v.suspicious) continue;
        emit(v, "Suspicious network connection: " + c.process_name + " " + c.local_ip + ":" +
                std::to_string(c.local_port) + " -> " + c.remote_ip + ":" + std::to_string(c.remote_port),
             connection_json(c), "network:" + c.key());
      }
      for (const auto& c : d.removed) spdlog::info("Pipeline network: closed {}", c.key());
      break;
    }
    case Category::Persistence: {
      auto d = diff_persistence(previous_.persistence, current.persistence);
      note_dups(d.duplicates);
      for (const auto& p : d.added) {
        auto v = safe_classify("persistence", [&]{ return classify_persistence(p, false, baseline, r); });
        if (!v.suspicious) continue;
        emit(v, "New persistence entry: " + p.key_path,
             json{{"keyPath", p.key_path}, {"kind", p.kind}, {"content", excerpt(p.content)}, {"hash", p.content_hash}},
             "persistence:" + p.key_path + ":" + p.content_hash);
      }
      for (const auto& ch : d.changed) {
        const auto& before = ch.first;
        const auto& after = ch.second;
        auto v = safe_classify("persistence", [&]{ return classify_persistence(after, true, baseline, r); });
        if (!v.suspicious) continue;
        emit(v, "Persistence entry modified: " + after.key_path,
             json{{"keyPath", after.key_path}, {"kind", after.kind}, {"oldValue", excerpt(before.content)},
                  {"newValue", excerpt(after.content)}, {"oldHash", before.content_hash}, {"hash", after.content_hash}},
             "persistence:" + after.key_path + ":" + after.content_hash);
      }
      for (const auto& p : d.removed) spdlog::info("Pipeline persistence: removed {}", p.key_path);
      break;
    }
    case Category::File: {
      auto d = diff_files(previous_.files, current.files);
      note_dups(d.duplicates);
      auto check = [&](const FileArtifact& f){
        auto v = safe_classify("file", [&]{ return classify_file(f, r); });
        if (!v.suspicious) return;
        std::string prefix = v.type == EventType::Malware ? "Potential malware: " : "Suspicious file: ";
        emit(v, prefix + f.path, file_json(f), "file:" + f.path + ":" + std::to_string(f.mtime));
      };
      for (const auto& f : d.added) check(f);
      for (const auto& ch : d.changed) check(ch.second);
      for (const auto& f : d.removed) spdlog::info("Pipeline file: removed {}", f.path);
      break;
    }
    case Category::Package: {
      auto d = diff_packages(previous_.packages, current.packages);
      note_dups(d.duplicates);
      auto check = [&](const PackageItem& p){
        auto v = safe_classify("package", [&]{ return classify_package(p, r); });
        if (!v.suspicious) return;
        emit(v, "Vulnerable package: " + p.name + " " + p.version,
             json{{"package", p.name}, {"version", p.version}},
             "vulnerability:" + p.name + ":" + p.version);
      };
      for (const auto& p : d.added) check(p);
      for (const auto& ch : d.changed) check(ch.second);
      for (const auto& p : d.removed) spdlog::info("Pipeline package: removed {} {}", p.name, p.version);
      break;
    }
    case Category::Auth:
      break;
  }
}

PipelineStats Pipeline::stats() const {
  return PipelineStats{cycles_.load(), poll_failures_.load(), classify_failures_.load(),
                       events_.load(), duplicate_keys_.load()};
}

} // namespace vigil::app
