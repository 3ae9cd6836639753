#include "app/Classifier.hpp"
#include "util/Strings.hpp"

#include <cctype>

namespace vigil::app {

using vigil::model::EventType;
using vigil::model::Severity;
using vigil::util::has_path_prefix;
using vigil::util::to_lower_copy;

void Verdict::add(Severity sev, std::string reason) {
  if (!suspicious) {
    suspicious = true;
    severity = sev;
  }
  reasons.push_back(std::move(reason));
}

static const std::string* match_dir(const std::string& path_lower, const DetectionRules& r) {
  for (const auto& d : r.suspicious_dirs) {
    if (has_path_prefix(path_lower, d)) return &d;
  }
  return nullptr;
}

static const std::string* match_token(const std::string& text_lower, const DetectionRules& r) {
  for (const auto& t : r.name_tokens) {
    if (text_lower.find(t) != std::string::npos) return &t;
  }
  return nullptr;
}

static const std::string* match_content(const std::string& text_lower, const DetectionRules& r) {
  for (const auto& c : r.content_patterns) {
    if (text_lower.find(c) != std::string::npos) return &c;
  }
  return nullptr;
}

static std::string trimmed_dir(const std::string& d) {
  return (!d.empty() && d.back() == '/') ? d.substr(0, d.size() - 1) : d;
}

auto classify_process(const vigil::model::ProcessItem& p, const DetectionRules& r) -> Verdict {
  Verdict v;
  v.type = EventType::Process;
  const std::string name_lower = to_lower_copy(p.name);
  const std::string exe_lower = to_lower_copy(p.exe_path);
  const std::string base_lower = vigil::util::basename_of(exe_lower);
  const std::string cmd_lower = to_lower_copy(p.cmdline);

  // keyword
  if (auto* t = match_token(name_lower, r)) {
    v.add(Severity::High, "name matches suspicious token '" + *t + "'");
  } else if (auto* t2 = match_token(base_lower, r)) {
    v.add(Severity::High, "executable name matches suspicious token '" + *t2 + "'");
  } else if (r.tool_names.count(name_lower) || r.tool_names.count(base_lower)) {
    v.add(Severity::High, "known offensive tool '" + (r.tool_names.count(name_lower) ? name_lower : base_lower) + "'");
  }

  // path
  if (auto* d = match_dir(exe_lower, r)) {
    v.add(Severity::High, "executable in suspicious directory " + trimmed_dir(*d));
    auto ext = vigil::util::extension_of(exe_lower);
    if (r.dropper_extensions.count(ext)) v.add(Severity::High, "suspicious extension " + ext);
  }

  if (!p.cmdline.empty() && p.cmdline.front() == '[' && p.cmdline.back() == ']' && !p.exe_path.empty()) {
    v.add(Severity::High, "fake kernel thread");
  }

  auto args = vigil::util::split_ws(cmd_lower);
  if (!args.empty() && r.interpreters.count(vigil::util::basename_of(args.front()))) {
    for (size_t i = 1; i < args.size(); ++i) {
      std::string clean = args[i];
      if (!clean.empty() && (clean.front() == '"' || clean.front() == '\'')) clean.erase(clean.begin());
      if (!clean.empty() && (clean.back() == '"' || clean.back() == '\'')) clean.pop_back();
      if (auto* d = match_dir(clean, r)) {
        v.add(Severity::High, "interpreter running script from " + trimmed_dir(*d));
        break;
      }
    }
  }

  const bool has_fetch = cmd_lower.find("curl") != std::string::npos || cmd_lower.find("wget") != std::string::npos;
  const bool has_pipe_sh = cmd_lower.find("| bash") != std::string::npos || cmd_lower.find("|bash") != std::string::npos ||
                           cmd_lower.find("| sh") != std::string::npos || cmd_lower.find("|sh") != std::string::npos;
  if (has_fetch && has_pipe_sh) v.add(Severity::Medium, "script download piped to shell");

  // secondary
  if (p.signing == vigil::model::SigningStatus::Invalid) {
    v.add(Severity::Medium, "running image deleted or replaced on disk");
  } else if (p.signing == vigil::model::SigningStatus::Unsigned) {
    v.add(Severity::Medium, "unsigned executable");
  }
  if (p.cpu_pct > r.cpu_alert_threshold) {
    v.add(Severity::Medium, "cpu " + std::to_string(static_cast<int>(p.cpu_pct + 0.5)) + "% above threshold");
  }
  // Only meaningful alongside another finding
  if (v.suspicious && p.exe_size > 0 && p.exe_size < r.min_executable_size) {
    v.add(Severity::Low, "executable smaller than " + std::to_string(r.min_executable_size) + " bytes");
  }
  return v;
}

auto classify_connection(const vigil::model::ConnectionItem& c, const DetectionRules& r) -> Verdict {
  Verdict v;
  v.type = EventType::Network;
  if (c.remote_port != 0 && r.suspicious_ports.count(c.remote_port)) {
    v.add(Severity::High, "remote port " + std::to_string(c.remote_port) + " is a known-bad port");
  }
  if (c.state == "LISTEN" && r.suspicious_ports.count(c.local_port)) {
    v.add(Severity::High, "listening on known-bad port " + std::to_string(c.local_port));
  }
  const std::string proc_lower = to_lower_copy(c.process_name);
  if (!proc_lower.empty()) {
    if (auto* t = match_token(proc_lower, r)) {
      v.add(Severity::High, "owned by process matching suspicious token '" + *t + "'");
    } else if (r.tool_names.count(proc_lower)) {
      v.add(Severity::High, "owned by known offensive tool '" + proc_lower + "'");
    }
    if (c.state == "ESTABLISHED" && c.remote_port != 0 && r.interpreters.count(proc_lower) &&
        !r.web_ports.count(c.remote_port)) {
      v.add(Severity::Medium, "interpreter '" + proc_lower + "' connected to non-web port " + std::to_string(c.remote_port));
    }
  }
  return v;
}

auto classify_persistence(const vigil::model::PersistenceItem& p, bool changed, bool baseline,
                          const DetectionRules& r) -> Verdict {
  Verdict v;
  v.type = EventType::Persistence;
  const std::string content_lower = to_lower_copy(p.content);
  if (auto* c = match_content(content_lower, r)) {
    v.add(Severity::High, "autorun content contains '" + *c + "'");
  }
  for (const auto& d : r.suspicious_dirs) {
    if (content_lower.find(d) != std::string::npos) {
      v.add(Severity::High, "autorun references " + trimmed_dir(d));
      break;
    }
  }
  if (p.kind == "preload" && !vigil::util::trim_copy(p.content).empty()) {
    v.add(Severity::High, "dynamic loader preload list is populated");
  }
  if (!baseline) {
    v.add(Severity::Medium, changed ? "autorun entry modified" : "new autorun entry");
  }
  return v;
}

auto classify_file(const vigil::model::FileArtifact& f, const DetectionRules& r) -> Verdict {
  Verdict v;
  v.type = EventType::File;
  const std::string path_lower = to_lower_copy(f.path);
  const std::string base_lower = vigil::util::basename_of(path_lower);
  const std::string ext = vigil::util::extension_of(path_lower);
  const std::string* dir = match_dir(path_lower, r);

  if (auto* t = match_token(base_lower, r)) {
    v.add(Severity::High, "file name matches suspicious token '" + *t + "'");
  }
  if (dir && r.dropper_extensions.count(ext)) {
    v.add(Severity::High, "suspicious extension " + ext + " in " + trimmed_dir(*dir));
  }
  if (dir && (f.mode & 04000)) {
    v.add(Severity::High, "setuid file in " + trimmed_dir(*dir));
  }
  if (dir && f.executable && r.script_extensions.count(ext)) {
    v.add(Severity::Medium, "executable script in " + trimmed_dir(*dir));
  }
  if (r.binary_extensions.count(ext) && f.size > 0 && f.size < r.min_executable_size) {
    v.add(Severity::Medium, "executable smaller than " + std::to_string(r.min_executable_size) + " bytes");
  }
  if (r.scan_content && !f.head.empty()) {
    if (auto* c = match_content(to_lower_copy(f.head), r)) {
      v.add(Severity::Critical, "malicious content pattern '" + *c + "'");
      // a content hit reclassifies the file as malware; severity stays with the first match
      v.type = EventType::Malware;
      v.confidence = r.malware_confidence;
    }
  }
  return v;
}

auto upstream_version(const std::string& v) -> std::string {
  std::string s = v;
  auto colon = s.find(':');
  if (colon != std::string::npos) s = s.substr(colon + 1);
  auto dash = s.rfind('-');
  if (dash != std::string::npos && dash > 0) s = s.substr(0, dash);
  return s;
}

bool version_matches(const VulnEntry& e, const std::string& version) {
  const std::string up = upstream_version(version);
  if (!e.prefix) return up == e.version;
  if (up.rfind(e.version, 0) != 0) return false;
  if (up.size() == e.version.size()) return true;
  return !std::isdigit(static_cast<unsigned char>(up[e.version.size()]));
}

auto classify_package(const vigil::model::PackageItem& p, const DetectionRules& r) -> Verdict {
  Verdict v;
  v.type = EventType::Vulnerability;
  const std::string name_lower = to_lower_copy(p.name);
  for (const auto& e : r.vulnerabilities) {
    if (e.package != name_lower || !version_matches(e, p.version)) continue;
    v.add(Severity::High, p.name + " " + p.version + " matches " + e.cve + " (" + e.title + ")");
    v.cves.push_back(e.cve);
  }
  if (v.suspicious) v.confidence = r.vuln_confidence;
  return v;
}

} // namespace vigil::app
