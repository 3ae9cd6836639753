#include "collectors/ProcessCollector.hpp"
#include "util/Procfs.hpp"
#include "util/Strings.hpp"

#include <unistd.h>
#include <cctype>
#include <charconv>
#include <sstream>
#include <spdlog/spdlog.h>

namespace vigil::collectors {

using vigil::model::ProcessItem;
using vigil::model::SigningStatus;

static uint64_t read_cpu_total() {
  auto txt = vigil::util::read_file_string("/proc/stat"); if (!txt) return 0;
  std::istringstream ss(*txt); std::string line; if (!std::getline(ss, line)) return 0;
  // parse after 'cpu '
  size_t pos = line.find(' '); if (pos == std::string::npos) return 0;
  std::string_view rest(line.c_str() + pos + 1);
  uint64_t vals[8]{}; int i=0; size_t start=0;
  while (i<8 && start<rest.size()) {
    while (start<rest.size() && (rest[start]==' '||rest[start]=='\t')) ++start;
    size_t end=start; while (end<rest.size() && rest[end]>='0'&&rest[end]<='9') ++end;
    if (end>start) { std::from_chars(rest.data()+start, rest.data()+end, vals[i++]); }
    start=end+1;
  }
  uint64_t total=0; for (int j=0;j<8;++j) total+=vals[j]; return total;
}

static unsigned read_cpu_count() {
  auto txt = vigil::util::read_file_string("/proc/stat"); if (!txt) return 1;
  std::istringstream ss(*txt); std::string line; unsigned count = 0; bool first = true;
  while (std::getline(ss, line)) {
    if (line.rfind("cpu", 0) == 0) {
      if (first) { first = false; continue; } // skip aggregate 'cpu '
      if (line.size() >= 4 && std::isdigit(static_cast<unsigned char>(line[3]))) count++;
    } else if (!first) {
      break; // stop after cpu block
    }
  }
  if (count == 0) count = 1;
  return count;
}

bool ProcessCollector::parse_stat_line(const std::string& content, StatFields& out) {
  // comm may itself contain spaces and parentheses
  auto lp = content.find('('); auto rp = content.rfind(')');
  if (lp==std::string::npos||rp==std::string::npos||rp<lp||rp+2>content.size()) return false;
  out.comm = content.substr(lp+1, rp-lp-1);
  std::istringstream ss(content.substr(rp+2));
  ss >> out.state >> out.ppid;
  // skip pgrp..cmajflt (9 fields)
  for (int i=0;i<9;i++){ std::string tmp; ss >> tmp; }
  ss >> out.utime >> out.stime;
  // skip cutime, cstime, priority, nice, num_threads, itrealvalue
  for (int i=0;i<6;i++){ std::string tmp; ss >> tmp; }
  ss >> out.start_time;
  unsigned long long vsize_bytes = 0;
  ss >> vsize_bytes;
  ss >> out.rss_pages;
  return !ss.fail();
}

static std::string read_cmdline(int32_t pid) {
  auto bytes = vigil::util::read_file_bytes(std::string("/proc/")+std::to_string(pid)+"/cmdline");
  if (!bytes) return {};
  std::string out; out.reserve(bytes->size()); bool sep=true;
  for (auto b : *bytes) { if (b==0) { if(!sep){ out.push_back(' '); sep=true; } } else { out.push_back(static_cast<char>(b)); sep=false; } }
  if (!out.empty() && out.back()==' ') out.pop_back();
  return out;
}

static bool read_uid(int32_t pid, uint32_t& uid) {
  auto txt = vigil::util::read_file_string(std::string("/proc/")+std::to_string(pid)+"/status");
  if (!txt) return false;
  std::istringstream ss(*txt); std::string line;
  while (std::getline(ss, line)) {
    if (line.rfind("Uid:",0)==0) {
      std::istringstream ls(line.substr(4));
      return static_cast<bool>(ls >> uid);
    }
  }
  return false;
}

std::string ProcessCollector::user_name_cached(uint32_t uid) {
  auto it = users_.find(uid);
  if (it != users_.end()) return it->second;
  std::string name = std::to_string(uid);
  if (auto pw = vigil::util::read_file_string("/etc/passwd")) {
    std::istringstream ss(*pw); std::string pl;
    while (std::getline(ss, pl)) {
      auto c1 = pl.find(':'); if (c1==std::string::npos) continue;
      auto c2 = pl.find(':', c1+1); if (c2==std::string::npos) continue;
      uint32_t fuid = static_cast<uint32_t>(std::strtoul(pl.c_str()+c2+1, nullptr, 10));
      if (fuid==uid) { name = pl.substr(0, c1); break; }
    }
  }
  users_.emplace(uid, name);
  return name;
}

bool ProcessCollector::poll(vigil::model::SnapshotSet& out, std::stop_token st) {
  clear_error();
  auto entries = vigil::util::list_dir("/proc");
  if (entries.empty()) {
    set_error("cannot list " + vigil::util::map_proc_path("/proc"));
    return false;
  }
  uint64_t cpu_total = read_cpu_total();
  if (ncpu_ == 0) ncpu_ = read_cpu_count();
  const long page_kb = ::sysconf(_SC_PAGESIZE) / 1024;

  std::unordered_map<int32_t, uint64_t> seen_times;
  for (auto& entry : entries) {
    if (st.stop_requested()) { set_error("cancelled"); return false; }
    if (entry.empty() || entry[0]<'0' || entry[0]>'9') continue; // numeric
    int32_t pid = static_cast<int32_t>(std::strtol(entry.c_str(), nullptr, 10));
    auto content = vigil::util::read_file_string(std::string("/proc/")+entry+"/stat");
    StatFields sf;
    if (!content || !parse_stat_line(*content, sf)) {
      // exited between readdir and open
      spdlog::debug("Process: pid {} vanished during scan", pid);
      continue;
    }
    uint64_t total_proc = sf.utime + sf.stime;
    double cpu_pct = 0.0;
    if (have_last_) {
      auto it = last_per_proc_.find(pid);
      uint64_t lastp = (it==last_per_proc_.end()) ? total_proc : it->second;
      uint64_t dp = (total_proc > lastp) ? (total_proc - lastp) : 0;
      uint64_t dt = (cpu_total > last_cpu_total_) ? (cpu_total - last_cpu_total_) : 0;
      if (dt>0) cpu_pct = 100.0 * static_cast<double>(dp) / static_cast<double>(dt);
      cpu_pct *= static_cast<double>(ncpu_); // percent of one core
    }
    seen_times[pid] = total_proc;

    ProcessItem p;
    p.pid = pid; p.ppid = sf.ppid; p.start_time = sf.start_time;
    p.rss_kb = sf.rss_pages > 0 ? static_cast<uint64_t>(sf.rss_pages) * static_cast<uint64_t>(page_kb) : 0;
    p.cpu_pct = cpu_pct;
    p.name = sf.comm;
    p.cmdline = read_cmdline(pid);
    if (auto link = vigil::util::read_symlink(std::string("/proc/")+entry+"/exe")) {
      p.exe_path = vigil::util::strip_deleted_suffix(*link);
      // Running image was unlinked or replaced on disk
      if (p.exe_path.size() != link->size()) p.signing = SigningStatus::Invalid;
      if (auto sz = vigil::util::file_size(p.exe_path)) p.exe_size = *sz;
    }
    uint32_t uid = 0;
    if (read_uid(pid, uid)) { p.uid = uid; p.user = user_name_cached(uid); }
    out.processes.push_back(std::move(p));
  }
  last_per_proc_ = std::move(seen_times);
  last_cpu_total_ = cpu_total; have_last_ = true;
  return true;
}

} // namespace vigil::collectors
