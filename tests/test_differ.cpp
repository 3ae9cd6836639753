#include "minitest.hpp"
#include "app/Differ.hpp"
#include <string>
#include <vector>

using namespace vigil::model;
using vigil::app::diff_connections;
using vigil::app::diff_files;
using vigil::app::diff_packages;
using vigil::app::diff_persistence;
using vigil::app::diff_processes;

static ProcessItem proc(int pid, const std::string& name, uint64_t start = 100, const std::string& exe = "/usr/bin/x") {
  ProcessItem p;
  p.pid = pid; p.name = name; p.start_time = start; p.exe_path = exe;
  return p;
}

static ConnectionItem conn(uint16_t lport, uint16_t rport, const std::string& state = "ESTABLISHED", int pid = 10) {
  ConnectionItem c;
  c.protocol = "tcp"; c.local_ip = "10.0.0.5"; c.local_port = lport;
  c.remote_ip = "198.51.100.7"; c.remote_port = rport; c.state = state; c.pid = pid;
  return c;
}

TEST(differ_identical_snapshots_are_empty) {
  std::vector<ConnectionItem> a{conn(40000, 443), conn(40001, 22)};
  auto d = diff_connections(a, a);
  ASSERT_TRUE(d.empty());
  ASSERT_EQ(0u, d.duplicates);
}

TEST(differ_first_snapshot_is_all_added) {
  std::vector<ProcessItem> curr{proc(1, "init"), proc(2, "kthreadd"), proc(3, "sshd")};
  auto d = diff_processes({}, curr);
  ASSERT_EQ(3u, d.added.size());
  ASSERT_TRUE(d.removed.empty());
  ASSERT_TRUE(d.changed.empty());
}

TEST(differ_added_removed_changed) {
  std::vector<ProcessItem> prev{proc(1, "init"), proc(2, "bash"), proc(3, "sleep")};
  std::vector<ProcessItem> curr{proc(1, "init"), proc(3, "sleep", 500), proc(4, "cron")};
  auto d = diff_processes(prev, curr);
  ASSERT_EQ(1u, d.added.size());
  ASSERT_EQ(4, d.added[0].pid);
  ASSERT_EQ(1u, d.removed.size());
  ASSERT_EQ(2, d.removed[0].pid);
  // pid 3 reused by a different process
  ASSERT_EQ(1u, d.changed.size());
  ASSERT_EQ(100u, d.changed[0].first.start_time);
  ASSERT_EQ(500u, d.changed[0].second.start_time);
}

TEST(differ_cpu_changes_are_not_content_changes) {
  auto a = proc(7, "worker"); a.cpu_pct = 1.0; a.rss_kb = 100;
  auto b = a; b.cpu_pct = 80.0; b.rss_kb = 9000;
  auto d = diff_processes({a}, {b});
  ASSERT_TRUE(d.empty());
}

TEST(differ_duplicate_keys_later_wins) {
  std::vector<ConnectionItem> curr{conn(40000, 443, "SYN_SENT"), conn(40000, 443, "ESTABLISHED")};
  auto d = diff_connections({}, curr);
  ASSERT_EQ(1u, d.duplicates);
  ASSERT_EQ(1u, d.added.size());
  ASSERT_EQ(std::string("ESTABLISHED"), d.added[0].state);
}

TEST(differ_connection_state_change) {
  auto d = diff_connections({conn(40000, 443, "SYN_SENT")}, {conn(40000, 443, "ESTABLISHED")});
  ASSERT_TRUE(d.added.empty());
  ASSERT_EQ(1u, d.changed.size());
}

TEST(differ_persistence_uses_content_hash) {
  PersistenceItem a{"/etc/cron.d/job", "cron", "* * * * * root /bin/true", "1111"};
  PersistenceItem b = a; b.content = "* * * * * root /tmp/x"; b.content_hash = "2222";
  PersistenceItem c = a; c.content = "same hash, different cached text";
  ASSERT_EQ(1u, diff_persistence({a}, {b}).changed.size());
  ASSERT_TRUE(diff_persistence({a}, {c}).empty());
}

TEST(differ_files_and_packages) {
  FileArtifact f1; f1.path = "/tmp/a.sh"; f1.size = 10; f1.mtime = 1; f1.mode = 0644;
  FileArtifact f2 = f1; f2.mode = 0755;
  ASSERT_EQ(1u, diff_files({f1}, {f2}).changed.size());

  std::vector<PackageItem> prev{{"bash", "5.1-6"}, {"openssl", "3.0.2-0ubuntu1"}};
  std::vector<PackageItem> curr{{"bash", "5.1-6ubuntu1"}, {"curl", "7.81.0-1"}};
  auto d = diff_packages(prev, curr);
  ASSERT_EQ(1u, d.added.size());
  ASSERT_EQ(1u, d.removed.size());
  ASSERT_EQ(1u, d.changed.size());
  ASSERT_EQ(std::string("openssl"), d.removed[0].name);
}
