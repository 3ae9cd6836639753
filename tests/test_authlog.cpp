#include "minitest.hpp"
#include "fixtures.hpp"
#include "collectors/AuthLogCollector.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

using namespace std::chrono_literals;
using fixtures::append_file;
using fixtures::write_file;
using vigil::collectors::AuthLogCollector;
using vigil::model::Event;
using vigil::model::EventType;
using vigil::model::Severity;

struct Captured {
  std::mutex mu;
  std::vector<Event> events;
  size_t size() { std::lock_guard<std::mutex> lk(mu); return events.size(); }
};

static std::string failed_line(const std::string& user, const std::string& ip) {
  return "Oct 19 10:00:01 web1 sshd[2211]: Failed password for " + user + " from " + ip + " port 50522 ssh2\n";
}

TEST(authlog_failed_logins_raise_brute_force) {
  auto root = fixtures::make_root("authlog");
  auto log = root / "auth.log";
  std::string body;
  for (int i = 0; i < AuthLogCollector::kBruteForceThreshold; ++i) body += failed_line("root", "203.0.113.5");
  body += "Oct 19 10:00:05 web1 sudo:    alice : 3 incorrect password attempts ; TTY=pts/0 ; PWD=/home/alice ; USER=root ; COMMAND=/bin/ls\n";
  body += "Oct 19 10:00:06 web1 CRON[99]: pam_unix(cron:session): session opened for user root\n";
  body += "Oct 19 10:00:07 web1 sshd[2300]: Invalid user admin from 198.51.100.2";  // no newline yet
  write_file(log, body);

  auto cap = std::make_shared<Captured>();
  AuthLogCollector c(log.string());
  c.set_event_sink([cap](Event e){ std::lock_guard<std::mutex> lk(cap->mu); cap->events.push_back(std::move(e)); });

  ASSERT_EQ(7, c.drain_once());
  ASSERT_EQ(7u, cap->size());
  int brute = 0, sudo = 0;
  for (auto& e : cap->events) {
    ASSERT_TRUE(e.type == EventType::Auth);
    if (e.dedup_key == "auth:bruteforce:203.0.113.5") { ++brute; ASSERT_TRUE(e.severity == Severity::High); }
    if (e.message.find("sudo") != std::string::npos) { ++sudo; ASSERT_EQ(std::string("alice"), e.details["user"].get<std::string>()); }
  }
  ASSERT_EQ(1, brute);
  ASSERT_EQ(1, sudo);

  // the partial line is finished by the next write
  append_file(log, " port 4000\n");
  ASSERT_EQ(1, c.drain_once());
  ASSERT_TRUE(cap->events.back().severity == Severity::Low);
  ASSERT_EQ(std::string("admin"), cap->events.back().details["user"].get<std::string>());
  ASSERT_EQ(0, c.drain_once());

  // a further failure from the same address does not repeat the brute-force event
  append_file(log, failed_line("root", "203.0.113.5"));
  ASSERT_EQ(1, c.drain_once());
}

TEST(authlog_persistent_source_is_reported_again) {
  auto root = fixtures::make_root("authlog_repeat");
  auto log = root / "auth.log";
  write_file(log, "");
  auto cap = std::make_shared<Captured>();
  AuthLogCollector c(log.string());
  c.set_event_sink([cap](Event e){ std::lock_guard<std::mutex> lk(cap->mu); cap->events.push_back(std::move(e)); });
  std::string body;
  for (int i = 0; i < 2 * AuthLogCollector::kBruteForceThreshold; ++i) body += failed_line("root", "203.0.113.77");
  append_file(log, body);
  c.drain_once();
  int brute = 0;
  for (auto& e : cap->events) if (e.dedup_key == "auth:bruteforce:203.0.113.77") ++brute;
  ASSERT_EQ(2, brute);
  ASSERT_EQ(1u, c.tracked_sources());
}

TEST(authlog_tracked_sources_stay_bounded) {
  auto root = fixtures::make_root("authlog_bounded");
  auto log = root / "auth.log";
  write_file(log, "");
  AuthLogCollector c(log.string());
  const size_t total = 3 * AuthLogCollector::kMaxTrackedSources;
  for (size_t batch = 0; batch < 3; ++batch) {
    std::string body;
    for (size_t i = 0; i < total / 3; ++i) {
      size_t n = batch * (total / 3) + i;
      body += failed_line("guest", "10." + std::to_string(n / 65536) + "." + std::to_string((n / 256) % 256) +
                                   "." + std::to_string(n % 256));
    }
    append_file(log, body);
    ASSERT_EQ(static_cast<int>(total / 3), c.drain_once());
    ASSERT_TRUE(c.tracked_sources() <= AuthLogCollector::kMaxTrackedSources);
  }
  ASSERT_EQ(AuthLogCollector::kMaxTrackedSources, c.tracked_sources());
}

TEST(authlog_rereads_after_rotation) {
  auto root = fixtures::make_root("authlog_rotate");
  auto log = root / "auth.log";
  write_file(log, failed_line("bob", "192.0.2.10") + failed_line("bob", "192.0.2.10"));
  AuthLogCollector c(log.string());
  ASSERT_EQ(2, c.drain_once());
  write_file(log, failed_line("eve", "192.0.2.11"));
  ASSERT_EQ(1, c.drain_once());
}

TEST(authlog_tails_in_background) {
  auto root = fixtures::make_root("authlog_tail");
  auto log = root / "auth.log";
  write_file(log, failed_line("old", "192.0.2.1"));
  auto cap = std::make_shared<Captured>();
  AuthLogCollector c(log.string(), 10ms);
  ASSERT_TRUE(!c.polls());
  c.set_event_sink([cap](Event e){ std::lock_guard<std::mutex> lk(cap->mu); cap->events.push_back(std::move(e)); });
  ASSERT_TRUE(c.start());
  ASSERT_TRUE(c.start());
  append_file(log, failed_line("mallory", "192.0.2.99"));
  ASSERT_TRUE(fixtures::wait_until([&]{ return cap->size() == 1; }));
  c.stop();
  c.stop();
  std::lock_guard<std::mutex> lk(cap->mu);
  ASSERT_EQ(std::string("mallory"), cap->events[0].details["user"].get<std::string>());
}

TEST(authlog_missing_file_is_unavailable) {
  auto root = fixtures::make_root("authlog_missing");
  AuthLogCollector c((root / "nope.log").string());
  ASSERT_TRUE(!c.start());
  c.stop();
  ASSERT_TRUE(!c.last_error().empty());
}
