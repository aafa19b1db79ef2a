#include "minitest.hpp"
#include "core/state.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace ntfsmh;

TEST(marker_save_creates_parent_and_overwrites) {
  auto root = fs::temp_directory_path() / fs::path("ntfsmh_test_state_") / fs::path(std::to_string(::getpid()));
  fs::path path = root / "run" / "ntfs-mount-helper.lastrun";
  ASSERT_TRUE(LastRunMarker{"first"}.save(path));
  ASSERT_TRUE(LastRunMarker{"second"}.save(path));
  ASSERT_EQ(load_lastrun_marker(path).timestamp, std::string("second"));
  fs::remove_all(root);
}

TEST(marker_now_is_date_formatted) {
  std::string ts = LastRunMarker::now().timestamp;
  ASSERT_TRUE(ts.size() > 20);
  // "Mon Oct 19 20:16:00 UTC 2026": weekday, month, day, time, zone, year
  ASSERT_EQ(ts[3], ' ');
  ASSERT_TRUE(ts.find(':') != std::string::npos);
}

TEST(marker_missing_reads_empty) {
  ASSERT_TRUE(load_lastrun_marker("/nonexistent/ntfsmh.lastrun").timestamp.empty());
}
