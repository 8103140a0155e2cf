#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <set>

#include "reel_cut/cleanup.hpp"
#include "reel_cut/job.hpp"

using namespace reel_cut;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

class CleanupTest : public ::testing::Test {
protected:
  fs::path root;

  void SetUp() override {
    root = fs::temp_directory_path() / ("reel_cut_cleanup_" + generate_job_id());
    ASSERT_TRUE(ensure_temp_directories(root));
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(root, ec);
  }

  static void touch(const fs::path &p, size_t bytes = 16) {
    fs::create_directories(p.parent_path());
    std::ofstream out(p, std::ios::binary);
    out << std::string(bytes, 'x');
  }

  static void age(const fs::path &p, std::chrono::hours by) {
    fs::last_write_time(p, fs::file_time_type::clock::now() - by);
  }
};

TEST_F(CleanupTest, CreatesLayout) {
  EXPECT_TRUE(fs::is_directory(downloads_dir(root)));
  EXPECT_TRUE(fs::is_directory(outputs_dir(root)));
  EXPECT_EQ(job_output_dir(root, "abc"), root / "outputs" / "abc");
}

TEST_F(CleanupTest, RemovesOnlyOldItems) {
  fs::path old_video = downloads_dir(root) / "aaaaaaaaaaa.mp4";
  fs::path new_video = downloads_dir(root) / "bbbbbbbbbbb.mp4";
  fs::path old_job = job_output_dir(root, "old-job");
  fs::path new_job = job_output_dir(root, "new-job");
  touch(old_video);
  touch(new_video);
  touch(old_job / "clip_1.mp4");
  touch(new_job / "clip_1.mp4");
  age(old_video, 48h);
  age(old_job, 48h);

  EXPECT_EQ(cleanup_old_files(root, 24h), 2);
  EXPECT_FALSE(fs::exists(old_video));
  EXPECT_FALSE(fs::exists(old_job));
  EXPECT_TRUE(fs::exists(new_video));
  EXPECT_TRUE(fs::exists(new_job / "clip_1.mp4"));
}

TEST_F(CleanupTest, SkipsEntriesHeldByUnfinishedJobs) {
  fs::path cached = downloads_dir(root) / "dQw4w9WgXcQ.mp4";
  fs::path other = downloads_dir(root) / "oHg5SJYRHA0.mp4";
  fs::path running = job_output_dir(root, "running");
  touch(cached);
  touch(other);
  touch(running / "clip_1.mp4");
  age(cached, 25h);
  age(other, 25h);
  age(running, 25h);

  // Keys are normalized, so a relative-looking spelling still matches
  std::set<std::string> in_use = {
      artifact_key(downloads_dir(root) / "." / "dQw4w9WgXcQ.mp4"),
      artifact_key(running)};
  EXPECT_EQ(cleanup_old_files(root, 24h, in_use), 1);
  EXPECT_TRUE(fs::exists(cached));
  EXPECT_TRUE(fs::exists(running / "clip_1.mp4"));
  EXPECT_FALSE(fs::exists(other));

  EXPECT_EQ(cleanup_old_files(root, 24h), 2);
  EXPECT_FALSE(fs::exists(cached));
}

TEST_F(CleanupTest, ZeroAgeRemovesEverything) {
  touch(downloads_dir(root) / "a.mp4");
  touch(job_output_dir(root, "j1") / "clip_1.mp4");
  touch(job_output_dir(root, "j2") / "clip_1.mp4");

  EXPECT_EQ(cleanup_old_files(root, 0s), 3);
  EXPECT_TRUE(fs::is_empty(downloads_dir(root)));
  EXPECT_TRUE(fs::is_empty(outputs_dir(root)));
}

TEST_F(CleanupTest, MissingTempDirIsNotAnError) {
  EXPECT_EQ(cleanup_old_files(root / "does-not-exist", 0s), 0);
}

TEST_F(CleanupTest, RemoveJobArtifactsAndUsage) {
  touch(job_output_dir(root, "job-1") / "clip_1.mp4", 100);
  touch(job_output_dir(root, "job-1") / "clip_2.mp4", 50);
  touch(downloads_dir(root) / "v.mp4", 10);

  StorageUsage usage = storage_usage(root);
  EXPECT_EQ(usage.files, 3u);
  EXPECT_EQ(usage.bytes, 160u);

  EXPECT_TRUE(remove_job_artifacts(root, "job-1"));
  EXPECT_FALSE(fs::exists(job_output_dir(root, "job-1")));
  EXPECT_TRUE(remove_job_artifacts(root, "never-existed"));
  EXPECT_FALSE(remove_job_artifacts(root, ""));
  EXPECT_EQ(storage_usage(root).files, 1u);
}
