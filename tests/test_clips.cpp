#include "clips.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <fstream>
#include <stdexcept>
#include <sstream>

namespace {

ResultRow row(const std::string& video_id, int start, int end) {
  ResultRow r;
  r.video_id = video_id;
  r.video_title = "My: Title/Part?";
  r.start_seconds = start;
  r.end_seconds = end;
  r.start_time = "00:01:40.000";
  r.end_time = "00:01:50.500";
  r.text = "texto";
  r.link = "https://www.youtube.com/watch?v=" + video_id + "&start=" +
           std::to_string(start - 4) + "&end=" + std::to_string(end + 2);
  return r;
}

} // namespace

TEST(ClipWindow, PadsBothSidesWithSpacing) {
  ClipWindow w = window_for(row("v", 100, 110), 5);
  EXPECT_EQ(w.start_seconds, 95);
  EXPECT_EQ(w.end_seconds, 115);
}

TEST(ClipWindow, NeverStartsBeforeZero) {
  ClipWindow w = window_for(row("v", 2, 4), 5);
  EXPECT_EQ(w.start_seconds, 0);
  EXPECT_EQ(w.end_seconds, 9);
}

TEST(ClipStem, EmbedsTitleIdAndTimesWithoutPathSeparators) {
  std::string stem = clip_stem(row("abc", 100, 110));
  EXPECT_EQ(stem, "My_ Title_Part_.abc.00_01_40.000-00_01_50.500");
}

TEST(ClipArchiveTest, PersistsKeys) {
  TempFolder folder;
  std::filesystem::create_directories(folder.path);
  auto file = folder.path / "archive.txt";
  {
    ClipArchive a(file);
    EXPECT_FALSE(a.contains("v 1-2"));
    a.add("v 1-2");
    a.add("v 1-2");
    EXPECT_TRUE(a.contains("v 1-2"));
  }
  ClipArchive b(file);
  EXPECT_TRUE(b.contains("v 1-2"));

  std::ifstream in(file);
  std::stringstream ss; ss << in.rdbuf();
  EXPECT_EQ(ss.str(), "v 1-2\n");
  EXPECT_EQ(ClipArchive::key_for("v", 1, 2), "v 1-2");
}

TEST(ClipArchiveTest, FailedAppendLeavesKeyUnrecorded) {
  TempFolder folder;
  // parent directory never created, so the append cannot open the file
  ClipArchive a(folder.path / "missing" / "archive.txt");
  EXPECT_THROW(a.add("v 1-2"), std::runtime_error);
  EXPECT_FALSE(a.contains("v 1-2"));
}

TEST(ClipExtractorTest, DownloadsOnceAcrossRuns) {
  TempFolder folder;
  FakeSource source;
  std::ostringstream log;

  {
    ClipExtractor clips(source, folder.path, 5, log);
    EXPECT_EQ(clips.extract(row("v1", 100, 110)), ClipOutcome::downloaded);
    EXPECT_EQ(clips.extract(row("v1", 100, 110)), ClipOutcome::already_archived);
  }
  ClipExtractor again(source, folder.path, 5, log);
  EXPECT_EQ(again.extract(row("v1", 100, 110)), ClipOutcome::already_archived);
  // same video, different range
  EXPECT_EQ(again.extract(row("v1", 200, 210)), ClipOutcome::downloaded);

  auto reqs = source.clips();
  ASSERT_EQ(reqs.size(), 2u);
  EXPECT_EQ(reqs[0].start_seconds, 95);
  EXPECT_EQ(reqs[0].end_seconds, 115);
  EXPECT_EQ(reqs[0].url, row("v1", 100, 110).link);
  EXPECT_EQ(reqs[0].output_stem, (folder.path / clip_stem(row("v1", 100, 110))).string());
  EXPECT_TRUE(std::filesystem::exists(folder.path / "archive.txt"));
}

TEST(ClipExtractorTest, SpacingChangesTheArchiveKey) {
  TempFolder folder;
  FakeSource source;
  std::ostringstream log;
  ClipExtractor narrow(source, folder.path, 1, log);
  ClipExtractor wide(source, folder.path, 10, log);
  EXPECT_EQ(narrow.extract(row("v1", 100, 110)), ClipOutcome::downloaded);
  EXPECT_EQ(wide.extract(row("v1", 100, 110)), ClipOutcome::downloaded);
  EXPECT_EQ(source.clips().size(), 2u);
}

TEST(ClipExtractorTest, FailuresDoNotStopTheBatch) {
  TempFolder folder;
  FakeSource source;
  std::ostringstream log;
  source.failing_clip_urls.insert(row("bad", 10, 20).link);

  ClipExtractor clips(source, folder.path, 5, log);
  auto s = clips.extract_all({ row("v1", 10, 20), row("bad", 10, 20), row("v2", 10, 20),
                               row("v1", 10, 20) });
  EXPECT_EQ(s.downloaded, 2u);
  EXPECT_EQ(s.failed, 1u);
  EXPECT_EQ(s.already_archived, 1u);
  EXPECT_NE(log.str().find("bad"), std::string::npos);

  // the failed clip was not archived and is retried
  source.failing_clip_urls.clear();
  EXPECT_EQ(clips.extract(row("bad", 10, 20)), ClipOutcome::downloaded);
}
