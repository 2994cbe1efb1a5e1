#pragma once
#include "media_source.hpp"
#include "search.hpp"
#include <filesystem>
#include <memory>
#include <ostream>
#include <set>
#include <string>
#include <vector>

// Keys of clips already downloaded into a folder, persisted as archive.txt
// with one "<video_id> <start>-<end>" line per clip.
class ClipArchive {
public:
  explicit ClipArchive(const std::filesystem::path& file);

  bool contains(const std::string& key) const { return keys_.count(key) != 0; }
  void add(const std::string& key);

  static std::string key_for(const std::string& video_id, int start, int end);

private:
  std::filesystem::path file_;
  std::set<std::string> keys_;
};

struct ClipWindow {
  int start_seconds;
  int end_seconds;
};

enum class ClipOutcome { downloaded, already_archived };

struct ClipBatchSummary {
  size_t downloaded = 0;
  size_t already_archived = 0;
  size_t failed = 0;
};

// [start - spacing, end + spacing], never before the start of the video.
ClipWindow window_for(const ResultRow& row, int spacing_seconds);

// "<title>.<video_id>.<start_time>-<end_time>" with path-unsafe characters
// replaced, so several clips of one video never collide.
std::string clip_stem(const ResultRow& row);

class ClipExtractor {
public:
  ClipExtractor(MediaSource& source, const std::filesystem::path& folder,
                int spacing_seconds, std::ostream& log);

  // Throws MediaSourceError when the download fails.
  ClipOutcome extract(const ResultRow& row);
  ClipBatchSummary extract_all(const std::vector<ResultRow>& rows);

private:
  ClipArchive& archive();

  MediaSource& source_;
  std::filesystem::path folder_;
  int spacing_;
  std::ostream& log_;
  std::unique_ptr<ClipArchive> archive_;
};
