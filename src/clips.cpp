#include "clips.hpp"
#include "log.hpp"
#include <re2/re2.h>
#include <algorithm>
#include <exception>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

ClipArchive::ClipArchive(const fs::path& file) : file_(file) {
  std::ifstream in(file_);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (!line.empty()) keys_.insert(line);
  }
}

void ClipArchive::add(const std::string& key) {
  if (contains(key)) return;
  std::ofstream out(file_, std::ios::app);
  out << key << "\n";
  out.flush();
  if (!out) throw std::runtime_error("cannot append to " + file_.string());
  keys_.insert(key);
}

std::string ClipArchive::key_for(const std::string& video_id, int start, int end) {
  return video_id + " " + std::to_string(start) + "-" + std::to_string(end);
}

ClipWindow window_for(const ResultRow& row, int spacing_seconds) {
  return ClipWindow{ std::max(0, row.start_seconds - spacing_seconds),
                     row.end_seconds + spacing_seconds };
}

std::string clip_stem(const ResultRow& row) {
  std::string stem = row.video_title + "." + row.video_id + "." +
                     row.start_time + "-" + row.end_time;
  static const RE2 unsafe(R"([/\\:*?"<>|[:cntrl:]])");
  RE2::GlobalReplace(&stem, unsafe, "_");
  return stem;
}

ClipExtractor::ClipExtractor(MediaSource& source, const fs::path& folder,
                             int spacing_seconds, std::ostream& log)
  : source_(source), folder_(folder), spacing_(spacing_seconds), log_(log) {}

ClipArchive& ClipExtractor::archive() {
  if (!archive_) {
    fs::create_directories(folder_);
    archive_.reset(new ClipArchive(folder_ / "archive.txt"));
  }
  return *archive_;
}

ClipOutcome ClipExtractor::extract(const ResultRow& row) {
  ClipWindow w = window_for(row, spacing_);
  std::string key = ClipArchive::key_for(row.video_id, w.start_seconds, w.end_seconds);
  if (archive().contains(key)) {
    log_write(log_, "[clips] Already downloaded: " + key + "\n");
    return ClipOutcome::already_archived;
  }

  ClipRequest req;
  req.url = row.link;
  req.start_seconds = w.start_seconds;
  req.end_seconds = w.end_seconds;
  req.output_stem = (folder_ / clip_stem(row)).string();

  log_write(log_, "[clips] Downloading " + row.video_id + " [" + std::to_string(w.start_seconds) +
                  "-" + std::to_string(w.end_seconds) + "] " + row.text + "\n");
  source_.fetch_clip(req);
  archive().add(key);
  return ClipOutcome::downloaded;
}

ClipBatchSummary ClipExtractor::extract_all(const std::vector<ResultRow>& rows) {
  ClipBatchSummary s;
  for (auto& row : rows) {
    try {
      switch (extract(row)) {
        case ClipOutcome::downloaded:       ++s.downloaded; break;
        case ClipOutcome::already_archived: ++s.already_archived; break;
      }
    } catch (const std::exception& e) {
      log_write(log_, "[clips] Failed " + row.video_id + " @" + row.start_time + ": " + e.what() + "\n");
      ++s.failed;
    }
  }
  return s;
}
