#pragma once
#include "store.hpp"
#include <memory>
#include <string>
#include <vector>

// One row of the subtitles_with_videos view.
struct ResultRow {
  long long subtitle_id = 0;
  std::string video_id;
  std::string uploader_id;
  std::string video_title;
  std::string upload_date;
  std::string channel_name;
  int start_seconds = 0;
  int end_seconds = 0;
  std::string start_time;
  std::string end_time;
  std::string lang;
  std::string text;
  std::string link;   // video url with padded &start= / &end=
};

struct SearchQuery {
  std::string text;         // FTS5 match expression
  std::string uploader_id;  // optional, empty = any channel
  std::string lang;         // optional, empty = any language
};

// Single-pass, read-only cursor over matching rows, ordered by video id then
// start second. Holds its own connection; run the search again to restart.
class ResultCursor {
public:
  ResultCursor(const std::string& sqlite_path, const SearchQuery& q);
  ~ResultCursor();
  ResultCursor(ResultCursor&&) noexcept;
  ResultCursor& operator=(ResultCursor&&) noexcept;

  bool next(ResultRow& out);

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

ResultCursor search(const Store& store, const SearchQuery& q);
std::vector<ResultRow> search_all(const Store& store, const SearchQuery& q);
