// src/search.cpp
#include "search.hpp"
#include "sqlite_db.hpp"
#include <string>

struct ResultCursor::Impl {
  Db db;
  Stmt st;
  bool finished = false;

  Impl(const std::string& path, const char* sql) : db(Db::reader(path)), st(db, sql) {}
};

namespace {

std::string select_sql(const SearchQuery& q) {
  // ?1 text, ?2 lang, ?3 uploader_id; filters left out are simply not bound
  std::string sql =
    "SELECT subtitle_id, video_id, uploader_id, video_title, upload_date, channel_name,"
    " start_seconds, end_seconds, start_time, end_time, lang, text, link"
    " FROM subtitles_with_videos"
    " WHERE subtitle_id IN (SELECT rowid FROM subtitles_fts WHERE subtitles_fts MATCH ?1)";
  if (!q.lang.empty()) sql += " AND lang = ?2";
  if (!q.uploader_id.empty())
    sql += " AND video_id IN (SELECT video_id FROM videos WHERE uploader_id = ?3)";
  sql += " ORDER BY video_id, start_seconds ASC;";
  return sql;
}

} // namespace

ResultCursor::ResultCursor(const std::string& sqlite_path, const SearchQuery& q)
  : impl_(new Impl(sqlite_path, select_sql(q).c_str())) {
  impl_->st.bind(1, q.text);
  if (!q.lang.empty()) impl_->st.bind(2, q.lang);
  if (!q.uploader_id.empty()) impl_->st.bind(3, q.uploader_id);
}

ResultCursor::~ResultCursor() = default;
ResultCursor::ResultCursor(ResultCursor&&) noexcept = default;
ResultCursor& ResultCursor::operator=(ResultCursor&&) noexcept = default;

bool ResultCursor::next(ResultRow& out) {
  if (!impl_ || impl_->finished) return false;
  auto& st = impl_->st;
  if (!st.step()) {
    impl_->finished = true;
    return false;
  }
  out.subtitle_id   = st.int64(0);
  out.video_id      = st.text(1);
  out.uploader_id   = st.text(2);
  out.video_title   = st.text(3);
  out.upload_date   = st.text(4);
  out.channel_name  = st.text(5);
  out.start_seconds = st.integer(6);
  out.end_seconds   = st.integer(7);
  out.start_time    = st.text(8);
  out.end_time      = st.text(9);
  out.lang          = st.text(10);
  out.text          = st.text(11);
  out.link          = st.text(12);
  return true;
}

ResultCursor search(const Store& store, const SearchQuery& q) {
  return ResultCursor(store.path(), q);
}

std::vector<ResultRow> search_all(const Store& store, const SearchQuery& q) {
  auto cursor = search(store, q);
  std::vector<ResultRow> rows;
  ResultRow r;
  while (cursor.next(r)) rows.push_back(r);
  return rows;
}
