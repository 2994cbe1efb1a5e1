#include "store.hpp"
#include "sqlite_db.hpp"
#include <mutex>

namespace {

const char* SCHEMA =
  "CREATE TABLE IF NOT EXISTS channels ("
  " uploader_id TEXT PRIMARY KEY,"
  " channel_name TEXT,"
  " channel_url TEXT NOT NULL"
  ");"
  "CREATE TABLE IF NOT EXISTS videos ("
  " video_id TEXT PRIMARY KEY,"
  " video_title TEXT NOT NULL,"
  " video_url TEXT NOT NULL,"
  " uploader_id TEXT REFERENCES channels(uploader_id),"
  " upload_date TEXT"
  ");"
  "CREATE INDEX IF NOT EXISTS idx_videos_uploader_id ON videos(uploader_id);"
  "CREATE TABLE IF NOT EXISTS subtitles ("
  " subtitle_id INTEGER PRIMARY KEY,"
  " video_id TEXT REFERENCES videos(video_id),"
  " start_time TEXT NOT NULL,"
  " end_time TEXT NOT NULL,"
  " start_seconds INTEGER NOT NULL,"
  " end_seconds INTEGER NOT NULL,"
  " lang TEXT NOT NULL,"
  " text TEXT NOT NULL"
  ");"
  "CREATE INDEX IF NOT EXISTS idx_subtitles_video_lang ON subtitles(video_id, lang);"
  "CREATE VIRTUAL TABLE IF NOT EXISTS subtitles_fts USING fts5("
  " text, content='subtitles', content_rowid='subtitle_id'"
  ");"
  "CREATE TRIGGER IF NOT EXISTS subtitles_ai AFTER INSERT ON subtitles BEGIN"
  " INSERT INTO subtitles_fts(rowid, text) VALUES (new.subtitle_id, new.text);"
  " END;"
  "CREATE TRIGGER IF NOT EXISTS subtitles_ad AFTER DELETE ON subtitles BEGIN"
  " INSERT INTO subtitles_fts(subtitles_fts, rowid, text) VALUES ('delete', old.subtitle_id, old.text);"
  " END;"
  "CREATE TRIGGER IF NOT EXISTS subtitles_au AFTER UPDATE ON subtitles BEGIN"
  " INSERT INTO subtitles_fts(subtitles_fts, rowid, text) VALUES ('delete', old.subtitle_id, old.text);"
  " INSERT INTO subtitles_fts(rowid, text) VALUES (new.subtitle_id, new.text);"
  " END;"
  "CREATE TABLE IF NOT EXISTS video_languages ("
  " video_id TEXT NOT NULL,"
  " lang TEXT NOT NULL,"
  " available INTEGER NOT NULL DEFAULT 1,"
  " PRIMARY KEY (video_id, lang)"
  ");"
  // clip link pads 4s before and 2s after the segment
  "CREATE VIEW IF NOT EXISTS subtitles_with_videos AS"
  " SELECT"
  "  s.subtitle_id, v.video_id, v.uploader_id, v.video_title, v.upload_date,"
  "  c.channel_name, s.start_seconds, s.end_seconds, s.start_time, s.end_time,"
  "  s.lang, s.text,"
  "  v.video_url || '&start=' || (s.start_seconds - 4) || '&end=' || (s.end_seconds + 2) AS link"
  " FROM subtitles s"
  " JOIN videos v ON s.video_id = v.video_id"
  " JOIN channels c ON v.uploader_id = c.uploader_id;";

void upsert_channel_in(Db& db, const Channel& c) {
  Stmt st(db,
    "INSERT INTO channels (uploader_id, channel_name, channel_url) VALUES (?, ?, ?) "
    "ON CONFLICT(uploader_id) DO UPDATE SET "
    " channel_name=excluded.channel_name, channel_url=excluded.channel_url;");
  st.bind(1, c.uploader_id);
  st.bind(2, c.channel_name);
  st.bind(3, c.channel_url);
  st.run();
}

void upsert_video_in(Db& db, const Video& v) {
  Stmt st(db,
    "INSERT INTO videos (video_id, video_title, video_url, uploader_id, upload_date) "
    "VALUES (?, ?, ?, ?, ?) "
    "ON CONFLICT(video_id) DO UPDATE SET "
    " video_title=excluded.video_title, video_url=excluded.video_url, "
    " uploader_id=excluded.uploader_id, upload_date=excluded.upload_date;");
  st.bind(1, v.video_id);
  st.bind(2, v.video_title);
  st.bind(3, v.video_url);
  st.bind(4, v.uploader_id);
  st.bind(5, v.upload_date);
  st.run();
}

void replace_segments_in(Db& db, const std::string& video_id, const std::string& lang,
                         const std::vector<Segment>& segments) {
  Stmt del(db, "DELETE FROM subtitles WHERE video_id = ? AND lang = ?;");
  del.bind(1, video_id);
  del.bind(2, lang);
  del.run();

  Stmt ins(db,
    "INSERT INTO subtitles (video_id, start_time, end_time, start_seconds, end_seconds, lang, text) "
    "VALUES (?, ?, ?, ?, ?, ?, ?);");
  for (auto& s : segments) {
    ins.bind(1, video_id);
    ins.bind(2, s.start_time);
    ins.bind(3, s.end_time);
    ins.bind(4, s.start_seconds);
    ins.bind(5, s.end_seconds);
    ins.bind(6, lang);
    ins.bind(7, s.text);
    ins.run();
    ins.reset();
  }
}

void set_availability_in(Db& db, const std::string& video_id, const std::string& lang,
                         bool available) {
  Stmt st(db,
    "INSERT INTO video_languages (video_id, lang, available) VALUES (?, ?, ?) "
    "ON CONFLICT(video_id, lang) DO UPDATE SET available=excluded.available;");
  st.bind(1, video_id);
  st.bind(2, lang);
  st.bind(3, available);
  st.run();
}

Channel read_channel(const Stmt& st) {
  return Channel{ st.text(0), st.text(1), st.text(2) };
}

Video read_video(const Stmt& st) {
  return Video{ st.text(0), st.text(1), st.text(2), st.text(3), st.text(4) };
}

} // namespace

struct Store::Impl {
  explicit Impl(const std::string& path)
    : writer(path, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX) {}

  Db writer;
  // the single write section: sqlite connections are not safe for
  // interleaved writers, so every mutation goes through here
  std::mutex write_mu;

  template <class F>
  void write(F&& f) {
    std::lock_guard<std::mutex> lk(write_mu);
    Transaction tx(writer);
    f(writer);
    tx.commit();
  }
};

Store::Store(const std::string& path) : path_(path), impl_(new Impl(path)) {
  try {
    impl_->writer.exec("PRAGMA journal_mode=WAL;");
    impl_->writer.exec("PRAGMA foreign_keys=ON;");
    ensure_schema();
  } catch (...) {
    delete impl_;
    throw;
  }
}

Store::~Store() {
  delete impl_;
}

void Store::ensure_schema() {
  std::lock_guard<std::mutex> lk(impl_->write_mu);
  impl_->writer.exec(SCHEMA);
}

void Store::upsert_channel(const Channel& c) {
  impl_->write([&](Db& db) { upsert_channel_in(db, c); });
}

void Store::upsert_video(const Video& v) {
  impl_->write([&](Db& db) { upsert_video_in(db, v); });
}

void Store::replace_segments(const std::string& video_id, const std::string& lang,
                             const std::vector<Segment>& segments) {
  impl_->write([&](Db& db) { replace_segments_in(db, video_id, lang, segments); });
}

void Store::set_language_availability(const std::string& video_id, const std::string& lang,
                                      bool available) {
  impl_->write([&](Db& db) { set_availability_in(db, video_id, lang, available); });
}

void Store::write_captions(const Channel& c, const Video& v, const std::string& lang,
                           const std::vector<Segment>& segments) {
  impl_->write([&](Db& db) {
    upsert_channel_in(db, c);
    upsert_video_in(db, v);
    replace_segments_in(db, v.video_id, lang, segments);
    set_availability_in(db, v.video_id, lang, true);
  });
}

void Store::delete_video(const std::string& video_id) {
  impl_->write([&](Db& db) {
    const char* sqls[] = {
      "DELETE FROM subtitles WHERE video_id = ?;",
      "DELETE FROM video_languages WHERE video_id = ?;",
      "DELETE FROM videos WHERE video_id = ?;",
    };
    for (auto* sql : sqls) {
      Stmt st(db, sql);
      st.bind(1, video_id);
      st.run();
    }
  });
}

void Store::delete_channel(const std::string& uploader_id) {
  impl_->write([&](Db& db) {
    // children first, while the videos still identify them
    const char* sqls[] = {
      "DELETE FROM subtitles WHERE video_id IN (SELECT video_id FROM videos WHERE uploader_id = ?);",
      "DELETE FROM video_languages WHERE video_id IN (SELECT video_id FROM videos WHERE uploader_id = ?);",
      "DELETE FROM videos WHERE uploader_id = ?;",
      "DELETE FROM channels WHERE uploader_id = ?;",
    };
    for (auto* sql : sqls) {
      Stmt st(db, sql);
      st.bind(1, uploader_id);
      st.run();
    }
  });
}

std::vector<Channel> Store::list_channels() const {
  auto db = Db::reader(path_);
  Stmt st(db, "SELECT uploader_id, channel_name, channel_url FROM channels ORDER BY uploader_id;");
  std::vector<Channel> out;
  while (st.step()) out.push_back(read_channel(st));
  return out;
}

std::vector<Video> Store::list_videos() const {
  auto db = Db::reader(path_);
  Stmt st(db,
    "SELECT video_id, video_title, video_url, uploader_id, upload_date FROM videos "
    "ORDER BY uploader_id, upload_date, video_id;");
  std::vector<Video> out;
  while (st.step()) out.push_back(read_video(st));
  return out;
}

std::optional<Channel> Store::get_channel(const std::string& uploader_id) const {
  auto db = Db::reader(path_);
  Stmt st(db, "SELECT uploader_id, channel_name, channel_url FROM channels WHERE uploader_id = ?;");
  st.bind(1, uploader_id);
  if (!st.step()) return std::nullopt;
  return read_channel(st);
}

std::optional<Video> Store::get_video(const std::string& video_id) const {
  auto db = Db::reader(path_);
  Stmt st(db,
    "SELECT video_id, video_title, video_url, uploader_id, upload_date FROM videos "
    "WHERE video_id = ?;");
  st.bind(1, video_id);
  if (!st.step()) return std::nullopt;
  return read_video(st);
}

std::vector<Segment> Store::get_segments(const std::string& video_id,
                                         const std::string& lang) const {
  auto db = Db::reader(path_);
  Stmt st(db,
    "SELECT subtitle_id, start_seconds, end_seconds, start_time, end_time, text "
    "FROM subtitles WHERE video_id = ? AND lang = ? ORDER BY start_seconds, subtitle_id;");
  st.bind(1, video_id);
  st.bind(2, lang);
  std::vector<Segment> out;
  while (st.step()) {
    Segment s;
    s.subtitle_id = st.int64(0);
    s.video_id = video_id;
    s.lang = lang;
    s.start_seconds = st.integer(1);
    s.end_seconds = st.integer(2);
    s.start_time = st.text(3);
    s.end_time = st.text(4);
    s.text = st.text(5);
    out.push_back(std::move(s));
  }
  return out;
}

std::optional<bool> Store::language_availability(const std::string& video_id,
                                                 const std::string& lang) const {
  auto db = Db::reader(path_);
  Stmt st(db, "SELECT available FROM video_languages WHERE video_id = ? AND lang = ?;");
  st.bind(1, video_id);
  st.bind(2, lang);
  if (!st.step()) return std::nullopt;
  return st.integer(0) != 0;
}

Stats Store::stats() const {
  auto db = Db::reader(path_);
  Stmt st(db,
    "SELECT (SELECT COUNT(*) FROM channels), (SELECT COUNT(*) FROM videos);");
  Stats s;
  if (st.step()) {
    s.channels = st.int64(0);
    s.videos = st.int64(1);
  }
  return s;
}
