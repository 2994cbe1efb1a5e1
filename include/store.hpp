#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

struct Channel {
  std::string uploader_id;  // stable handle, e.g. @user
  std::string channel_name;
  std::string channel_url;
};

struct Video {
  std::string video_id;
  std::string video_title;
  std::string video_url;
  std::string uploader_id;
  std::string upload_date;  // YYYY-MM-DD, may be empty
};

struct Segment {
  long long subtitle_id = 0; // assigned by the store
  std::string video_id;
  std::string lang;
  int start_seconds = 0;     // floor of cue start
  int end_seconds = 0;       // ceil of cue end
  std::string start_time;    // HH:MM:SS.mmm
  std::string end_time;
  std::string text;
};

struct Stats {
  long long channels = 0;
  long long videos = 0;
};

class StoreError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// SQLite-backed archive. Every mutating call takes one process-wide write
// lock and runs in its own transaction; reads go through separate read-only
// connections and only see committed data.
class Store {
public:
  explicit Store(const std::string& sqlite_path);
  ~Store();
  Store(const Store&) = delete;
  Store& operator=(const Store&) = delete;

  void ensure_schema();
  const std::string& path() const { return path_; }

  void upsert_channel(const Channel& c);
  void upsert_video(const Video& v);
  // Deletes every segment of (video_id, lang), then inserts `segments`.
  void replace_segments(const std::string& video_id, const std::string& lang,
                        const std::vector<Segment>& segments);
  void set_language_availability(const std::string& video_id, const std::string& lang,
                                 bool available);

  // The per-video write unit: channel, video, segments and availability=true
  // committed together or not at all.
  void write_captions(const Channel& c, const Video& v, const std::string& lang,
                      const std::vector<Segment>& segments);

  void delete_video(const std::string& video_id);
  void delete_channel(const std::string& uploader_id);

  std::vector<Channel> list_channels() const;
  std::vector<Video> list_videos() const;
  std::optional<Channel> get_channel(const std::string& uploader_id) const;
  std::optional<Video> get_video(const std::string& video_id) const;
  std::vector<Segment> get_segments(const std::string& video_id, const std::string& lang) const;
  // nullopt when no attempt was ever recorded for the pair
  std::optional<bool> language_availability(const std::string& video_id,
                                            const std::string& lang) const;
  Stats stats() const;

private:
  std::string path_;
  struct Impl;
  Impl* impl_;
};
