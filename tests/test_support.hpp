#pragma once
// Shared fixtures: throwaway database files and an in-memory MediaSource.
#include "media_source.hpp"
#include "store.hpp"

#include <unistd.h>
#include <atomic>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

inline fs::path unique_temp_path(const std::string& stem) {
  static std::atomic<int> counter{0};
  return fs::temp_directory_path() /
         (stem + "-" + std::to_string(::getpid()) + "-" + std::to_string(counter++));
}

// Removes the database and its WAL side files on destruction. Declare it
// before the Store that uses it.
struct TempDb {
  std::string path = unique_temp_path("supercut-test").string() + ".db";

  ~TempDb() {
    std::error_code ec;
    for (const char* suffix : { "", "-wal", "-shm" }) fs::remove(path + suffix, ec);
  }
};

struct TempFolder {
  fs::path path = unique_temp_path("supercut-clips");

  ~TempFolder() {
    std::error_code ec;
    fs::remove_all(path, ec);
  }
};

inline Cue cue(double start, double end, const std::string& text) {
  return Cue{ start, end, "start", "end", text };
}

inline Channel channel(const std::string& uploader_id) {
  return Channel{ uploader_id, "Channel " + uploader_id, "https://www.youtube.com/" + uploader_id };
}

inline Video video(const std::string& video_id, const std::string& uploader_id,
                   const std::string& url = "") {
  return Video{ video_id, "Title " + video_id,
                url.empty() ? "https://www.youtube.com/watch?v=" + video_id : url,
                uploader_id, "2023-04-05" };
}

inline Segment segment(int start, int end, const std::string& text) {
  Segment s;
  s.start_seconds = start;
  s.end_seconds = end;
  s.start_time = "00:00:" + std::to_string(start) + ".000";
  s.end_time = "00:00:" + std::to_string(end) + ".000";
  s.text = text;
  return s;
}

inline CaptionTrack track(const std::string& video_id, const std::string& uploader_id,
                          std::vector<Cue> cues) {
  return CaptionTrack{ std::move(cues), video(video_id, uploader_id), channel(uploader_id) };
}

class FakeSource : public MediaSource {
public:
  std::vector<std::string> listing;
  std::set<std::string> failing_ids;
  std::set<std::string> failing_clip_urls;
  std::function<void(const std::string&)> on_fetch;

  void add(const std::string& lang, const CaptionTrack& t) {
    tracks_[t.video.video_id + "/" + lang] = t;
  }
  // registers a track under an id that differs from its metadata
  void add_as(const std::string& id, const std::string& lang, const CaptionTrack& t) {
    tracks_[id + "/" + lang] = t;
  }

  int caption_calls() const { return caption_calls_.load(); }
  std::vector<ClipRequest> clips() const {
    std::lock_guard<std::mutex> lk(mu_);
    return clips_;
  }

  std::vector<std::string> list_video_ids(const std::string&) override { return listing; }

  std::optional<CaptionTrack> fetch_captions(const std::string& video_id,
                                             const std::string& lang) override {
    ++caption_calls_;
    if (on_fetch) on_fetch(video_id);
    if (failing_ids.count(video_id)) throw MediaSourceError("network down for " + video_id);
    auto it = tracks_.find(video_id + "/" + lang);
    if (it == tracks_.end()) return std::nullopt;
    return it->second;
  }

  void fetch_clip(const ClipRequest& req) override {
    if (failing_clip_urls.count(req.url)) throw MediaSourceError("clip failed: " + req.url);
    std::lock_guard<std::mutex> lk(mu_);
    clips_.push_back(req);
  }

private:
  std::map<std::string, CaptionTrack> tracks_;
  std::atomic<int> caption_calls_{0};
  mutable std::mutex mu_;
  std::vector<ClipRequest> clips_;
};
