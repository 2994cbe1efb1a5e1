#pragma once
#include "captions.hpp"
#include "store.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// Everything a successful caption fetch yields for one video.
struct CaptionTrack {
  std::vector<Cue> cues;
  Video video;
  Channel channel;
};

struct ClipRequest {
  std::string url;          // the video's page url
  int start_seconds = 0;    // window, already padded
  int end_seconds = 0;
  std::string output_stem;  // destination path without extension
};

class MediaSourceError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Fetched fine, but the metadata could not be turned into a Video/Channel.
class MetadataError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Network-facing collaborator. Calls may be slow and may be issued from
// several worker threads at once.
class MediaSource {
public:
  virtual ~MediaSource() = default;

  virtual std::vector<std::string> list_video_ids(const std::string& collection_url) = 0;
  // nullopt when the video has no caption track in `lang`
  virtual std::optional<CaptionTrack> fetch_captions(const std::string& video_id,
                                                     const std::string& lang) = 0;
  virtual void fetch_clip(const ClipRequest& req) = 0;
};
