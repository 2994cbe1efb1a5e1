#pragma once
#include "media_source.hpp"
#include <ostream>
#include <string>
#include <vector>

struct YtDlpConfig {
  // Downloader binary name or path
  std::string binary = "yt-dlp";
  // Extra CLI arguments appended to every invocation
  std::string extra_args;
  // Let yt-dlp print its own progress and warnings
  bool verbose = false;
};

// MediaSource backed by the yt-dlp executable.
class YtDlpSource : public MediaSource {
public:
  YtDlpSource(const YtDlpConfig& cfg, std::ostream& log);

  std::vector<std::string> list_video_ids(const std::string& collection_url) override;
  std::optional<CaptionTrack> fetch_captions(const std::string& video_id,
                                             const std::string& lang) override;
  void fetch_clip(const ClipRequest& req) override;

private:
  std::string base_command() const;
  // Runs `cmd`, collecting stdout into `out` when given. Returns the exit code.
  int run(const std::string& cmd, std::string* out) const;

  YtDlpConfig cfg_;
  std::ostream& log_;
};

// Shell-safe single quoting.
std::string shell_quote(const std::string& s);

// Ids from `--flat-playlist --dump-single-json` output. Channel pages nest
// one more level of `entries` (one per tab).
std::vector<std::string> parse_video_listing(const std::string& json_text);

// Video and channel from a `.info.json`; cues are left empty.
// Throws MetadataError when required fields are missing or malformed.
CaptionTrack parse_info_json(const std::string& json_text);
