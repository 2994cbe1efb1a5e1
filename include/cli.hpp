#pragma once
#include <string>

// Exit status of the binary.
constexpr int EXIT_OK = 0;
constexpr int EXIT_FATAL = 1;     // usage or top-level error
constexpr int EXIT_ABORTED = 130; // interrupted by the user

struct Args {
  std::string mode;          // index, search, list-channels, list-videos, stats,
                             // remove-channel, remove-video
  std::string target;        // url, search text, uploader id or video id
  std::string sqlite_path = "youtube.db"; // $DB_PATH overrides, --db overrides both
  std::string ytdlp = "yt-dlp";
  std::string lang;          // index defaults to "es"; search: any
  std::string user;          // search: restrict to one uploader id
  std::string format;        // "" or "json"
  int max_threads = 0;       // 0 = pick from hardware
  bool verbose = false;
  bool download_parts = false;
  int spacing_secs = 5;
};

Args parse_cli(int argc, char** argv);
