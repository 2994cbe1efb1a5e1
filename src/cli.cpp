#include "cli.hpp"
#include <cstdlib>
#include <iostream>
#include <stdexcept>

static const char* USAGE =
"supercut index <url> [--lang es] [--max-threads N] [--verbose]\n"
"supercut search \"text\" [--user ID] [--lang L] [--format json] [--download-parts] [--spacing-secs N]\n"
"supercut list-channels [--format json]\n"
"supercut list-videos [--format json]\n"
"supercut stats [--format json]\n"
"supercut remove-channel <uploader_id>\n"
"supercut remove-video <video_id>\n"
"common: [--db path] [--ytdlp path]\n";

static int to_int(const std::string& flag, const std::string& v) {
  try {
    return std::stoi(v);
  } catch (const std::exception&) {
    std::cerr << "Invalid number for " << flag << ": " << v << "\n";
    std::exit(EXIT_FATAL);
  }
}

Args parse_cli(int argc, char** argv) {
  Args a;
  if (const char* env = std::getenv("DB_PATH")) {
    if (env[0] != '\0') a.sqlite_path = env;
  }
  if (argc < 2) { std::cerr << USAGE; std::exit(EXIT_FATAL); }
  a.mode = argv[1];
  int i = 2;
  if (a.mode == "index" || a.mode == "search" ||
      a.mode == "remove-channel" || a.mode == "remove-video") {
    if (i >= argc) { std::cerr << USAGE; std::exit(EXIT_FATAL); }
    a.target = argv[i++];
  } else if (a.mode != "list-channels" && a.mode != "list-videos" && a.mode != "stats") {
    std::cerr << USAGE; std::exit(EXIT_FATAL);
  }

  while (i < argc) {
    std::string f = argv[i++];
    auto next = [&](std::string& dst){
      if (i >= argc) { std::cerr << "Missing value after " << f << "\n"; std::exit(EXIT_FATAL); }
      dst = argv[i++];
    };
    if (f == "--db") next(a.sqlite_path);
    else if (f == "--ytdlp") next(a.ytdlp);
    else if (f == "--lang") next(a.lang);
    else if (f == "--user") next(a.user);
    else if (f == "--format") next(a.format);
    else if (f == "--max-threads") { std::string v; next(v); a.max_threads = to_int(f, v); }
    else if (f == "--spacing-secs") { std::string v; next(v); a.spacing_secs = to_int(f, v); }
    else if (f == "--verbose") a.verbose = true;
    else if (f == "--download-parts") a.download_parts = true;
    else { std::cerr << "Unknown flag: " << f << "\n"; std::exit(EXIT_FATAL); }
  }
  if (a.mode == "index" && a.lang.empty()) a.lang = "es";
  if (!a.format.empty() && a.format != "json") {
    std::cerr << "Unknown format: " << a.format << "\n"; std::exit(EXIT_FATAL);
  }
  return a;
}
