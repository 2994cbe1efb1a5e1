#include "ytdlp_source.hpp"
#include "log.hpp"
#include <nlohmann/json.hpp>
#include <re2/re2.h>
#include <sys/wait.h>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

// Private scratch directory, removed on scope exit.
struct TempDir {
  fs::path path;

  TempDir() {
    std::string tmpl = (fs::temp_directory_path() / "supercut-XXXXXX").string();
    if (!mkdtemp(tmpl.data()))
      throw MediaSourceError("cannot create temp directory under " +
                             fs::temp_directory_path().string());
    path = tmpl;
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path, ec);
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;
};

std::string read_file(const fs::path& p) {
  std::ifstream in(p, std::ios::binary);
  if (!in) throw MediaSourceError("cannot read " + p.string());
  std::ostringstream ss; ss << in.rdbuf();
  return ss.str();
}

std::string required(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string() || it->get<std::string>().empty())
    throw MetadataError(std::string("info json: missing '") + key + "'");
  return it->get<std::string>();
}

std::string optional_str(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) return {};
  return it->get<std::string>();
}

} // namespace

std::string shell_quote(const std::string& s) {
  std::string out = "'";
  for (char c : s) {
    if (c == '\'') out += "'\\''";
    else out += c;
  }
  out += '\'';
  return out;
}

std::vector<std::string> parse_video_listing(const std::string& json_text) {
  json info;
  try {
    info = json::parse(json_text);
  } catch (const json::exception& e) {
    throw MediaSourceError(std::string("listing: invalid json: ") + e.what());
  }

  std::vector<std::string> ids;
  auto id_of = [&](const json& e) {
    if (e.is_object() && e.contains("id") && e["id"].is_string())
      ids.push_back(e["id"].get<std::string>());
  };

  if (info.contains("entries") && info["entries"].is_array()) {
    for (auto& entry : info["entries"]) {
      if (entry.is_object() && entry.contains("entries") && entry["entries"].is_array()) {
        for (auto& sub : entry["entries"]) id_of(sub);
      } else {
        id_of(entry);
      }
    }
  } else {
    id_of(info);
  }
  return ids;
}

CaptionTrack parse_info_json(const std::string& json_text) {
  json info;
  try {
    info = json::parse(json_text);
  } catch (const json::exception& e) {
    throw MetadataError(std::string("info json: ") + e.what());
  }
  if (!info.is_object()) throw MetadataError("info json: not an object");

  CaptionTrack t;
  t.video.video_id = required(info, "id");
  t.video.video_title = required(info, "title");
  t.video.video_url = required(info, "webpage_url");

  std::string uploader_id = optional_str(info, "uploader_id");
  if (uploader_id.empty()) uploader_id = required(info, "channel_id");
  t.video.uploader_id = uploader_id;

  std::string date = optional_str(info, "upload_date");
  if (!date.empty()) {
    std::string y, m, d;
    if (!RE2::FullMatch(date, R"((\d{4})(\d{2})(\d{2}))", &y, &m, &d))
      throw MetadataError("info json: bad upload_date '" + date + "'");
    t.video.upload_date = y + "-" + m + "-" + d;
  }

  t.channel.uploader_id = uploader_id;
  t.channel.channel_name = optional_str(info, "uploader");
  if (t.channel.channel_name.empty()) t.channel.channel_name = optional_str(info, "channel");
  t.channel.channel_url = required(info, "channel_url");
  return t;
}

YtDlpSource::YtDlpSource(const YtDlpConfig& cfg, std::ostream& log) : cfg_(cfg), log_(log) {
  // merge extra args from the environment
  if (const char* env = std::getenv("SUPERCUT_YTDLP_ARGS")) {
    if (env[0] != '\0') {
      if (!cfg_.extra_args.empty()) cfg_.extra_args += ' ';
      cfg_.extra_args += env;
    }
  }
}

std::string YtDlpSource::base_command() const {
  std::string cmd = shell_quote(cfg_.binary);
  if (!cfg_.verbose) cmd += " --quiet --no-warnings --no-progress";
  if (!cfg_.extra_args.empty()) cmd += " " + cfg_.extra_args;
  return cmd;
}

int YtDlpSource::run(const std::string& cmd, std::string* out) const {
  if (cfg_.verbose) log_write(log_, "[yt-dlp] Running: " + cmd + "\n");
  FILE* pipe = popen(cmd.c_str(), "r");
  if (!pipe) throw MediaSourceError("cannot start: " + cfg_.binary);

  char buf[4096];
  size_t n;
  while ((n = fread(buf, 1, sizeof(buf), pipe)) > 0) {
    if (out) out->append(buf, n);
  }
  int status = pclose(pipe);
  if (status == -1) throw MediaSourceError("pclose failed for: " + cfg_.binary);
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  return 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
}

std::vector<std::string> YtDlpSource::list_video_ids(const std::string& collection_url) {
  std::string cmd = base_command() +
    " --skip-download --flat-playlist --dump-single-json"
    " --extractor-args " + shell_quote("youtube:skip=dash,hls") +
    " " + shell_quote(collection_url);
  std::string out;
  int rc = run(cmd, &out);
  if (rc != 0)
    throw MediaSourceError("yt-dlp listing failed (exit " + std::to_string(rc) + ") for " + collection_url);
  return parse_video_listing(out);
}

std::optional<CaptionTrack> YtDlpSource::fetch_captions(const std::string& video_id,
                                                        const std::string& lang) {
  TempDir tmp;
  std::string cmd = base_command() +
    " --skip-download --write-auto-subs --write-info-json"
    " --sub-format vtt --convert-subs vtt"
    " --sub-langs " + shell_quote(lang + ",-live_chat") +
    " -o " + shell_quote((tmp.path / "%(id)s.%(ext)s").string()) +
    " " + shell_quote("https://www.youtube.com/watch?v=" + video_id);
  std::string ignored;
  int rc = run(cmd, &ignored);
  if (rc != 0)
    throw MediaSourceError("yt-dlp failed (exit " + std::to_string(rc) + ") for " + video_id);

  const fs::path sub_path = tmp.path / (video_id + "." + lang + ".vtt");
  const fs::path info_path = tmp.path / (video_id + ".info.json");
  if (!fs::exists(sub_path)) return std::nullopt;
  if (!fs::exists(info_path))
    throw MediaSourceError("yt-dlp wrote no info json for " + video_id);

  CaptionTrack track = parse_info_json(read_file(info_path));
  try {
    track.cues = read_vtt_file(sub_path.string());
  } catch (const CaptionError& e) {
    throw MediaSourceError(std::string(e.what()) + " (" + video_id + ")");
  }
  return track;
}

void YtDlpSource::fetch_clip(const ClipRequest& req) {
  // '%' would be read as an output template field
  std::string stem;
  for (char c : req.output_stem) {
    if (c == '%') stem += "%%";
    else stem += c;
  }
  std::string cmd = base_command() +
    " --force-keyframes-at-cuts"
    " --download-sections " +
    shell_quote("*" + std::to_string(req.start_seconds) + "-" + std::to_string(req.end_seconds)) +
    " -o " + shell_quote(stem + ".%(ext)s") +
    " " + shell_quote(req.url);
  int rc = run(cmd, nullptr);
  if (rc != 0)
    throw MediaSourceError("yt-dlp clip download failed (exit " + std::to_string(rc) + ") for " + req.url);
}
