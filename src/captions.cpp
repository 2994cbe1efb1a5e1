// src/captions.cpp
#include "captions.hpp"
#include <re2/re2.h>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <sstream>

namespace {

constexpr double kMinCueSeconds = 0.5;
// Far below the millisecond resolution of cue timings; absorbs the error of
// subtracting two parsed times, so 12.200 --> 12.700 still counts as 0.5s.
constexpr double kTimeEpsilon = 1e-9;

// [HH:]MM:SS.mmm --> [HH:]MM:SS.mmm [cue settings]
const RE2& timing_re() {
  static const RE2 re(
    R"(\s*(?:(\d+):)?(\d{2}):(\d{2})\.(\d{3})\s+-->\s+(?:(\d+):)?(\d{2}):(\d{2})\.(\d{3})(?:\s.*)?)");
  return re;
}

const RE2& tag_re() {
  static const RE2 re("<[^>]*>");
  return re;
}

int64_t to_millis(const std::string& h, const std::string& m,
                  const std::string& s, const std::string& ms) {
  int64_t hours = h.empty() ? 0 : std::stoll(h);
  return ((hours * 60 + std::stoll(m)) * 60 + std::stoll(s)) * 1000 + std::stoll(ms);
}

std::string format_millis(int64_t total) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld.%03lld",
                (long long)(total / 3600000), (long long)(total / 60000 % 60),
                (long long)(total / 1000 % 60), (long long)(total % 1000));
  return buf;
}

bool starts_with(const std::string& s, const char* prefix) {
  return s.rfind(prefix, 0) == 0;
}

std::vector<std::string> split_lines(const std::string& text) {
  std::vector<std::string> lines;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    lines.push_back(std::move(line));
  }
  return lines;
}

Cue parse_block(const std::vector<std::string>& block) {
  size_t t = 0;
  if (block[0].find("-->") == std::string::npos) t = 1; // cue identifier
  if (t >= block.size() || block[t].find("-->") == std::string::npos)
    throw CaptionError("vtt: cue block without timing line: " + block[0]);

  std::string h1, m1, s1, ms1, h2, m2, s2, ms2;
  if (!RE2::FullMatch(block[t], timing_re(), &h1, &m1, &s1, &ms1, &h2, &m2, &s2, &ms2))
    throw CaptionError("vtt: malformed timing line: " + block[t]);

  int64_t b = to_millis(h1, m1, s1, ms1);
  int64_t e = to_millis(h2, m2, s2, ms2);

  std::string text;
  for (size_t i = t + 1; i < block.size(); ++i) {
    std::string line = block[i];
    RE2::GlobalReplace(&line, tag_re(), "");
    if (i > t + 1) text += '\n';
    text += line;
  }
  return Cue{ b / 1000.0, e / 1000.0, format_millis(b), format_millis(e), std::move(text) };
}

} // namespace

std::vector<Cue> parse_vtt(const std::string& text) {
  auto lines = split_lines(text);
  std::vector<Cue> cues;
  std::vector<std::string> block;
  bool header_seen = false;

  auto flush = [&]() {
    if (block.empty()) return;
    if (!header_seen) {
      header_seen = true;
      if (!starts_with(block[0], "WEBVTT") && !starts_with(block[0], "\xEF\xBB\xBFWEBVTT"))
        throw CaptionError("vtt: missing WEBVTT header");
    } else if (!starts_with(block[0], "NOTE") && !starts_with(block[0], "STYLE") &&
               !starts_with(block[0], "REGION")) {
      cues.push_back(parse_block(block));
    }
    block.clear();
  };

  for (auto& line : lines) {
    if (line.empty()) flush();
    else block.push_back(line);
  }
  flush();
  return cues;
}

std::vector<Cue> read_vtt_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw CaptionError("vtt: cannot open " + path);
  std::ostringstream ss; ss << in.rdbuf();
  return parse_vtt(ss.str());
}

std::vector<Segment> normalize_cues(const std::string& video_id,
                                    const std::string& lang,
                                    const std::vector<Cue>& cues) {
  std::vector<Segment> out;
  out.reserve(cues.size());
  for (auto& c : cues) {
    if (c.end - c.start < kMinCueSeconds - kTimeEpsilon) continue;
    Segment s;
    s.video_id = video_id;
    s.lang = lang;
    s.start_seconds = (int)std::floor(c.start);
    s.end_seconds = (int)std::ceil(c.end);
    s.start_time = c.start_time;
    s.end_time = c.end_time;
    s.text = c.text.substr(0, c.text.find('\n'));
    out.push_back(std::move(s));
  }
  return out;
}
