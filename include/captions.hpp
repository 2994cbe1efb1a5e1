#pragma once
#include "store.hpp"
#include <stdexcept>
#include <string>
#include <vector>

struct Cue {
  double start;           // seconds
  double end;             // seconds
  std::string start_time; // HH:MM:SS.mmm
  std::string end_time;
  std::string text;       // payload lines joined by '\n', tags removed
};

class CaptionError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// WebVTT -> cues. Header, NOTE, STYLE and REGION blocks are skipped.
std::vector<Cue> parse_vtt(const std::string& text);
std::vector<Cue> read_vtt_file(const std::string& path);

// Drops cues shorter than half a second, floors start / ceils end and keeps
// only the first line of text.
std::vector<Segment> normalize_cues(const std::string& video_id,
                                    const std::string& lang,
                                    const std::vector<Cue>& cues);
