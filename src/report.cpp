#include "report.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>

using json = nlohmann::json;

void to_json(json& j, const ResultRow& r) {
  j = json{
    {"subtitle_id", r.subtitle_id}, {"video_id", r.video_id}, {"uploader_id", r.uploader_id},
    {"video_title", r.video_title}, {"upload_date", r.upload_date},
    {"channel_name", r.channel_name}, {"start_seconds", r.start_seconds},
    {"end_seconds", r.end_seconds}, {"start_time", r.start_time}, {"end_time", r.end_time},
    {"lang", r.lang}, {"text", r.text}, {"link", r.link},
  };
}

void to_json(json& j, const Channel& c) {
  j = json{ {"uploader_id", c.uploader_id}, {"channel_name", c.channel_name},
            {"channel_url", c.channel_url} };
}

void to_json(json& j, const Video& v) {
  j = json{ {"video_id", v.video_id}, {"video_title", v.video_title},
            {"video_url", v.video_url}, {"uploader_id", v.uploader_id},
            {"upload_date", v.upload_date} };
}

size_t utf8_length(const std::string& s) {
  size_t n = 0;
  for (unsigned char c : s)
    if ((c & 0xC0) != 0x80) ++n;
  return n;
}

std::string utf8_prefix(const std::string& s, size_t n) {
  size_t i = 0;
  for (size_t seen = 0; i < s.size(); ++i) {
    if (((unsigned char)s[i] & 0xC0) != 0x80 && seen++ == n) break;
  }
  return s.substr(0, i);
}

void print_table(std::ostream& out,
                 const std::vector<std::string>& headers,
                 const std::vector<std::vector<std::string>>& rows,
                 size_t max_width) {
  auto clip = [&](const std::string& s) {
    if (max_width == 0 || utf8_length(s) <= max_width) return s;
    return utf8_prefix(s, max_width > 3 ? max_width - 3 : max_width) + "...";
  };

  std::vector<size_t> width(headers.size(), 0);
  for (size_t c = 0; c < headers.size(); ++c) width[c] = utf8_length(clip(headers[c]));
  for (auto& row : rows)
    for (size_t c = 0; c < row.size() && c < width.size(); ++c)
      width[c] = std::max(width[c], utf8_length(clip(row[c])));

  auto line = [&](const std::vector<std::string>& cells) {
    for (size_t c = 0; c < width.size(); ++c) {
      std::string cell = c < cells.size() ? clip(cells[c]) : std::string();
      out << cell;
      if (c + 1 < width.size()) out << std::string(width[c] - utf8_length(cell) + 2, ' ');
    }
    out << "\n";
  };

  line(headers);
  std::vector<std::string> rule;
  for (auto w : width) rule.push_back(std::string(w, '-'));
  line(rule);
  for (auto& row : rows) line(row);
}

void print_rows(std::ostream& out, const std::vector<ResultRow>& rows, OutputFormat fmt) {
  if (fmt == OutputFormat::json) {
    out << json(rows).dump(2) << "\n";
    return;
  }
  std::vector<std::vector<std::string>> cells;
  for (auto& r : rows) {
    cells.push_back({ std::to_string(r.subtitle_id), r.video_id, r.uploader_id, r.video_title,
                      r.upload_date, r.channel_name, std::to_string(r.start_seconds),
                      std::to_string(r.end_seconds), r.lang, r.text, r.link });
  }
  print_table(out,
              { "subtitle_id", "video_id", "uploader_id", "video_title", "upload_date",
                "channel_name", "start_seconds", "end_seconds", "lang", "text", "link" },
              cells, 20);
}

void print_channels(std::ostream& out, const std::vector<Channel>& channels, OutputFormat fmt) {
  if (fmt == OutputFormat::json) {
    out << json(channels).dump(2) << "\n";
    return;
  }
  std::vector<std::vector<std::string>> cells;
  for (auto& c : channels) cells.push_back({ c.uploader_id, c.channel_name, c.channel_url });
  print_table(out, { "uploader_id", "channel_name", "channel_url" }, cells);
}

void print_videos(std::ostream& out, const std::vector<Video>& videos, OutputFormat fmt) {
  if (fmt == OutputFormat::json) {
    out << json(videos).dump(2) << "\n";
    return;
  }
  std::vector<std::vector<std::string>> cells;
  for (auto& v : videos)
    cells.push_back({ v.video_id, v.uploader_id, v.upload_date, v.video_title, v.video_url });
  print_table(out, { "video_id", "uploader_id", "upload_date", "video_title", "video_url" },
              cells, 40);
}

void print_stats(std::ostream& out, const Stats& stats, OutputFormat fmt) {
  if (fmt == OutputFormat::json) {
    out << json{ {"channels", stats.channels}, {"videos", stats.videos} }.dump(2) << "\n";
    return;
  }
  print_table(out, { "", "" },
              { { "channels", std::to_string(stats.channels) },
                { "videos", std::to_string(stats.videos) } });
}
