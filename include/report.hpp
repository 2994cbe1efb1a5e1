#pragma once
#include "search.hpp"
#include "store.hpp"
#include <ostream>
#include <string>
#include <vector>

enum class OutputFormat { table, json };

// Width of UTF-8 text in code points, and its first `n` code points.
size_t utf8_length(const std::string& s);
std::string utf8_prefix(const std::string& s, size_t n);

// Plain text table; widths count code points. Cells wider than `max_width` are cut with "..." (0 = no limit).
void print_table(std::ostream& out,
                 const std::vector<std::string>& headers,
                 const std::vector<std::vector<std::string>>& rows,
                 size_t max_width = 0);

void print_rows(std::ostream& out, const std::vector<ResultRow>& rows, OutputFormat fmt);
void print_channels(std::ostream& out, const std::vector<Channel>& channels, OutputFormat fmt);
void print_videos(std::ostream& out, const std::vector<Video>& videos, OutputFormat fmt);
void print_stats(std::ostream& out, const Stats& stats, OutputFormat fmt);
