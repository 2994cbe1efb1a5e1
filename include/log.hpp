#pragma once
#include <ostream>
#include <string>

// Writes `text` to `log` and flushes, under one process-wide lock. Worker
// threads share the diagnostics stream, so every write to it goes through here.
void log_write(std::ostream& log, const std::string& text);
