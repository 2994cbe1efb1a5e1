#include "log.hpp"
#include <mutex>

namespace {
std::mutex g_log_mu;
}

void log_write(std::ostream& log, const std::string& text) {
  std::lock_guard<std::mutex> lk(g_log_mu);
  log << text << std::flush;
}
