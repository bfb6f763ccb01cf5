
#include "logging.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>

namespace hdlcd {

bool parse_log_level(const std::string &name, LogLevel &lvl) {
  std::string s = name;
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return (char)std::tolower(c); });
  if (s == "trace")
    lvl = LogLevel::TRACE;
  else if (s == "debug")
    lvl = LogLevel::DEBUG;
  else if (s == "info")
    lvl = LogLevel::INFO;
  else if (s == "warn" || s == "warning")
    lvl = LogLevel::WARN;
  else if (s == "error")
    lvl = LogLevel::ERROR;
  else
    return false;
  return true;
}

Logger::Logger() {
  const char *env = std::getenv("HDLCD_LOG_LEVEL");
  LogLevel lvl;
  if (env && parse_log_level(env, lvl))
    level_ = lvl;
}

Logger &Logger::instance() {
  static Logger inst;
  return inst;
}
void Logger::set_level(LogLevel lvl) { level_ = lvl; }
const char *Logger::level_str(LogLevel lvl) {
  switch (lvl) {
  case LogLevel::TRACE:
    return "TRACE";
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  default:
    return "ERROR";
  }
}

void Logger::log(LogLevel lvl, const char *fmt, ...) {
  if (!enabled(lvl))
    return;
  std::lock_guard<std::mutex> lk(mtx_);
  using namespace std::chrono;
  auto now = system_clock::now();
  auto t = system_clock::to_time_t(now);
  auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm tm_buf{};
  localtime_r(&t, &tm_buf);
  char ts[32];
  std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm_buf);
  std::fprintf(stderr, "%s.%03d [%s] ", ts, (int)ms, level_str(lvl));
  va_list ap;
  va_start(ap, fmt);
  std::vfprintf(stderr, fmt, ap);
  va_end(ap);
  std::fprintf(stderr, "\n");
}

} // namespace hdlcd
