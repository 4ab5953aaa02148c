// src/log.cpp
#include "log.h"
#include <atomic>
#include <mutex>
#include <ctime>
#include <cstdio>
#include <iostream>

namespace mahito {

static std::mutex g_logMu;
static std::atomic<bool> g_verbose{false};

void setVerboseLogging(bool on) { g_verbose = on; }
bool verboseLogging() { return g_verbose.load(); }

void _log_emit(const char* lvl, const std::string& msg) {
  std::time_t now = std::time(nullptr);
  std::tm st{};
  localtime_r(&now, &st);
  char stamp[32];
  std::snprintf(stamp, sizeof(stamp), "%04d-%02d-%02d %02d:%02d:%02d",
    st.tm_year + 1900, st.tm_mon + 1, st.tm_mday, st.tm_hour, st.tm_min, st.tm_sec);

  std::lock_guard<std::mutex> lk(g_logMu);
  std::cerr << "[" << lvl << "] " << stamp << " | " << msg << "\n";
}

void logEvent(const std::string& runId,
              const std::string& eventType,
              const std::map<std::string,std::string>& kv)
{
  if (!g_verbose) return;
  std::string line = "[LOG][" + eventType + "] id=" + runId;
  for (auto& [k,v] : kv) line += " " + k + "=" + v;
  std::lock_guard<std::mutex> lk(g_logMu);
  std::cerr << line << "\n";
}

} // namespace mahito
