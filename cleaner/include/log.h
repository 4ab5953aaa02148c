#pragma once
#include <string>
#include <map>

namespace mahito {

void _log_emit(const char* lvl, const std::string& msg);

// Debug lines (LOGD, logEvent) are dropped unless verbose logging is on.
void setVerboseLogging(bool on);
bool verboseLogging();

// Structured event line: [LOG][type] id=<runId> k=v ...
void logEvent(const std::string& runId,
              const std::string& eventType,
              const std::map<std::string,std::string>& kv);

} // namespace mahito

#define LOGI(m) ::mahito::_log_emit("INFO ", (m))
#define LOGW(m) ::mahito::_log_emit("WARN ", (m))
#define LOGE(m) ::mahito::_log_emit("ERROR", (m))
#define LOGD(m) do { if (::mahito::verboseLogging()) ::mahito::_log_emit("DEBUG", (m)); } while (0)
