#include "env_config.h"
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace mahito {

static std::string env(const char* key, const char* def = "") {
  const char* v = std::getenv(key);
  return (v && *v) ? std::string(v) : std::string(def);
}

bool parseWorkerCount(const std::string& s, unsigned& out) {
  if (s.empty()) return false;
  for (char c : s) if (c < '0' || c > '9') return false;   // stoul would accept "-1" and " 4"
  try {
    size_t used = 0;
    unsigned long n = std::stoul(s, &used);
    if (used != s.size() || n > std::numeric_limits<unsigned>::max()) return false;
    out = static_cast<unsigned>(n);
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

bool applyEnvOverrides(CleanOptions& options, std::string& err) {
  std::string mode = env("MAHITO_MODE");
  if (!mode.empty() && !parseCleanMode(mode, options.mode)) {
    err = "MAHITO_MODE: unknown mode '" + mode + "'";
    return false;
  }

  std::string workers = env("MAHITO_WORKERS");
  if (!workers.empty() && !parseWorkerCount(workers, options.workers)) {
    err = "MAHITO_WORKERS: not a number '" + workers + "'";
    return false;
  }

  std::string owner = env("MAHITO_NEUTRAL_OWNER");
  if (!owner.empty()) options.neutralOwner = owner;
  return true;
}

} // namespace mahito
