#pragma once
#include "types.hpp"
#include <string>

namespace mahito {

struct AppConfig {
  CleanOptions options;   // engine.* and limits.* land here
};

// Absent keys keep their current value in 'outCfg'. Unknown mode or
// operation names are errors.
bool loadConfigYaml(const std::string& path, AppConfig& outCfg, std::string& err);

} // namespace mahito
