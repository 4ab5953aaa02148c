#pragma once
#include "core/types.hpp"
#include <string>

namespace mahito {

// Decimal worker count, digits only ("4x", "-1" and "" are rejected). 0 = all cores.
bool parseWorkerCount(const std::string& s, unsigned& out);

// MAHITO_MODE, MAHITO_WORKERS, MAHITO_NEUTRAL_OWNER; unset variables change nothing.
bool applyEnvOverrides(CleanOptions& options, std::string& err);

} // namespace mahito
