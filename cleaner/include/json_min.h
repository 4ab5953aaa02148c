// include/json_min.h
#pragma once
#include <string>

namespace mahito {

std::string jsonEscape(const std::string& s);

} // namespace mahito
