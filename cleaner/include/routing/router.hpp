#pragma once
#include <string>
#include <filesystem>

namespace mahito {

enum class DocumentFamily { None, WordProcessing, Spreadsheet, Presentation };

struct RoutingDecision {
  DocumentFamily family = DocumentFamily::None;
  std::string reason;  // "ext" or empty
};

// Extension sniffing only; content is checked later by the scrubber.
RoutingDecision routeToHandler(const std::filesystem::path& path);

// First four bytes are a zip local-file header ("PK\3\4").
bool hasZipMagic(const std::filesystem::path& path);

const char* toString(DocumentFamily f);

} // namespace mahito
