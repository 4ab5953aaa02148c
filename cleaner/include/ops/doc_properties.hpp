#pragma once
#include <string>
#include <vector>
#include <utility>

namespace mahito {

enum class PropertyPart { Core, App };

constexpr const char* kCorePropsPart = "docProps/core.xml";
constexpr const char* kAppPropsPart  = "docProps/app.xml";

struct PropertyChange {
  std::string element;    // qualified name as written, e.g. "dc:creator"
  std::string previous;   // text content before scrubbing
};

// Empties the text of every known personal-metadata element that is a direct
// child of the part's root. Elements are kept (with attributes); unknown and
// custom properties are not touched. 'out' is only meaningful when changes is non-empty.
bool scrubPropertyXml(const std::string& xml, PropertyPart part,
                      std::string& out, std::vector<PropertyChange>& changes,
                      std::string& err);

// Current values of the known elements, in document order.
bool readPropertyValues(const std::string& xml, PropertyPart part,
                        std::vector<std::pair<std::string,std::string>>& out,
                        std::string& err);

bool isScrubbedProperty(PropertyPart part, const std::string& qualifiedName);

} // namespace mahito
