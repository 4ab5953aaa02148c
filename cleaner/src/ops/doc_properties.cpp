// src/ops/doc_properties.cpp
#include "ops/doc_properties.hpp"
#include <array>
#include <cstring>
#include <string_view>
#include <tinyxml2.h>

namespace mahito {

// Matched on local name so any namespace prefix works (dc:, cp:, or none).
static constexpr std::array<std::string_view, 10> kCoreElements = {
  "creator", "lastModifiedBy", "title", "subject", "description",
  "keywords", "category", "contentStatus", "identifier", "lastPrinted"};

static constexpr std::array<std::string_view, 4> kAppElements = {
  "Company", "Manager", "HyperlinkBase", "Template"};

static std::string_view localName(std::string_view qualified) {
  auto colon = qualified.find(':');
  return colon == std::string_view::npos ? qualified : qualified.substr(colon + 1);
}

bool isScrubbedProperty(PropertyPart part, const std::string& qualifiedName) {
  auto local = localName(qualifiedName);
  if (part == PropertyPart::Core) {
    for (auto n : kCoreElements) if (n == local) return true;
  } else {
    for (auto n : kAppElements) if (n == local) return true;
  }
  return false;
}

static void collectText(const tinyxml2::XMLNode* node, std::string& out) {
  for (auto* c = node->FirstChild(); c; c = c->NextSibling()) {
    if (auto* t = c->ToText()) out += t->Value();
    else collectText(c, out);
  }
}

static bool parse(tinyxml2::XMLDocument& doc, const std::string& xml, std::string& err) {
  if (doc.Parse(xml.c_str(), xml.size()) != tinyxml2::XML_SUCCESS) {
    err = std::string("xml parse failed: ") + doc.ErrorStr();
    return false;
  }
  if (!doc.RootElement()) { err = "xml has no root element"; return false; }
  return true;
}

bool scrubPropertyXml(const std::string& xml, PropertyPart part,
                      std::string& out, std::vector<PropertyChange>& changes,
                      std::string& err) {
  tinyxml2::XMLDocument doc(true, tinyxml2::PRESERVE_WHITESPACE);
  if (!parse(doc, xml, err)) return false;

  for (auto* el = doc.RootElement()->FirstChildElement(); el; el = el->NextSiblingElement()) {
    const char* name = el->Name();
    if (!name || !isScrubbedProperty(part, name)) continue;
    if (el->NoChildren()) continue;       // already empty

    PropertyChange ch;
    ch.element = name;
    collectText(el, ch.previous);
    el->DeleteChildren();
    changes.push_back(std::move(ch));
  }

  if (changes.empty()) return true;

  tinyxml2::XMLPrinter printer(nullptr, true);
  doc.Print(&printer);
  out.assign(printer.CStr(), printer.CStrSize() > 0 ? (size_t)printer.CStrSize() - 1 : 0);
  return true;
}

bool readPropertyValues(const std::string& xml, PropertyPart part,
                        std::vector<std::pair<std::string,std::string>>& out,
                        std::string& err) {
  tinyxml2::XMLDocument doc(true, tinyxml2::PRESERVE_WHITESPACE);
  if (!parse(doc, xml, err)) return false;

  for (auto* el = doc.RootElement()->FirstChildElement(); el; el = el->NextSiblingElement()) {
    const char* name = el->Name();
    if (!name || !isScrubbedProperty(part, name)) continue;
    std::string value;
    collectText(el, value);
    out.emplace_back(name, std::move(value));
  }
  return true;
}

} // namespace mahito
