#include "ops/doc_properties.hpp"
#include "test_util.h"

using namespace mahito;
using namespace mahito::testutil;

TEST(DocProperties, EmptiesKnownCoreElements) {
  std::string out, err;
  std::vector<PropertyChange> changes;
  ASSERT_TRUE(scrubPropertyXml(coreXml("Alice"), PropertyPart::Core, out, changes, err)) << err;

  ASSERT_EQ(changes.size(), 3u);
  EXPECT_EQ(changes[0].element, "dc:title");
  EXPECT_EQ(changes[1].element, "dc:creator");
  EXPECT_EQ(changes[1].previous, "Alice");
  EXPECT_EQ(changes[2].element, "cp:lastModifiedBy");

  // element kept, text gone; revision and created untouched
  EXPECT_EQ(out.find("Alice"), std::string::npos);
  EXPECT_NE(out.find("dc:creator"), std::string::npos);
  EXPECT_NE(out.find("<cp:revision>3</cp:revision>"), std::string::npos);
  EXPECT_NE(out.find("2021-05-01T09:00:00Z"), std::string::npos);
  EXPECT_NE(out.find("xsi:type=\"dcterms:W3CDTF\""), std::string::npos);
}

TEST(DocProperties, EmptiesKnownAppElements) {
  std::string out, err;
  std::vector<PropertyChange> changes;
  ASSERT_TRUE(scrubPropertyXml(appXml("Acme Corp"), PropertyPart::App, out, changes, err)) << err;
  ASSERT_EQ(changes.size(), 2u);
  EXPECT_EQ(changes[0].element, "Company");
  EXPECT_EQ(changes[0].previous, "Acme Corp");
  EXPECT_EQ(changes[1].element, "Manager");
  EXPECT_EQ(out.find("Acme Corp"), std::string::npos);
  EXPECT_NE(out.find("<Application>Microsoft Office Word</Application>"), std::string::npos);
  EXPECT_NE(out.find("<Pages>1</Pages>"), std::string::npos);
}

TEST(DocProperties, ScrubbedOutputIsAFixedPoint) {
  std::string once, twice, err;
  std::vector<PropertyChange> changes;
  ASSERT_TRUE(scrubPropertyXml(coreXml("Alice"), PropertyPart::Core, once, changes, err));
  changes.clear();
  ASSERT_TRUE(scrubPropertyXml(once, PropertyPart::Core, twice, changes, err));
  EXPECT_TRUE(changes.empty());
}

TEST(DocProperties, CoreNamesDoNotLeakIntoApp) {
  EXPECT_TRUE(isScrubbedProperty(PropertyPart::Core, "dc:creator"));
  EXPECT_TRUE(isScrubbedProperty(PropertyPart::Core, "creator"));
  EXPECT_FALSE(isScrubbedProperty(PropertyPart::App, "dc:creator"));
  EXPECT_TRUE(isScrubbedProperty(PropertyPart::App, "Company"));
  EXPECT_FALSE(isScrubbedProperty(PropertyPart::App, "Application"));
  EXPECT_FALSE(isScrubbedProperty(PropertyPart::Core, "cp:revision"));
}

TEST(DocProperties, NestedCustomElementsAreLeftAlone) {
  const std::string xml =
    "<Properties><Company>Acme</Company>"
    "<HeadingPairs><Company>nested, not a property</Company></HeadingPairs></Properties>";
  std::string out, err;
  std::vector<PropertyChange> changes;
  ASSERT_TRUE(scrubPropertyXml(xml, PropertyPart::App, out, changes, err));
  ASSERT_EQ(changes.size(), 1u);
  EXPECT_NE(out.find("nested, not a property"), std::string::npos);
}

TEST(DocProperties, MalformedXmlIsReported) {
  std::string out, err;
  std::vector<PropertyChange> changes;
  EXPECT_FALSE(scrubPropertyXml("<cp:coreProperties><dc:creator>Alice", PropertyPart::Core, out, changes, err));
  EXPECT_FALSE(err.empty());
}

TEST(DocProperties, ReadsCurrentValues) {
  std::vector<std::pair<std::string, std::string>> values;
  std::string err;
  ASSERT_TRUE(readPropertyValues(appXml("Acme", "Dana"), PropertyPart::App, values, err));
  ASSERT_EQ(values.size(), 2u);
  EXPECT_EQ(values[0], std::make_pair(std::string("Company"), std::string("Acme")));
  EXPECT_EQ(values[1], std::make_pair(std::string("Manager"), std::string("Dana")));
}
