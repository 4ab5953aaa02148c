#include "routing/router.hpp"
#include "test_util.h"

using namespace mahito;
using namespace mahito::testutil;

TEST(Router, FamiliesByExtension) {
  EXPECT_EQ(routeToHandler("report.docx").family, DocumentFamily::WordProcessing);
  EXPECT_EQ(routeToHandler("macro.DOCM").family, DocumentFamily::WordProcessing);
  EXPECT_EQ(routeToHandler("book.xlsx").family, DocumentFamily::Spreadsheet);
  EXPECT_EQ(routeToHandler("tmpl.xltm").family, DocumentFamily::Spreadsheet);
  EXPECT_EQ(routeToHandler("deck.pptx").family, DocumentFamily::Presentation);
  EXPECT_EQ(routeToHandler("deck.potx").family, DocumentFamily::Presentation);
}

TEST(Router, OtherFilesAreNotRouted) {
  EXPECT_EQ(routeToHandler("notes.txt").family, DocumentFamily::None);
  EXPECT_EQ(routeToHandler("legacy.doc").family, DocumentFamily::None);
  EXPECT_EQ(routeToHandler("archive.zip").family, DocumentFamily::None);
  EXPECT_EQ(routeToHandler("docx").family, DocumentFamily::None);
}

class ZipMagicTest : public TempDirTest {};

TEST_F(ZipMagicTest, DetectsLocalHeader) {
  writeZip(file("a.docx"), officePackage("Alice", "Acme"));
  writeFile(file("b.docx"), "plain text pretending to be a document");
  writeFile(file("c.docx"), "PK");
  EXPECT_TRUE(hasZipMagic(file("a.docx")));
  EXPECT_FALSE(hasZipMagic(file("b.docx")));
  EXPECT_FALSE(hasZipMagic(file("c.docx")));
  EXPECT_FALSE(hasZipMagic(file("missing.docx")));
}
