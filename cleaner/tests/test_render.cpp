#include "render.h"
#include <gtest/gtest.h>

using namespace mahito;

static CleanReport sampleReport() {
  CleanReport report;
  FileResult r;
  r.path = "dir/quote\"d.docx";
  r.outcomes.push_back(OperationOutcome::applied(OperationKind::Streams, false, "removed 1: user.xdg.origin.url"));
  r.outcomes.push_back(OperationOutcome::skipped(OperationKind::OfficeProperties, SkipReason::AlreadyClean));
  r.outcomes.push_back(OperationOutcome::failed(OperationKind::Owner, ErrorKind::PrivilegeRequired));
  report.add(0, r);
  report.finalize();
  return report;
}

TEST(Render, ReportTextShowsStatusesAndSummary) {
  std::string text = renderReportText(sampleReport(), false);
  EXPECT_NE(text.find("streams: applied - removed 1"), std::string::npos);
  EXPECT_NE(text.find("office_properties: skipped(already_clean)"), std::string::npos);
  EXPECT_NE(text.find("owner: failed(privilege_required)"), std::string::npos);
  EXPECT_NE(text.find("summary: 1 file(s)"), std::string::npos);
  EXPECT_EQ(text.find("dry run"), std::string::npos);
}

TEST(Render, ReportJsonEscapesAndFlagsFailures) {
  std::string json = renderReportJson(sampleReport(), true);
  EXPECT_NE(json.find("\"dry_run\":true"), std::string::npos);
  EXPECT_NE(json.find("quote\\\"d.docx"), std::string::npos);
  EXPECT_NE(json.find("\"error\":\"privilege_required\""), std::string::npos);
  EXPECT_NE(json.find("\"reason\":\"already_clean\""), std::string::npos);
  EXPECT_NE(json.find("\"has_failures\":true"), std::string::npos);
}

TEST(Render, SnapshotJson) {
  FileSnapshot s;
  s.path = "a.docx";
  s.exists = true;
  s.isRegular = true;
  s.size = 10;
  s.owner = "alice";
  s.streams.push_back({"user.xdg.origin.url", 20});
  s.family = DocumentFamily::WordProcessing;
  s.documentProperties.emplace_back("dc:creator", "Alice\n");
  std::string json = renderSnapshotJson(s);
  EXPECT_NE(json.find("\"document_family\":\"word_processing\""), std::string::npos);
  EXPECT_NE(json.find("\"dc:creator\":\"Alice\\n\""), std::string::npos);
  EXPECT_NE(json.find("{\"name\":\"user.xdg.origin.url\",\"size\":20}"), std::string::npos);
  EXPECT_EQ(json.back(), '}');
}

TEST(Render, MissingSnapshotText) {
  FileSnapshot s;
  s.path = "gone.txt";
  s.warnings.push_back("No such file or directory");
  std::string text = renderSnapshotText(s);
  EXPECT_NE(text.find("not found"), std::string::npos);
}
