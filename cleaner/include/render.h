// include/render.h
#pragma once
#include "core/report.hpp"
#include "core/snapshot.hpp"
#include <string>

namespace mahito {

// One line per operation, then a per-kind summary.
std::string renderReportText(const CleanReport& report, bool dryRun);
std::string renderReportJson(const CleanReport& report, bool dryRun);

std::string renderSnapshotText(const FileSnapshot& snap);
std::string renderSnapshotJson(const FileSnapshot& snap);

} // namespace mahito
