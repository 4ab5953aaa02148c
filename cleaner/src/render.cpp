// src/render.cpp
#include "render.h"
#include "json_min.h"

namespace mahito {

static constexpr OperationKind kKinds[] = {
  OperationKind::Streams, OperationKind::Timestamps,
  OperationKind::OfficeProperties, OperationKind::Owner
};

static std::string q(const std::string& s) { return "\"" + jsonEscape(s) + "\""; }

static std::string statusText(const OperationOutcome& o) {
  std::string s = toString(o.status);
  if (o.status == OperationStatus::Skipped) s += "(" + std::string(toString(o.reason)) + ")";
  if (o.status == OperationStatus::Failed)  s += "(" + std::string(toString(o.error)) + ")";
  return s;
}

static std::string timeText(const FileTime& t) {
  return formatUtc(t) + " (" + std::to_string(t.sec) + "." + std::to_string(t.nsec) + ")";
}

// ====== CleanReport ======
std::string renderReportText(const CleanReport& report, bool dryRun) {
  std::string out;
  if (dryRun) out += "dry run: nothing was modified\n";
  for (const auto& r : report.results()) {
    out += r.path.string() + "\n";
    for (const auto& o : r.outcomes) {
      out += "  " + std::string(toString(o.kind)) + ": " + statusText(o);
      if (o.detail && !o.detail->empty()) out += " - " + *o.detail;
      out += "\n";
    }
  }
  out += "summary: " + std::to_string(report.fileCount()) + " file(s)\n";
  for (auto k : kKinds) {
    const auto& c = report.counts(k);
    out += "  " + std::string(toString(k)) + ": applied=" + std::to_string(c.applied)
         + " would_apply=" + std::to_string(c.wouldApply)
         + " skipped=" + std::to_string(c.skipped)
         + " failed=" + std::to_string(c.failed) + "\n";
  }
  return out;
}

std::string renderReportJson(const CleanReport& report, bool dryRun) {
  std::string body = "{";
  body += "\"dry_run\":" + std::string(dryRun ? "true" : "false") + ",";
  body += "\"files\":[";
  bool firstFile = true;
  for (const auto& r : report.results()) {
    if (!firstFile) body += ",";
    firstFile = false;
    body += "{\"path\":" + q(r.path.string()) + ",\"outcomes\":[";
    bool first = true;
    for (const auto& o : r.outcomes) {
      if (!first) body += ",";
      first = false;
      body += "{\"kind\":" + q(toString(o.kind)) + ",\"status\":" + q(toString(o.status));
      if (o.status == OperationStatus::Skipped) body += ",\"reason\":" + q(toString(o.reason));
      if (o.status == OperationStatus::Failed)  body += ",\"error\":" + q(toString(o.error));
      if (o.detail) body += ",\"detail\":" + q(*o.detail);
      body += "}";
    }
    body += "]}";
  }
  body += "],\"summary\":{";
  bool first = true;
  for (auto k : kKinds) {
    const auto& c = report.counts(k);
    if (!first) body += ",";
    first = false;
    body += q(toString(k)) + ":{\"applied\":" + std::to_string(c.applied)
          + ",\"would_apply\":" + std::to_string(c.wouldApply)
          + ",\"skipped\":" + std::to_string(c.skipped)
          + ",\"failed\":" + std::to_string(c.failed) + "}";
  }
  body += "},\"has_failures\":" + std::string(report.hasFailures() ? "true" : "false") + "}";
  return body;
}

// ====== FileSnapshot ======
std::string renderSnapshotText(const FileSnapshot& snap) {
  std::string out = snap.path.string() + "\n";
  if (!snap.exists) {
    out += "  not found\n";
    for (const auto& w : snap.warnings) out += "  warning: " + w + "\n";
    return out;
  }
  out += "  type: " + std::string(snap.isRegular ? "regular file" : "other") + "\n";
  out += "  size: " + std::to_string(snap.size) + "\n";
  if (!snap.sha256.empty()) out += "  sha256: " + snap.sha256 + "\n";
  out += "  owner: " + snap.owner + " (" + std::to_string(snap.uid) + ")"
       + "  group: " + snap.group + " (" + std::to_string(snap.gid) + ")\n";
  out += "  accessed: " + timeText(snap.times.access) + "\n";
  out += "  modified: " + timeText(snap.times.modify) + "\n";
  out += "  changed:  " + timeText(snap.times.change) + "\n";
  if (snap.times.hasBirth) out += "  created:  " + timeText(snap.times.birth) + "\n";

  if (!snap.streamsSupported) {
    out += "  streams: not supported by this filesystem\n";
  } else {
    out += "  streams: " + std::to_string(snap.streams.size()) + "\n";
    for (const auto& s : snap.streams) out += "    " + s.name + " (" + std::to_string(s.size) + " bytes)\n";
  }

  if (snap.family != DocumentFamily::None) {
    out += "  document: " + std::string(toString(snap.family)) + "\n";
    for (const auto& p : snap.documentProperties)
      out += "    " + p.first + " = \"" + p.second + "\"\n";
  }
  for (const auto& w : snap.warnings) out += "  warning: " + w + "\n";
  return out;
}

std::string renderSnapshotJson(const FileSnapshot& snap) {
  auto timeJson = [](const FileTime& t) {
    return "{\"utc\":" + q(formatUtc(t)) + ",\"sec\":" + std::to_string(t.sec)
         + ",\"nsec\":" + std::to_string(t.nsec) + "}";
  };

  std::string body = "{";
  body += "\"path\":" + q(snap.path.string()) + ",";
  body += "\"exists\":" + std::string(snap.exists ? "true" : "false");
  if (snap.exists) {
    body += ",\"regular\":" + std::string(snap.isRegular ? "true" : "false");
    body += ",\"size\":" + std::to_string(snap.size);
    if (!snap.sha256.empty()) body += ",\"sha256\":" + q(snap.sha256);
    body += ",\"owner\":{\"uid\":" + std::to_string(snap.uid) + ",\"name\":" + q(snap.owner) + "}";
    body += ",\"group\":{\"gid\":" + std::to_string(snap.gid) + ",\"name\":" + q(snap.group) + "}";
    body += ",\"times\":{\"access\":" + timeJson(snap.times.access)
          + ",\"modify\":" + timeJson(snap.times.modify)
          + ",\"change\":" + timeJson(snap.times.change);
    if (snap.times.hasBirth) body += ",\"birth\":" + timeJson(snap.times.birth);
    body += "}";
    body += ",\"streams_supported\":" + std::string(snap.streamsSupported ? "true" : "false");
    body += ",\"streams\":[";
    for (size_t i = 0; i < snap.streams.size(); ++i) {
      if (i) body += ",";
      body += "{\"name\":" + q(snap.streams[i].name) + ",\"size\":" + std::to_string(snap.streams[i].size) + "}";
    }
    body += "]";
    body += ",\"document_family\":" + q(toString(snap.family));
    body += ",\"document_properties\":{";
    for (size_t i = 0; i < snap.documentProperties.size(); ++i) {
      if (i) body += ",";
      body += q(snap.documentProperties[i].first) + ":" + q(snap.documentProperties[i].second);
    }
    body += "}";
  }
  body += ",\"warnings\":[";
  for (size_t i = 0; i < snap.warnings.size(); ++i) {
    if (i) body += ",";
    body += q(snap.warnings[i]);
  }
  body += "]}";
  return body;
}

} // namespace mahito
