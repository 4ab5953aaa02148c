#pragma once
#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <cstdint>
#include <initializer_list>

namespace mahito {

enum class OperationKind { Streams = 0, Timestamps = 1, OfficeProperties = 2, Owner = 3 };
constexpr int kOperationKindCount = 4;

enum class CleanMode { Quick, Standard, Full, Custom };

enum class OperationStatus { Applied, WouldApply, Skipped, Failed };

enum class SkipReason {
  None,
  NotRequested,
  NoStreamsFound,
  NotAnOfficeDocument,
  AlreadyClean,
  AlreadyNeutral,
  Cancelled
};

enum class ErrorKind {
  None,
  NotFound,
  AccessDenied,
  ResourceBusy,
  PrivilegeRequired,
  Unsupported,          // volume lacks a required feature
  CorruptContainer,
  PartialWriteFailure,
  Timeout
};

// Small bitset over OperationKind, order-independent.
class OperationSet {
public:
  OperationSet() = default;
  OperationSet(std::initializer_list<OperationKind> kinds) { for (auto k : kinds) add(k); }

  void add(OperationKind k)            { bits_ |= bit(k); }
  void remove(OperationKind k)         { bits_ &= static_cast<uint8_t>(~bit(k)); }
  bool contains(OperationKind k) const { return (bits_ & bit(k)) != 0; }
  bool empty() const                   { return bits_ == 0; }
  bool operator==(const OperationSet& o) const { return bits_ == o.bits_; }

private:
  static uint8_t bit(OperationKind k) { return static_cast<uint8_t>(1u << static_cast<int>(k)); }
  uint8_t bits_ = 0;
};

struct Limits {
  uint32_t timeoutFileMs = 5000;   // per-file time limit for stream enumeration
};

struct CleanOptions {
  CleanMode mode = CleanMode::Standard;
  bool dryRun = false;
  bool verbose = false;
  bool elevateOwnership = false;
  bool ignoreBirthTime = false;    // reset access/modify even where the birth time cannot be set

  OperationSet customOperations{OperationKind::Streams, OperationKind::Timestamps};
  std::string neutralOwner = "root";                  // user name or numeric uid
  std::vector<std::string> streamNamespaces{"user."}; // xattr prefixes treated as named streams
  unsigned workers = 0;                               // 0 = hardware concurrency
  Limits limits;
};

struct OperationOutcome {
  OperationKind kind = OperationKind::Streams;
  OperationStatus status = OperationStatus::Skipped;
  SkipReason reason = SkipReason::None;
  ErrorKind error = ErrorKind::None;
  std::optional<std::string> detail;

  static OperationOutcome applied(OperationKind k, bool dryRun, std::string detail = {});
  static OperationOutcome skipped(OperationKind k, SkipReason r, std::string detail = {});
  static OperationOutcome failed(OperationKind k, ErrorKind e, std::string detail = {});
};

struct FileResult {
  std::filesystem::path path;
  std::vector<OperationOutcome> outcomes;   // fixed order: Streams, Timestamps, OfficeProperties, Owner

  const OperationOutcome* find(OperationKind k) const;
  bool hasFailures() const;
};

// Operation set requested by a mode (Custom reads options.customOperations).
OperationSet operationsFor(const CleanOptions& options);

ErrorKind errorKindFromErrno(int err);

const char* toString(OperationKind k);
const char* toString(CleanMode m);
const char* toString(OperationStatus s);
const char* toString(SkipReason r);
const char* toString(ErrorKind e);

bool parseCleanMode(const std::string& s, CleanMode& out);
bool parseOperationKind(const std::string& s, OperationKind& out);

} // namespace mahito
