#include "core/config.hpp"
#include "core/engine.hpp"
#include "env_config.h"
#include "render.h"
#include "log.h"

#include <cstdio>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>
#include <signal.h>

using namespace mahito;
namespace fs = std::filesystem;

static CancellationToken g_cancel;

extern "C" void onInterrupt(int) { g_cancel.cancel(); }

static void installInterruptHandler() {
  struct sigaction sa;
  std::memset(&sa, 0, sizeof(sa));
  sa.sa_handler = onInterrupt;
  sa.sa_flags = SA_RESETHAND;   // a second Ctrl-C terminates
  sigemptyset(&sa.sa_mask);
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
}

static void usage() {
  std::fprintf(stderr,
    "usage: mahito [options] <command> <path>\n"
    "commands:\n"
    "  file <path>        clean one file\n"
    "  dir <path>         clean the files directly inside a directory\n"
    "  recursive <path>   clean every file under a directory\n"
    "  info <path>        show the metadata of one file\n"
    "options:\n"
    "  -n, --dry-run      report what would change, modify nothing\n"
    "  -v, --verbose      debug logging\n"
    "  -a, --admin        also reset the owner (needs CAP_CHOWN)\n"
    "  -m, --mode MODE    quick | standard | full | custom\n"
    "  -c, --config FILE  YAML configuration\n"
    "  -j, --workers N    parallel workers (0 = all cores)\n"
    "      --json         machine-readable output\n"
    "      --ignore-birth-time\n"
    "                     reset access/modify times even though the\n"
    "                     birth time cannot be changed on this host\n");
}

struct CliArgs {
  bool dryRun = false;
  bool verbose = false;
  bool admin = false;
  bool json = false;
  bool ignoreBirthTime = false;
  std::string mode;
  std::string configPath;
  std::string workers;
  std::string command;
  std::string path;
};

static bool parseArgs(int argc, char** argv, CliArgs& a, std::string& err) {
  std::vector<std::string> positional;
  for (int i = 1; i < argc; ++i) {
    std::string s = argv[i];
    auto value = [&](std::string& out) {
      if (i + 1 >= argc) { err = s + " needs a value"; return false; }
      out = argv[++i];
      return true;
    };
    if (s == "-n" || s == "--dry-run")      a.dryRun = true;
    else if (s == "-v" || s == "--verbose") a.verbose = true;
    else if (s == "-a" || s == "--admin")   a.admin = true;
    else if (s == "--json")                 a.json = true;
    else if (s == "--ignore-birth-time")    a.ignoreBirthTime = true;
    else if (s == "-m" || s == "--mode")    { if (!value(a.mode)) return false; }
    else if (s == "-c" || s == "--config")  { if (!value(a.configPath)) return false; }
    else if (s == "-j" || s == "--workers") { if (!value(a.workers)) return false; }
    else if (s == "-h" || s == "--help")    { err.clear(); return false; }
    else if (s.size() > 1 && s[0] == '-')   { err = "unknown option " + s; return false; }
    else positional.push_back(s);
  }
  if (positional.size() != 2) { err = "expected <command> <path>"; return false; }
  a.command = positional[0];
  a.path = positional[1];
  if (a.command != "file" && a.command != "dir" && a.command != "recursive" && a.command != "info") {
    err = "unknown command " + a.command;
    return false;
  }
  return true;
}

// config file, then environment, then flags
static bool buildOptions(const CliArgs& a, CleanOptions& out, std::string& err) {
  AppConfig cfg;
  if (!a.configPath.empty() && !loadConfigYaml(a.configPath, cfg, err)) {
    err = a.configPath + ": " + err;
    return false;
  }
  if (!applyEnvOverrides(cfg.options, err)) return false;

  CleanOptions& o = cfg.options;
  o.dryRun = a.dryRun;
  o.verbose = a.verbose;
  if (!a.mode.empty() && !parseCleanMode(a.mode, o.mode)) {
    err = "unknown mode " + a.mode;
    return false;
  }
  if (!a.workers.empty() && !parseWorkerCount(a.workers, o.workers)) {
    err = "--workers: not a number " + a.workers;
    return false;
  }
  if (a.ignoreBirthTime) o.ignoreBirthTime = true;
  if (a.admin) {
    o.elevateOwnership = true;
    if (o.mode == CleanMode::Custom) o.customOperations.add(OperationKind::Owner);
    else if (a.mode.empty()) o.mode = CleanMode::Full;
    else if (!operationsFor(o).contains(OperationKind::Owner))
      LOGW(std::string("--admin has no effect in mode ") + toString(o.mode));
  }
  out = std::move(o);
  return true;
}

int main(int argc, char** argv) {
  CliArgs args;
  std::string err;
  if (!parseArgs(argc, argv, args, err)) {
    if (!err.empty()) std::fprintf(stderr, "mahito: %s\n", err.c_str());
    usage();
    return err.empty() ? 0 : 2;
  }

  CleanOptions options;
  if (!buildOptions(args, options, err)) {
    LOGE(err);
    return 2;
  }
  setVerboseLogging(options.verbose);

  try {
    CleaningEngine engine(options);

    if (args.command == "info") {
      FileSnapshot snap = engine.inspect(args.path);
      std::cout << (args.json ? renderSnapshotJson(snap) + "\n" : renderSnapshotText(snap));
      return snap.exists ? 0 : 1;
    }

    LOGD(std::string("mode=") + toString(options.mode) + (options.dryRun ? " dry-run" : ""));
    installInterruptHandler();

    CleanReport report;
    bool ok = false;
    if (args.command == "file") {
      ListPathSource source({fs::path(args.path)});
      ok = engine.cleanAll(source, report, err, &g_cancel);
    } else {
      DirectoryPathSource source(args.path, args.command == "recursive");
      ok = engine.cleanAll(source, report, err, &g_cancel);
    }

    std::cout << (args.json ? renderReportJson(report, options.dryRun) + "\n"
                            : renderReportText(report, options.dryRun));
    if (!ok) {
      LOGE("aborted: " + err);
      return 2;
    }
    if (g_cancel.cancelled()) LOGW("interrupted; unprocessed files were left untouched");
    return report.hasFailures() ? 1 : 0;
  } catch (const std::exception& ex) {
    LOGE(std::string("fatal: ") + ex.what());
    return 2;
  }
}
