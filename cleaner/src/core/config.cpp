#include "core/config.hpp"
#include <yaml-cpp/yaml.h>

namespace mahito {

static bool parseOperationList(const YAML::Node& n, OperationSet& out, std::string& err) {
  if (!n.IsSequence()) { err = "engine.custom_operations must be a list"; return false; }
  OperationSet set;
  for (const auto& item : n) {
    const std::string name = item.as<std::string>();
    OperationKind k;
    if (!parseOperationKind(name, k)) { err = "unknown operation '" + name + "'"; return false; }
    set.add(k);
  }
  out = set;
  return true;
}

bool loadConfigYaml(const std::string& path, AppConfig& outCfg, std::string& err) {
  try {
    YAML::Node root = YAML::LoadFile(path);
    CleanOptions& o = outCfg.options;

    auto eng = root["engine"];
    if (eng) {
      if (auto m = eng["mode"]) {
        const std::string mode = m.as<std::string>();
        if (!parseCleanMode(mode, o.mode)) { err = "unknown mode '" + mode + "'"; return false; }
      }
      if (auto ops = eng["custom_operations"]) {
        if (!parseOperationList(ops, o.customOperations, err)) return false;
      }
      o.workers = eng["workers"].as<unsigned>(o.workers);
      o.neutralOwner = eng["neutral_owner"].as<std::string>(o.neutralOwner);
      o.ignoreBirthTime = eng["ignore_birth_time"].as<bool>(o.ignoreBirthTime);
      if (auto ns = eng["stream_namespaces"]) {
        if (!ns.IsSequence()) { err = "engine.stream_namespaces must be a list"; return false; }
        o.streamNamespaces.clear();
        for (const auto& item : ns) o.streamNamespaces.push_back(item.as<std::string>());
      }
    }
    auto lim = root["limits"];
    if (lim) {
      if (auto t = lim["timeouts"]) {
        o.limits.timeoutFileMs = t["per_file_ms"].as<uint32_t>(o.limits.timeoutFileMs);
      }
    }
    return true;
  } catch (const std::exception& ex) {
    err = ex.what();
    return false;
  }
}

} // namespace mahito
