#include "Config.h"
#include "../lib/Utilities.h"

#include <chrono>
#include <cstdint>
#include <filesystem>

namespace bx {

namespace {

using Error = AppConfig::Error;

AppConfig::Roe<const nlohmann::json *> section(const nlohmann::json &json, const char *name) {
  if (!json.contains(name)) {
    return static_cast<const nlohmann::json *>(nullptr);
  }
  if (!json[name].is_object()) {
    return Error(AppConfig::E_TYPE, std::string("'") + name + "' must be an object");
  }
  return &json[name];
}

AppConfig::Roe<void> readString(const nlohmann::json &sec, const char *key, std::string &out) {
  if (!sec.contains(key)) {
    return {};
  }
  if (!sec[key].is_string()) {
    return Error(AppConfig::E_TYPE, std::string("'") + key + "' must be a string");
  }
  out = sec[key].get<std::string>();
  return {};
}

AppConfig::Roe<void> readBool(const nlohmann::json &sec, const char *key, bool &out) {
  if (!sec.contains(key)) {
    return {};
  }
  if (!sec[key].is_boolean()) {
    return Error(AppConfig::E_TYPE, std::string("'") + key + "' must be a boolean");
  }
  out = sec[key].get<bool>();
  return {};
}

AppConfig::Roe<void> readUInt(const nlohmann::json &sec, const char *key, uint64_t max,
                              uint64_t &out) {
  if (!sec.contains(key)) {
    return {};
  }
  const auto &v = sec[key];
  if (!v.is_number_integer() || v.get<int64_t>() < 0) {
    return Error(AppConfig::E_TYPE, std::string("'") + key + "' must be a non-negative integer");
  }
  if (v.get<uint64_t>() > max) {
    return Error(AppConfig::E_VALUE, std::string("'") + key + "' is out of range");
  }
  out = v.get<uint64_t>();
  return {};
}

} // namespace

AppConfig::Roe<void> AppConfig::applyJson(const nlohmann::json &json) {
  if (!json.is_object()) {
    return Error(E_TYPE, "Configuration must be a JSON object");
  }

  auto rpcSec = section(json, "rpc");
  if (!rpcSec) {
    return rpcSec.error();
  }
  if (rpcSec.value()) {
    const auto &sec = *rpcSec.value();
    uint64_t connectMs = static_cast<uint64_t>(rpc.connectTimeout.count());
    uint64_t readMs = static_cast<uint64_t>(rpc.readTimeout.count());
    for (auto r : {readString(sec, "url", rpc.url), readString(sec, "user", rpc.user),
                   readString(sec, "password", rpc.password),
                   readUInt(sec, "connectTimeoutMs", UINT32_MAX, connectMs),
                   readUInt(sec, "readTimeoutMs", UINT32_MAX, readMs)}) {
      if (!r) {
        return r;
      }
    }
    rpc.connectTimeout = std::chrono::milliseconds(connectMs);
    rpc.readTimeout = std::chrono::milliseconds(readMs);
  }

  auto serverSec = section(json, "server");
  if (!serverSec) {
    return serverSec.error();
  }
  if (serverSec.value()) {
    const auto &sec = *serverSec.value();
    uint64_t port = server.port;
    uint64_t threads = server.threads;
    for (auto r : {readString(sec, "host", server.host), readUInt(sec, "port", 65535, port),
                   readUInt(sec, "threads", 1024, threads)}) {
      if (!r) {
        return r;
      }
    }
    server.port = static_cast<uint16_t>(port);
    server.threads = static_cast<size_t>(threads);
  }

  auto explorerSec = section(json, "explorer");
  if (!explorerSec) {
    return explorerSec.error();
  }
  if (explorerSec.value()) {
    const auto &sec = *explorerSec.value();
    uint64_t verbosity = static_cast<uint64_t>(tx.verbosity);
    for (auto r : {readBool(sec, "parallelFetch", latest.parallelFetch),
                   readUInt(sec, "txVerbosity", 2, verbosity)}) {
      if (!r) {
        return r;
      }
    }
    tx.verbosity = static_cast<int>(verbosity);
  }

  auto logSec = section(json, "log");
  if (!logSec) {
    return logSec.error();
  }
  if (logSec.value()) {
    const auto &sec = *logSec.value();
    std::string level = logging::levelToString(log.level);
    for (auto r : {readString(sec, "level", level), readString(sec, "file", log.file)}) {
      if (!r) {
        return r;
      }
    }
    if (!logging::parseLevel(level, log.level)) {
      return Error(E_VALUE, "Unknown log level: " + level);
    }
  }

  return {};
}

AppConfig::Roe<void> AppConfig::applyOverrides(const Overrides &overrides) {
  if (overrides.host) {
    server.host = *overrides.host;
  }
  if (overrides.port) {
    server.port = *overrides.port;
  }
  if (overrides.rpcUrl) {
    rpc.url = *overrides.rpcUrl;
  }
  if (overrides.rpcUser) {
    rpc.user = *overrides.rpcUser;
  }
  if (overrides.rpcPassword) {
    rpc.password = *overrides.rpcPassword;
  }
  if (overrides.logLevel && !logging::parseLevel(*overrides.logLevel, log.level)) {
    return Error(E_VALUE, "Unknown log level: " + *overrides.logLevel);
  }
  if (overrides.logFile) {
    log.file = *overrides.logFile;
  }
  if (overrides.parallelFetch) {
    latest.parallelFetch = *overrides.parallelFetch;
  }
  return {};
}

AppConfig::Roe<void> AppConfig::validate() const {
  auto ep = bx::rpc::RpcClient::parseUrl(rpc.url);
  if (!ep) {
    return Error(E_VALUE, ep.error().message);
  }
  if (server.port == 0) {
    return Error(E_VALUE, "'port' must be between 1 and 65535");
  }
  if (tx.verbosity != 1 && tx.verbosity != 2) {
    return Error(E_VALUE, "'txVerbosity' must be 1 or 2");
  }
  return {};
}

AppConfig::Roe<AppConfig> AppConfig::fromJson(const nlohmann::json &json,
                                               const Overrides &overrides) {
  AppConfig config;
  auto applied = config.applyJson(json);
  if (!applied) {
    return applied.error();
  }
  auto overridden = config.applyOverrides(overrides);
  if (!overridden) {
    return overridden.error();
  }
  auto valid = config.validate();
  if (!valid) {
    return valid.error();
  }
  return config;
}

AppConfig::Roe<AppConfig> AppConfig::load(const std::string &path, bool required,
                                          const Overrides &overrides) {
  nlohmann::json json = nlohmann::json::object();
  if (required || std::filesystem::exists(path)) {
    auto loaded = utl::loadJsonFile(path);
    if (!loaded) {
      return Error(E_FILE, loaded.error().message);
    }
    json = loaded.value();
  }
  return fromJson(json, overrides);
}

nlohmann::json AppConfig::toJson() const {
  // No password, this goes to the log
  return {{"rpc",
           {{"url", rpc.url},
            {"user", rpc.user},
            {"connectTimeoutMs", rpc.connectTimeout.count()},
            {"readTimeoutMs", rpc.readTimeout.count()}}},
          {"server", {{"host", server.host}, {"port", server.port}, {"threads", server.threads}}},
          {"explorer", {{"parallelFetch", latest.parallelFetch}, {"txVerbosity", tx.verbosity}}},
          {"log", {{"level", logging::levelToString(log.level)}, {"file", log.file}}}};
}

} // namespace bx
