#ifndef BX_SERVER_CONFIG_H
#define BX_SERVER_CONFIG_H

#include "ApiServer.h"
#include "../explorer/LatestBlocks.h"
#include "../explorer/TxResolver.h"
#include "../lib/Logger.h"
#include "../lib/ResultOrError.hpp"
#include "../rpc/RpcClient.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace bx {

/**
 * Process configuration, read once at start-up.
 *
 * {
 *   "rpc":      { "url", "user", "password", "connectTimeoutMs", "readTimeoutMs" },
 *   "server":   { "host", "port", "threads" },
 *   "explorer": { "parallelFetch", "txVerbosity" },
 *   "log":      { "level", "file" }
 * }
 *
 * Every section and key is optional.
 */
struct AppConfig {
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr const char *DEFAULT_FILE = "config.json";

  // Error codes
  static constexpr const int32_t E_FILE = 1;
  static constexpr const int32_t E_TYPE = 2;
  static constexpr const int32_t E_VALUE = 3;

  struct Log {
    logging::Level level{ logging::Level::INFO };
    std::string file;
  };

  /** Command line values, each one set replaces what the file says */
  struct Overrides {
    std::optional<std::string> host;
    std::optional<uint16_t> port;
    std::optional<std::string> rpcUrl;
    std::optional<std::string> rpcUser;
    std::optional<std::string> rpcPassword;
    std::optional<std::string> logLevel;
    std::optional<std::string> logFile;
    std::optional<bool> parallelFetch;
  };

  rpc::RpcClient::Config rpc;
  ApiServer::Config server;
  explorer::TxResolver::Config tx;
  explorer::LatestBlocks::Config latest;
  Log log;

  /** Apply the keys present in `json` on top of the current values */
  Roe<void> applyJson(const nlohmann::json &json);

  Roe<void> applyOverrides(const Overrides &overrides);

  /** Check cross-field constraints (URL shape, port range) */
  Roe<void> validate() const;

  /** Defaults, then `json`, then `overrides`, then validate() */
  static Roe<AppConfig> fromJson(const nlohmann::json &json,
                                 const Overrides &overrides = Overrides());

  /**
   * Start-up configuration.
   * @param path JSON file to read
   * @param required When false a missing file means defaults; set it when
   *                 the path was named on the command line
   * @param overrides Command line values
   */
  static Roe<AppConfig> load(const std::string &path, bool required,
                             const Overrides &overrides);

  nlohmann::json toJson() const;
};

} // namespace bx

#endif // BX_SERVER_CONFIG_H
