#ifndef BX_RPC_CLIENT_H
#define BX_RPC_CLIENT_H

#include "INodeRpc.hpp"
#include "../lib/Module.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace bx {
namespace rpc {

/**
 * JSON-RPC client for a Bitcoin Core compatible node.
 *
 * Every call opens its own HTTP connection with basic authentication and
 * posts a JSON-RPC 2.0 request object. The client keeps no per-call state,
 * so one instance can serve all request threads.
 */
class RpcClient : public Module, public INodeRpc {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using ConfigRoe = ResultOrError<T, Error>;

  static constexpr const uint16_t DEFAULT_PORT = 8332;
  static constexpr std::chrono::milliseconds DEFAULT_CONNECT_TIMEOUT{5000};
  static constexpr std::chrono::milliseconds DEFAULT_READ_TIMEOUT{30000};

  // Error codes for configuration problems
  static constexpr const int32_t E_INVALID_URL = 1;

  struct Config {
    std::string url{ "http://127.0.0.1:8332" };
    std::string user;
    std::string password;
    std::chrono::milliseconds connectTimeout{ DEFAULT_CONNECT_TIMEOUT };
    std::chrono::milliseconds readTimeout{ DEFAULT_READ_TIMEOUT };
  };

  /** Parsed form of Config::url */
  struct Endpoint {
    std::string scheme;
    std::string host;
    uint16_t port{ DEFAULT_PORT };
    std::string path{ "/" };

    std::string schemeHostPort() const;
  };

  RpcClient();
  ~RpcClient() override = default;

  ConfigRoe<void> setConfig(const Config &config);

  Roe<nlohmann::json> call(const std::string &method,
                           const nlohmann::json &params) override;

  /**
   * Split "scheme://host[:port][/path]" into its parts.
   * Only http and https are accepted; the port defaults to 8332.
   * IPv6 hosts must be bracketed. Credentials in the url are refused,
   * they belong in Config::user and Config::password.
   */
  static ConfigRoe<Endpoint> parseUrl(const std::string &url);

  /** Build the request object. Null params are sent as []. */
  static Roe<nlohmann::json> makeRequest(uint64_t id, const std::string &method,
                                         const nlohmann::json &params);

  /**
   * Classify a node reply body
   * @param body Raw HTTP body
   * @param id Request id the reply must echo
   */
  static Roe<nlohmann::json> decodeResponse(const std::string &body, uint64_t id);

private:
  bool configured_{ false };
  Config config_;
  Endpoint endpoint_;
  std::atomic<uint64_t> nextId_{ 1 };
};

} // namespace rpc
} // namespace bx

#endif // BX_RPC_CLIENT_H
