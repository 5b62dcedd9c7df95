#pragma once

#include "../lib/ResultOrError.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace bx {
namespace rpc {

/**
 * Failure of a single node call.
 *   E_TRANSPORT     - connection/timeout/DNS failure or HTTP non-2xx (httpStatus set)
 *   E_NODE_REJECTED - the node answered with a JSON-RPC error object (nodeCode set)
 *   E_DECODE        - the body is not a usable JSON-RPC response, the result
 *                     does not have the expected shape, or params is not an array
 */
struct RpcError : RoeErrorBase {
  static constexpr const int32_t E_TRANSPORT = 1;
  static constexpr const int32_t E_NODE_REJECTED = 2;
  static constexpr const int32_t E_DECODE = 3;

  int httpStatus{ 0 };
  int64_t nodeCode{ 0 };

  using RoeErrorBase::RoeErrorBase;

  static RpcError transport(const std::string &msg, int status = 0) {
    RpcError e(E_TRANSPORT, msg);
    e.httpStatus = status;
    return e;
  }

  static RpcError nodeRejected(int64_t code, const std::string &msg) {
    RpcError e(E_NODE_REJECTED, msg);
    e.nodeCode = code;
    return e;
  }

  static RpcError decode(const std::string &msg) {
    return RpcError(E_DECODE, msg);
  }

  bool isTransport() const { return code == E_TRANSPORT; }
  bool isNodeRejected() const { return code == E_NODE_REJECTED; }
  bool isDecode() const { return code == E_DECODE; }
};

template <typename T> using Roe = ResultOrError<T, RpcError>;

/**
 * Positional JSON-RPC access to a Bitcoin node.
 * Implementations must be safe to call from several threads at once.
 */
class INodeRpc {
public:
  virtual ~INodeRpc() = default;

  /**
   * Invoke a node method
   * @param method RPC method name, e.g. "getblockcount"
   * @param params JSON array of positional parameters
   * @return The decoded "result" member, or a classified failure
   */
  virtual Roe<nlohmann::json> call(const std::string &method,
                                   const nlohmann::json &params) = 0;
};

} // namespace rpc
} // namespace bx
