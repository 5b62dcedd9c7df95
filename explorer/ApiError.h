#ifndef BX_EXPLORER_API_ERROR_H
#define BX_EXPLORER_API_ERROR_H

#include "../lib/ResultOrError.hpp"
#include "../rpc/INodeRpc.hpp"

#include <string>

namespace bx {
namespace explorer {

/**
 * Error surfaced to HTTP clients. `message` is the fixed, client-visible
 * text of the endpoint; `detail` holds the internal cause and is only logged.
 */
struct ApiError : RoeErrorBase {
  static constexpr const int32_t E_INVALID_INPUT = 1;
  static constexpr const int32_t E_NOT_FOUND_OR_UPSTREAM = 2;
  static constexpr const int32_t E_UPSTREAM = 3;

  static constexpr const int HTTP_BAD_REQUEST = 400;
  static constexpr const int HTTP_INTERNAL_ERROR = 500;

  static constexpr const char *MSG_INVALID_BLOCK_HASH = "Invalid block hash";
  static constexpr const char *MSG_BLOCK_FAILED = "Failed to retrieve block information";
  static constexpr const char *MSG_TX_FAILED = "Failed to retrieve transaction information";
  static constexpr const char *MSG_LATEST_FAILED = "Failed to retrieve latest blocks";

  int httpStatus{ HTTP_INTERNAL_ERROR };
  std::string detail;

  ApiError() = default;
  ApiError(int32_t c, int status, const std::string &msg, const std::string &why)
      : RoeErrorBase(c, msg), httpStatus(status), detail(why) {}

  static ApiError invalidInput(int status, const std::string &msg, const std::string &why) {
    return ApiError(E_INVALID_INPUT, status, msg, why);
  }

  /**
   * Translate a node failure. A node-side rejection (e.g. unknown hash) is
   * kept apart from transport and decode failures for logging, but all of
   * them surface as HTTP 500 with the same message.
   */
  static ApiError fromRpc(const rpc::RpcError &err, const std::string &msg) {
    int32_t kind = err.isNodeRejected() ? E_NOT_FOUND_OR_UPSTREAM : E_UPSTREAM;
    return ApiError(kind, HTTP_INTERNAL_ERROR, msg, err.message);
  }

  bool isInvalidInput() const { return code == E_INVALID_INPUT; }
};

template <typename T> using ApiRoe = ResultOrError<T, ApiError>;

} // namespace explorer
} // namespace bx

#endif // BX_EXPLORER_API_ERROR_H
