#ifndef BX_SERVER_API_SERVER_H
#define BX_SERVER_API_SERVER_H

#include "../explorer/BlockResolver.h"
#include "../explorer/LatestBlocks.h"
#include "../explorer/TxResolver.h"
#include "../lib/Service.h"

#include <cstdint>
#include <memory>
#include <string>

namespace httplib {
class Server;
struct Response;
} // namespace httplib

namespace bx {

/**
 * HTTP front end of the explorer.
 *
 *   GET /block/{hash}    -> Block JSON | 400 / 500 text
 *   GET /tx/{txid}       -> Transaction JSON | 500 text
 *   GET /latest_blocks   -> JSON array of Block | 500 text
 *
 * Handlers run on the HTTP library's worker pool and only call into the
 * resolvers, which are safe for concurrent use.
 */
class ApiServer : public Service {
public:
  static constexpr const uint16_t DEFAULT_PORT = 8080;
  static constexpr const size_t DEFAULT_THREADS = 8;

  struct Config {
    std::string host{ "0.0.0.0" };
    uint16_t port{ DEFAULT_PORT }; // 0 picks a free port
    size_t threads{ DEFAULT_THREADS };
  };

  ApiServer(explorer::BlockResolver &blocks, explorer::TxResolver &txs,
            explorer::LatestBlocks &latest);
  ~ApiServer() override;

  /** Bind and start serving in the service thread */
  Roe<void> start(const Config &config);

  /** Port actually bound, valid after a successful start */
  uint16_t getPort() const { return boundPort_; }

  /** Fixed client message of the route serving `path` */
  static std::string failureMessage(const std::string &path);

protected:
  Roe<void> onStart() override;
  void runLoop() override;
  void onStopRequest() override;

private:
  void registerRoutes();
  static void setTextError(httplib::Response &res, const explorer::ApiError &err);

  explorer::BlockResolver &blocks_;
  explorer::TxResolver &txs_;
  explorer::LatestBlocks &latest_;
  Config config_;
  uint16_t boundPort_{ 0 };
  std::unique_ptr<httplib::Server> upServer_;
};

} // namespace bx

#endif // BX_SERVER_API_SERVER_H
