#ifndef BX_EXPLORER_TX_RESOLVER_H
#define BX_EXPLORER_TX_RESOLVER_H

#include "ApiError.h"
#include "Types.hpp"
#include "../lib/Module.h"
#include "../rpc/INodeRpc.hpp"

#include <string>

namespace bx {
namespace explorer {

/**
 * Resolves a txid to its public representation via `getrawtransaction`,
 * checks the reply against the requested id and fills in the height of the
 * containing block.
 */
class TxResolver : public Module {
public:
  struct Config {
    // 1: plain verbose decode, 2: with prevouts and fee
    int verbosity{ 1 };
  };

  explicit TxResolver(rpc::INodeRpc &node);
  ~TxResolver() override = default;

  void setConfig(const Config &config) { config_ = config; }
  const Config &getConfig() const { return config_; }

  /**
   * Every failure, including a malformed txid, surfaces as
   * 500 "Failed to retrieve transaction information".
   */
  ApiRoe<Transaction> resolve(const std::string &rawTxId);

  rpc::Roe<Transaction> fetch(const TxId &txid);

private:
  rpc::Roe<uint64_t> fetchBlockHeight(const std::string &blockHash);

  rpc::INodeRpc &node_;
  Config config_;
};

} // namespace explorer
} // namespace bx

#endif // BX_EXPLORER_TX_RESOLVER_H
