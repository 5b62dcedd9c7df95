#ifndef BX_EXPLORER_BLOCK_RESOLVER_H
#define BX_EXPLORER_BLOCK_RESOLVER_H

#include "ApiError.h"
#include "Types.hpp"
#include "../lib/Module.h"
#include "../rpc/INodeRpc.hpp"

#include <string>

namespace bx {
namespace explorer {

/**
 * Resolves a block hash to its public representation via `getblock`.
 */
class BlockResolver : public Module {
public:
  explicit BlockResolver(rpc::INodeRpc &node);
  ~BlockResolver() override = default;

  /**
   * Validate a client supplied hash and fetch the block.
   * Malformed hash: 400 "Invalid block hash" without contacting the node.
   * Any node failure: 500 "Failed to retrieve block information".
   */
  ApiRoe<Block> resolve(const std::string &rawHash);

  /**
   * Fetch and decode a block without API error translation. A reply that
   * does not decode, or describes a different block, is an E_DECODE failure.
   */
  rpc::Roe<Block> fetch(const BlockHash &hash);

private:
  rpc::INodeRpc &node_;
};

} // namespace explorer
} // namespace bx

#endif // BX_EXPLORER_BLOCK_RESOLVER_H
