#ifndef BX_EXPLORER_LATEST_BLOCKS_H
#define BX_EXPLORER_LATEST_BLOCKS_H

#include "ApiError.h"
#include "BlockResolver.h"
#include "Types.hpp"
#include "../lib/Module.h"
#include "../rpc/INodeRpc.hpp"

#include <cstdint>
#include <vector>

namespace bx {
namespace explorer {

/**
 * Assembles the most recent blocks as one snapshot of the chain.
 *
 * The tip height H is read once per call; the block at position i of the
 * result has height H - i. A newer tip arriving mid-call is ignored, a
 * reorganization that moves a block off its expected height fails the call.
 * Any single failing node call fails the whole list, partial lists are never
 * returned.
 */
class LatestBlocks : public Module {
public:
  static constexpr const uint32_t COUNT = 10;

  struct Config {
    // Fetch the per-height hash/block pairs concurrently
    bool parallelFetch{ false };
  };

  LatestBlocks(rpc::INodeRpc &node, BlockResolver &blocks);
  ~LatestBlocks() override = default;

  void setConfig(const Config &config) { config_ = config; }
  const Config &getConfig() const { return config_; }

  /**
   * Up to COUNT blocks, most recent first; fewer only near genesis.
   * Any failure: 500 "Failed to retrieve latest blocks".
   */
  ApiRoe<std::vector<Block>> list();

  /** Same as list() without API error translation */
  rpc::Roe<std::vector<Block>> collect();

private:
  rpc::Roe<uint64_t> fetchTipHeight();
  rpc::Roe<Block> fetchAtHeight(uint64_t height);

  rpc::Roe<std::vector<Block>> collectSequential(uint64_t tip, uint64_t count);
  rpc::Roe<std::vector<Block>> collectParallel(uint64_t tip, uint64_t count);

  rpc::INodeRpc &node_;
  BlockResolver &blocks_;
  Config config_;
};

} // namespace explorer
} // namespace bx

#endif // BX_EXPLORER_LATEST_BLOCKS_H
