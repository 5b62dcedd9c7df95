#include "BlockResolver.h"

namespace bx {
namespace explorer {

BlockResolver::BlockResolver(rpc::INodeRpc &node)
    : Module("explorer.blocks"), node_(node) {}

ApiRoe<Block> BlockResolver::resolve(const std::string &rawHash) {
  auto hash = BlockHash::fromString(rawHash);
  if (!hash) {
    log().warning << "Rejected block hash: " << hash.error().message;
    return ApiError::invalidInput(ApiError::HTTP_BAD_REQUEST,
                                  ApiError::MSG_INVALID_BLOCK_HASH,
                                  hash.error().message);
  }

  auto block = fetch(hash.value());
  if (!block) {
    auto err = ApiError::fromRpc(block.error(), ApiError::MSG_BLOCK_FAILED);
    log().error << "Block " << hash.value() << " unavailable: " << err.detail;
    return err;
  }
  return block.value();
}

rpc::Roe<Block> BlockResolver::fetch(const BlockHash &hash) {
  auto reply = node_.call("getblock", nlohmann::json::array({hash.str(), 1}));
  if (!reply) {
    return reply.error();
  }

  Block block;
  auto decoded = block.fromNodeJson(reply.value());
  if (!decoded) {
    return rpc::RpcError::decode(decoded.error().message);
  }
  if (utl::toLower(block.hash) != hash.str()) {
    return rpc::RpcError::decode("Node returned block " + block.hash +
                                 " for requested " + hash.str());
  }
  log().debug << "Fetched block " << block.hash << " at height " << block.height;
  return block;
}

} // namespace explorer
} // namespace bx
