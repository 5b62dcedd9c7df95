#include "LatestBlocks.h"

#include <algorithm>
#include <future>

namespace bx {
namespace explorer {

LatestBlocks::LatestBlocks(rpc::INodeRpc &node, BlockResolver &blocks)
    : Module("explorer.latest"), node_(node), blocks_(blocks) {}

ApiRoe<std::vector<Block>> LatestBlocks::list() {
  auto result = collect();
  if (!result) {
    auto err = ApiError::fromRpc(result.error(), ApiError::MSG_LATEST_FAILED);
    err.code = ApiError::E_UPSTREAM;
    log().error << "Latest blocks unavailable: " << err.detail;
    return err;
  }
  return result.value();
}

rpc::Roe<std::vector<Block>> LatestBlocks::collect() {
  auto tip = fetchTipHeight();
  if (!tip) {
    return tip.error();
  }

  const uint64_t count = std::min<uint64_t>(COUNT, tip.value() + 1);
  log().debug << "Collecting " << count << " blocks below tip " << tip.value();

  if (config_.parallelFetch && count > 1) {
    return collectParallel(tip.value(), count);
  }
  return collectSequential(tip.value(), count);
}

rpc::Roe<std::vector<Block>> LatestBlocks::collectSequential(uint64_t tip, uint64_t count) {
  std::vector<Block> result;
  result.reserve(count);
  for (uint64_t i = 0; i < count; ++i) {
    auto block = fetchAtHeight(tip - i);
    if (!block) {
      return block.error();
    }
    result.push_back(std::move(block.value()));
  }
  return result;
}

rpc::Roe<std::vector<Block>> LatestBlocks::collectParallel(uint64_t tip, uint64_t count) {
  std::vector<std::future<rpc::Roe<Block>>> pending;
  pending.reserve(count);
  for (uint64_t i = 0; i < count; ++i) {
    const uint64_t height = tip - i;
    pending.push_back(std::async(std::launch::async,
                                 [this, height]() { return fetchAtHeight(height); }));
  }

  // Collected in launch order, so the result is descending regardless of
  // which fetch finishes first. Every future is drained before returning.
  std::vector<Block> result;
  result.reserve(count);
  bool failed = false;
  rpc::RpcError firstError;
  for (auto &f : pending) {
    auto block = f.get();
    if (failed) {
      continue;
    }
    if (!block) {
      failed = true;
      firstError = block.error();
      continue;
    }
    result.push_back(std::move(block.value()));
  }
  if (failed) {
    return firstError;
  }
  return result;
}

rpc::Roe<uint64_t> LatestBlocks::fetchTipHeight() {
  auto reply = node_.call("getblockcount", nlohmann::json::array());
  if (!reply) {
    return reply.error();
  }
  const auto &json = reply.value();
  if (!json.is_number_integer() || json.get<int64_t>() < 0) {
    return rpc::RpcError::decode("getblockcount returned " + json.dump());
  }
  return json.get<uint64_t>();
}

rpc::Roe<Block> LatestBlocks::fetchAtHeight(uint64_t height) {
  auto reply = node_.call("getblockhash", nlohmann::json::array({height}));
  if (!reply) {
    return reply.error();
  }
  if (!reply.value().is_string()) {
    return rpc::RpcError::decode("getblockhash returned " + reply.value().dump());
  }
  auto hash = BlockHash::fromString(reply.value().get<std::string>());
  if (!hash) {
    return rpc::RpcError::decode("getblockhash returned a malformed hash: " +
                                 hash.error().message);
  }

  auto block = blocks_.fetch(hash.value());
  if (!block) {
    return block.error();
  }
  if (block.value().height != height) {
    // The chain reorganized between the two calls
    return rpc::RpcError::decode("Block " + hash.value().str() + " reports height " +
                                 std::to_string(block.value().height) + ", expected " +
                                 std::to_string(height));
  }
  return block;
}

} // namespace explorer
} // namespace bx
