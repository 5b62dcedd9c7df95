#include "LatestBlocks.h"
#include "FakeNode.hpp"
#include <gtest/gtest.h>

#include <set>

using namespace bx::explorer;
using bx::rpc::RpcError;
using bx::test::FakeNode;
using json = nlohmann::json;

namespace {

void expectDescendingFrom(const std::vector<Block> &blocks, uint64_t tip, size_t count) {
  ASSERT_EQ(blocks.size(), count);
  std::set<std::string> hashes;
  for (size_t i = 0; i < blocks.size(); ++i) {
    EXPECT_EQ(blocks[i].height, tip - i);
    EXPECT_EQ(blocks[i].hash, FakeNode::hashAt(tip - i));
    hashes.insert(blocks[i].hash);
  }
  EXPECT_EQ(hashes.size(), blocks.size());
}

} // namespace

class LatestBlocksTest : public ::testing::TestWithParam<bool> {
protected:
  LatestBlocksTest() : node_(105), blocks_(node_), latest_(node_, blocks_) {
    latest_.setConfig(LatestBlocks::Config{GetParam()});
  }

  FakeNode node_;
  BlockResolver blocks_;
  LatestBlocks latest_;
};

TEST_P(LatestBlocksTest, ReturnsTenMostRecentDescending) {
  auto r = latest_.list();
  ASSERT_TRUE(r.isOk()) << r.error().detail;
  expectDescendingFrom(r.value(), 105, 10);
  EXPECT_EQ(node_.callCount("getblockcount"), 1u);
  EXPECT_EQ(node_.callCount("getblockhash"), 10u);
  EXPECT_EQ(node_.callCount("getblock"), 10u);
}

TEST_P(LatestBlocksTest, ShortChainReturnsEverything) {
  FakeNode node(3);
  BlockResolver blocks(node);
  LatestBlocks latest(node, blocks);
  latest.setConfig(LatestBlocks::Config{GetParam()});

  auto r = latest.list();
  ASSERT_TRUE(r.isOk());
  expectDescendingFrom(r.value(), 3, 4);
  EXPECT_FALSE(r.value().back().previousBlockHash.has_value());
}

TEST_P(LatestBlocksTest, GenesisOnly) {
  FakeNode node(0);
  BlockResolver blocks(node);
  LatestBlocks latest(node, blocks);
  latest.setConfig(LatestBlocks::Config{GetParam()});

  auto r = latest.list();
  ASSERT_TRUE(r.isOk());
  expectDescendingFrom(r.value(), 0, 1);
}

TEST_P(LatestBlocksTest, NineBlockChainEdge) {
  FakeNode node(9);
  BlockResolver blocks(node);
  LatestBlocks latest(node, blocks);
  latest.setConfig(LatestBlocks::Config{GetParam()});

  auto r = latest.list();
  ASSERT_TRUE(r.isOk());
  expectDescendingFrom(r.value(), 9, 10);
}

TEST_P(LatestBlocksTest, TipFailureFailsWithoutFurtherCalls) {
  node_.failAll("getblockcount", RpcError::transport("Connection refused"));
  auto r = latest_.list();
  ASSERT_TRUE(r.isError());
  EXPECT_EQ(r.error().httpStatus, 500);
  EXPECT_EQ(r.error().message, "Failed to retrieve latest blocks");
  EXPECT_EQ(node_.callCount("getblockhash"), 0u);
}

TEST_P(LatestBlocksTest, NonNumericTipIsFailure) {
  for (const json &bad : {json("abc"), json(-1), json(1.5)}) {
    node_.overrideResult("getblockcount", bad);
    auto r = latest_.list();
    ASSERT_TRUE(r.isError()) << bad.dump();
    EXPECT_EQ(r.error().code, ApiError::E_UPSTREAM);
  }
  EXPECT_EQ(node_.callCount("getblockhash"), 0u);
}

TEST_P(LatestBlocksTest, MidAggregationFailureFailsWholeList) {
  node_.failCall("getblockhash", 4, RpcError::transport("Connection reset by peer"));
  auto r = latest_.list();
  ASSERT_TRUE(r.isError());
  EXPECT_EQ(r.error().httpStatus, 500);
  EXPECT_EQ(r.error().message, "Failed to retrieve latest blocks");
  EXPECT_EQ(r.error().code, ApiError::E_UPSTREAM);
}

TEST_P(LatestBlocksTest, NodeRejectionStillReportsUpstream) {
  node_.failCall("getblock", 7, RpcError::nodeRejected(-5, "Block not found"));
  auto r = latest_.list();
  ASSERT_TRUE(r.isError());
  EXPECT_EQ(r.error().code, ApiError::E_UPSTREAM);
  EXPECT_EQ(r.error().message, "Failed to retrieve latest blocks");
}

TEST_P(LatestBlocksTest, NewTipDuringAggregationIsIgnored) {
  node_.setHook([this](const std::string &method, const json &) {
    if (method == "getblockhash") {
      node_.extendTo(node_.tip() + 1);
    }
  });
  auto r = latest_.list();
  ASSERT_TRUE(r.isOk());
  expectDescendingFrom(r.value(), 105, 10);
  EXPECT_GT(node_.tip(), 105u);
}

TEST_P(LatestBlocksTest, HeightMismatchFailsTheList) {
  node_.mutateBlock(FakeNode::hashAt(100), [](json &b) { b["height"] = 99; });
  auto r = latest_.list();
  ASSERT_TRUE(r.isError());
  EXPECT_EQ(r.error().message, "Failed to retrieve latest blocks");

  auto collected = latest_.collect();
  ASSERT_TRUE(collected.isError());
  EXPECT_TRUE(collected.error().isDecode());
}

TEST_P(LatestBlocksTest, ReorgBelowSnapshotStaysConsistent) {
  // Blocks 101.. are replaced right after the tip was read
  node_.setHook([this](const std::string &method, const json &) {
    if (method == "getblockcount") {
      node_.setHook(nullptr);
      node_.reorgFrom(101, 106);
    }
  });
  auto r = latest_.list();
  ASSERT_TRUE(r.isOk());
  const auto &list = r.value();
  ASSERT_EQ(list.size(), 10u);
  for (size_t i = 0; i < list.size(); ++i) {
    EXPECT_EQ(list[i].height, 105 - i);
  }
  EXPECT_EQ(list[0].hash, FakeNode::hashAt(105, 1));
  EXPECT_EQ(list[9].hash, FakeNode::hashAt(96));
}

INSTANTIATE_TEST_SUITE_P(FetchModes, LatestBlocksTest, ::testing::Values(false, true),
                         [](const ::testing::TestParamInfo<bool> &info) {
                           return info.param ? std::string("Parallel") : std::string("Sequential");
                         });

TEST(LatestBlocksParallelTest, FailureStillDrainsEveryFetch) {
  FakeNode node(50);
  BlockResolver blocks(node);
  LatestBlocks latest(node, blocks);
  latest.setConfig(LatestBlocks::Config{true});
  node.failCall("getblockhash", 0, RpcError::transport("timeout"));

  auto r = latest.list();
  ASSERT_TRUE(r.isError());
  EXPECT_EQ(node.callCount("getblockhash"), 10u);
}

TEST(LatestBlocksParallelTest, SequentialStopsAtFirstFailure) {
  FakeNode node(50);
  BlockResolver blocks(node);
  LatestBlocks latest(node, blocks);
  node.failCall("getblockhash", 2, RpcError::transport("timeout"));

  auto r = latest.list();
  ASSERT_TRUE(r.isError());
  EXPECT_EQ(node.callCount("getblockhash"), 3u);
}
