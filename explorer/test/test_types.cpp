#include "Types.hpp"
#include "FakeNode.hpp"
#include "TxFixtures.hpp"
#include <gtest/gtest.h>

using namespace bx::explorer;
using bx::test::FakeNode;
using json = nlohmann::json;

namespace {

json nodeBlock(uint64_t height) {
  FakeNode node(height);
  auto r = node.call("getblock", json::array({FakeNode::hashAt(height), 1}));
  return r.value();
}

} // namespace

// ========== Identifiers ==========

TEST(HexIdTest, AcceptsAndLowercases) {
  std::string mixed = "000000000019D6689C085AE165831E934FF763AE46A2A6C172B3F1B60A8CE26F";
  auto hash = BlockHash::fromString(mixed);
  ASSERT_TRUE(hash.isOk());
  EXPECT_EQ(hash.value().str(),
            "000000000019d6689c085ae165831e934ff763ae46a2a6c172b3f1b60a8ce26f");
}

TEST(HexIdTest, RejectsWrongShape) {
  EXPECT_TRUE(BlockHash::fromString("").isError());
  EXPECT_TRUE(BlockHash::fromString("abc").isError());
  EXPECT_TRUE(BlockHash::fromString(std::string(63, 'a')).isError());
  EXPECT_TRUE(BlockHash::fromString(std::string(65, 'a')).isError());
  EXPECT_TRUE(TxId::fromString(std::string(64, 'x')).isError());
  EXPECT_TRUE(TxId::fromString(" " + std::string(63, 'a')).isError());
}

TEST(HexIdTest, EqualityIgnoresInputCase) {
  auto a = TxId::fromString(std::string(64, 'A'));
  auto b = TxId::fromString(std::string(64, 'a'));
  ASSERT_TRUE(a && b);
  EXPECT_EQ(a.value(), b.value());
}

// ========== Block ==========

TEST(BlockTest, DecodesVerboseReply) {
  Block block;
  ASSERT_TRUE(block.fromNodeJson(nodeBlock(5)).isOk());
  EXPECT_EQ(block.hash, FakeNode::hashAt(5));
  EXPECT_EQ(block.height, 5u);
  ASSERT_TRUE(block.previousBlockHash.has_value());
  EXPECT_EQ(*block.previousBlockHash, FakeNode::hashAt(4));
  EXPECT_FALSE(block.nextBlockHash.has_value());
  ASSERT_TRUE(block.confirmations.has_value());
  EXPECT_EQ(*block.confirmations, 1);
  EXPECT_EQ(block.nTx, 1u);
  EXPECT_EQ(block.txids.size(), 1u);
}

TEST(BlockTest, GenesisHasNoPrevious) {
  Block block;
  ASSERT_TRUE(block.fromNodeJson(nodeBlock(0)).isOk());
  EXPECT_FALSE(block.previousBlockHash.has_value());
  json out = block.toJson();
  EXPECT_FALSE(out.contains("previousblockhash"));
  EXPECT_EQ(out["height"], 0);
}

TEST(BlockTest, ToJsonUsesNodeFieldNames) {
  json in = nodeBlock(3);
  Block block;
  ASSERT_TRUE(block.fromNodeJson(in).isOk());
  json out = block.toJson();
  for (const char *key : {"hash", "height", "previousblockhash", "confirmations", "time",
                          "mediantime", "version", "merkleroot", "nonce", "bits", "difficulty",
                          "chainwork", "size", "strippedsize", "weight", "nTx", "tx"}) {
    ASSERT_TRUE(out.contains(key)) << key;
    EXPECT_EQ(out[key], in[key]) << key;
  }
}

TEST(BlockTest, OmittedNodeFieldsStayOmitted) {
  json in = nodeBlock(3);
  for (const char *key : {"confirmations", "mediantime", "version", "bits", "chainwork",
                          "strippedsize", "weight"}) {
    in.erase(key);
  }
  Block block;
  ASSERT_TRUE(block.fromNodeJson(in).isOk());
  EXPECT_FALSE(block.bits.has_value());
  json out = block.toJson();
  for (const char *key : {"confirmations", "mediantime", "version", "bits", "chainwork",
                          "strippedsize", "weight"}) {
    EXPECT_FALSE(out.contains(key)) << key;
  }
  EXPECT_EQ(out["merkleroot"], in["merkleroot"]);
}

TEST(BlockTest, AcceptsVerbosityTwoTransactions) {
  json in = nodeBlock(2);
  in["tx"] = json::array({{{"txid", std::string(64, 'd')}, {"size", 100}}});
  Block block;
  ASSERT_TRUE(block.fromNodeJson(in).isOk());
  ASSERT_EQ(block.txids.size(), 1u);
  EXPECT_EQ(block.txids[0], std::string(64, 'd'));
}

TEST(BlockTest, RejectsMissingOrMistypedFields) {
  Block block;
  EXPECT_TRUE(block.fromNodeJson(json::array()).isError());
  EXPECT_TRUE(block.fromNodeJson("not a block").isError());

  json noHeight = nodeBlock(1);
  noHeight.erase("height");
  EXPECT_TRUE(block.fromNodeJson(noHeight).isError());

  json badTime = nodeBlock(1);
  badTime["time"] = "yesterday";
  EXPECT_TRUE(block.fromNodeJson(badTime).isError());
}

// ========== Transaction ==========

TEST(TransactionTest, DecodesCoinbase) {
  Transaction tx;
  ASSERT_TRUE(tx.fromNodeJson(bx::test::genesisCoinbaseReply(FakeNode::hashAt(0))).isOk());
  EXPECT_EQ(tx.txid, bx::test::GENESIS_COINBASE_TXID);
  EXPECT_TRUE(tx.isCoinbase());
  EXPECT_EQ(tx.vout.size(), 1u);
  EXPECT_DOUBLE_EQ(tx.vout[0].value, 50.0);
  EXPECT_TRUE(tx.status.confirmed);
  EXPECT_EQ(tx.status.blockHash, FakeNode::hashAt(0));
  EXPECT_FALSE(tx.fee.has_value());

  json out = tx.toJson();
  EXPECT_TRUE(out["vin"][0].contains("coinbase"));
  EXPECT_FALSE(out["vin"][0].contains("txid"));
  EXPECT_FALSE(out.contains("fee"));
}

TEST(TransactionTest, UnconfirmedStatus) {
  Transaction tx;
  ASSERT_TRUE(tx.fromNodeJson(bx::test::segwitReply()).isOk());
  EXPECT_FALSE(tx.status.confirmed);
  EXPECT_EQ(tx.toJson()["status"], json({{"confirmed", false}}));
  EXPECT_EQ(tx.wtxid, bx::test::SEGWIT_WTXID);
  ASSERT_EQ(tx.vin.size(), 1u);
  EXPECT_EQ(tx.vin[0].witness.size(), 2u);
  EXPECT_EQ(tx.vin[0].sequence, 4294967293u);
}

TEST(TransactionTest, OmittedSizesStayOmitted) {
  json reply = bx::test::genesisCoinbaseReply(FakeNode::hashAt(0));
  reply.erase("vsize");
  reply.erase("weight");
  reply.erase("blocktime");
  Transaction tx;
  ASSERT_TRUE(tx.fromNodeJson(reply).isOk());
  json out = tx.toJson();
  EXPECT_FALSE(out.contains("vsize"));
  EXPECT_FALSE(out.contains("weight"));
  EXPECT_EQ(out["size"], 204);
  EXPECT_FALSE(out["status"].contains("block_time"));
  EXPECT_EQ(out["status"]["confirmations"], 1);
}

TEST(TransactionTest, FeeFromNode) {
  json reply = bx::test::segwitReply();
  reply["fee"] = 0.0000111;
  Transaction tx;
  ASSERT_TRUE(tx.fromNodeJson(reply).isOk());
  ASSERT_TRUE(tx.fee.has_value());
  EXPECT_DOUBLE_EQ(*tx.fee, 0.0000111);
}

TEST(TransactionTest, FeeFromPrevouts) {
  json reply = bx::test::segwitReply();
  reply["vin"][0]["prevout"] = {{"value", 0.0006}, {"height", 100}};
  Transaction tx;
  ASSERT_TRUE(tx.fromNodeJson(reply).isOk());
  ASSERT_TRUE(tx.fee.has_value());
  EXPECT_DOUBLE_EQ(*tx.fee, 0.0001);
}

TEST(TransactionTest, NoFeeWithoutPrevouts) {
  Transaction tx;
  ASSERT_TRUE(tx.fromNodeJson(bx::test::segwitReply()).isOk());
  EXPECT_FALSE(tx.fee.has_value());
}

TEST(TransactionTest, LegacyAddressesListIsFolded) {
  json reply = bx::test::segwitReply();
  reply["vout"][0]["scriptPubKey"]["addresses"] = json::array({"bc1qexample"});
  Transaction tx;
  ASSERT_TRUE(tx.fromNodeJson(reply).isOk());
  ASSERT_TRUE(tx.vout[0].scriptPubKey.address.has_value());
  EXPECT_EQ(*tx.vout[0].scriptPubKey.address, "bc1qexample");
  EXPECT_EQ(tx.toJson()["vout"][0]["scriptPubKey"]["address"], "bc1qexample");
}

TEST(TransactionTest, RejectsMalformedReply) {
  Transaction tx;
  json reply = bx::test::segwitReply();
  reply["vout"][0].erase("value");
  EXPECT_TRUE(tx.fromNodeJson(reply).isError());

  reply = bx::test::segwitReply();
  reply.erase("vin");
  EXPECT_TRUE(tx.fromNodeJson(reply).isError());

  EXPECT_TRUE(tx.fromNodeJson(json()).isError());
}

TEST(TxStatusTest, ConfirmedCarriesBlockFields) {
  TxStatus status;
  status.confirmed = true;
  status.blockHash = FakeNode::hashAt(7);
  status.blockHeight = 7;
  status.blockTime = 1700000000;
  status.confirmations = 4;
  json out = status.toJson();
  EXPECT_EQ(out["confirmed"], true);
  EXPECT_EQ(out["block_hash"], FakeNode::hashAt(7));
  EXPECT_EQ(out["block_height"], 7);
  EXPECT_EQ(out["block_time"], 1700000000);
  EXPECT_EQ(out["confirmations"], 4);
}
