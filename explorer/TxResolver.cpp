#include "TxResolver.h"
#include "TxCodec.h"

namespace bx {
namespace explorer {

TxResolver::TxResolver(rpc::INodeRpc &node)
    : Module("explorer.transactions"), node_(node) {}

ApiRoe<Transaction> TxResolver::resolve(const std::string &rawTxId) {
  auto txid = TxId::fromString(rawTxId);
  if (!txid) {
    // The /tx route has no 400 path, malformed ids share the generic failure
    log().warning << "Rejected txid: " << txid.error().message;
    return ApiError::invalidInput(ApiError::HTTP_INTERNAL_ERROR,
                                  ApiError::MSG_TX_FAILED,
                                  txid.error().message);
  }

  auto tx = fetch(txid.value());
  if (!tx) {
    auto err = ApiError::fromRpc(tx.error(), ApiError::MSG_TX_FAILED);
    log().error << "Transaction " << txid.value() << " unavailable: " << err.detail;
    return err;
  }
  return tx.value();
}

rpc::Roe<Transaction> TxResolver::fetch(const TxId &txid) {
  nlohmann::json verbose = config_.verbosity >= 2 ? nlohmann::json(2) : nlohmann::json(true);
  auto reply = node_.call("getrawtransaction", nlohmann::json::array({txid.str(), verbose}));
  if (!reply) {
    return reply.error();
  }

  Transaction tx;
  auto decoded = tx.fromNodeJson(reply.value());
  if (!decoded) {
    return rpc::RpcError::decode(decoded.error().message);
  }

  if (utl::toLower(tx.txid) != txid.str()) {
    return rpc::RpcError::decode("Node returned transaction " + tx.txid +
                                 " for requested " + txid.str());
  }
  if (!tx.hex.empty()) {
    auto computed = txcodec::computeTxid(tx.hex);
    if (!computed) {
      return rpc::RpcError::decode("Undecodable transaction hex: " + computed.error().message);
    }
    if (computed.value() != txid.str()) {
      return rpc::RpcError::decode("Transaction hex hashes to " + computed.value() +
                                   ", expected " + txid.str());
    }
    auto wtxid = txcodec::computeWtxid(tx.hex);
    if (!wtxid) {
      return rpc::RpcError::decode("Undecodable transaction hex: " + wtxid.error().message);
    }
    if (wtxid.value() != utl::toLower(tx.wtxid)) {
      return rpc::RpcError::decode("Transaction hex has wtxid " + wtxid.value() +
                                   ", node reported " + tx.wtxid);
    }
  }

  if (tx.status.confirmed) {
    auto height = fetchBlockHeight(tx.status.blockHash);
    if (!height) {
      return height.error();
    }
    tx.status.blockHeight = height.value();
  }

  log().debug << "Fetched transaction " << tx.txid
              << (tx.status.confirmed ? " in block " + tx.status.blockHash : " (unconfirmed)");
  return tx;
}

rpc::Roe<uint64_t> TxResolver::fetchBlockHeight(const std::string &blockHash) {
  auto header = node_.call("getblockheader", nlohmann::json::array({blockHash, true}));
  if (!header) {
    return header.error();
  }
  const auto &json = header.value();
  if (!json.is_object() || !json.contains("height") ||
      !json["height"].is_number_integer() || json["height"].get<int64_t>() < 0) {
    return rpc::RpcError::decode("Block header for " + blockHash + " carries no height");
  }
  return json["height"].get<uint64_t>();
}

} // namespace explorer
} // namespace bx
