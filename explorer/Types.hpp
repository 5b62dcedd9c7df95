#pragma once

#include "../lib/Utilities.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace bx {
namespace explorer {

/**
 * 32-byte identifier in its 64 hex character display form.
 * Only constructible through fromString(), which validates the shape and
 * normalizes to lowercase. The tag keeps block hashes and txids apart.
 */
template <typename Tag> class HexId {
public:
  static constexpr const size_t HEX_LENGTH = 64;

  static bool isValid(const std::string &raw) {
    return utl::isHexString(raw, HEX_LENGTH);
  }

  static Roe<HexId> fromString(const std::string &raw) {
    if (!isValid(raw)) {
      return Error(1, "Expected " + std::to_string(HEX_LENGTH) +
                          " hex characters, got '" + raw + "'");
    }
    return HexId(utl::toLower(raw));
  }

  const std::string &str() const { return hex_; }

  bool operator==(const HexId &other) const { return hex_ == other.hex_; }
  bool operator!=(const HexId &other) const { return hex_ != other.hex_; }

private:
  explicit HexId(std::string hex) : hex_(std::move(hex)) {}

  std::string hex_;
};

template <typename Tag>
inline std::ostream &operator<<(std::ostream &os, const HexId<Tag> &id) {
  return os << id.str();
}

struct BlockHashTag {};
struct TxIdTag {};

using BlockHash = HexId<BlockHashTag>;
using TxId = HexId<TxIdTag>;

/**
 * Public block representation. Field values are taken verbatim from the
 * node's verbose getblock reply and emitted under the node's field names.
 * Optional fields the node left out are left out of toJson() too.
 */
struct Block {
  std::string hash;
  uint64_t height{ 0 };
  std::optional<std::string> previousBlockHash; // absent for genesis
  std::optional<std::string> nextBlockHash;     // absent at the tip
  std::optional<int64_t> confirmations;
  int64_t time{ 0 };
  std::optional<int64_t> medianTime;
  std::optional<int32_t> version;
  std::string merkleRoot;
  uint32_t nonce{ 0 };
  std::optional<std::string> bits;
  double difficulty{ 0 };
  std::optional<std::string> chainwork;
  uint64_t size{ 0 };
  std::optional<uint64_t> strippedSize;
  std::optional<uint64_t> weight;
  uint64_t nTx{ 0 };
  std::vector<std::string> txids;

  Roe<void> fromNodeJson(const nlohmann::json &json);
  nlohmann::json toJson() const;
};

struct ScriptPubKey {
  std::string hex;
  std::string asm_;
  std::string type;
  std::optional<std::string> address; // only for standard destinations

  nlohmann::json toJson() const;
};

struct TxOutput {
  double value{ 0 }; // BTC, as reported by the node
  uint32_t n{ 0 };
  ScriptPubKey scriptPubKey;

  Roe<void> fromNodeJson(const nlohmann::json &json);
  nlohmann::json toJson() const;
};

struct TxInput {
  std::optional<std::string> coinbase; // coinbase script hex, set for coinbase inputs
  std::string txid;                    // spent output, empty for coinbase
  uint32_t vout{ 0 };
  std::string scriptSigHex;
  std::string scriptSigAsm;
  uint32_t sequence{ 0 };
  std::vector<std::string> witness;
  std::optional<double> prevoutValue; // only with verbosity 2

  bool isCoinbase() const { return coinbase.has_value(); }

  Roe<void> fromNodeJson(const nlohmann::json &json);
  nlohmann::json toJson() const;
};

struct TxStatus {
  bool confirmed{ false };
  std::string blockHash;
  uint64_t blockHeight{ 0 };
  std::optional<int64_t> blockTime;
  std::optional<int64_t> confirmations;

  nlohmann::json toJson() const;
};

struct Transaction {
  std::string txid;
  std::string wtxid; // node field "hash"
  int32_t version{ 0 };
  uint64_t size{ 0 };
  std::optional<uint64_t> vsize;
  std::optional<uint64_t> weight;
  uint32_t locktime{ 0 };
  std::vector<TxInput> vin;
  std::vector<TxOutput> vout;
  TxStatus status;
  std::optional<double> fee; // BTC
  std::string hex;

  bool isCoinbase() const { return vin.size() == 1 && vin[0].isCoinbase(); }

  /**
   * Decode a getrawtransaction reply. status.blockHeight is not part of
   * the reply and is left at 0.
   */
  Roe<void> fromNodeJson(const nlohmann::json &json);
  nlohmann::json toJson() const;

  /**
   * Inputs minus outputs, when every input carries its prevout value.
   * Empty for coinbase transactions.
   */
  std::optional<double> feeFromPrevouts() const;
};

} // namespace explorer
} // namespace bx
