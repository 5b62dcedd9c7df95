#include "Types.hpp"

#include <cmath>

namespace bx {
namespace explorer {

namespace {

constexpr double SATOSHIS_PER_BTC = 100000000.0;

int64_t toSatoshis(double btc) {
  return static_cast<int64_t>(std::llround(btc * SATOSHIS_PER_BTC));
}

template <typename T>
void readOptional(const nlohmann::json &json, const char *key, T &out) {
  if (json.contains(key) && !json[key].is_null()) {
    out = json[key].get<T>();
  }
}

template <typename T>
void readOptional(const nlohmann::json &json, const char *key, std::optional<T> &out) {
  if (json.contains(key) && !json[key].is_null()) {
    out = json[key].get<T>();
  }
}

template <typename T>
void writeOptional(nlohmann::json &json, const char *key, const std::optional<T> &value) {
  if (value) {
    json[key] = *value;
  }
}

} // namespace

// ========== Block ==========

Roe<void> Block::fromNodeJson(const nlohmann::json &json) {
  if (!json.is_object()) {
    return Error(1, "Block reply is not an object");
  }
  try {
    hash = json.at("hash").get<std::string>();
    height = json.at("height").get<uint64_t>();
    time = json.at("time").get<int64_t>();
    merkleRoot = json.at("merkleroot").get<std::string>();
    nonce = json.at("nonce").get<uint32_t>();
    difficulty = json.at("difficulty").get<double>();
    size = json.at("size").get<uint64_t>();

    txids.clear();
    for (const auto &tx : json.at("tx")) {
      // Verbosity 2 replies carry objects instead of plain ids
      txids.push_back(tx.is_object() ? tx.at("txid").get<std::string>()
                                     : tx.get<std::string>());
    }
    nTx = json.contains("nTx") ? json["nTx"].get<uint64_t>() : txids.size();

    readOptional(json, "previousblockhash", previousBlockHash);
    readOptional(json, "nextblockhash", nextBlockHash);
    readOptional(json, "confirmations", confirmations);
    readOptional(json, "mediantime", medianTime);
    readOptional(json, "version", version);
    readOptional(json, "bits", bits);
    readOptional(json, "chainwork", chainwork);
    readOptional(json, "strippedsize", strippedSize);
    readOptional(json, "weight", weight);
  } catch (const nlohmann::json::exception &e) {
    return Error(2, "Malformed block reply: " + std::string(e.what()));
  }
  return {};
}

nlohmann::json Block::toJson() const {
  nlohmann::json j;
  j["hash"] = hash;
  j["height"] = height;
  writeOptional(j, "previousblockhash", previousBlockHash);
  writeOptional(j, "nextblockhash", nextBlockHash);
  writeOptional(j, "confirmations", confirmations);
  j["time"] = time;
  writeOptional(j, "mediantime", medianTime);
  writeOptional(j, "version", version);
  j["merkleroot"] = merkleRoot;
  j["nonce"] = nonce;
  writeOptional(j, "bits", bits);
  j["difficulty"] = difficulty;
  writeOptional(j, "chainwork", chainwork);
  j["size"] = size;
  writeOptional(j, "strippedsize", strippedSize);
  writeOptional(j, "weight", weight);
  j["nTx"] = nTx;
  j["tx"] = txids;
  return j;
}

// ========== Transaction parts ==========

nlohmann::json ScriptPubKey::toJson() const {
  nlohmann::json j;
  j["asm"] = asm_;
  j["hex"] = hex;
  j["type"] = type;
  if (address) {
    j["address"] = *address;
  }
  return j;
}

Roe<void> TxOutput::fromNodeJson(const nlohmann::json &json) {
  try {
    value = json.at("value").get<double>();
    n = json.at("n").get<uint32_t>();
    const auto &spk = json.at("scriptPubKey");
    scriptPubKey.hex = spk.at("hex").get<std::string>();
    readOptional(spk, "asm", scriptPubKey.asm_);
    readOptional(spk, "type", scriptPubKey.type);
    readOptional(spk, "address", scriptPubKey.address);
    // Nodes before v22 report a list of addresses instead
    if (!scriptPubKey.address && spk.contains("addresses") &&
        spk["addresses"].is_array() && spk["addresses"].size() == 1) {
      scriptPubKey.address = spk["addresses"][0].get<std::string>();
    }
  } catch (const nlohmann::json::exception &e) {
    return Error(2, "Malformed output: " + std::string(e.what()));
  }
  return {};
}

nlohmann::json TxOutput::toJson() const {
  return {{"value", value}, {"n", n}, {"scriptPubKey", scriptPubKey.toJson()}};
}

Roe<void> TxInput::fromNodeJson(const nlohmann::json &json) {
  try {
    sequence = json.at("sequence").get<uint32_t>();
    readOptional(json, "txinwitness", witness);
    if (json.contains("coinbase")) {
      coinbase = json["coinbase"].get<std::string>();
      return {};
    }
    txid = json.at("txid").get<std::string>();
    vout = json.at("vout").get<uint32_t>();
    if (json.contains("scriptSig")) {
      const auto &sig = json["scriptSig"];
      readOptional(sig, "hex", scriptSigHex);
      readOptional(sig, "asm", scriptSigAsm);
    }
    if (json.contains("prevout") && json["prevout"].is_object()) {
      prevoutValue = json["prevout"].at("value").get<double>();
    }
  } catch (const nlohmann::json::exception &e) {
    return Error(2, "Malformed input: " + std::string(e.what()));
  }
  return {};
}

nlohmann::json TxInput::toJson() const {
  nlohmann::json j;
  if (coinbase) {
    j["coinbase"] = *coinbase;
  } else {
    j["txid"] = txid;
    j["vout"] = vout;
    j["scriptSig"] = {{"asm", scriptSigAsm}, {"hex", scriptSigHex}};
    if (prevoutValue) {
      j["prevout"] = {{"value", *prevoutValue}};
    }
  }
  if (!witness.empty()) {
    j["txinwitness"] = witness;
  }
  j["sequence"] = sequence;
  return j;
}

nlohmann::json TxStatus::toJson() const {
  if (!confirmed) {
    return {{"confirmed", false}};
  }
  nlohmann::json j = {{"confirmed", true}, {"block_hash", blockHash}, {"block_height", blockHeight}};
  writeOptional(j, "block_time", blockTime);
  writeOptional(j, "confirmations", confirmations);
  return j;
}

// ========== Transaction ==========

Roe<void> Transaction::fromNodeJson(const nlohmann::json &json) {
  if (!json.is_object()) {
    return Error(1, "Transaction reply is not an object");
  }
  try {
    txid = json.at("txid").get<std::string>();
    wtxid = json.contains("hash") ? json["hash"].get<std::string>() : txid;
    version = json.at("version").get<int32_t>();
    size = json.at("size").get<uint64_t>();
    locktime = json.at("locktime").get<uint32_t>();
    readOptional(json, "vsize", vsize);
    readOptional(json, "weight", weight);
    readOptional(json, "hex", hex);

    vin.clear();
    for (const auto &in : json.at("vin")) {
      TxInput input;
      auto r = input.fromNodeJson(in);
      if (!r) {
        return r;
      }
      vin.push_back(std::move(input));
    }
    vout.clear();
    for (const auto &out : json.at("vout")) {
      TxOutput output;
      auto r = output.fromNodeJson(out);
      if (!r) {
        return r;
      }
      vout.push_back(std::move(output));
    }

    status = TxStatus{};
    if (json.contains("blockhash") && json["blockhash"].is_string()) {
      status.confirmed = true;
      status.blockHash = json["blockhash"].get<std::string>();
      readOptional(json, "blocktime", status.blockTime);
      readOptional(json, "confirmations", status.confirmations);
    }

    fee.reset();
    if (json.contains("fee") && json["fee"].is_number()) {
      fee = json["fee"].get<double>();
    } else {
      fee = feeFromPrevouts();
    }
  } catch (const nlohmann::json::exception &e) {
    return Error(2, "Malformed transaction reply: " + std::string(e.what()));
  }
  return {};
}

std::optional<double> Transaction::feeFromPrevouts() const {
  if (vin.empty() || isCoinbase()) {
    return std::nullopt;
  }
  int64_t in = 0;
  for (const auto &input : vin) {
    if (!input.prevoutValue) {
      return std::nullopt;
    }
    in += toSatoshis(*input.prevoutValue);
  }
  int64_t out = 0;
  for (const auto &output : vout) {
    out += toSatoshis(output.value);
  }
  return static_cast<double>(in - out) / SATOSHIS_PER_BTC;
}

nlohmann::json Transaction::toJson() const {
  nlohmann::json j;
  j["txid"] = txid;
  j["hash"] = wtxid;
  j["version"] = version;
  j["size"] = size;
  writeOptional(j, "vsize", vsize);
  writeOptional(j, "weight", weight);
  j["locktime"] = locktime;
  nlohmann::json inputs = nlohmann::json::array();
  for (const auto &input : vin) {
    inputs.push_back(input.toJson());
  }
  j["vin"] = inputs;
  nlohmann::json outputs = nlohmann::json::array();
  for (const auto &output : vout) {
    outputs.push_back(output.toJson());
  }
  j["vout"] = outputs;
  j["status"] = status.toJson();
  if (fee) {
    j["fee"] = *fee;
  }
  if (!hex.empty()) {
    j["hex"] = hex;
  }
  return j;
}

} // namespace explorer
} // namespace bx
