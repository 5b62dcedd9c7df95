#include "TxCodec.h"

#include <algorithm>

namespace bx {
namespace explorer {
namespace txcodec {

namespace {

class Reader {
public:
  explicit Reader(const std::string &data) : data_(data) {}

  size_t pos() const { return pos_; }
  bool atEnd() const { return pos_ == data_.size(); }

  bool skip(uint64_t n) {
    if (n > data_.size() - pos_) {
      return false;
    }
    pos_ += static_cast<size_t>(n);
    return true;
  }

  bool peek(size_t offset, uint8_t &byte) const {
    if (offset >= data_.size() - pos_) {
      return false;
    }
    byte = static_cast<uint8_t>(data_[pos_ + offset]);
    return true;
  }

  bool readVarInt(uint64_t &value) {
    uint8_t prefix = 0;
    if (!peek(0, prefix)) {
      return false;
    }
    ++pos_;
    size_t width = 0;
    switch (prefix) {
    case 0xfd:
      width = 2;
      break;
    case 0xfe:
      width = 4;
      break;
    case 0xff:
      width = 8;
      break;
    default:
      value = prefix;
      return true;
    }
    if (width > data_.size() - pos_) {
      return false;
    }
    value = 0;
    for (size_t i = 0; i < width; ++i) {
      value |= static_cast<uint64_t>(static_cast<uint8_t>(data_[pos_ + i])) << (8 * i);
    }
    pos_ += width;
    return true;
  }

  // varint length followed by that many bytes
  bool skipVarBytes() {
    uint64_t len = 0;
    return readVarInt(len) && skip(len);
  }

private:
  const std::string &data_;
  size_t pos_{ 0 };
};

Error truncated(const char *where) {
  return Error(E_TRUNCATED, std::string("Transaction truncated in ") + where);
}

std::string displayHash(const std::string &raw) {
  std::string digest = utl::sha256d(raw);
  std::reverse(digest.begin(), digest.end());
  return utl::hexEncode(digest);
}

Roe<std::string> decodeHex(const std::string &rawHex) {
  if (rawHex.empty() || rawHex.size() % 2 != 0) {
    return Error(E_BAD_HEX, "Transaction hex has odd or zero length");
  }
  std::string raw = utl::hexDecode(rawHex);
  if (raw.empty()) {
    return Error(E_BAD_HEX, "Transaction hex contains non-hex characters");
  }
  return raw;
}

} // namespace

Roe<std::string> stripWitness(const std::string &raw) {
  Reader r(raw);
  if (!r.skip(4)) {
    return truncated("version");
  }

  // Marker 0x00 followed by a non-zero flag announces witness data
  uint8_t marker = 0, flag = 0;
  bool segwit = r.peek(0, marker) && marker == 0x00 && r.peek(1, flag) && flag != 0x00;
  if (segwit && !r.skip(2)) {
    return truncated("marker");
  }

  const size_t bodyStart = r.pos();
  uint64_t nIn = 0;
  if (!r.readVarInt(nIn)) {
    return truncated("input count");
  }
  for (uint64_t i = 0; i < nIn; ++i) {
    if (!r.skip(36) || !r.skipVarBytes() || !r.skip(4)) {
      return truncated("inputs");
    }
  }
  uint64_t nOut = 0;
  if (!r.readVarInt(nOut)) {
    return truncated("output count");
  }
  for (uint64_t i = 0; i < nOut; ++i) {
    if (!r.skip(8) || !r.skipVarBytes()) {
      return truncated("outputs");
    }
  }
  const size_t bodyEnd = r.pos();

  if (segwit) {
    for (uint64_t i = 0; i < nIn; ++i) {
      uint64_t nItems = 0;
      if (!r.readVarInt(nItems)) {
        return truncated("witness");
      }
      for (uint64_t k = 0; k < nItems; ++k) {
        if (!r.skipVarBytes()) {
          return truncated("witness");
        }
      }
    }
  }

  if (!r.skip(4)) {
    return truncated("locktime");
  }
  if (!r.atEnd()) {
    return Error(E_TRAILING_DATA, "Unexpected bytes after locktime");
  }

  if (!segwit) {
    return raw;
  }
  return raw.substr(0, 4) + raw.substr(bodyStart, bodyEnd - bodyStart) +
         raw.substr(raw.size() - 4);
}

Roe<std::string> computeTxid(const std::string &rawHex) {
  auto raw = decodeHex(rawHex);
  if (!raw) {
    return raw;
  }
  auto stripped = stripWitness(raw.value());
  if (!stripped) {
    return stripped;
  }
  return displayHash(stripped.value());
}

Roe<std::string> computeWtxid(const std::string &rawHex) {
  auto raw = decodeHex(rawHex);
  if (!raw) {
    return raw;
  }
  // Validates the layout, the stripped copy itself is not needed
  auto stripped = stripWitness(raw.value());
  if (!stripped) {
    return stripped;
  }
  return displayHash(raw.value());
}

} // namespace txcodec
} // namespace explorer
} // namespace bx
