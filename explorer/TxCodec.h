#ifndef BX_EXPLORER_TX_CODEC_H
#define BX_EXPLORER_TX_CODEC_H

#include "../lib/Utilities.h"

#include <string>

namespace bx {
namespace explorer {
namespace txcodec {

// Error codes
static constexpr const int32_t E_BAD_HEX = 1;
static constexpr const int32_t E_TRUNCATED = 2;
static constexpr const int32_t E_TRAILING_DATA = 3;

/**
 * Strip the segwit marker, flag and witness stacks from a serialized
 * transaction. Legacy transactions are returned unchanged.
 * @param raw Binary serialization
 */
Roe<std::string> stripWitness(const std::string &raw);

/**
 * Transaction id of a hex encoded transaction: double SHA-256 of the
 * witness-stripped serialization, byte-reversed, lowercase hex.
 */
Roe<std::string> computeTxid(const std::string &rawHex);

/** Same as computeTxid but over the full serialization (BIP 141 wtxid) */
Roe<std::string> computeWtxid(const std::string &rawHex);

} // namespace txcodec
} // namespace explorer
} // namespace bx

#endif // BX_EXPLORER_TX_CODEC_H
