#ifndef BX_UTILITIES_H
#define BX_UTILITIES_H

#include "ResultOrError.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace bx {

// Error type for utility functions
struct Error : public RoeErrorBase {
  Error() : RoeErrorBase() {}
  Error(int32_t c, const std::string &msg) : RoeErrorBase(c, msg) {}
  Error(int32_t c, std::string &&msg) : RoeErrorBase(c, std::move(msg)) {}
  explicit Error(const std::string &msg) : RoeErrorBase(msg) {}
  explicit Error(std::string &&msg) : RoeErrorBase(std::move(msg)) {}
};

template <typename T> using Roe = ResultOrError<T, Error>;

namespace utl {

/**
 * Parse an integer from a string
 * @param str String to parse
 * @param value Output parameter for the parsed value
 * @return true if parsing succeeded, false otherwise
 */
bool parseInt(const std::string &str, int &value);

/**
 * Parse a port number from a string (validates range 0-65535)
 * @param str String to parse
 * @param port Output parameter for the parsed port
 * @return true if parsing succeeded and port is in valid range, false otherwise
 */
bool parsePort(const std::string &str, uint16_t &port);

/**
 * Parse a host:port string into separate host and port components
 * @param hostPort String in format "host:port"
 * @param host Output parameter for the host part
 * @param port Output parameter for the port part
 * @return true if parsing succeeded, false otherwise
 */
bool parseHostPort(const std::string &hostPort, std::string &host, uint16_t &port);

/**
 * Load and parse a JSON file
 * @param path Path to the JSON file
 * @return Parsed JSON, or error code 1 (missing), 2 (unreadable), 3 (invalid JSON)
 */
bx::Roe<nlohmann::json> loadJsonFile(const std::string &path);

/** Lowercase copy of an ASCII string */
std::string toLower(const std::string &str);

/**
 * Check that a string consists of exactly `length` hex digits (either case)
 */
bool isHexString(const std::string &str, size_t length);

/**
 * Encode binary data as hex string
 * @param data Raw bytes
 * @return Lowercase hex string (two chars per byte)
 */
std::string hexEncode(const std::string &data);

/**
 * Decode hex string back to binary
 * @param hex Hex string (even length, 0-9a-fA-F)
 * @return Decoded bytes, or empty string if input is invalid
 */
std::string hexDecode(const std::string &hex);

/**
 * Compute SHA-256 using Libsodium
 * @param input Input bytes
 * @return Raw 32-byte digest
 * @throws std::runtime_error if hash computation fails
 */
std::string sha256(const std::string &input);

/** SHA-256 applied twice, raw 32-byte digest */
std::string sha256d(const std::string &input);

} // namespace utl
} // namespace bx

#endif // BX_UTILITIES_H
