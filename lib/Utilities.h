#ifndef TALLY_UTILITIES_H
#define TALLY_UTILITIES_H

#include "ResultOrError.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace tally {

// Error type for utility functions
struct Error : public RoeErrorBase {
  using RoeErrorBase::RoeErrorBase;
};

template <typename T> using Roe = ResultOrError<T, Error>;

namespace utl {

/**
 * Load and parse a JSON file
 * @param path Path to the JSON file
 * @return Parsed document, or error 1 (missing), 2 (unreadable), 3 (bad JSON)
 */
Roe<nlohmann::json> loadJsonFile(const std::string &path);

/**
 * Encode binary data as lowercase hex (two chars per byte)
 */
std::string hexEncode(const std::string &data);

/**
 * BLAKE2b digest with a 32-byte output, computed by libsodium
 * @param input Bytes to hash
 * @return 64-character lowercase hex digest
 */
std::string blake2b256(const std::string &input);

/**
 * Decimal rendering of an unsigned 128-bit value
 */
std::string toString(unsigned __int128 value);

// --- Ed25519 (raw binary: 32-byte public key, 32-byte private key, 64-byte signature)

struct Ed25519KeyPair {
  std::string publicKey;
  std::string privateKey;
};

/**
 * Generate a new Ed25519 key pair
 * @return Key pair as raw binary strings, or error
 */
Roe<Ed25519KeyPair> ed25519Generate();

/**
 * Sign a message with a 32-byte Ed25519 private key (seed)
 * @return 64-byte detached signature, or error
 */
Roe<std::string> ed25519Sign(const std::string &privateKey,
                             const std::string &message);

/**
 * Verify a detached Ed25519 signature
 * @return true if valid; false if invalid or keys/signature are malformed
 */
bool ed25519Verify(const std::string &publicKey, const std::string &message,
                   const std::string &signature);

/**
 * True if str is a 32-byte raw key that decodes to a valid curve point
 */
bool isValidEd25519PublicKey(const std::string &str);

} // namespace utl
} // namespace tally

#endif // TALLY_UTILITIES_H
