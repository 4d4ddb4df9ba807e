#include "Utilities.h"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sodium.h>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace tally {
namespace utl {

// Initialize libsodium (safe to call multiple times)
namespace {
struct SodiumInitializer {
  SodiumInitializer() {
    if (sodium_init() < 0) {
      throw std::runtime_error("Failed to initialize libsodium");
    }
  }
};
static SodiumInitializer sodium_initializer;

constexpr size_t BLAKE2B_256_SIZE = 32;
constexpr size_t ED25519_PRIVATE_KEY_SIZE = 32;
constexpr size_t ED25519_PUBLIC_KEY_SIZE = 32;
constexpr size_t ED25519_SIGNATURE_SIZE = 64;

} // namespace

Roe<nlohmann::json> loadJsonFile(const std::string &path) {
  if (!std::filesystem::exists(path)) {
    return Error(1, "File not found: " + path);
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    return Error(2, "Failed to open file: " + path);
  }

  std::string content((std::istreambuf_iterator<char>(file)),
                      std::istreambuf_iterator<char>());

  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(content);
  } catch (const nlohmann::json::parse_error &e) {
    return Error(3, "Failed to parse JSON: " + std::string(e.what()));
  }

  return doc;
}

std::string hexEncode(const std::string &data) {
  std::stringstream ss;
  for (unsigned char c : data) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
  }
  return ss.str();
}

std::string blake2b256(const std::string &input) {
  unsigned char hash[BLAKE2B_256_SIZE];

  if (crypto_generichash(hash, sizeof(hash),
                         reinterpret_cast<const unsigned char *>(input.data()),
                         input.size(), nullptr, 0) != 0) {
    throw std::runtime_error("crypto_generichash failed");
  }

  return hexEncode(std::string(reinterpret_cast<const char *>(hash),
                               sizeof(hash)));
}

std::string toString(unsigned __int128 value) {
  if (value == 0) {
    return "0";
  }
  std::string out;
  while (value > 0) {
    out.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
    value /= 10;
  }
  return std::string(out.rbegin(), out.rend());
}

// --- Ed25519

Roe<Ed25519KeyPair> ed25519Generate() {
  Ed25519KeyPair pair;
  pair.publicKey.resize(crypto_sign_PUBLICKEYBYTES);
  pair.privateKey.resize(crypto_sign_SECRETKEYBYTES);

  if (crypto_sign_keypair(
          reinterpret_cast<unsigned char *>(pair.publicKey.data()),
          reinterpret_cast<unsigned char *>(pair.privateKey.data())) != 0) {
    return Error(1, "crypto_sign_keypair failed");
  }

  // Libsodium's secret key is seed followed by public key; keep the seed
  pair.privateKey.resize(ED25519_PRIVATE_KEY_SIZE);

  return pair;
}

Roe<std::string> ed25519Sign(const std::string &privateKey,
                             const std::string &message) {
  if (privateKey.size() != ED25519_PRIVATE_KEY_SIZE) {
    return Error(1, "ed25519Sign: private key must be 32 bytes");
  }

  // Expand the seed into libsodium's 64-byte secret key
  std::vector<unsigned char> pk(crypto_sign_PUBLICKEYBYTES);
  std::vector<unsigned char> sk(crypto_sign_SECRETKEYBYTES);

  if (crypto_sign_seed_keypair(
          pk.data(), sk.data(),
          reinterpret_cast<const unsigned char *>(privateKey.data())) != 0) {
    return Error(2, "crypto_sign_seed_keypair failed");
  }

  std::string signature(crypto_sign_BYTES, '\0');
  unsigned long long sigLen = 0;

  int rc = crypto_sign_detached(
      reinterpret_cast<unsigned char *>(signature.data()), &sigLen,
      reinterpret_cast<const unsigned char *>(message.data()), message.size(),
      sk.data());
  sodium_memzero(sk.data(), sk.size());
  if (rc != 0) {
    return Error(3, "crypto_sign_detached failed");
  }

  if (sigLen != ED25519_SIGNATURE_SIZE) {
    return Error(4, "unexpected signature size");
  }

  return signature;
}

bool ed25519Verify(const std::string &publicKey, const std::string &message,
                   const std::string &signature) {
  if (publicKey.size() != ED25519_PUBLIC_KEY_SIZE ||
      signature.size() != ED25519_SIGNATURE_SIZE) {
    return false;
  }

  int result = crypto_sign_verify_detached(
      reinterpret_cast<const unsigned char *>(signature.data()),
      reinterpret_cast<const unsigned char *>(message.data()), message.size(),
      reinterpret_cast<const unsigned char *>(publicKey.data()));

  return result == 0;
}

bool isValidEd25519PublicKey(const std::string &str) {
  if (str.size() != ED25519_PUBLIC_KEY_SIZE) {
    return false;
  }
  return crypto_core_ed25519_is_valid_point(
             reinterpret_cast<const unsigned char *>(str.data())) == 1;
}

} // namespace utl
} // namespace tally
