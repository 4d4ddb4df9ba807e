#ifndef TALLY_LEDGER_TYPES_HPP
#define TALLY_LEDGER_TYPES_HPP

#include <cstdint>
#include <string>

namespace tally {

using AccountId = std::string;
using Balance = unsigned __int128;
// Milliseconds since unix epoch
using Timestamp = unsigned __int128;
using Nonce = unsigned __int128;
// Lowercase hex of a 32-byte BLAKE2b digest
using Hash = std::string;
// Raw 32-byte Ed25519 public key
using PublicKey = std::string;
// Raw 64-byte Ed25519 signature
using Signature = std::string;

enum class AccountType : uint8_t { User = 0, Contract = 1 };

struct Account {
  AccountType type{ AccountType::User };
  Balance balance{ 0 };
  PublicKey publicKey;

  Account() = default;
  Account(AccountType t, const PublicKey &key) : type(t), publicKey(key) {}
};

} // namespace tally

#endif // TALLY_LEDGER_TYPES_HPP
