#ifndef TALLY_TRANSACTION_H
#define TALLY_TRANSACTION_H

#include "../interface/LedgerError.h"
#include "../interface/Types.hpp"
#include "../interface/WorldState.hpp"
#include "../lib/Utilities.h"

#include <optional>
#include <string>
#include <variant>

namespace tally {

struct CreateAccount {
  AccountId accountId;
  PublicKey publicKey;

  template <typename Archive> void serialize(Archive &ar) const {
    ar & accountId & publicKey;
  }
};

struct Transfer {
  AccountId to;
  Balance amount{ 0 };

  template <typename Archive> void serialize(Archive &ar) const {
    ar & to & amount;
  }
};

struct MintInitialSupply {
  AccountId to;
  Balance amount{ 0 };

  template <typename Archive> void serialize(Archive &ar) const {
    ar & to & amount;
  }
};

using TransactionData = std::variant<CreateAccount, Transfer, MintInitialSupply>;

/**
 * Signed request for a single state transition.
 *
 * The hash covers (nonce, timestamp, data, sender) and deliberately leaves
 * the signature out, since the signature is computed over that hash.
 * Attaching a signature therefore never changes the hash.
 */
class Transaction {
public:
  explicit Transaction(TransactionData data,
                       std::optional<AccountId> from = std::nullopt,
                       Nonce nonce = 0, Timestamp timestamp = 0);

  Nonce getNonce() const { return nonce_; }
  Timestamp getTimestamp() const { return timestamp_; }
  const TransactionData &getData() const { return data_; }
  const std::optional<AccountId> &getFrom() const { return from_; }
  const std::optional<Signature> &getSignature() const { return signature_; }

  Hash calculateHash() const;

  void addSignature(const Signature &signature);

  /**
   * Sign the transaction hash with an Ed25519 private key and attach the
   * signature
   * @param privateKey 32-byte raw private key
   */
  Roe<void> sign(const std::string &privateKey);

  /**
   * Apply this transaction to the given state.
   * Outside genesis every kind except CreateAccount must carry a valid
   * signature from its sender.
   * @param state Account table to read and mutate
   * @param isGenesis Whether the enclosing block is the genesis block
   */
  LedgerRoe<void> execute(iii::WorldState &state, bool isGenesis) const;

  /**
   * Verify the attached signature against the sender's stored public key
   * over the transaction hash
   */
  LedgerRoe<void> checkSignature(const iii::WorldState &state) const;

  // Hash preimage; the signature is not part of it
  template <typename Archive> void serialize(Archive &ar) const {
    ar & nonce_ & timestamp_ & data_ & from_;
  }

private:
  Nonce nonce_{ 0 };
  Timestamp timestamp_{ 0 };
  TransactionData data_;
  std::optional<AccountId> from_;
  std::optional<Signature> signature_;
};

} // namespace tally

#endif // TALLY_TRANSACTION_H
