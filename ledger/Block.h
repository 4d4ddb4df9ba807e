#ifndef TALLY_BLOCK_H
#define TALLY_BLOCK_H

#include "../interface/Types.hpp"
#include "Transaction.h"

#include <optional>
#include <vector>

namespace tally {

/**
 * Ordered batch of transactions linked to its predecessor by hash.
 *
 * The hash is cached write-through: every mutator recomputes and stores it
 * before returning, so a block built through this API always verifies.
 *
 * BlockTestPeer is a test seam. It is defined only in
 * ledger/test/LedgerTestUtil.h and lets tests edit fields without rehashing
 * to simulate corruption. Production code must not define or use it.
 */
class Block {
public:
  explicit Block(std::optional<Hash> previousHash = std::nullopt);

  void setNonce(Nonce nonce);
  void addTransaction(Transaction tx);
  void setPreviousHash(std::optional<Hash> previousHash);

  Nonce getNonce() const { return nonce_; }
  const std::optional<Hash> &getHash() const { return hash_; }
  const std::optional<Hash> &getPreviousHash() const { return previousHash_; }
  const std::vector<Transaction> &getTransactions() const {
    return transactions_;
  }
  size_t getTransactionCount() const { return transactions_.size(); }

  /**
   * Digest over (previous hash, nonce) followed by the hash of each
   * transaction in order
   */
  Hash calculateHash() const;

  // True iff a hash is cached and it matches a fresh computation
  bool verify() const;

private:
  // Test seam, see class comment
  friend class BlockTestPeer;

  void updateHash();

  Nonce nonce_{ 0 };
  std::optional<Hash> hash_;
  std::optional<Hash> previousHash_;
  std::vector<Transaction> transactions_;
};

} // namespace tally

#endif // TALLY_BLOCK_H
