#ifndef TALLY_LEDGER_TEST_UTIL_H
#define TALLY_LEDGER_TEST_UTIL_H

#include "Block.h"
#include "BlockChain.h"
#include "Transaction.h"
#include "Utilities.h"
#include "WorldState.hpp"

#include <map>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace tally {

// Raw field access for simulating edits that bypass rehashing
class BlockTestPeer {
public:
  static void setNonceRaw(Block &block, Nonce nonce) { block.nonce_ = nonce; }
  static void setPreviousHashRaw(Block &block, std::optional<Hash> hash) {
    block.previousHash_ = std::move(hash);
  }
  static std::vector<Transaction> &transactions(Block &block) {
    return block.transactions_;
  }
};

namespace test {

// Minimal account table for exercising Transaction::execute in isolation
class FakeWorldState : public iii::WorldState {
public:
  std::vector<AccountId> getAccountIds() const override {
    std::vector<AccountId> ids;
    for (const auto &[id, account] : accounts) {
      ids.push_back(id);
    }
    return ids;
  }

  const Account *getAccount(const AccountId &id) const override {
    auto it = accounts.find(id);
    return it == accounts.end() ? nullptr : &it->second;
  }

  Account *getMutableAccount(const AccountId &id) override {
    auto it = accounts.find(id);
    return it == accounts.end() ? nullptr : &it->second;
  }

  LedgerRoe<void> createAccount(const AccountId &id, AccountType type,
                                const PublicKey &publicKey) override {
    if (!accounts.emplace(id, Account(type, publicKey)).second) {
      return LedgerError(ErrorCode::AccountAlreadyExists,
                         "AccountId already exist: " + id);
    }
    return {};
  }

  std::map<AccountId, Account> accounts;
};

inline utl::Ed25519KeyPair generateKeyPair() {
  auto pair = utl::ed25519Generate();
  if (!pair) {
    throw std::runtime_error(pair.error().message);
  }
  return pair.value();
}

inline AccountId generateRandomAccount() {
  static std::mt19937_64 rng{ std::random_device{}() };
  return utl::blake2b256(std::to_string(rng()) + ":" + std::to_string(rng()));
}

inline Transaction createAccountTx(const AccountId &id,
                                   const PublicKey &publicKey) {
  return Transaction(CreateAccount{ id, publicKey });
}

inline Transaction createAccountTx(const AccountId &id) {
  return createAccountTx(id, generateKeyPair().publicKey);
}

inline Transaction mintTx(const AccountId &to, Balance amount) {
  return Transaction(MintInitialSupply{ to, amount });
}

inline Transaction transferTx(const AccountId &from, const AccountId &to,
                              Balance amount, const std::string &privateKey) {
  Transaction tx(Transfer{ to, amount }, from);
  auto signResult = tx.sign(privateKey);
  if (!signResult) {
    throw std::runtime_error(signResult.error().message);
  }
  return tx;
}

// Block linked to the current head of the chain
inline Block nextBlock(const BlockChain &chain, std::vector<Transaction> txs,
                       Nonce nonce = 0) {
  Block block(chain.getLastBlockHash());
  block.setNonce(nonce);
  for (auto &tx : txs) {
    block.addTransaction(std::move(tx));
  }
  return block;
}

} // namespace test
} // namespace tally

#endif // TALLY_LEDGER_TEST_UTIL_H
