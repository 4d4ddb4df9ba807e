#ifndef TALLY_BLOCKCHAIN_H
#define TALLY_BLOCKCHAIN_H

#include "../interface/LedgerError.h"
#include "../interface/Types.hpp"
#include "../interface/WorldState.hpp"
#include "../lib/Logger.h"
#include "../lib/Module.h"
#include "../lib/Utilities.h"
#include "Block.h"
#include "Chain.hpp"
#include "Snapshot.hpp"
#include "Transaction.h"

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace tally {

using IWorldState = iii::WorldState;

/**
 * In-memory ledger: owns the block chain, the account table and a pool of
 * pending transactions.
 *
 * appendBlock() executes a block against the account table as one unit.
 * Either every transaction applies and the block is appended, or the table
 * is restored to its state before the block and nothing is appended.
 *
 * Not thread safe. Callers must serialize writers around appendBlock().
 */
class BlockChain : public Module, public IWorldState {
public:
  /**
   * logLevel is applied to the "tally.blockchain" logger, which lives in the
   * process-wide registry and is shared by every BlockChain instance.
   * Constructing a BlockChain therefore sets the level for all of them; the
   * most recently constructed instance wins.
   */
  struct Config {
    uint64_t maxPendingTransactions{ 10000 };
    logging::Level logLevel{ logging::Level::INFO };

    /**
     * Read configuration from JSON. Both keys are optional:
     *   {"maxPendingTransactions": 500, "logLevel": "debug"}
     */
    static Roe<Config> fromJson(const nlohmann::json &j);
    static Roe<Config> loadFile(const std::string &path);
  };

  // Config error codes (file errors 1-3 come from utl::loadJsonFile)
  constexpr static int32_t E_CONFIG_TYPE = 10;
  constexpr static int32_t E_CONFIG_LOG_LEVEL = 11;

  BlockChain();
  explicit BlockChain(const Config &config);
  ~BlockChain() override = default;

  // IWorldState
  std::vector<AccountId> getAccountIds() const override;
  const Account *getAccount(const AccountId &id) const override;
  Account *getMutableAccount(const AccountId &id) override;
  LedgerRoe<void> createAccount(const AccountId &id, AccountType type,
                                const PublicKey &publicKey) override;

  /**
   * Verify and execute a block, then append it.
   * The first block appended is the genesis block; it may be empty and it
   * skips signature checks. Any transaction failure rolls back the whole
   * account table and reports that transaction's error code.
   */
  LedgerRoe<void> appendBlock(Block block);

  /**
   * Walk the chain from newest to genesis checking hashes and linkage.
   * Blocks are numbered from getSize() down to 1 (genesis).
   */
  LedgerRoe<void> validate() const;

  std::optional<Hash> getLastBlockHash() const;
  size_t getSize() const;
  const Chain<Block> &getBlocks() const { return blocks_; }
  Chain<Block> &getBlocks() { return blocks_; }

  LedgerRoe<Balance> getBalance(const AccountId &id) const;

  // Pending transaction storage; appendBlock never consumes it
  LedgerRoe<void> submitTransaction(Transaction tx);
  const std::vector<Transaction> &getPendingTransactions() const {
    return transactionPool_;
  }
  void clearPendingTransactions();

  const Config &getConfig() const { return config_; }

private:
  Config config_;
  Chain<Block> blocks_;
  std::map<AccountId, Account> accounts_;
  std::vector<Transaction> transactionPool_;
};

} // namespace tally

#endif // TALLY_BLOCKCHAIN_H
