#include "BlockChain.h"

#include <string>
#include <utility>
#include <variant>

namespace tally {

namespace {

std::string describe(const Transaction &tx) {
  const TransactionData &data = tx.getData();
  if (const auto *op = std::get_if<CreateAccount>(&data)) {
    return "create account " + op->accountId;
  }
  if (const auto *op = std::get_if<MintInitialSupply>(&data)) {
    return "mint " + utl::toString(op->amount) + " to " + op->to;
  }
  const auto &op = std::get<Transfer>(data);
  return "transfer " + utl::toString(op.amount) + " from " +
         tx.getFrom().value_or("<unset>") + " to " + op.to;
}

} // namespace

// ----------------- Config -------------------------------------

Roe<BlockChain::Config> BlockChain::Config::fromJson(const nlohmann::json &j) {
  Config config;
  if (!j.is_object()) {
    return Error(E_CONFIG_TYPE, "Configuration must be a JSON object");
  }

  if (j.contains("maxPendingTransactions")) {
    const auto &value = j["maxPendingTransactions"];
    if (!value.is_number_unsigned()) {
      return Error(E_CONFIG_TYPE,
                   "maxPendingTransactions must be a non-negative integer");
    }
    config.maxPendingTransactions = value.get<uint64_t>();
  }

  if (j.contains("logLevel")) {
    const auto &value = j["logLevel"];
    if (!value.is_string()) {
      return Error(E_CONFIG_TYPE, "logLevel must be a string");
    }
    auto level = logging::parseLevel(value.get<std::string>());
    if (!level) {
      return Error(E_CONFIG_LOG_LEVEL, level.error().message);
    }
    config.logLevel = level.value();
  }

  return config;
}

Roe<BlockChain::Config> BlockChain::Config::loadFile(const std::string &path) {
  auto doc = utl::loadJsonFile(path);
  if (!doc) {
    return doc.error();
  }
  return fromJson(doc.value());
}

// ----------------- BlockChain -------------------------------------

BlockChain::BlockChain() : BlockChain(Config()) {}

BlockChain::BlockChain(const Config &config)
    : Module("tally.blockchain"), config_(config) {
  log().setLevel(config_.logLevel);
}

std::vector<AccountId> BlockChain::getAccountIds() const {
  std::vector<AccountId> ids;
  ids.reserve(accounts_.size());
  for (const auto &[id, account] : accounts_) {
    ids.push_back(id);
  }
  return ids;
}

const Account *BlockChain::getAccount(const AccountId &id) const {
  auto it = accounts_.find(id);
  if (it == accounts_.end()) {
    return nullptr;
  }
  return &it->second;
}

Account *BlockChain::getMutableAccount(const AccountId &id) {
  auto it = accounts_.find(id);
  if (it == accounts_.end()) {
    return nullptr;
  }
  return &it->second;
}

LedgerRoe<void> BlockChain::createAccount(const AccountId &id,
                                          AccountType type,
                                          const PublicKey &publicKey) {
  auto inserted = accounts_.emplace(id, Account(type, publicKey));
  if (!inserted.second) {
    return LedgerError(ErrorCode::AccountAlreadyExists,
                       "AccountId already exist: " + id);
  }
  log().debug << "Created account " << id;
  return {};
}

LedgerRoe<void> BlockChain::appendBlock(Block block) {
  if (!block.verify()) {
    log().warning << "Rejected block: invalid hash";
    return LedgerError(ErrorCode::InvalidBlockHash, "Block has invalid hash");
  }

  bool isGenesis = blocks_.empty();

  if (!isGenesis && block.getTransactionCount() == 0) {
    log().warning << "Rejected block: no transactions";
    return LedgerError(ErrorCode::EmptyBlock, "Block has 0 transaction.");
  }

  // Full copy of the account table, restored on failure or exception
  Snapshot<std::map<AccountId, Account>> snapshot(accounts_);

  size_t index = 0;
  for (const auto &tx : block.getTransactions()) {
    auto result = tx.execute(*this, isGenesis);
    if (!result) {
      log().warning << "Rolled back block at transaction " << index << " ("
                    << toString(result.error().kind())
                    << "): " << result.error().message;
      return LedgerError(result.error().kind(),
                         "Error during executing transactions: " +
                             result.error().message);
    }
    log().debug << "Executed transaction " << index << " "
                << tx.calculateHash() << ": " << describe(tx);
    ++index;
  }
  snapshot.commit();

  log().info << "Appended block " << (blocks_.size() + 1) << " "
             << block.getHash().value_or("") << " with "
             << block.getTransactionCount() << " transactions";
  blocks_.append(std::move(block));
  return {};
}

LedgerRoe<void> BlockChain::validate() const {
  size_t blockNum = blocks_.size();
  std::optional<Hash> newerPreviousHash;

  for (const auto &block : blocks_) {
    bool isGenesis = blockNum == 1;

    if (!block.verify()) {
      return LedgerError(ErrorCode::InvalidBlockHash,
                         "Block " + std::to_string(blockNum) +
                             " has invalid hash");
    }

    if (!block.getPreviousHash() && !isGenesis) {
      return LedgerError(ErrorCode::ChainLinkageBroken,
                         "Block " + std::to_string(blockNum) +
                             " doesn't have prev_hash");
    }

    if (block.getPreviousHash() && isGenesis) {
      return LedgerError(ErrorCode::ChainLinkageBroken,
                         "Genesis block shouldn't have prev_hash");
    }

    // The newer neighbour must point at this block
    if (blockNum != blocks_.size() && newerPreviousHash &&
        *newerPreviousHash != *block.getHash()) {
      return LedgerError(ErrorCode::ChainLinkageBroken,
                         "Block " + std::to_string(blockNum + 1) +
                             " prev_hash doesn't match Block " +
                             std::to_string(blockNum) + " hash");
    }

    newerPreviousHash = block.getPreviousHash();
    --blockNum;
  }

  return {};
}

std::optional<Hash> BlockChain::getLastBlockHash() const {
  const Block *head = blocks_.head();
  if (!head) {
    return std::nullopt;
  }
  return head->calculateHash();
}

size_t BlockChain::getSize() const { return blocks_.size(); }

LedgerRoe<Balance> BlockChain::getBalance(const AccountId &id) const {
  const Account *account = getAccount(id);
  if (!account) {
    return LedgerError(ErrorCode::InvalidAccount, "Invalid account.");
  }
  return account->balance;
}

LedgerRoe<void> BlockChain::submitTransaction(Transaction tx) {
  if (transactionPool_.size() >= config_.maxPendingTransactions) {
    return LedgerError(ErrorCode::TransactionPoolFull,
                       "Transaction pool is full (" +
                           std::to_string(config_.maxPendingTransactions) +
                           ")");
  }
  transactionPool_.push_back(std::move(tx));
  return {};
}

void BlockChain::clearPendingTransactions() { transactionPool_.clear(); }

} // namespace tally
