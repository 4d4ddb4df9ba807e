#include "Transaction.h"
#include "../lib/BinaryPack.hpp"

#include <utility>

namespace tally {

namespace {

template <class... Ts> struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

// State transition functions

LedgerRoe<void> createAccount(iii::WorldState &state, const CreateAccount &op) {
  if (!utl::isValidEd25519PublicKey(op.publicKey)) {
    return LedgerError(ErrorCode::InvalidPublicKey,
                       "Invalid public key for account: " + op.accountId);
  }
  return state.createAccount(op.accountId, AccountType::User, op.publicKey);
}

LedgerRoe<void> mintInitialSupply(iii::WorldState &state,
                                  const MintInitialSupply &op, bool isGenesis) {
  if (!isGenesis) {
    return LedgerError(ErrorCode::NotGenesis,
                       "Initial Supply can be minted only in genesis block");
  }
  Account *account = state.getMutableAccount(op.to);
  if (!account) {
    return LedgerError(ErrorCode::InvalidAccount, "Invalid account.");
  }
  Balance credited = account->balance + op.amount;
  if (credited < account->balance) {
    return LedgerError(ErrorCode::BalanceOverflow, "Balance overflow.");
  }
  account->balance = credited;
  return {};
}

// Debit and credit are applied one after the other; a failed credit leaves
// the debit in place and relies on the block-level rollback.
LedgerRoe<void> transfer(iii::WorldState &state,
                         const std::optional<AccountId> &from,
                         const Transfer &op) {
  Account *sender = from ? state.getMutableAccount(*from) : nullptr;
  if (!sender) {
    return LedgerError(ErrorCode::InvalidSenderAddress,
                       "Invalid sender address.");
  }
  if (sender->balance < op.amount) {
    return LedgerError(ErrorCode::InsufficientBalance, "Insufficient balance");
  }
  sender->balance -= op.amount;

  Account *receiver = state.getMutableAccount(op.to);
  if (!receiver) {
    return LedgerError(ErrorCode::InvalidReceiverAddress,
                       "Invalid receiver address.");
  }
  Balance credited = receiver->balance + op.amount;
  if (credited < receiver->balance) {
    return LedgerError(ErrorCode::BalanceOverflow, "Balance overflow.");
  }
  receiver->balance = credited;
  return {};
}

} // namespace

Transaction::Transaction(TransactionData data, std::optional<AccountId> from,
                         Nonce nonce, Timestamp timestamp)
    : nonce_(nonce), timestamp_(timestamp), data_(std::move(data)),
      from_(std::move(from)) {}

Hash Transaction::calculateHash() const {
  return utl::blake2b256(utl::binaryPack(*this));
}

void Transaction::addSignature(const Signature &signature) {
  signature_ = signature;
}

Roe<void> Transaction::sign(const std::string &privateKey) {
  auto result = utl::ed25519Sign(privateKey, calculateHash());
  if (!result) {
    return result.error();
  }
  signature_ = result.value();
  return {};
}

LedgerRoe<void> Transaction::execute(iii::WorldState &state,
                                     bool isGenesis) const {
  return std::visit(
      overloaded{
          [&](const CreateAccount &op) -> LedgerRoe<void> {
            // No existing key can authorize the first registration of an id
            return createAccount(state, op);
          },
          [&](const MintInitialSupply &op) -> LedgerRoe<void> {
            // Only reachable in genesis, which is exempt from signatures
            return mintInitialSupply(state, op, isGenesis);
          },
          [&](const Transfer &op) -> LedgerRoe<void> {
            if (!isGenesis) {
              auto sigResult = checkSignature(state);
              if (!sigResult) {
                return sigResult;
              }
            }
            return transfer(state, from_, op);
          },
      },
      data_);
}

LedgerRoe<void> Transaction::checkSignature(const iii::WorldState &state) const {
  if (!signature_) {
    return LedgerError(ErrorCode::SignatureMissing,
                       "Transaction is not signed.");
  }
  if (!from_) {
    return LedgerError(ErrorCode::FromUnset, "Transaction sender is not set.");
  }
  const Account *sender = state.getAccount(*from_);
  if (!sender) {
    return LedgerError(ErrorCode::InvalidSenderAddress,
                       "Invalid sender address.");
  }
  if (!utl::ed25519Verify(sender->publicKey, calculateHash(), *signature_)) {
    return LedgerError(ErrorCode::SignatureInvalid,
                       "Invalid signature for sender: " + *from_);
  }
  return {};
}

} // namespace tally
