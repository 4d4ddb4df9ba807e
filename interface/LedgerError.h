#ifndef TALLY_LEDGER_ERROR_H
#define TALLY_LEDGER_ERROR_H

#include "../lib/ResultOrError.hpp"

#include <cstdint>
#include <string>

namespace tally {

// Every failure the ledger core can report
enum class ErrorCode : int32_t {
  AccountAlreadyExists = 1,
  InvalidAccount = 2,
  NotGenesis = 3,
  InsufficientBalance = 4,
  InvalidSenderAddress = 5,
  InvalidReceiverAddress = 6,
  BalanceOverflow = 7,
  SignatureMissing = 8,
  SignatureInvalid = 9,
  FromUnset = 10,
  InvalidBlockHash = 11,
  EmptyBlock = 12,
  ChainLinkageBroken = 13,
  InvalidPublicKey = 14,
  TransactionPoolFull = 15,
};

const char *toString(ErrorCode code);

struct LedgerError : RoeErrorBase {
  LedgerError() = default;
  LedgerError(ErrorCode c, const std::string &msg)
      : RoeErrorBase(static_cast<int32_t>(c), msg) {}
  LedgerError(ErrorCode c, std::string &&msg)
      : RoeErrorBase(static_cast<int32_t>(c), std::move(msg)) {}

  ErrorCode kind() const { return static_cast<ErrorCode>(code); }
};

template <typename T> using LedgerRoe = ResultOrError<T, LedgerError>;

} // namespace tally

#endif // TALLY_LEDGER_ERROR_H
