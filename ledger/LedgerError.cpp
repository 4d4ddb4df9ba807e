#include "../interface/LedgerError.h"

namespace tally {

const char *toString(ErrorCode code) {
  switch (code) {
  case ErrorCode::AccountAlreadyExists:
    return "AccountAlreadyExists";
  case ErrorCode::InvalidAccount:
    return "InvalidAccount";
  case ErrorCode::NotGenesis:
    return "NotGenesis";
  case ErrorCode::InsufficientBalance:
    return "InsufficientBalance";
  case ErrorCode::InvalidSenderAddress:
    return "InvalidSenderAddress";
  case ErrorCode::InvalidReceiverAddress:
    return "InvalidReceiverAddress";
  case ErrorCode::BalanceOverflow:
    return "BalanceOverflow";
  case ErrorCode::SignatureMissing:
    return "SignatureMissing";
  case ErrorCode::SignatureInvalid:
    return "SignatureInvalid";
  case ErrorCode::FromUnset:
    return "FromUnset";
  case ErrorCode::InvalidBlockHash:
    return "InvalidBlockHash";
  case ErrorCode::EmptyBlock:
    return "EmptyBlock";
  case ErrorCode::ChainLinkageBroken:
    return "ChainLinkageBroken";
  case ErrorCode::InvalidPublicKey:
    return "InvalidPublicKey";
  case ErrorCode::TransactionPoolFull:
    return "TransactionPoolFull";
  }
  return "Unknown";
}

} // namespace tally
