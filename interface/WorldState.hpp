#pragma once

#include "LedgerError.h"
#include "Types.hpp"

#include <vector>

namespace tally {
namespace iii {

/**
 * Interface to the account table.
 * Transactions read and mutate ledger state only through this interface,
 * so execution logic runs unchanged against any storage that implements it.
 */
class WorldState {
public:
  virtual ~WorldState() = default;

  virtual std::vector<AccountId> getAccountIds() const = 0;

  // nullptr if the account does not exist
  virtual const Account *getAccount(const AccountId &id) const = 0;

  // The only sanctioned path for balance mutation; nullptr if absent
  virtual Account *getMutableAccount(const AccountId &id) = 0;

  // Fails with AccountAlreadyExists if the id is taken
  virtual LedgerRoe<void> createAccount(const AccountId &id, AccountType type,
                                        const PublicKey &publicKey) = 0;
};

} // namespace iii
} // namespace tally
