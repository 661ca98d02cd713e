#ifndef DPOS_LEDGER_LEDGER_H
#define DPOS_LEDGER_LEDGER_H

#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"
#include "Types.hpp"

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace dpos {

/**
 * Ledger - account store
 *
 * Owns every account of the chain. Accounts are created by genesis,
 * explicitly, or implicitly as transfer recipients, and are never deleted.
 * Balance mutations are guarded: a change that would make a balance negative
 * is rejected and leaves the ledger untouched.
 *
 * Not thread-safe; the owning Chain serializes access.
 */
class Ledger : public Module {
public:
  struct Account {
    std::string address;
    Amount balance{ 0 };
    uint64_t nonce{ 0 };
    Amount staked{ 0 };
    Amount stakingRewards{ 0 };
    bool isValidator{ false };
    std::string publicKey; // raw ed25519 key, empty for unkeyed accounts
    std::map<std::string, Amount> mTokenBalances;

    Amount getTokenBalance(const std::string &symbol) const;
    nlohmann::json toJson() const;
  };

  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_ACCOUNT_NOT_FOUND = 1; // No account at address
  constexpr static int32_t E_ACCOUNT_EXISTS = 2;    // Address already taken
  constexpr static int32_t E_INVALID_ADDRESS = 3;   // Empty address
  constexpr static int32_t E_INVALID_AMOUNT = 4;    // Negative initial balance

  Ledger();
  ~Ledger() override = default;

  // ----------------- accessors -------------------------------------
  bool hasAccount(const std::string &address) const;
  Roe<Account> getAccount(const std::string &address) const;
  Amount getBalance(const std::string &address) const;
  std::vector<Account> getAccounts() const;
  size_t getAccountCount() const;

  /** SHA-256 over the address-ordered rendering of all accounts */
  std::string calculateStateRoot() const;

  // ----------------- methods -------------------------------------
  Roe<void> createAccount(const std::string &address, Amount initialBalance = 0,
                          const std::string &publicKey = "");

  /** Creates a zero-balance account if none exists. */
  void ensureAccount(const std::string &address);

  bool adjustBalance(const std::string &address, Amount delta);
  bool adjustStaked(const std::string &address, Amount delta);
  bool adjustTokenBalance(const std::string &address, const std::string &symbol,
                          Amount delta);
  bool creditRewards(const std::string &address, Amount amount);
  bool incrementNonce(const std::string &address);
  bool setValidatorFlag(const std::string &address, bool isValidator);
  bool setPublicKey(const std::string &address, const std::string &publicKey);

private:
  static bool applyDelta(Amount &target, Amount delta);

  Account *findAccount(const std::string &address);

  std::map<std::string, Account> mAccounts_;
};

} // namespace dpos

#endif // DPOS_LEDGER_LEDGER_H
