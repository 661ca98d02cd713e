#include "Ledger.h"
#include "../lib/Utilities.h"

#include <sstream>

namespace dpos {

Amount Ledger::Account::getTokenBalance(const std::string &symbol) const {
  auto it = mTokenBalances.find(symbol);
  return it == mTokenBalances.end() ? 0 : it->second;
}

nlohmann::json Ledger::Account::toJson() const {
  nlohmann::json j;
  j["address"] = address;
  j["balance"] = balance;
  j["nonce"] = nonce;
  j["staked"] = staked;
  j["stakingRewards"] = stakingRewards;
  j["isValidator"] = isValidator;
  if (!publicKey.empty()) {
    j["publicKey"] = utl::hexEncode(publicKey);
  }
  if (!mTokenBalances.empty()) {
    j["tokens"] = mTokenBalances;
  }
  return j;
}

Ledger::Ledger() : Module("Ledger") {}

bool Ledger::hasAccount(const std::string &address) const {
  return mAccounts_.find(address) != mAccounts_.end();
}

Ledger::Roe<Ledger::Account>
Ledger::getAccount(const std::string &address) const {
  auto it = mAccounts_.find(address);
  if (it == mAccounts_.end()) {
    return Error(E_ACCOUNT_NOT_FOUND, "Account not found: " + address);
  }
  return it->second;
}

Amount Ledger::getBalance(const std::string &address) const {
  auto it = mAccounts_.find(address);
  return it == mAccounts_.end() ? 0 : it->second.balance;
}

std::vector<Ledger::Account> Ledger::getAccounts() const {
  std::vector<Account> accounts;
  accounts.reserve(mAccounts_.size());
  for (const auto &[address, account] : mAccounts_) {
    accounts.push_back(account);
  }
  return accounts;
}

size_t Ledger::getAccountCount() const { return mAccounts_.size(); }

std::string Ledger::calculateStateRoot() const {
  std::ostringstream oss;
  for (const auto &[address, account] : mAccounts_) {
    oss << address << ':' << canonicalAmount(account.balance) << ':'
        << account.nonce << ':' << canonicalAmount(account.staked) << ':'
        << canonicalAmount(account.stakingRewards) << ':'
        << (account.isValidator ? 1 : 0);
    for (const auto &[symbol, amount] : account.mTokenBalances) {
      oss << ':' << symbol << '=' << canonicalAmount(amount);
    }
    oss << ';';
  }
  return utl::sha256(oss.str());
}

Ledger::Roe<void> Ledger::createAccount(const std::string &address,
                                        Amount initialBalance,
                                        const std::string &publicKey) {
  if (address.empty()) {
    return Error(E_INVALID_ADDRESS, "Account address must not be empty");
  }
  if (initialBalance < 0) {
    return Error(E_INVALID_AMOUNT, "Initial balance must not be negative: " +
                                       std::to_string(initialBalance));
  }
  if (hasAccount(address)) {
    return Error(E_ACCOUNT_EXISTS, "Account already exists: " + address);
  }

  Account account;
  account.address = address;
  account.balance = initialBalance;
  account.publicKey = publicKey;
  mAccounts_.emplace(address, account);
  log().debug << "Created account " << address << " with balance "
              << initialBalance;
  return {};
}

void Ledger::ensureAccount(const std::string &address) {
  if (address.empty() || hasAccount(address)) {
    return;
  }
  Account account;
  account.address = address;
  mAccounts_.emplace(address, account);
  log().debug << "Created account " << address;
}

bool Ledger::applyDelta(Amount &target, Amount delta) {
  Amount next = target + delta;
  if (next < -AMOUNT_EPSILON) {
    return false;
  }
  target = next < 0 ? 0 : next;
  return true;
}

Ledger::Account *Ledger::findAccount(const std::string &address) {
  auto it = mAccounts_.find(address);
  return it == mAccounts_.end() ? nullptr : &it->second;
}

bool Ledger::adjustBalance(const std::string &address, Amount delta) {
  Account *account = findAccount(address);
  return account && applyDelta(account->balance, delta);
}

bool Ledger::adjustStaked(const std::string &address, Amount delta) {
  Account *account = findAccount(address);
  return account && applyDelta(account->staked, delta);
}

bool Ledger::adjustTokenBalance(const std::string &address,
                                const std::string &symbol, Amount delta) {
  Account *account = findAccount(address);
  if (!account) {
    return false;
  }
  Amount current = account->getTokenBalance(symbol);
  if (!applyDelta(current, delta)) {
    return false;
  }
  account->mTokenBalances[symbol] = current;
  return true;
}

bool Ledger::creditRewards(const std::string &address, Amount amount) {
  Account *account = findAccount(address);
  if (!account || amount < 0) {
    return false;
  }
  account->stakingRewards += amount;
  return true;
}

bool Ledger::incrementNonce(const std::string &address) {
  Account *account = findAccount(address);
  if (!account) {
    return false;
  }
  account->nonce++;
  return true;
}

bool Ledger::setValidatorFlag(const std::string &address, bool isValidator) {
  Account *account = findAccount(address);
  if (!account) {
    return false;
  }
  account->isValidator = isValidator;
  return true;
}

bool Ledger::setPublicKey(const std::string &address,
                          const std::string &publicKey) {
  Account *account = findAccount(address);
  if (!account) {
    return false;
  }
  account->publicKey = publicKey;
  return true;
}

} // namespace dpos
