#ifndef DPOS_LEDGER_TRANSACTION_POOL_H
#define DPOS_LEDGER_TRANSACTION_POOL_H

#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"
#include "Transaction.h"

#include <deque>
#include <string>
#include <unordered_set>
#include <vector>

namespace dpos {

/**
 * TransactionPool - FIFO staging of admitted, unconfirmed transactions.
 *
 * Order of arrival is the order of application when a block is mined.
 */
class TransactionPool : public Module {
public:
  struct Config {
    size_t maxSize{ 10000 };
    int64_t duplicateWindowMs{ 60 * 1000 };
  };

  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_DUPLICATE = 1;      // Same id already pending
  constexpr static int32_t E_NEAR_DUPLICATE = 2; // Same transfer within window
  constexpr static int32_t E_POOL_FULL = 3;      // Capacity reached
  constexpr static int32_t E_NOT_FOUND = 4;      // No pending transaction

  TransactionPool();
  ~TransactionPool() override = default;

  void setConfig(const Config &config) { config_ = config; }
  const Config &getConfig() const { return config_; }

  // ----------------- accessors -------------------------------------
  bool contains(const std::string &id) const;
  Roe<Transaction> find(const std::string &id) const;
  std::vector<Transaction> getTransactions() const;

  /** First maxCount transactions in arrival order */
  std::vector<Transaction> peek(size_t maxCount) const;
  size_t size() const { return transactions_.size(); }
  bool isEmpty() const { return transactions_.empty(); }

  // ----------------- methods -------------------------------------
  Roe<void> add(const Transaction &tx);
  size_t remove(const std::vector<std::string> &ids);
  void clear();

private:
  bool isNearDuplicate(const Transaction &tx) const;

  Config config_;
  std::deque<Transaction> transactions_;
  std::unordered_set<std::string> ids_;
};

} // namespace dpos

#endif // DPOS_LEDGER_TRANSACTION_POOL_H
