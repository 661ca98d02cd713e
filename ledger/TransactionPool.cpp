#include "TransactionPool.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace dpos {

TransactionPool::TransactionPool() : Module("TransactionPool") {}

bool TransactionPool::contains(const std::string &id) const {
  return ids_.count(id) > 0;
}

TransactionPool::Roe<Transaction>
TransactionPool::find(const std::string &id) const {
  if (contains(id)) {
    for (const auto &tx : transactions_) {
      if (tx.getId() == id) {
        return tx;
      }
    }
  }
  return Error(E_NOT_FOUND, "Transaction not pending: " + id);
}

std::vector<Transaction> TransactionPool::getTransactions() const {
  return std::vector<Transaction>(transactions_.begin(), transactions_.end());
}

std::vector<Transaction> TransactionPool::peek(size_t maxCount) const {
  size_t count = std::min(maxCount, transactions_.size());
  return std::vector<Transaction>(transactions_.begin(),
                                  transactions_.begin() + count);
}

bool TransactionPool::isNearDuplicate(const Transaction &tx) const {
  for (const auto &pending : transactions_) {
    if (pending.getFrom() == tx.getFrom() && pending.getTo() == tx.getTo() &&
        pending.getType() == tx.getType() &&
        std::fabs(pending.getAmount() - tx.getAmount()) < AMOUNT_EPSILON &&
        std::llabs(pending.getTimestamp() - tx.getTimestamp()) <
            config_.duplicateWindowMs) {
      return true;
    }
  }
  return false;
}

TransactionPool::Roe<void> TransactionPool::add(const Transaction &tx) {
  if (contains(tx.getId())) {
    return Error(E_DUPLICATE, "Transaction already pending: " + tx.getId());
  }
  if (isNearDuplicate(tx)) {
    return Error(E_NEAR_DUPLICATE,
                 "Duplicate " + Transaction::typeToString(tx.getType()) +
                     " from " + tx.getFrom() + " to " + tx.getTo() +
                     " within " + std::to_string(config_.duplicateWindowMs) +
                     " ms");
  }
  if (transactions_.size() >= config_.maxSize) {
    return Error(E_POOL_FULL, "Transaction pool is full (" +
                                  std::to_string(config_.maxSize) + ")");
  }

  transactions_.push_back(tx);
  ids_.insert(tx.getId());
  log().debug << "Queued " << Transaction::typeToString(tx.getType()) << " "
              << tx.getId() << " (" << transactions_.size() << " pending)";
  return {};
}

size_t TransactionPool::remove(const std::vector<std::string> &ids) {
  std::unordered_set<std::string> toRemove(ids.begin(), ids.end());
  size_t before = transactions_.size();
  transactions_.erase(std::remove_if(transactions_.begin(), transactions_.end(),
                                     [&toRemove](const Transaction &tx) {
                                       return toRemove.count(tx.getId()) > 0;
                                     }),
                      transactions_.end());
  for (const auto &id : ids) {
    ids_.erase(id);
  }
  return before - transactions_.size();
}

void TransactionPool::clear() {
  transactions_.clear();
  ids_.clear();
}

} // namespace dpos
