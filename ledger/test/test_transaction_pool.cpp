#include "../TransactionPool.h"
#include <gtest/gtest.h>

using namespace dpos;

namespace {

constexpr int64_t NOW = 1700000000000;

Transaction transfer(const std::string &from, const std::string &to,
                     Amount amount, int64_t timestamp) {
  return Transaction(from, to, amount, Transaction::Type::TRANSFER, {},
                     timestamp);
}

} // namespace

TEST(TransactionPoolTest, KeepsArrivalOrder) {
  TransactionPool pool;
  auto a = transfer("alice", "bob", 1, NOW);
  auto b = transfer("carol", "bob", 2, NOW);
  auto c = transfer("dave", "bob", 3, NOW);
  ASSERT_TRUE(pool.add(a).isOk());
  ASSERT_TRUE(pool.add(b).isOk());
  ASSERT_TRUE(pool.add(c).isOk());

  auto first = pool.peek(2);
  ASSERT_EQ(first.size(), 2u);
  EXPECT_EQ(first[0].getId(), a.getId());
  EXPECT_EQ(first[1].getId(), b.getId());
  EXPECT_EQ(pool.peek(10).size(), 3u);
  EXPECT_EQ(pool.size(), 3u);
}

TEST(TransactionPoolTest, RejectsSameId) {
  TransactionPool pool;
  auto tx = transfer("alice", "bob", 1, NOW);
  ASSERT_TRUE(pool.add(tx).isOk());
  auto again = pool.add(tx);
  ASSERT_TRUE(again.isError());
  EXPECT_EQ(again.error().code, TransactionPool::E_DUPLICATE);
}

TEST(TransactionPoolTest, RejectsNearDuplicateWithinWindow) {
  TransactionPool pool;
  ASSERT_TRUE(pool.add(transfer("alice", "bob", 5, NOW)).isOk());

  auto near = pool.add(transfer("alice", "bob", 5, NOW + 30 * 1000));
  ASSERT_TRUE(near.isError());
  EXPECT_EQ(near.error().code, TransactionPool::E_NEAR_DUPLICATE);

  EXPECT_TRUE(pool.add(transfer("alice", "bob", 5, NOW + 61 * 1000)).isOk());
  EXPECT_TRUE(pool.add(transfer("alice", "bob", 6, NOW + 1)).isOk());
  EXPECT_TRUE(pool.add(transfer("alice", "carol", 5, NOW + 1)).isOk());
}

TEST(TransactionPoolTest, RejectsWhenFull) {
  TransactionPool pool;
  TransactionPool::Config config;
  config.maxSize = 2;
  pool.setConfig(config);

  ASSERT_TRUE(pool.add(transfer("a", "b", 1, NOW)).isOk());
  ASSERT_TRUE(pool.add(transfer("c", "d", 1, NOW)).isOk());
  auto full = pool.add(transfer("e", "f", 1, NOW));
  ASSERT_TRUE(full.isError());
  EXPECT_EQ(full.error().code, TransactionPool::E_POOL_FULL);
}

TEST(TransactionPoolTest, FindRemoveAndClear) {
  TransactionPool pool;
  auto a = transfer("alice", "bob", 1, NOW);
  auto b = transfer("carol", "bob", 2, NOW);
  pool.add(a);
  pool.add(b);

  EXPECT_TRUE(pool.contains(a.getId()));
  auto found = pool.find(b.getId());
  ASSERT_TRUE(found.isOk());
  EXPECT_EQ(found->getFrom(), "carol");
  EXPECT_EQ(pool.find("missing").error().code, TransactionPool::E_NOT_FOUND);

  EXPECT_EQ(pool.remove({a.getId(), "missing"}), 1u);
  EXPECT_FALSE(pool.contains(a.getId()));
  EXPECT_EQ(pool.size(), 1u);

  // Removed ids may be queued again
  EXPECT_TRUE(pool.add(a).isOk());

  pool.clear();
  EXPECT_TRUE(pool.isEmpty());
  EXPECT_FALSE(pool.contains(b.getId()));
}
