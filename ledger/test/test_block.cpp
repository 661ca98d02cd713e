#include "../Block.h"
#include "../../lib/Utilities.h"
#include <gtest/gtest.h>

using namespace dpos;

class BlockTest : public ::testing::Test {
protected:
  static constexpr int64_t NOW = 1700000000000;

  std::vector<Transaction> makeTransactions(size_t count) {
    std::vector<Transaction> txs;
    for (size_t i = 0; i < count; ++i) {
      txs.emplace_back("alice", "bob", 10.0 + i, Transaction::Type::TRANSFER,
                       Transaction::Payload{}, NOW + static_cast<int64_t>(i));
    }
    return txs;
  }
};

TEST_F(BlockTest, ConstructionSealsBlock) {
  auto txs = makeTransactions(3);
  Block block(1, NOW, "prev", txs, "validator_1", "root", 12.5);

  EXPECT_EQ(block.getIndex(), 1u);
  EXPECT_EQ(block.getPreviousHash(), "prev");
  EXPECT_EQ(block.getValidator(), "validator_1");
  EXPECT_EQ(block.getTransactionCount(), 3u);
  EXPECT_NEAR(block.getTotalFees(),
              txs[0].getFee() + txs[1].getFee() + txs[2].getFee(), 1e-12);
  EXPECT_EQ(block.getHash(), block.calculateHash());
  EXPECT_EQ(block.getMerkleRoot(), Block::calculateMerkleRoot(txs));
  EXPECT_TRUE(block.validateStructure().isOk());
}

TEST_F(BlockTest, MerkleRootOfEmptyListIsHashOfEmptyString) {
  EXPECT_EQ(Block::calculateMerkleRoot({}), utl::sha256(""));
}

TEST_F(BlockTest, MerkleRootSingleLeafAndOrder) {
  auto txs = makeTransactions(2);
  EXPECT_EQ(Block::calculateMerkleRoot({txs[0]}), utl::sha256(txs[0].getId()));

  std::vector<Transaction> reversed{txs[1], txs[0]};
  EXPECT_NE(Block::calculateMerkleRoot(txs), Block::calculateMerkleRoot(reversed));
}

TEST_F(BlockTest, MerkleRootDuplicatesLastNodeOnOddLevels) {
  auto txs = makeTransactions(3);
  std::vector<Transaction> padded{txs[0], txs[1], txs[2], txs[2]};
  EXPECT_EQ(Block::calculateMerkleRoot(txs), Block::calculateMerkleRoot(padded));
}

TEST_F(BlockTest, HashCoversHeaderFields) {
  auto txs = makeTransactions(1);
  Block a(1, NOW, "prev", txs, "validator_1", "root", 10);
  Block b(1, NOW, "prev", txs, "validator_2", "root", 10);
  Block c(1, NOW, "prev", txs, "validator_1", "other_root", 10);
  Block d(1, NOW, "prev", txs, "validator_1", "root", 11);
  EXPECT_NE(a.getHash(), b.getHash());
  EXPECT_NE(a.getHash(), c.getHash());
  EXPECT_NE(a.getHash(), d.getHash());
}

TEST_F(BlockTest, SignAndVerify) {
  auto pair = utl::ed25519Generate();
  auto other = utl::ed25519Generate();
  ASSERT_TRUE(pair.isOk() && other.isOk());

  Block block(0, NOW, Block::GENESIS_PREVIOUS_HASH, {}, Block::GENESIS_VALIDATOR,
              "root", 0);
  EXPECT_FALSE(block.verifySignature(pair->publicKey));
  ASSERT_TRUE(block.sign(pair->privateKey).isOk());
  EXPECT_TRUE(block.verifySignature(pair->publicKey));
  EXPECT_FALSE(block.verifySignature(other->publicKey));
  EXPECT_EQ(block.sign("short").error().code, Block::E_SIGNATURE);
}

TEST_F(BlockTest, JsonKeepsStoredFields) {
  auto txs = makeTransactions(2);
  Block block(4, NOW, "prev", txs, "validator_1", "root", 10.02);

  auto restored = Block::fromJson(block.toJson());
  ASSERT_TRUE(restored.isOk()) << restored.error().message;
  EXPECT_EQ(restored->getHash(), block.getHash());
  EXPECT_EQ(restored->getMerkleRoot(), block.getMerkleRoot());
  EXPECT_EQ(restored->getTransactions().size(), 2u);
  EXPECT_TRUE(restored->validateStructure().isOk());
}

TEST_F(BlockTest, TamperingIsDetected) {
  auto txs = makeTransactions(2);
  Block block(4, NOW, "prev", txs, "validator_1", "root", 10);
  auto j = block.toJson();

  auto rewardTampered = j;
  rewardTampered["reward"] = 1000;
  auto a = Block::fromJson(rewardTampered);
  ASSERT_TRUE(a.isOk());
  EXPECT_EQ(a->validateStructure().error().code, Block::E_HASH);

  auto txDropped = j;
  txDropped["transactions"].erase(1);
  auto b = Block::fromJson(txDropped);
  ASSERT_TRUE(b.isOk());
  EXPECT_EQ(b->validateStructure().error().code, Block::E_MERKLE);

  auto countTampered = j;
  countTampered["transactionCount"] = 5;
  auto c = Block::fromJson(countTampered);
  ASSERT_TRUE(c.isOk());
  EXPECT_EQ(c->validateStructure().error().code, Block::E_AGGREGATE);
}

TEST_F(BlockTest, FromJsonRejectsMalformed) {
  nlohmann::json j = {{"index", 1}};
  EXPECT_EQ(Block::fromJson(j).error().code, Block::E_PARSE);
}
