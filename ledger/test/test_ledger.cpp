#include "../Ledger.h"
#include <gtest/gtest.h>

using namespace dpos;

class LedgerTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_TRUE(ledger.createAccount("alice", 1000).isOk());
    ASSERT_TRUE(ledger.createAccount("bob", 250).isOk());
  }

  Ledger ledger;
};

TEST_F(LedgerTest, CreateAccountStoresInitialState) {
  auto account = ledger.getAccount("alice");
  ASSERT_TRUE(account.isOk());
  EXPECT_EQ(account->address, "alice");
  EXPECT_DOUBLE_EQ(account->balance, 1000);
  EXPECT_EQ(account->nonce, 0u);
  EXPECT_DOUBLE_EQ(account->staked, 0);
  EXPECT_FALSE(account->isValidator);
  EXPECT_EQ(ledger.getAccountCount(), 2u);
}

TEST_F(LedgerTest, CreateAccountRejectsDuplicatesAndBadInput) {
  auto duplicate = ledger.createAccount("alice", 5);
  ASSERT_TRUE(duplicate.isError());
  EXPECT_EQ(duplicate.error().code, Ledger::E_ACCOUNT_EXISTS);
  EXPECT_DOUBLE_EQ(ledger.getBalance("alice"), 1000);

  EXPECT_EQ(ledger.createAccount("", 5).error().code, Ledger::E_INVALID_ADDRESS);
  EXPECT_EQ(ledger.createAccount("carol", -1).error().code,
            Ledger::E_INVALID_AMOUNT);
  EXPECT_FALSE(ledger.hasAccount("carol"));
}

TEST_F(LedgerTest, UnknownAccount) {
  auto missing = ledger.getAccount("nobody");
  ASSERT_TRUE(missing.isError());
  EXPECT_EQ(missing.error().code, Ledger::E_ACCOUNT_NOT_FOUND);
  EXPECT_DOUBLE_EQ(ledger.getBalance("nobody"), 0);
  EXPECT_FALSE(ledger.adjustBalance("nobody", 10));
}

TEST_F(LedgerTest, AdjustBalanceNeverGoesNegative) {
  EXPECT_TRUE(ledger.adjustBalance("bob", -200));
  EXPECT_DOUBLE_EQ(ledger.getBalance("bob"), 50);

  EXPECT_FALSE(ledger.adjustBalance("bob", -50.5));
  EXPECT_DOUBLE_EQ(ledger.getBalance("bob"), 50);

  EXPECT_TRUE(ledger.adjustBalance("bob", -50));
  EXPECT_DOUBLE_EQ(ledger.getBalance("bob"), 0);
}

TEST_F(LedgerTest, StakedAndTokenBalancesAreGuarded) {
  EXPECT_TRUE(ledger.adjustStaked("alice", 300));
  EXPECT_FALSE(ledger.adjustStaked("alice", -301));
  EXPECT_DOUBLE_EQ(ledger.getAccount("alice")->staked, 300);

  EXPECT_TRUE(ledger.adjustTokenBalance("alice", "USDT", 12.5));
  EXPECT_FALSE(ledger.adjustTokenBalance("alice", "USDT", -13));
  EXPECT_DOUBLE_EQ(ledger.getAccount("alice")->getTokenBalance("USDT"), 12.5);
  EXPECT_DOUBLE_EQ(ledger.getAccount("alice")->getTokenBalance("ETH"), 0);
}

TEST_F(LedgerTest, EnsureAccountCreatesOnlyOnce) {
  ledger.ensureAccount("carol");
  ASSERT_TRUE(ledger.hasAccount("carol"));
  EXPECT_DOUBLE_EQ(ledger.getBalance("carol"), 0);

  ledger.adjustBalance("carol", 7);
  ledger.ensureAccount("carol");
  EXPECT_DOUBLE_EQ(ledger.getBalance("carol"), 7);
}

TEST_F(LedgerTest, RewardsNonceFlagsAndKeys) {
  EXPECT_TRUE(ledger.creditRewards("alice", 1.5));
  EXPECT_FALSE(ledger.creditRewards("alice", -1));
  EXPECT_TRUE(ledger.incrementNonce("alice"));
  EXPECT_TRUE(ledger.setValidatorFlag("alice", true));
  EXPECT_TRUE(ledger.setPublicKey("alice", std::string(32, 'k')));

  auto account = ledger.getAccount("alice");
  ASSERT_TRUE(account.isOk());
  EXPECT_DOUBLE_EQ(account->stakingRewards, 1.5);
  EXPECT_EQ(account->nonce, 1u);
  EXPECT_TRUE(account->isValidator);
  EXPECT_EQ(account->publicKey.size(), 32u);
  // Rewards are tracked apart from the spendable balance
  EXPECT_DOUBLE_EQ(account->balance, 1000);
}

TEST_F(LedgerTest, ListingIsOrderedByAddress) {
  EXPECT_EQ(ledger.getAccountCount(), 2u);
  auto accounts = ledger.getAccounts();
  ASSERT_EQ(accounts.size(), 2u);
  EXPECT_EQ(accounts[0].address, "alice");
  EXPECT_EQ(accounts[1].address, "bob");
}

TEST_F(LedgerTest, StateRootFollowsState) {
  std::string before = ledger.calculateStateRoot();
  EXPECT_EQ(before.size(), 64u);
  EXPECT_EQ(before, ledger.calculateStateRoot());

  ledger.adjustBalance("alice", -1);
  std::string after = ledger.calculateStateRoot();
  EXPECT_NE(before, after);

  ledger.adjustBalance("alice", 1);
  EXPECT_EQ(before, ledger.calculateStateRoot());
}

TEST_F(LedgerTest, AccountToJson) {
  ledger.adjustTokenBalance("bob", "USDT", 3);
  auto j = ledger.getAccount("bob")->toJson();
  EXPECT_EQ(j["address"], "bob");
  EXPECT_DOUBLE_EQ(j["balance"].get<double>(), 250);
  EXPECT_DOUBLE_EQ(j["tokens"]["USDT"].get<double>(), 3);
  EXPECT_FALSE(j.contains("publicKey"));
}
