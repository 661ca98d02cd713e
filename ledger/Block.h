#pragma once

#include "../lib/ResultOrError.hpp"
#include "Transaction.h"
#include "Types.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace dpos {

/**
 * Sealed block of the chain.
 *
 * All header fields are fixed at construction: the merkle root, transaction
 * count and total fees are derived from the transaction list and the hash
 * covers every header field. Only the producer signature is attached later.
 */
class Block {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_HASH = 1;       // Stored hash does not match
  constexpr static int32_t E_MERKLE = 2;     // Merkle root does not match
  constexpr static int32_t E_AGGREGATE = 3;  // Count or fee total mismatch
  constexpr static int32_t E_SIGNATURE = 4;  // Signing or verification failed
  constexpr static int32_t E_PARSE = 5;      // Malformed JSON

  constexpr static uint16_t CURRENT_VERSION = 1;
  constexpr static const char *GENESIS_PREVIOUS_HASH = "0";
  constexpr static const char *GENESIS_VALIDATOR = "genesis";

  Block() = default;
  Block(uint64_t index, int64_t timestamp, const std::string &previousHash,
        const std::vector<Transaction> &transactions,
        const std::string &validator, const std::string &stateRoot,
        Amount reward);

  /**
   * Merkle root over transaction ids. Leaves are SHA-256 of the ids, odd
   * levels duplicate their last node, an empty list hashes the empty string.
   */
  static std::string calculateMerkleRoot(
      const std::vector<Transaction> &transactions);

  // ----------------- accessors -------------------------------------
  uint64_t getIndex() const { return index_; }
  int64_t getTimestamp() const { return timestamp_; }
  const std::vector<Transaction> &getTransactions() const {
    return transactions_;
  }
  const std::string &getPreviousHash() const { return previousHash_; }
  const std::string &getHash() const { return hash_; }
  uint64_t getNonce() const { return nonce_; }
  const std::string &getValidator() const { return validator_; }
  const std::string &getSignature() const { return signature_; }
  const std::string &getMerkleRoot() const { return merkleRoot_; }
  const std::string &getStateRoot() const { return stateRoot_; }
  size_t getTransactionCount() const { return transactionCount_; }
  Amount getTotalFees() const { return totalFees_; }
  Amount getReward() const { return reward_; }

  // ----------------- methods -------------------------------------
  std::string calculateHash() const;

  /** Signs the block hash with the producer's raw ed25519 private key */
  Roe<void> sign(const std::string &privateKey);
  bool verifySignature(const std::string &publicKey) const;

  /** Recomputes hash, merkle root and aggregates from the block content */
  Roe<void> validateStructure() const;

  nlohmann::json toJson() const;

  /** Restores a block exactly as serialized, without resealing it */
  static Roe<Block> fromJson(const nlohmann::json &j);

private:
  uint64_t index_{ 0 };
  int64_t timestamp_{ 0 };
  std::vector<Transaction> transactions_;
  std::string previousHash_;
  std::string hash_;
  uint64_t nonce_{ 0 };
  std::string validator_;
  std::string signature_; // hex encoded
  std::string merkleRoot_;
  std::string stateRoot_;
  size_t transactionCount_{ 0 };
  Amount totalFees_{ 0 };
  Amount reward_{ 0 };
};

} // namespace dpos
