#include "Block.h"
#include "../lib/Utilities.h"

#include <cmath>
#include <iomanip>
#include <openssl/evp.h>
#include <sstream>
#include <stdexcept>

namespace dpos {

// Helper function to compute SHA-256 hash using OpenSSL 3.0 EVP API
static std::string sha256(const std::string &input) {
  EVP_MD_CTX *mdctx = EVP_MD_CTX_new();
  if (!mdctx) {
    throw std::runtime_error("Failed to create EVP_MD_CTX");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hashLen = 0;

  if (EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(mdctx, input.data(), input.size()) != 1 ||
      EVP_DigestFinal_ex(mdctx, hash, &hashLen) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw std::runtime_error("EVP sha256 digest failed");
  }

  EVP_MD_CTX_free(mdctx);

  std::stringstream ss;
  for (unsigned int i = 0; i < hashLen; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(hash[i]);
  }
  return ss.str();
}

static Amount sumFees(const std::vector<Transaction> &transactions) {
  Amount total = 0;
  for (const auto &tx : transactions) {
    total += tx.getFee();
  }
  return total;
}

Block::Block(uint64_t index, int64_t timestamp, const std::string &previousHash,
             const std::vector<Transaction> &transactions,
             const std::string &validator, const std::string &stateRoot,
             Amount reward)
    : index_(index), timestamp_(timestamp), transactions_(transactions),
      previousHash_(previousHash), validator_(validator),
      stateRoot_(stateRoot), reward_(reward) {
  merkleRoot_ = calculateMerkleRoot(transactions_);
  transactionCount_ = transactions_.size();
  totalFees_ = sumFees(transactions_);
  hash_ = calculateHash();
}

std::string Block::calculateMerkleRoot(
    const std::vector<Transaction> &transactions) {
  if (transactions.empty()) {
    return sha256("");
  }

  std::vector<std::string> level;
  level.reserve(transactions.size());
  for (const auto &tx : transactions) {
    level.push_back(sha256(tx.getId()));
  }

  while (level.size() > 1) {
    if (level.size() % 2 != 0) {
      level.push_back(level.back());
    }
    std::vector<std::string> next;
    next.reserve(level.size() / 2);
    for (size_t i = 0; i < level.size(); i += 2) {
      next.push_back(sha256(level[i] + level[i + 1]));
    }
    level.swap(next);
  }
  return level.front();
}

std::string Block::calculateHash() const {
  std::stringstream ss;
  ss << CURRENT_VERSION << '|' << index_ << '|' << timestamp_ << '|'
     << previousHash_ << '|' << merkleRoot_ << '|' << stateRoot_ << '|'
     << validator_ << '|' << nonce_ << '|' << transactionCount_ << '|'
     << canonicalAmount(totalFees_) << '|' << canonicalAmount(reward_);
  return sha256(ss.str());
}

Block::Roe<void> Block::sign(const std::string &privateKey) {
  auto result = utl::ed25519Sign(privateKey, hash_);
  if (!result) {
    return Error(E_SIGNATURE, "Failed to sign block " + std::to_string(index_) +
                                  ": " + result.error().message);
  }
  signature_ = utl::hexEncode(result.value());
  return {};
}

bool Block::verifySignature(const std::string &publicKey) const {
  return utl::ed25519Verify(publicKey, hash_, utl::hexDecode(signature_));
}

Block::Roe<void> Block::validateStructure() const {
  if (calculateMerkleRoot(transactions_) != merkleRoot_) {
    return Error(E_MERKLE, "Merkle root mismatch in block " +
                               std::to_string(index_));
  }
  if (transactionCount_ != transactions_.size()) {
    return Error(E_AGGREGATE, "Transaction count mismatch in block " +
                                  std::to_string(index_));
  }
  if (std::fabs(sumFees(transactions_) - totalFees_) > AMOUNT_EPSILON) {
    return Error(E_AGGREGATE, "Total fee mismatch in block " +
                                  std::to_string(index_));
  }
  if (calculateHash() != hash_) {
    return Error(E_HASH, "Hash mismatch in block " + std::to_string(index_));
  }
  return {};
}

nlohmann::json Block::toJson() const {
  nlohmann::json j;
  j["index"] = index_;
  j["timestamp"] = timestamp_;
  j["transactions"] = nlohmann::json::array();
  for (const auto &tx : transactions_) {
    j["transactions"].push_back(tx.toJson());
  }
  j["previousHash"] = previousHash_;
  j["hash"] = hash_;
  j["nonce"] = nonce_;
  j["validator"] = validator_;
  j["signature"] = signature_;
  j["merkleRoot"] = merkleRoot_;
  j["stateRoot"] = stateRoot_;
  j["transactionCount"] = transactionCount_;
  j["totalFees"] = totalFees_;
  j["reward"] = reward_;
  return j;
}

Block::Roe<Block> Block::fromJson(const nlohmann::json &j) {
  try {
    Block block;
    block.index_ = j.at("index").get<uint64_t>();
    block.timestamp_ = j.at("timestamp").get<int64_t>();
    for (const auto &txJson : j.at("transactions")) {
      auto tx = Transaction::fromJson(txJson);
      if (!tx) {
        return Error(E_PARSE, "Invalid transaction in block " +
                                  std::to_string(block.index_) + ": " +
                                  tx.error().message);
      }
      block.transactions_.push_back(tx.value());
    }
    block.previousHash_ = j.at("previousHash").get<std::string>();
    block.hash_ = j.at("hash").get<std::string>();
    block.nonce_ = j.value("nonce", uint64_t(0));
    block.validator_ = j.at("validator").get<std::string>();
    block.signature_ = j.value("signature", std::string());
    block.merkleRoot_ = j.at("merkleRoot").get<std::string>();
    block.stateRoot_ = j.at("stateRoot").get<std::string>();
    block.transactionCount_ = j.at("transactionCount").get<size_t>();
    block.totalFees_ = j.at("totalFees").get<Amount>();
    block.reward_ = j.at("reward").get<Amount>();
    return block;
  } catch (const nlohmann::json::exception &e) {
    return Error(E_PARSE, "Failed to parse block: " + std::string(e.what()));
  }
}

} // namespace dpos
