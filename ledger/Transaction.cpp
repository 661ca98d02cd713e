#include "Transaction.h"
#include "../lib/Utilities.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace dpos {

namespace {

Amount typeFeeMultiplier(Transaction::Type type) {
  switch (type) {
  case Transaction::Type::STAKE:
    return 2;
  case Transaction::Type::UNSTAKE:
    return 3;
  case Transaction::Type::SWAP:
    return 1.5;
  case Transaction::Type::TRANSFER:
  default:
    return 1;
  }
}

} // namespace

Transaction::Transaction(const std::string &from, const std::string &to,
                         Amount amount, Type type, const Payload &payload,
                         int64_t timestamp)
    : from_(from), to_(to), amount_(amount),
      fee_(calculateFee(type, amount)),
      timestamp_(timestamp != 0 ? timestamp : utl::getCurrentTimeMs()),
      type_(type), payload_(payload) {
  id_ = calculateId();
}

std::string Transaction::typeToString(Type type) {
  switch (type) {
  case Type::TRANSFER:
    return "transfer";
  case Type::STAKE:
    return "stake";
  case Type::UNSTAKE:
    return "unstake";
  case Type::SWAP:
    return "swap";
  default:
    return "unknown";
  }
}

Transaction::Roe<Transaction::Type>
Transaction::typeFromString(const std::string &name) {
  if (name == "transfer") {
    return Type::TRANSFER;
  }
  if (name == "stake") {
    return Type::STAKE;
  }
  if (name == "unstake") {
    return Type::UNSTAKE;
  }
  if (name == "swap") {
    return Type::SWAP;
  }
  return Error(E_UNKNOWN_TYPE, "Unknown transaction type: " + name);
}

Amount Transaction::calculateFee(Type type, Amount amount) {
  Amount typeFee = BASE_FEE * typeFeeMultiplier(type);
  Amount percentageFee = amount * PERCENTAGE_FEE_RATE;
  Amount largeFee = amount > LARGE_TRANSACTION_THRESHOLD
                        ? amount * LARGE_TRANSACTION_FEE_RATE
                        : 0;
  return std::max(typeFee + percentageFee + largeFee, BASE_FEE);
}

const std::string &Transaction::getStakeTarget() const {
  if (auto p = std::get_if<StakePayload>(&payload_)) {
    if (!p->validator.empty()) {
      return p->validator;
    }
  }
  return to_;
}

const Transaction::SwapPayload *Transaction::getSwapPayload() const {
  return std::get_if<SwapPayload>(&payload_);
}

std::string Transaction::canonicalPayload() const {
  std::ostringstream oss;
  if (auto stake = std::get_if<StakePayload>(&payload_)) {
    oss << "validator=" << stake->validator;
  } else if (auto swap = std::get_if<SwapPayload>(&payload_)) {
    oss << "swap=" << swap->tokenA << '>' << swap->tokenB << ','
        << canonicalAmount(swap->amountIn) << ','
        << canonicalAmount(swap->minAmountOut);
  } else if (auto opaque = std::get_if<OpaquePayload>(&payload_)) {
    oss << "bytes=" << utl::hexEncode(opaque->bytes);
  }
  return oss.str();
}

std::string Transaction::calculateId() const {
  std::ostringstream oss;
  oss << from_ << '|' << to_ << '|' << canonicalAmount(amount_) << '|'
      << canonicalAmount(fee_) << '|' << timestamp_ << '|'
      << typeToString(type_) << '|' << canonicalPayload();
  return utl::sha256(oss.str());
}

Transaction::Roe<void> Transaction::sign(const std::string &privateKey) {
  auto result = utl::ed25519Sign(privateKey, id_);
  if (!result) {
    return Error(E_SIGNATURE,
                 "Failed to sign transaction: " + result.error().message);
  }
  signature_ = utl::hexEncode(result.value());
  return {};
}

bool Transaction::verifySignature(const std::string &publicKey) const {
  if (signature_.empty() || id_ != calculateId()) {
    return false;
  }
  return utl::ed25519Verify(publicKey, id_, utl::hexDecode(signature_));
}

Transaction::Roe<void> Transaction::validate(int64_t nowMs) const {
  if (from_.empty() || to_.empty()) {
    return Error(E_INVALID_FIELD, "Transaction requires sender and recipient");
  }
  if (!std::isfinite(amount_) || amount_ <= 0) {
    return Error(E_INVALID_AMOUNT, "Transaction amount must be positive: " +
                                       std::to_string(amount_));
  }
  Amount minFee = calculateFee(type_, amount_);
  if (!std::isfinite(fee_) || fee_ < minFee - AMOUNT_EPSILON) {
    return Error(E_INVALID_AMOUNT, "Transaction fee " + std::to_string(fee_) +
                                       " below required " +
                                       std::to_string(minFee));
  }
  if (from_ == to_ && type_ != Type::STAKE && type_ != Type::UNSTAKE) {
    return Error(E_SELF_TRANSFER, "Self-transactions are only allowed for "
                                  "stake and unstake");
  }
  if (timestamp_ < nowMs - MAX_AGE_MS) {
    return Error(E_TIMESTAMP, "Transaction is too old: " +
                                  std::to_string(timestamp_));
  }
  if (timestamp_ > nowMs + MAX_FUTURE_MS) {
    return Error(E_TIMESTAMP, "Transaction timestamp is in the future: " +
                                  std::to_string(timestamp_));
  }

  switch (type_) {
  case Type::TRANSFER:
    if (std::holds_alternative<StakePayload>(payload_) ||
        std::holds_alternative<SwapPayload>(payload_)) {
      return Error(E_PAYLOAD, "Transfer carries a foreign payload");
    }
    break;
  case Type::STAKE:
  case Type::UNSTAKE:
    if (std::holds_alternative<SwapPayload>(payload_)) {
      return Error(E_PAYLOAD, "Stake operations cannot carry swap data");
    }
    break;
  case Type::SWAP: {
    auto p = getSwapPayload();
    if (!p || p->tokenA.empty() || p->tokenB.empty()) {
      return Error(E_PAYLOAD, "Swap requires tokenA and tokenB");
    }
    if (p->tokenA == p->tokenB) {
      return Error(E_PAYLOAD, "Swap tokens must differ: " + p->tokenA);
    }
    if (std::fabs(p->amountIn - amount_) > AMOUNT_EPSILON ||
        p->minAmountOut < 0) {
      return Error(E_PAYLOAD, "Swap amounts are inconsistent");
    }
    break;
  }
  default:
    return Error(E_UNKNOWN_TYPE, "Unknown transaction type");
  }

  if (id_ != calculateId()) {
    return Error(E_ID_MISMATCH, "Transaction id does not match its content");
  }
  return {};
}

nlohmann::json Transaction::toJson() const {
  nlohmann::json j;
  j["id"] = id_;
  j["from"] = from_;
  j["to"] = to_;
  j["amount"] = amount_;
  j["fee"] = fee_;
  j["timestamp"] = timestamp_;
  j["signature"] = signature_;
  j["type"] = typeToString(type_);

  if (auto stake = std::get_if<StakePayload>(&payload_)) {
    j["data"] = {{"validator", stake->validator}};
  } else if (auto swap = std::get_if<SwapPayload>(&payload_)) {
    j["data"] = {{"tokenA", swap->tokenA},
                 {"tokenB", swap->tokenB},
                 {"amountIn", swap->amountIn},
                 {"minAmountOut", swap->minAmountOut}};
  } else if (auto opaque = std::get_if<OpaquePayload>(&payload_)) {
    j["data"] = {{"bytes", utl::hexEncode(opaque->bytes)}};
  } else {
    j["data"] = nullptr;
  }
  return j;
}

Transaction::Roe<Transaction> Transaction::fromJson(const nlohmann::json &j) {
  try {
    auto typeResult = typeFromString(j.at("type").get<std::string>());
    if (!typeResult) {
      return typeResult.error();
    }
    Type type = typeResult.value();

    Payload payload;
    if (j.contains("data") && j["data"].is_object()) {
      const auto &data = j["data"];
      if (type == Type::SWAP) {
        SwapPayload swap;
        swap.tokenA = data.at("tokenA").get<std::string>();
        swap.tokenB = data.at("tokenB").get<std::string>();
        swap.amountIn = data.value("amountIn", j.at("amount").get<Amount>());
        swap.minAmountOut = data.value("minAmountOut", Amount(0));
        payload = swap;
      } else if (data.contains("validator")) {
        payload = StakePayload{ data["validator"].get<std::string>() };
      } else if (data.contains("bytes")) {
        payload = OpaquePayload{
            utl::hexDecode(data["bytes"].get<std::string>()) };
      }
    }

    Transaction tx(j.at("from").get<std::string>(),
                   j.at("to").get<std::string>(),
                   j.at("amount").get<Amount>(), type, payload,
                   j.value("timestamp", int64_t(0)));
    if (j.contains("fee")) {
      tx.fee_ = j["fee"].get<Amount>();
    }
    tx.id_ = tx.calculateId();

    if (j.contains("id") && !j["id"].get<std::string>().empty() &&
        j["id"].get<std::string>() != tx.id_) {
      return Error(E_ID_MISMATCH, "Transaction id does not match its content: " +
                                      j["id"].get<std::string>());
    }
    tx.signature_ = j.value("signature", std::string());
    return tx;
  } catch (const nlohmann::json::exception &e) {
    return Error(E_PARSE, "Failed to parse transaction: " + std::string(e.what()));
  }
}

} // namespace dpos
