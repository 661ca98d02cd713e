#ifndef DPOS_LEDGER_TRANSACTION_H
#define DPOS_LEDGER_TRANSACTION_H

#include "../lib/ResultOrError.hpp"
#include "Types.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <variant>

namespace dpos {

/**
 * Transaction - immutable value object moved between pool, chain and export.
 *
 * The id is the SHA-256 of the canonical content (every field except id and
 * signature), so two transactions with the same content share an id. The fee
 * is derived from type and amount at construction.
 */
class Transaction {
public:
  enum class Type { TRANSFER, STAKE, UNSTAKE, SWAP };

  // Target override for stake/unstake, defaults to the recipient
  struct StakePayload {
    std::string validator;
  };

  struct SwapPayload {
    std::string tokenA; // sold
    std::string tokenB; // bought
    Amount amountIn{ 0 };
    Amount minAmountOut{ 0 };
  };

  struct OpaquePayload {
    std::string bytes;
  };

  using Payload =
      std::variant<std::monostate, StakePayload, SwapPayload, OpaquePayload>;

  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_INVALID_FIELD = 1; // Missing sender/recipient
  constexpr static int32_t E_INVALID_AMOUNT = 2; // Amount or fee out of range
  constexpr static int32_t E_SELF_TRANSFER = 3;  // Sender equals recipient
  constexpr static int32_t E_TIMESTAMP = 4;      // Too old or in the future
  constexpr static int32_t E_PAYLOAD = 5;        // Payload does not fit type
  constexpr static int32_t E_UNKNOWN_TYPE = 6;   // Type outside enumeration
  constexpr static int32_t E_PARSE = 7;          // Malformed JSON
  constexpr static int32_t E_ID_MISMATCH = 8;    // Id does not match content
  constexpr static int32_t E_SIGNATURE = 9;      // Signing failed

  constexpr static Amount BASE_FEE = 0.001;
  constexpr static Amount PERCENTAGE_FEE_RATE = 0.0001;
  constexpr static Amount LARGE_TRANSACTION_THRESHOLD = 1000;
  constexpr static Amount LARGE_TRANSACTION_FEE_RATE = 0.0005;
  constexpr static int64_t MAX_AGE_MS = 10 * 60 * 1000;
  constexpr static int64_t MAX_FUTURE_MS = 60 * 1000;

  Transaction() = default;

  /**
   * @param timestamp Unix milliseconds, 0 for the current time
   */
  Transaction(const std::string &from, const std::string &to, Amount amount,
              Type type, const Payload &payload = {}, int64_t timestamp = 0);

  static std::string typeToString(Type type);
  static Roe<Type> typeFromString(const std::string &name);

  /** Fee schedule: base fee scaled by type, plus percentage and large-amount surcharges */
  static Amount calculateFee(Type type, Amount amount);

  // ----------------- accessors -------------------------------------
  const std::string &getId() const { return id_; }
  const std::string &getFrom() const { return from_; }
  const std::string &getTo() const { return to_; }
  Amount getAmount() const { return amount_; }
  Amount getFee() const { return fee_; }
  int64_t getTimestamp() const { return timestamp_; }
  const std::string &getSignature() const { return signature_; }
  Type getType() const { return type_; }
  const Payload &getPayload() const { return payload_; }
  bool isSigned() const { return !signature_.empty(); }

  /** Validator addressed by a stake or unstake */
  const std::string &getStakeTarget() const;

  /** Swap parameters, nullptr unless the payload is a SwapPayload */
  const SwapPayload *getSwapPayload() const;

  // ----------------- methods -------------------------------------
  std::string calculateId() const;

  /** Signs the id with a raw 32-byte ed25519 private key */
  Roe<void> sign(const std::string &privateKey);
  bool verifySignature(const std::string &publicKey) const;

  /** Structural checks that do not depend on ledger state */
  Roe<void> validate(int64_t nowMs) const;

  nlohmann::json toJson() const;
  static Roe<Transaction> fromJson(const nlohmann::json &j);

private:
  std::string canonicalPayload() const;

  std::string id_;
  std::string from_;
  std::string to_;
  Amount amount_{ 0 };
  Amount fee_{ 0 };
  int64_t timestamp_{ 0 };
  std::string signature_; // hex encoded
  Type type_{ Type::TRANSFER };
  Payload payload_;
};

} // namespace dpos

#endif // DPOS_LEDGER_TRANSACTION_H
