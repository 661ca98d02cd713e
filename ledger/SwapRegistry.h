#ifndef DPOS_LEDGER_SWAP_REGISTRY_H
#define DPOS_LEDGER_SWAP_REGISTRY_H

#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"
#include "Types.hpp"

#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace dpos {

/**
 * SwapRegistry - constant-product liquidity pairs.
 *
 * Pairs are keyed independently of token order. Reserves are bookkeeping
 * only; they are not backed by ledger balances.
 */
class SwapRegistry : public Module {
public:
  struct SwapPair {
    std::string tokenA;
    std::string tokenB;
    Amount reserveA{ 0 };
    Amount reserveB{ 0 };
    Amount fee{ 0 };
    Amount totalLiquidity{ 0 };

    nlohmann::json toJson() const;
  };

  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_PAIR_NOT_FOUND = 1;  // No pair for the tokens
  constexpr static int32_t E_INVALID_AMOUNT = 2;  // Non-positive input
  constexpr static int32_t E_SLIPPAGE = 3;        // Output below minimum
  constexpr static int32_t E_LIQUIDITY = 4;       // Output exceeds reserve

  constexpr static Amount DEFAULT_FEE = 0.003;

  SwapRegistry();
  ~SwapRegistry() override = default;

  static std::string pairKey(const std::string &tokenA,
                             const std::string &tokenB);

  // ----------------- accessors -------------------------------------
  bool hasPair(const std::string &tokenA, const std::string &tokenB) const;
  Roe<SwapPair> getPair(const std::string &tokenA,
                        const std::string &tokenB) const;
  std::vector<SwapPair> getPairs() const;
  size_t getPairCount() const { return mPairs_.size(); }

  /** Output amount for selling amountIn of tokenIn, without applying it */
  Roe<Amount> quote(const std::string &tokenIn, const std::string &tokenOut,
                    Amount amountIn) const;

  // ----------------- methods -------------------------------------
  bool createPair(const std::string &tokenA, const std::string &tokenB,
                  Amount reserveA, Amount reserveB);

  /** Applies a quote to the reserves, returns the output amount */
  Roe<Amount> swap(const std::string &tokenIn, const std::string &tokenOut,
                   Amount amountIn, Amount minAmountOut);

private:
  std::map<std::string, SwapPair> mPairs_;
};

} // namespace dpos

#endif // DPOS_LEDGER_SWAP_REGISTRY_H
