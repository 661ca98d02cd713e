#include "SwapRegistry.h"

#include <cmath>

namespace dpos {

nlohmann::json SwapRegistry::SwapPair::toJson() const {
  nlohmann::json j;
  j["tokenA"] = tokenA;
  j["tokenB"] = tokenB;
  j["reserveA"] = reserveA;
  j["reserveB"] = reserveB;
  j["fee"] = fee;
  j["totalLiquidity"] = totalLiquidity;
  return j;
}

SwapRegistry::SwapRegistry() : Module("SwapRegistry") {}

std::string SwapRegistry::pairKey(const std::string &tokenA,
                                  const std::string &tokenB) {
  return tokenA < tokenB ? tokenA + "-" + tokenB : tokenB + "-" + tokenA;
}

bool SwapRegistry::hasPair(const std::string &tokenA,
                           const std::string &tokenB) const {
  return mPairs_.count(pairKey(tokenA, tokenB)) > 0;
}

SwapRegistry::Roe<SwapRegistry::SwapPair>
SwapRegistry::getPair(const std::string &tokenA,
                      const std::string &tokenB) const {
  auto it = mPairs_.find(pairKey(tokenA, tokenB));
  if (it == mPairs_.end()) {
    return Error(E_PAIR_NOT_FOUND,
                 "Swap pair not found: " + pairKey(tokenA, tokenB));
  }
  return it->second;
}

std::vector<SwapRegistry::SwapPair> SwapRegistry::getPairs() const {
  std::vector<SwapPair> pairs;
  for (const auto &[key, pair] : mPairs_) {
    pairs.push_back(pair);
  }
  return pairs;
}

SwapRegistry::Roe<Amount> SwapRegistry::quote(const std::string &tokenIn,
                                              const std::string &tokenOut,
                                              Amount amountIn) const {
  if (!(amountIn > 0)) {
    return Error(E_INVALID_AMOUNT,
                 "Swap input must be positive: " + std::to_string(amountIn));
  }
  auto it = mPairs_.find(pairKey(tokenIn, tokenOut));
  if (it == mPairs_.end() || tokenIn == tokenOut) {
    return Error(E_PAIR_NOT_FOUND,
                 "Swap pair not found: " + pairKey(tokenIn, tokenOut));
  }

  const SwapPair &pair = it->second;
  bool forward = pair.tokenA == tokenIn;
  Amount reserveIn = forward ? pair.reserveA : pair.reserveB;
  Amount reserveOut = forward ? pair.reserveB : pair.reserveA;

  Amount amountInWithFee = amountIn * (1 - pair.fee);
  Amount amountOut = reserveOut * amountInWithFee / (reserveIn + amountInWithFee);
  if (amountOut >= reserveOut) {
    return Error(E_LIQUIDITY, "Insufficient liquidity in " +
                                  pairKey(tokenIn, tokenOut));
  }
  return amountOut;
}

bool SwapRegistry::createPair(const std::string &tokenA,
                              const std::string &tokenB, Amount reserveA,
                              Amount reserveB) {
  if (tokenA.empty() || tokenB.empty() || tokenA == tokenB) {
    return false;
  }
  if (!(reserveA > 0) || !(reserveB > 0)) {
    return false;
  }
  std::string key = pairKey(tokenA, tokenB);
  if (mPairs_.count(key) > 0) {
    return false;
  }

  SwapPair pair;
  pair.tokenA = tokenA;
  pair.tokenB = tokenB;
  pair.reserveA = reserveA;
  pair.reserveB = reserveB;
  pair.fee = DEFAULT_FEE;
  pair.totalLiquidity = std::sqrt(reserveA * reserveB);
  mPairs_.emplace(key, pair);

  log().info << "Created swap pair " << key << " (" << reserveA << " / "
             << reserveB << ")";
  return true;
}

SwapRegistry::Roe<Amount> SwapRegistry::swap(const std::string &tokenIn,
                                             const std::string &tokenOut,
                                             Amount amountIn,
                                             Amount minAmountOut) {
  auto quoted = quote(tokenIn, tokenOut, amountIn);
  if (!quoted) {
    return quoted.error();
  }
  Amount amountOut = quoted.value();
  if (amountOut < minAmountOut) {
    return Error(E_SLIPPAGE, "Slippage: output " + std::to_string(amountOut) +
                                 " below minimum " +
                                 std::to_string(minAmountOut));
  }

  SwapPair &pair = mPairs_[pairKey(tokenIn, tokenOut)];
  if (pair.tokenA == tokenIn) {
    pair.reserveA += amountIn;
    pair.reserveB -= amountOut;
  } else {
    pair.reserveB += amountIn;
    pair.reserveA -= amountOut;
  }
  log().debug << "Swapped " << amountIn << " " << tokenIn << " for "
              << amountOut << " " << tokenOut;
  return amountOut;
}

} // namespace dpos
