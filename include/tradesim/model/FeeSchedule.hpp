#pragma once

#include <array>
#include <cstddef>
#include <string>

namespace tradesim::model {

enum class FeeTier : std::size_t { Vip0 = 0, Vip1, Vip2, Vip3, Vip4, Vip5 };

constexpr std::size_t kFeeTierCount = 6;

// Unrecognized labels map to this tier (the most expensive one), never to zero fees.
constexpr FeeTier kFallbackFeeTier = FeeTier::Vip0;

// Taker fee rate as a fraction of notional.
double feeRate(FeeTier tier);

// "VIP 0" .. "VIP 5" (case-insensitive, space optional). Anything else falls
// back to kFallbackFeeTier; `recognized` reports which happened.
FeeTier parseFeeTier(const std::string& label, bool* recognized = nullptr);

std::string toString(FeeTier tier);

} // namespace tradesim::model
