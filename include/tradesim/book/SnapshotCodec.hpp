#pragma once

#include <string>

#include "tradesim/Result.hpp"
#include "tradesim/book/OrderBookSnapshot.hpp"

namespace tradesim {

// Decodes one feed frame:
//   { "timestamp": "...", "exchange": "...", "symbol": "...",
//     "asks": [["price","size"], ...], "bids": [["price","size"], ...] }
// Prices and sizes may be JSON strings or numbers; both are read as exact
// decimals. Missing asks/bids decode as empty sides.
Result<OrderBookSnapshot> parseSnapshot(const std::string& text);

} // namespace tradesim
