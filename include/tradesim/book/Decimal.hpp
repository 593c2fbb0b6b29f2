#pragma once

#include <boost/multiprecision/cpp_dec_float.hpp>

#include <optional>
#include <string>

namespace tradesim {

// Exact decimal for prices and sizes. Wire strings such as "0.1" are held
// without binary rounding, so repeated price*size sums don't drift.
using Decimal = boost::multiprecision::cpp_dec_float_50;

// Parses a plain decimal literal ("101.25", "-3", "1e-4"). Returns nullopt for
// empty or non-numeric text and for NaN/Inf.
std::optional<Decimal> parseDecimal(const std::string& text);

inline double toDouble(const Decimal& d) { return d.convert_to<double>(); }

std::string toString(const Decimal& d);

} // namespace tradesim
