#include "tradesim/book/Decimal.hpp"

#include <cctype>
#include <stdexcept>

namespace tradesim {

// [+-]digits[.digits][(e|E)[+-]digits], at least one mantissa digit.
static bool looksNumeric(const std::string& s) {
  std::size_t i = 0, n = s.size();
  if (i < n && (s[i] == '+' || s[i] == '-')) ++i;
  std::size_t digits = 0;
  while (i < n && std::isdigit(static_cast<unsigned char>(s[i]))) { ++i; ++digits; }
  if (i < n && s[i] == '.') {
    ++i;
    while (i < n && std::isdigit(static_cast<unsigned char>(s[i]))) { ++i; ++digits; }
  }
  if (digits == 0) return false;
  if (i < n && (s[i] == 'e' || s[i] == 'E')) {
    ++i;
    if (i < n && (s[i] == '+' || s[i] == '-')) ++i;
    std::size_t expDigits = 0;
    while (i < n && std::isdigit(static_cast<unsigned char>(s[i]))) { ++i; ++expDigits; }
    if (expDigits == 0) return false;
  }
  return i == n;
}

std::optional<Decimal> parseDecimal(const std::string& text) {
  if (!looksNumeric(text)) return std::nullopt;
  try {
    return Decimal(text);
  } catch (const std::runtime_error&) {
    return std::nullopt;
  }
}

std::string toString(const Decimal& d) {
  return d.str();
}

} // namespace tradesim
