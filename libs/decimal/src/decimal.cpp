#include "settlecore/decimal/decimal.hpp"

#include <cmath>
#include <cstdlib>
#include <limits>

namespace settlecore {
namespace decimal {

namespace {

bool is_space(char c) noexcept {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
}

std::string_view trim(std::string_view text) noexcept {
  while (!text.empty() && is_space(text.front())) {
    text.remove_prefix(1);
  }
  while (!text.empty() && is_space(text.back())) {
    text.remove_suffix(1);
  }
  return text;
}

bool is_digit(char c) noexcept {
  return c >= '0' && c <= '9';
}

}  // namespace

Decimal Decimal::from_double(double value) noexcept {
  // std::llround rounds halfway cases away from zero.
  return Decimal{static_cast<std::int64_t>(std::llround(value * static_cast<double>(kScale)))};
}

std::optional<Decimal> Decimal::parse(std::string_view text) noexcept {
  text = trim(text);
  if (text.empty()) {
    return std::nullopt;
  }

  bool negative = false;
  if (text.front() == '-' || text.front() == '+') {
    negative = text.front() == '-';
    text.remove_prefix(1);
  }

  const auto dot = text.find('.');
  const std::string_view whole = text.substr(0, dot);
  const std::string_view fraction = dot == std::string_view::npos ? std::string_view{} : text.substr(dot + 1);
  if (whole.empty() && fraction.empty()) {
    return std::nullopt;
  }

  constexpr std::int64_t kMaxWhole = std::numeric_limits<std::int64_t>::max() / kScale - 1;
  std::int64_t whole_value = 0;
  for (const char c : whole) {
    if (!is_digit(c)) {
      return std::nullopt;
    }
    whole_value = whole_value * 10 + (c - '0');
    if (whole_value > kMaxWhole) {
      return std::nullopt;
    }
  }

  std::int64_t fraction_value = 0;
  int fraction_digits = 0;
  bool round_up = false;
  for (const char c : fraction) {
    if (!is_digit(c)) {
      return std::nullopt;
    }
    if (fraction_digits < kFractionDigits) {
      fraction_value = fraction_value * 10 + (c - '0');
    } else if (fraction_digits == kFractionDigits) {
      round_up = c >= '5';
    }
    ++fraction_digits;
  }
  for (int i = fraction_digits; i < kFractionDigits; ++i) {
    fraction_value *= 10;
  }

  std::int64_t raw = whole_value * kScale + fraction_value + (round_up ? 1 : 0);
  return Decimal{negative ? -raw : raw};
}

std::string Decimal::to_string() const {
  // Magnitude in unsigned space so INT64_MIN does not overflow.
  const std::uint64_t magnitude = raw_ < 0 ? 0 - static_cast<std::uint64_t>(raw_) : static_cast<std::uint64_t>(raw_);
  const std::uint64_t whole = magnitude / kScale;
  std::uint64_t frac = magnitude % kScale;

  std::string out;
  if (raw_ < 0) {
    out.push_back('-');
  }
  out += std::to_string(whole);
  if (frac == 0) {
    return out;
  }

  char digits[kFractionDigits];
  for (int i = kFractionDigits - 1; i >= 0; --i) {
    digits[i] = static_cast<char>('0' + frac % 10);
    frac /= 10;
  }
  int len = kFractionDigits;
  while (len > 0 && digits[len - 1] == '0') {
    --len;
  }
  out.push_back('.');
  out.append(digits, static_cast<std::size_t>(len));
  return out;
}

}  // namespace decimal
}  // namespace settlecore
