#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace settlecore {
namespace decimal {

// Exact monetary value with four fractional digits, stored as value * 10'000.
class Decimal {
 public:
  static constexpr std::int64_t kScale = 10'000;
  static constexpr int kFractionDigits = 4;

  constexpr Decimal() noexcept = default;

  [[nodiscard]] static constexpr Decimal from_raw(std::int64_t raw) noexcept { return Decimal{raw}; }
  // Rounds half away from zero to the nearest ten-thousandth.
  [[nodiscard]] static Decimal from_double(double value) noexcept;
  // Exact decimal text such as "1.5", "-0.0001" or " 42 ". Digits past the
  // fourth fractional place round half away from zero.
  [[nodiscard]] static std::optional<Decimal> parse(std::string_view text) noexcept;

  [[nodiscard]] constexpr std::int64_t raw() const noexcept { return raw_; }
  [[nodiscard]] constexpr bool is_negative() const noexcept { return raw_ < 0; }

  // Canonical text: no exponent, trailing fractional zeros stripped.
  [[nodiscard]] std::string to_string() const;

  constexpr Decimal& operator+=(Decimal other) noexcept {
    raw_ += other.raw_;
    return *this;
  }
  constexpr Decimal& operator-=(Decimal other) noexcept {
    raw_ -= other.raw_;
    return *this;
  }

  friend constexpr Decimal operator+(Decimal lhs, Decimal rhs) noexcept { return Decimal{lhs.raw_ + rhs.raw_}; }
  friend constexpr Decimal operator-(Decimal lhs, Decimal rhs) noexcept { return Decimal{lhs.raw_ - rhs.raw_}; }
  friend constexpr auto operator<=>(Decimal, Decimal) noexcept = default;
  friend constexpr bool operator==(Decimal, Decimal) noexcept = default;

 private:
  constexpr explicit Decimal(std::int64_t raw) noexcept : raw_(raw) {}

  std::int64_t raw_{0};
};

}  // namespace decimal
}  // namespace settlecore
