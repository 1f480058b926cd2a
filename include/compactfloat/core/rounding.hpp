#ifndef COMPACTFLOAT_CORE_ROUNDING_HPP
#define COMPACTFLOAT_CORE_ROUNDING_HPP

// Decimal digit rounding.
//
// Conversions that run out of coefficient room keep feeding the digits they
// cannot hold into a DiscardedDigits record. Once the input is consumed, the
// rounding policy decides from that record (and the parity of the kept
// coefficient) whether the kept coefficient is incremented.

#include <concepts>
#include <cstdint>

namespace compactfloat {

// What a conversion threw away: the first discarded digit and whether any
// later one was non-zero.
struct DiscardedDigits {
  int First = 0;
  bool Sticky = false;
  bool Seen = false;

  constexpr void push(int Digit) {
    if (!Seen) {
      First = Digit;
      Seen = true;
    } else if (Digit != 0) {
      Sticky = true;
    }
  }

  // True if a non-zero digit was lost.
  constexpr bool inexact() const { return First != 0 || Sticky; }
};

template <typename R>
concept RoundingPolicy = requires(DiscardedDigits D, bool Odd) {
  { R::roundsUp(D, Odd) } -> std::convertible_to<bool>;
};

namespace rounding {

// Truncation. Discarded digits never carry.
struct TowardZero {
  static constexpr bool roundsUp(const DiscardedDigits &, bool) {
    return false;
  }
};

// Round to nearest, ties to even.
struct ToNearestTiesToEven {
  static constexpr bool roundsUp(const DiscardedDigits &D, bool Odd) {
    if (D.First != 5)
      return D.First > 5;
    return D.Sticky || Odd;
  }
};

using Default = ToNearestTiesToEven;

static_assert(RoundingPolicy<TowardZero>);
static_assert(RoundingPolicy<ToNearestTiesToEven>);

} // namespace rounding

// Applies policy R to Coefficient. Returns true if digits were lost.
template <RoundingPolicy R = rounding::Default>
constexpr bool roundCoefficient(uint64_t &Coefficient,
                                const DiscardedDigits &D) {
  if (R::roundsUp(D, (Coefficient & 1) != 0))
    ++Coefficient;
  return D.inexact();
}

} // namespace compactfloat

#endif // COMPACTFLOAT_CORE_ROUNDING_HPP
