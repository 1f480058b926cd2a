#ifndef COMPACTFLOAT_CORE_DFLOAT_HPP
#define COMPACTFLOAT_CORE_DFLOAT_HPP

// DFloat: a decimal floating point value in 96 bits.
//
//   value = Coefficient * 10^Exponent
//
// Coefficient covers the int64_t range and carries the sign. Exponent
// covers -0x7fffffff..0x7fffffff; ExpSpecial (INT32_MIN) marks a special
// value whose coefficient is one of the Coeff* tags from layout.hpp.
//
// Normal values are kept minimized: no trailing decimal zero in the
// coefficient, and zero always has exponent 0. That makes structural
// equality (operator==) numeric equality.

#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <ostream>
#include <string>
#include <string_view>
#include <system_error>

#include <gmp.h>
#include <mpfr.h>

#include "compactfloat/core/bigdecimal.hpp"
#include "compactfloat/core/bigfloat.hpp"
#include "compactfloat/core/bigint.hpp"
#include "compactfloat/core/layout.hpp"
#include "compactfloat/core/literal.hpp"
#include "compactfloat/core/rounding.hpp"
#include "compactfloat/core/status.hpp"

namespace compactfloat {

// Top mantissa bit of a binary64 NaN: set for quiet, clear for signaling.
inline constexpr uint64_t Float64QuietBit = uint64_t{1} << 51;
inline constexpr uint64_t Float64QuietNaNBits = 0x7FF8000000000000ull;
inline constexpr uint64_t Float64SignalingNaNBits = 0x7FF0000000000001ull;

namespace detail {

[[noreturn]] inline void illegalSpecial(int64_t Coefficient) {
  std::fprintf(stderr, "compactfloat: %lld: illegal special coefficient\n",
               static_cast<long long>(Coefficient));
  std::abort();
}

inline bool exponentInRange(int64_t Exp) {
  return Exp >= -DFloatLayout::max_exponent &&
         Exp <= DFloatLayout::max_exponent;
}

inline void minimize(uint64_t &Coefficient, int64_t &Exponent) {
  if (Coefficient == 0) {
    Exponent = 0;
    return;
  }
  while (Coefficient % 10 == 0) {
    Coefficient /= 10;
    ++Exponent;
  }
}

// Largest coefficient with the requested number of significant digits.
// 0 (or anything out of 1..19) means the full int64_t range.
inline uint64_t coefficientLimit(int SignificantDigits) {
  static constexpr uint64_t DigitsMax[] = {
      0,
      9,
      99,
      999,
      9999,
      99999,
      999999,
      9999999,
      99999999,
      999999999,
      9999999999,
      99999999999,
      999999999999,
      9999999999999,
      99999999999999,
      999999999999999,
      9999999999999999,
      99999999999999999,
      999999999999999999,
      9999999999999999999ull,
  };
  constexpr uint64_t Cap = static_cast<uint64_t>(INT64_MAX);
  if (SignificantDigits <= 0 || SignificantDigits >= 19)
    return Cap;
  return DigitsMax[SignificantDigits];
}

inline uint64_t magnitude(int64_t V) {
  return V < 0 ? 0 - static_cast<uint64_t>(V) : static_cast<uint64_t>(V);
}

// mpfr_get_str digit count for a given binary precision: 3 digits per 10
// bits, plus the remainder.
inline size_t decimalDigitsFor(mpfr_prec_t Bits) {
  static constexpr int BitsToDigits[] = {0, 1, 1, 1, 1, 2, 2, 2, 3, 3};
  size_t Digits = static_cast<size_t>(Bits / 10) * 3 +
                  static_cast<size_t>(BitsToDigits[Bits % 10]);
  return Digits < 2 ? 2 : Digits;
}

} // namespace detail

class DFloat {
public:
  constexpr DFloat() = default;

  // Builds a value and minimizes it.
  constexpr DFloat(int32_t Exponent, int64_t Coefficient)
      : Exp(Exponent), Coeff(Coefficient) {
    minimizeInPlace();
  }

  // Stores the pair exactly as given. Callers own the invariants.
  static constexpr DFloat raw(int32_t Exponent, int64_t Coefficient) {
    DFloat D;
    D.Exp = Exponent;
    D.Coeff = Coefficient;
    return D;
  }

  static constexpr DFloat zero() { return raw(0, 0); }
  static constexpr DFloat negativeZero() {
    return raw(ExpSpecial, CoeffNegativeZero);
  }
  static constexpr DFloat infinity() { return raw(ExpSpecial, CoeffInfinity); }
  static constexpr DFloat negativeInfinity() {
    return raw(ExpSpecial, CoeffNegativeInfinity);
  }
  static constexpr DFloat quietNaN() { return raw(ExpSpecial, CoeffNaN); }
  static constexpr DFloat signalingNaN() {
    return raw(ExpSpecial, CoeffSignalingNaN);
  }

  constexpr int32_t exponent() const { return Exp; }
  constexpr int64_t coefficient() const { return Coeff; }

  constexpr bool isSpecial() const { return Exp == ExpSpecial; }
  // Positive or negative zero
  constexpr bool isZero() const { return Coeff == 0; }
  constexpr bool isNegativeZero() const { return *this == negativeZero(); }
  // Positive or negative infinity
  constexpr bool isInfinity() const {
    return isSpecial() && (Coeff & CoeffInfinity) != 0;
  }
  constexpr bool isNegativeInfinity() const {
    return *this == negativeInfinity();
  }
  // Quiet or signaling NaN
  constexpr bool isNaN() const {
    return isSpecial() && (Coeff & CoeffNaN) != 0;
  }
  constexpr bool isSignalingNaN() const { return *this == signalingNaN(); }

  friend constexpr bool operator==(const DFloat &, const DFloat &) = default;

  // --- Construction ---

  // Parses a decimal literal. Digits beyond the coefficient's capacity, or
  // beyond SignificantDigits when that is 1..19, are rounded away and
  // reported as Status::Rounded.
  template <RoundingPolicy R = rounding::Default>
  static Result<DFloat> fromString(std::string_view Text,
                                   int SignificantDigits = 0);

  // Goes through the shortest decimal string that round-trips Value, then
  // rounds to SignificantDigits (<= 0: keep them all).
  template <RoundingPolicy R = rounding::Default>
  static Result<DFloat> fromFloat64(double Value, int SignificantDigits = 0);

  template <RoundingPolicy R = rounding::Default>
  static Result<DFloat> fromUint64(uint64_t Value);

  static Result<DFloat> fromInt64(int64_t Value) { return {DFloat(0, Value)}; }

  template <RoundingPolicy R = rounding::Default>
  static Result<DFloat> fromBigInt(const BigInt &Value);

  template <RoundingPolicy R = rounding::Default>
  static Result<DFloat> fromBigDecimal(const BigDecimal &Value);

  template <RoundingPolicy R = rounding::Default>
  static Result<DFloat> fromBigFloat(const BigFloat &Value);

  // --- Conversion ---

  double toFloat64() const;
  std::string text(char Format = 'g') const {
    return toBigDecimal().text(Format);
  }
  Result<int64_t> toInt64() const;
  Result<uint64_t> toUint64() const;
  Result<BigInt> toBigInt() const;
  BigDecimal toBigDecimal() const;
  BigFloat toBigFloat(mpfr_prec_t Precision = DefaultBigFloatPrecision) const;

private:
  constexpr void minimizeInPlace() {
    if (Exp == ExpSpecial)
      return;
    if (Coeff == 0) {
      Exp = 0;
      return;
    }
    // Stops at the top of the exponent range rather than overflowing it.
    while (Coeff % 10 == 0 && Exp < DFloatLayout::max_exponent) {
      Coeff /= 10;
      ++Exp;
    }
  }

  template <RoundingPolicy R>
  static Result<DFloat> fromDigits(const detail::DecimalLiteral &Lit,
                                   int SignificantDigits);

  int32_t Exp = 0;
  int64_t Coeff = 0;
};

inline std::ostream &operator<<(std::ostream &Out, const DFloat &V) {
  return Out << V.text('g');
}

// ===================================================================
// Construction
// ===================================================================

template <RoundingPolicy R>
Result<DFloat> DFloat::fromDigits(const detail::DecimalLiteral &Lit,
                                  int SignificantDigits) {
  const uint64_t Limit = detail::coefficientLimit(SignificantDigits);
  uint64_t Coefficient = 0;
  int64_t Exponent = Lit.Exponent;
  DiscardedDigits Dropped;

  auto feed = [&](char C, bool Fractional) {
    int Digit = C - '0';
    if (!Dropped.Seen &&
        Coefficient <= (Limit - static_cast<uint64_t>(Digit)) / 10) {
      Coefficient = Coefficient * 10 + static_cast<uint64_t>(Digit);
      if (Fractional)
        --Exponent;
      return;
    }
    // Out of room: integer digits still scale the value
    Dropped.push(Digit);
    if (!Fractional)
      ++Exponent;
  };

  for (char C : Lit.Integer)
    feed(C, false);
  for (char C : Lit.Fraction)
    feed(C, true);

  bool Lost = roundCoefficient<R>(Coefficient, Dropped);
  if (Coefficient > static_cast<uint64_t>(INT64_MAX)) {
    // Rounding carried past the int64_t range; give up one more digit.
    DiscardedDigits Carry;
    Carry.push(static_cast<int>(Coefficient % 10));
    Coefficient /= 10;
    ++Exponent;
    roundCoefficient<R>(Coefficient, Carry);
  }

  if (Coefficient == 0)
    return {Lit.Negative ? negativeZero() : zero()};

  detail::minimize(Coefficient, Exponent);
  if (!detail::exponentInRange(Exponent))
    return {zero(), Status::ValueTooLarge};

  int64_t Signed = Lit.Negative ? -static_cast<int64_t>(Coefficient)
                                : static_cast<int64_t>(Coefficient);
  return {raw(static_cast<int32_t>(Exponent), Signed),
          Lost ? Status::Rounded : Status::Ok};
}

template <RoundingPolicy R>
Result<DFloat> DFloat::fromString(std::string_view Text,
                                  int SignificantDigits) {
  detail::DecimalLiteral Lit;
  Status S = detail::lexDecimalLiteral(Text, Lit);
  if (S != Status::Ok)
    return {zero(), S};

  switch (Lit.Kind) {
  case detail::LiteralKind::Infinity:
    return {Lit.Negative ? negativeInfinity() : infinity()};
  case detail::LiteralKind::NaN:
    return {quietNaN()};
  case detail::LiteralKind::SignalingNaN:
    return {signalingNaN()};
  case detail::LiteralKind::Number:
    break;
  }

  // No digits at all: the empty string
  if (Lit.Integer.empty() && Lit.Fraction.empty())
    return {zero()};

  return fromDigits<R>(Lit, SignificantDigits);
}

template <RoundingPolicy R>
Result<DFloat> DFloat::fromFloat64(double Value, int SignificantDigits) {
  uint64_t Bits;
  std::memcpy(&Bits, &Value, sizeof(double));

  if (Value == 0)
    return {std::signbit(Value) ? negativeZero() : zero()};
  if (std::isinf(Value))
    return {Value < 0 ? negativeInfinity() : infinity()};
  if (std::isnan(Value))
    return {(Bits & Float64QuietBit) != 0 ? quietNaN() : signalingNaN()};

  // Shortest representation that parses back to the same double.
  char Buf[32];
  auto [End, Ec] = std::to_chars(Buf, Buf + sizeof(Buf), Value);
  if (Ec != std::errc())
    return {zero(), Status::Malformed};
  return fromString<R>(std::string_view(Buf, static_cast<size_t>(End - Buf)),
                       SignificantDigits);
}

template <RoundingPolicy R>
Result<DFloat> DFloat::fromUint64(uint64_t Value) {
  if (Value <= static_cast<uint64_t>(INT64_MAX))
    return {DFloat(0, static_cast<int64_t>(Value))};

  // One digit always makes room: UINT64_MAX / 10 < INT64_MAX.
  DiscardedDigits Dropped;
  Dropped.push(static_cast<int>(Value % 10));
  Value /= 10;
  bool Lost = roundCoefficient<R>(Value, Dropped);
  return {DFloat(1, static_cast<int64_t>(Value)),
          Lost ? Status::Rounded : Status::Ok};
}

template <RoundingPolicy R>
Result<DFloat> DFloat::fromBigInt(const BigInt &Value) {
  if (Value.fitsInt64())
    return {DFloat(0, Value.toInt64())};

  BigInt Magnitude = Value;
  mpz_abs(Magnitude, Magnitude);
  return fromBigDecimal<R>(
      BigDecimal(std::move(Magnitude), 0, Value.sign() < 0));
}

template <RoundingPolicy R>
Result<DFloat> DFloat::fromBigDecimal(const BigDecimal &Value) {
  switch (Value.Form) {
  case DecimalForm::Infinite:
    return {Value.Negative ? negativeInfinity() : infinity()};
  case DecimalForm::NaN:
    return {quietNaN()};
  case DecimalForm::NaNSignaling:
    return {signalingNaN()};
  case DecimalForm::Finite:
    break;
  }

  if (Value.isZero())
    return {Value.Negative ? negativeZero() : zero()};

  if (Value.Coefficient.bitLength() <= 63) {
    uint64_t Coefficient = Value.Coefficient.magnitudeUint64();
    int64_t Exponent = Value.Exponent;
    detail::minimize(Coefficient, Exponent);
    if (!detail::exponentInRange(Exponent))
      return {zero(), Status::ValueTooLarge};
    int64_t Signed = Value.Negative ? -static_cast<int64_t>(Coefficient)
                                    : static_cast<int64_t>(Coefficient);
    return {raw(static_cast<int32_t>(Exponent), Signed)};
  }

  // Too many digits: round through the canonical text form.
  return fromString<R>(Value.text('g'));
}

template <RoundingPolicy R>
Result<DFloat> DFloat::fromBigFloat(const BigFloat &Value) {
  if (Value.isNan())
    return {quietNaN()};
  if (Value.isInf())
    return {Value.isNegative() ? negativeInfinity() : infinity()};
  if (Value.isZero())
    return {Value.isNegative() ? negativeZero() : zero()};

  size_t Digits = detail::decimalDigitsFor(Value.precision());
  mpfr_exp_t Exp10 = 0;
  char *Str = mpfr_get_str(nullptr, &Exp10, 10, Digits, Value, MPFR_RNDN);
  if (Str == nullptr)
    return {zero(), Status::Malformed};

  // Str holds [-]d1d2...dn meaning 0.d1d2...dn * 10^Exp10
  std::string Text(Str);
  mpfr_free_str(Str);
  Text += 'e';
  Text += std::to_string(static_cast<long long>(Exp10) -
                         static_cast<long long>(Digits));
  return fromString<R>(Text);
}

// ===================================================================
// Conversion
// ===================================================================

inline double DFloat::toFloat64() const {
  auto fromBits = [](uint64_t Bits) {
    double D;
    std::memcpy(&D, &Bits, sizeof(double));
    return D;
  };

  if (isSpecial()) {
    switch (Coeff) {
    case CoeffNegativeZero:
      return -0.0;
    case CoeffInfinity:
      return std::numeric_limits<double>::infinity();
    case CoeffNegativeInfinity:
      return -std::numeric_limits<double>::infinity();
    case CoeffNaN:
      return fromBits(Float64QuietNaNBits);
    case CoeffSignalingNaN:
      return fromBits(Float64SignalingNaNBits);
    default:
      detail::illegalSpecial(Coeff);
    }
  }
  if (Coeff == 0)
    return 0.0;

  std::string Text = text('g');
  double Parsed = 0;
  auto Ec = std::from_chars(Text.data(), Text.data() + Text.size(), Parsed).ec;
  if (Ec == std::errc::result_out_of_range) {
    // Only a positive exponent can overflow; anything else underflowed.
    bool Negative = Coeff < 0;
    if (Exp > 0)
      return Negative ? -std::numeric_limits<double>::infinity()
                      : std::numeric_limits<double>::infinity();
    return Negative ? -0.0 : 0.0;
  }
  return Parsed;
}

inline Result<int64_t> DFloat::toInt64() const {
  if (isSpecial())
    return {0, isNegativeZero() ? Status::Ok : Status::NotFinite};
  if (Coeff == 0)
    return {0};
  if (Exp < 0)
    return {0, Status::NotWholeNumber};

  int64_t Scaled = Coeff;
  for (int32_t I = 0; I < Exp; ++I) {
    if (Scaled > INT64_MAX / 10 || Scaled < INT64_MIN / 10)
      return {0, Status::OutOfRange};
    Scaled *= 10;
  }
  return {Scaled};
}

inline Result<uint64_t> DFloat::toUint64() const {
  if (isSpecial())
    return {0, isNegativeZero() ? Status::Ok : Status::NotFinite};
  if (Coeff == 0)
    return {0};
  if (Exp < 0)
    return {0, Status::NotWholeNumber};
  if (Coeff < 0)
    return {0, Status::OutOfRange};

  uint64_t Scaled = static_cast<uint64_t>(Coeff);
  for (int32_t I = 0; I < Exp; ++I) {
    if (Scaled > UINT64_MAX / 10)
      return {0, Status::OutOfRange};
    Scaled *= 10;
  }
  return {Scaled};
}

inline Result<BigInt> DFloat::toBigInt() const {
  if (isSpecial())
    return {BigInt(), isNegativeZero() ? Status::Ok : Status::NotFinite};
  if (Exp < 0)
    return {BigInt(), Status::NotWholeNumber};

  BigInt Scaled = BigInt::pow10(static_cast<unsigned long>(Exp));
  BigInt Factor = BigInt::fromInt64(Coeff);
  mpz_mul(Scaled, Scaled, Factor);
  return {std::move(Scaled)};
}

inline BigDecimal DFloat::toBigDecimal() const {
  if (isSpecial()) {
    switch (Coeff) {
    case CoeffNegativeZero:
      return BigDecimal(BigInt(), 0, true);
    case CoeffInfinity:
      return BigDecimal::special(DecimalForm::Infinite);
    case CoeffNegativeInfinity:
      return BigDecimal::special(DecimalForm::Infinite, true);
    case CoeffNaN:
      return BigDecimal::special(DecimalForm::NaN);
    case CoeffSignalingNaN:
      return BigDecimal::special(DecimalForm::NaNSignaling);
    default:
      detail::illegalSpecial(Coeff);
    }
  }
  return BigDecimal(BigInt(detail::magnitude(Coeff)), Exp, Coeff < 0);
}

inline BigFloat DFloat::toBigFloat(mpfr_prec_t Precision) const {
  BigFloat Out(Precision);
  if (isSpecial()) {
    switch (Coeff) {
    case CoeffNegativeZero:
      mpfr_set_zero(Out, -1);
      return Out;
    case CoeffInfinity:
      mpfr_set_inf(Out, 1);
      return Out;
    case CoeffNegativeInfinity:
      mpfr_set_inf(Out, -1);
      return Out;
    case CoeffNaN:
    case CoeffSignalingNaN:
      mpfr_set_nan(Out);
      return Out;
    default:
      detail::illegalSpecial(Coeff);
    }
  }
  if (Coeff == 0) {
    mpfr_set_zero(Out, 1);
    return Out;
  }
  // Correctly rounded from the exact decimal text
  std::string Text = text('e');
  if (mpfr_set_str(Out, Text.c_str(), 10, MPFR_RNDN) != 0)
    mpfr_set_nan(Out);
  return Out;
}

} // namespace compactfloat

#endif // COMPACTFLOAT_CORE_DFLOAT_HPP
