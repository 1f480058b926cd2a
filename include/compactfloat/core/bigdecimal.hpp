#ifndef COMPACTFLOAT_CORE_BIGDECIMAL_HPP
#define COMPACTFLOAT_CORE_BIGDECIMAL_HPP

// BigDecimal: arbitrary-precision decimal, the interchange type for values
// whose coefficient does not fit a DFloat.
//
// value = (-1)^Negative * Coefficient * 10^Exponent
//
// Coefficient is a non-negative magnitude. Trailing zeros are significant
// and kept ("1.0" is {10, -1}); use compare()/equalValue() for numeric
// equality.

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "compactfloat/core/bigint.hpp"
#include "compactfloat/core/layout.hpp"
#include "compactfloat/core/literal.hpp"
#include "compactfloat/core/status.hpp"

namespace compactfloat {

enum class DecimalForm { Finite, Infinite, NaN, NaNSignaling };

struct BigDecimal {
  DecimalForm Form = DecimalForm::Finite;
  bool Negative = false;
  int32_t Exponent = 0;
  BigInt Coefficient;

  BigDecimal() = default;

  BigDecimal(BigInt Coeff, int32_t Exp, bool Neg = false)
      : Negative(Neg), Exponent(Exp), Coefficient(std::move(Coeff)) {}

  static BigDecimal special(DecimalForm F, bool Neg = false) {
    BigDecimal D;
    D.Form = F;
    D.Negative = Neg;
    return D;
  }

  bool isFinite() const { return Form == DecimalForm::Finite; }
  bool isZero() const { return isFinite() && Coefficient.isZero(); }

  static Result<BigDecimal> fromString(std::string_view Text);

  // Formats with one of e, E, f, g, G. Any other format character c
  // yields "%c".
  std::string text(char Format = 'g') const;
};

inline Result<BigDecimal> BigDecimal::fromString(std::string_view Text) {
  detail::DecimalLiteral Lit;
  Status S = detail::lexDecimalLiteral(Text, Lit);
  if (S != Status::Ok)
    return {{}, S};

  switch (Lit.Kind) {
  case detail::LiteralKind::Infinity:
    return {special(DecimalForm::Infinite, Lit.Negative)};
  case detail::LiteralKind::NaN:
    return {special(DecimalForm::NaN)};
  case detail::LiteralKind::SignalingNaN:
    return {special(DecimalForm::NaNSignaling)};
  case detail::LiteralKind::Number:
    break;
  }

  BigDecimal D;
  D.Negative = Lit.Negative;
  if (Lit.Integer.empty() && Lit.Fraction.empty())
    return {std::move(D)};

  int64_t Exp = Lit.Exponent - static_cast<int64_t>(Lit.Fraction.size());
  if (Exp < -DFloatLayout::max_exponent || Exp > DFloatLayout::max_exponent)
    return {{}, Status::ValueTooLarge};

  std::string Digits;
  Digits.reserve(Lit.Integer.size() + Lit.Fraction.size());
  Digits.append(Lit.Integer);
  Digits.append(Lit.Fraction);
  if (!BigInt::parseDigits(Digits, D.Coefficient))
    return {{}, Status::Malformed};
  D.Exponent = static_cast<int32_t>(Exp);
  return {std::move(D)};
}

namespace detail {

// d.ddddde+n
inline void appendScientific(std::string &Out, char Marker,
                             const std::string &Digits, int32_t Exponent) {
  int64_t Adjusted =
      int64_t{Exponent} + static_cast<int64_t>(Digits.size()) - 1;
  Out += Digits[0];
  if (Digits.size() > 1) {
    Out += '.';
    Out.append(Digits, 1, std::string::npos);
  }
  Out += Marker;
  Out += Adjusted < 0 ? '-' : '+';
  Out += std::to_string(Adjusted < 0 ? -Adjusted : Adjusted);
}

// ddddd.ddddd
inline void appendPlain(std::string &Out, const std::string &Digits,
                        int32_t Exponent) {
  if (Exponent >= 0) {
    Out += Digits;
    Out.append(static_cast<size_t>(Exponent), '0');
    return;
  }
  int64_t Left = -int64_t{Exponent} - static_cast<int64_t>(Digits.size());
  if (Left >= 0) {
    Out += "0.";
    Out.append(static_cast<size_t>(Left), '0');
    Out += Digits;
  } else {
    size_t Point = static_cast<size_t>(-Left);
    Out.append(Digits, 0, Point);
    Out += '.';
    Out.append(Digits, Point, std::string::npos);
  }
}

} // namespace detail

inline std::string BigDecimal::text(char Format) const {
  switch (Format) {
  case 'e': case 'E': case 'f': case 'g': case 'G':
    break;
  default:
    return std::string{'%', Format};
  }

  std::string Out;
  if (Negative)
    Out += '-';

  switch (Form) {
  case DecimalForm::Infinite:
    return Out + "Infinity";
  case DecimalForm::NaN:
    return Out + "NaN";
  case DecimalForm::NaNSignaling:
    return Out + "sNaN";
  case DecimalForm::Finite:
    break;
  }

  if (Coefficient.isZero() && Exponent == 0)
    return Out + "0";

  std::string Digits = Coefficient.toString();
  switch (Format) {
  case 'e':
  case 'E':
    detail::appendScientific(Out, Format, Digits, Exponent);
    break;
  case 'f':
    detail::appendPlain(Out, Digits, Exponent);
    break;
  default: {
    // General Decimal Arithmetic to-scientific-string rule
    int64_t Adjusted =
        int64_t{Exponent} + static_cast<int64_t>(Digits.size()) - 1;
    if (Exponent <= 0 && Adjusted >= -6)
      detail::appendPlain(Out, Digits, Exponent);
    else
      detail::appendScientific(Out, Format == 'g' ? 'e' : 'E', Digits,
                               Exponent);
    break;
  }
  }
  return Out;
}

// Numeric comparison of two finite or infinite values: -1, 0 or 1.
// Signed zeros compare equal. Not meaningful for NaN.
inline int compare(const BigDecimal &A, const BigDecimal &B) {
  auto signum = [](const BigDecimal &D) {
    if (D.isZero())
      return 0;
    return D.Negative ? -1 : 1;
  };
  int SA = signum(A);
  int SB = signum(B);
  if (SA != SB)
    return SA < SB ? -1 : 1;
  if (SA == 0)
    return 0;

  int Mag;
  bool InfA = A.Form == DecimalForm::Infinite;
  bool InfB = B.Form == DecimalForm::Infinite;
  if (InfA || InfB) {
    Mag = InfA == InfB ? 0 : (InfA ? 1 : -1);
  } else {
    std::string DigitsA = A.Coefficient.toString();
    std::string DigitsB = B.Coefficient.toString();
    int64_t AdjA = int64_t{A.Exponent} + static_cast<int64_t>(DigitsA.size());
    int64_t AdjB = int64_t{B.Exponent} + static_cast<int64_t>(DigitsB.size());
    if (AdjA != AdjB) {
      Mag = AdjA < AdjB ? -1 : 1;
    } else {
      // Same magnitude class: the exponent gap is bounded by the digit
      // count difference, so scaling stays small.
      BigInt CA = A.Coefficient;
      BigInt CB = B.Coefficient;
      if (A.Exponent > B.Exponent) {
        BigInt Scale = BigInt::pow10(
            static_cast<unsigned long>(int64_t{A.Exponent} - B.Exponent));
        mpz_mul(CA, CA, Scale);
      } else if (B.Exponent > A.Exponent) {
        BigInt Scale = BigInt::pow10(
            static_cast<unsigned long>(int64_t{B.Exponent} - A.Exponent));
        mpz_mul(CB, CB, Scale);
      }
      int C = CA.compare(CB);
      Mag = C < 0 ? -1 : (C > 0 ? 1 : 0);
    }
  }
  return SA < 0 ? -Mag : Mag;
}

// Numeric equality for any form. NaNs equal NaNs of the same kind.
inline bool equalValue(const BigDecimal &A, const BigDecimal &B) {
  if (A.Form == DecimalForm::NaN || A.Form == DecimalForm::NaNSignaling ||
      B.Form == DecimalForm::NaN || B.Form == DecimalForm::NaNSignaling)
    return A.Form == B.Form;
  if (A.isZero() && B.isZero())
    return A.Negative == B.Negative;
  return compare(A, B) == 0;
}

} // namespace compactfloat

#endif // COMPACTFLOAT_CORE_BIGDECIMAL_HPP
