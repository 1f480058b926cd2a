#ifndef COMPACTFLOAT_CORE_LITERAL_HPP
#define COMPACTFLOAT_CORE_LITERAL_HPP

// Lexer for decimal literals, shared by DFloat and BigDecimal.
//
//   literal  := ""                       (zero)
//             | sign? digits             (at least one digit overall)
//             | sign? ("inf" | "infinity")
//             | ("nan" | "snan")         (no sign allowed)
//   digits   := [0-9]* ("." [0-9]*)? (("e" | "E") sign? [0-9]+)?
//
// Keywords are case-insensitive. The lexer only splits the text; rounding
// and range checks belong to the caller.

#include <cstdint>
#include <string_view>

#include "compactfloat/core/status.hpp"

namespace compactfloat::detail {

enum class LiteralKind { Number, Infinity, NaN, SignalingNaN };

struct DecimalLiteral {
  LiteralKind Kind = LiteralKind::Number;
  bool Negative = false;
  std::string_view Integer;  // digits before the point
  std::string_view Fraction; // digits after the point
  int64_t Exponent = 0;      // value of the e/E part
};

// Literal exponents beyond this are rejected outright. It leaves room for
// the digit count adjustments callers make before their own range check.
inline constexpr int64_t MaxLiteralExponent = int64_t{1} << 40;

inline bool isDigit(char C) { return C >= '0' && C <= '9'; }

inline bool equalsIgnoreCase(std::string_view A, std::string_view B) {
  if (A.size() != B.size())
    return false;
  for (size_t I = 0; I < A.size(); ++I) {
    char C = A[I];
    if (C >= 'A' && C <= 'Z')
      C = static_cast<char>(C - 'A' + 'a');
    if (C != B[I])
      return false;
  }
  return true;
}

inline Status lexDecimalLiteral(std::string_view Text, DecimalLiteral &Out) {
  Out = DecimalLiteral{};
  if (Text.empty())
    return Status::Ok;

  bool HasSign = false;
  if (Text[0] == '-' || Text[0] == '+') {
    Out.Negative = Text[0] == '-';
    HasSign = true;
    Text.remove_prefix(1);
  }
  if (Text.empty())
    return Status::Malformed;

  if (!isDigit(Text[0]) && Text[0] != '.') {
    if (equalsIgnoreCase(Text, "inf") || equalsIgnoreCase(Text, "infinity")) {
      Out.Kind = LiteralKind::Infinity;
      return Status::Ok;
    }
    // NaN has no sign
    if (equalsIgnoreCase(Text, "nan")) {
      Out.Kind = LiteralKind::NaN;
      return HasSign ? Status::Malformed : Status::Ok;
    }
    if (equalsIgnoreCase(Text, "snan")) {
      Out.Kind = LiteralKind::SignalingNaN;
      return HasSign ? Status::Malformed : Status::Ok;
    }
    return Status::Malformed;
  }

  size_t Pos = 0;
  while (Pos < Text.size() && isDigit(Text[Pos]))
    ++Pos;
  Out.Integer = Text.substr(0, Pos);

  if (Pos < Text.size() && Text[Pos] == '.') {
    size_t Start = ++Pos;
    while (Pos < Text.size() && isDigit(Text[Pos]))
      ++Pos;
    Out.Fraction = Text.substr(Start, Pos - Start);
  }

  if (Out.Integer.empty() && Out.Fraction.empty())
    return Status::Malformed;

  if (Pos < Text.size() && (Text[Pos] == 'e' || Text[Pos] == 'E')) {
    ++Pos;
    bool ExpNegative = false;
    if (Pos < Text.size() && (Text[Pos] == '-' || Text[Pos] == '+')) {
      ExpNegative = Text[Pos] == '-';
      ++Pos;
    }
    if (Pos >= Text.size())
      return Status::Malformed;
    int64_t Exp = 0;
    for (; Pos < Text.size(); ++Pos) {
      if (!isDigit(Text[Pos]))
        return Status::Malformed;
      Exp = Exp * 10 + (Text[Pos] - '0');
      if (Exp > MaxLiteralExponent)
        return Status::ValueTooLarge;
    }
    Out.Exponent = ExpNegative ? -Exp : Exp;
  }

  if (Pos != Text.size())
    return Status::Malformed;
  return Status::Ok;
}

} // namespace compactfloat::detail

#endif // COMPACTFLOAT_CORE_LITERAL_HPP
