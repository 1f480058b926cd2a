#ifndef COMPACTFLOAT_CORE_LAYOUT_HPP
#define COMPACTFLOAT_CORE_LAYOUT_HPP

// Wire geometry of the compact float format.
//
// A normal value is two ULEB128 fields:
//
//   exponent field:     [ |exponent| ][ exponent sign ][ coefficient sign ]
//                         bits 2..       bit 1            bit 0
//   coefficient field:  |coefficient|
//
// Special values use a first field that no normal value can produce: a
// one-byte field 2 or 3 for the zeros, and a two-byte (non-minimal) field
// 0..3 for the NaNs and infinities.

#include <cstdint>

namespace compactfloat {

// An exponent of ExpSpecial marks a special value; the coefficient is then
// one of the Coeff* tags below, not a number.
inline constexpr int32_t ExpSpecial = INT32_MIN;

inline constexpr int64_t CoeffNegativeZero = 0;
inline constexpr int64_t CoeffInfinity = 1;
inline constexpr int64_t CoeffNaN = 2;
inline constexpr int64_t CoeffNegativeInfinity = 5;
inline constexpr int64_t CoeffSignalingNaN = 6;

template <int ExponentBits, int CoefficientBits, int GroupBits>
struct WireLayout {
  static constexpr int coefficient_sign_offset = 0;
  static constexpr int exponent_sign_offset = 1;
  static constexpr int exponent_offset = 2;
  static constexpr int exponent_bits = ExponentBits; // magnitude only
  static constexpr int coefficient_bits = CoefficientBits;
  static constexpr int group_bits = GroupBits;

  static constexpr int exponent_field_bits = exponent_offset + ExponentBits;
  static constexpr uint64_t max_exponent_field =
      (uint64_t{1} << exponent_field_bits) - 1;
  static constexpr int32_t max_exponent =
      static_cast<int32_t>((uint64_t{1} << ExponentBits) - 1);

  static constexpr int groupsFor(int Bits) {
    return Bits <= 0 ? 1 : (Bits + GroupBits - 1) / GroupBits;
  }

  static constexpr int max_exponent_field_length =
      groupsFor(exponent_field_bits);
  static constexpr int max_coefficient_length = groupsFor(CoefficientBits);
  static constexpr int max_encode_length =
      max_exponent_field_length + max_coefficient_length;

  static_assert(ExponentBits >= 1 && ExponentBits <= 61,
                "exponent field must fit in 64 bits");
  static_assert(CoefficientBits >= 1, "coefficient needs at least 1 bit");
  static_assert(GroupBits >= 1 && GroupBits <= 7,
                "a group shares its byte with the continuation bit");
};

// DFloat: 31-bit exponent magnitude (ExpSpecial excluded), coefficient
// magnitude up to 2^63, 7 value bits per byte.
using DFloatLayout = WireLayout<31, 64, 7>;

// One-byte special values.
inline constexpr uint8_t EncodedZero = 0x02;
inline constexpr uint8_t EncodedNegativeZero = 0x03;

// Two-byte special values: (0x80 | code), 0x00.
inline constexpr uint8_t ContinuationBit = 0x80;
inline constexpr uint8_t EncodedQuietNaN = 0x00;
inline constexpr uint8_t EncodedSignalingNaN = 0x01;
inline constexpr uint8_t EncodedInfinity = 0x02;
inline constexpr uint8_t EncodedNegativeInfinity = 0x03;

} // namespace compactfloat

#endif // COMPACTFLOAT_CORE_LAYOUT_HPP
