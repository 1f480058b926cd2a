#ifndef COMPACTFLOAT_CORE_CODEC_HPP
#define COMPACTFLOAT_CORE_CODEC_HPP

// Compact float wire codec.
//
// encode() writes a DFloat or a BigDecimal as the special byte sequences or
// as the two ULEB128 fields described in layout.hpp. decode() reads one
// value back and reports how many bytes it consumed; bytes after the value
// are left alone.
//
// Coefficients that do not fit a DFloat (more than 64 bits, or bit 63 set)
// decode to a BigDecimal instead.

#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <variant>
#include <vector>

#include <gmp.h>

#include "compactfloat/core/bigdecimal.hpp"
#include "compactfloat/core/bigint.hpp"
#include "compactfloat/core/dfloat.hpp"
#include "compactfloat/core/layout.hpp"
#include "compactfloat/core/status.hpp"
#include "compactfloat/core/stream.hpp"
#include "compactfloat/core/uleb128.hpp"

namespace compactfloat {

namespace detail {

inline uint64_t exponentField(int64_t Exponent, bool NegativeCoefficient) {
  uint64_t Field = magnitude(Exponent) << DFloatLayout::exponent_offset;
  if (Exponent < 0)
    Field |= uint64_t{1} << DFloatLayout::exponent_sign_offset;
  if (NegativeCoefficient)
    Field |= uint64_t{1} << DFloatLayout::coefficient_sign_offset;
  return Field;
}

// The exponent field holds a 31-bit magnitude; INT32_MIN has no encoding.
inline bool encodable(const BigDecimal &V) {
  return !V.isFinite() || V.isZero() ||
         magnitude(V.Exponent) <=
             static_cast<uint64_t>(DFloatLayout::max_exponent);
}

inline size_t writeTwoByteSpecial(uint8_t Code, uint8_t *Dst) {
  Dst[0] = ContinuationBit | Code;
  Dst[1] = 0;
  return 2;
}

} // namespace detail

// Worst case for any DFloat.
constexpr size_t maxEncodeLength() { return DFloatLayout::max_encode_length; }

// Upper bound for V, cheap enough to presize a buffer with.
inline size_t maxEncodeLength(const BigDecimal &V) {
  size_t Bits = V.Coefficient.limbCount() * GMP_NUMB_BITS;
  return Bits / uleb128::GroupBits + 1 +
         DFloatLayout::max_exponent_field_length;
}

inline size_t encodedLength(const DFloat &V) {
  if (V.isSpecial())
    return V.coefficient() == CoeffNegativeZero ? 1 : 2;
  if (V.isZero())
    return 1;
  int64_t Coefficient = V.coefficient();
  return uleb128::encodedLength(
             detail::exponentField(V.exponent(), Coefficient < 0)) +
         uleb128::encodedLength(detail::magnitude(Coefficient));
}

inline size_t encodedLength(const BigDecimal &V) {
  if (V.Form != DecimalForm::Finite)
    return 2;
  if (V.isZero())
    return 1;
  return uleb128::encodedLength(detail::exponentField(V.Exponent, V.Negative)) +
         uleb128::encodedLength(V.Coefficient);
}

// Dst must hold encodedLength(V) bytes.
inline size_t encodeUnchecked(const DFloat &V, uint8_t *Dst) {
  if (V.isSpecial()) {
    switch (V.coefficient()) {
    case CoeffNegativeZero:
      Dst[0] = EncodedNegativeZero;
      return 1;
    case CoeffNaN:
      return detail::writeTwoByteSpecial(EncodedQuietNaN, Dst);
    case CoeffSignalingNaN:
      return detail::writeTwoByteSpecial(EncodedSignalingNaN, Dst);
    case CoeffInfinity:
      return detail::writeTwoByteSpecial(EncodedInfinity, Dst);
    case CoeffNegativeInfinity:
      return detail::writeTwoByteSpecial(EncodedNegativeInfinity, Dst);
    default:
      detail::illegalSpecial(V.coefficient());
    }
  }
  if (V.isZero()) {
    Dst[0] = EncodedZero;
    return 1;
  }

  int64_t Coefficient = V.coefficient();
  size_t N = uleb128::encodeUnchecked(
      detail::exponentField(V.exponent(), Coefficient < 0), Dst);
  return N + uleb128::encodeUnchecked(detail::magnitude(Coefficient), Dst + N);
}

// Dst must hold encodedLength(V) bytes, and V.Exponent must be within
// +/-DFloatLayout::max_exponent.
inline size_t encodeUnchecked(const BigDecimal &V, uint8_t *Dst) {
  switch (V.Form) {
  case DecimalForm::Infinite:
    return detail::writeTwoByteSpecial(
        V.Negative ? EncodedNegativeInfinity : EncodedInfinity, Dst);
  case DecimalForm::NaN:
    return detail::writeTwoByteSpecial(EncodedQuietNaN, Dst);
  case DecimalForm::NaNSignaling:
    return detail::writeTwoByteSpecial(EncodedSignalingNaN, Dst);
  case DecimalForm::Finite:
    break;
  }
  if (V.isZero()) {
    Dst[0] = V.Negative ? EncodedNegativeZero : EncodedZero;
    return 1;
  }

  size_t N = uleb128::encodeUnchecked(
      detail::exponentField(V.Exponent, V.Negative), Dst);
  return N + uleb128::encodeUnchecked(V.Coefficient, Dst + N);
}

// Fixed buffer. On BufferTooSmall nothing is written and Value holds the
// length that would have been needed.
inline Result<size_t> encode(const DFloat &V, std::span<uint8_t> Dst) {
  size_t Needed = encodedLength(V);
  if (Dst.size() < Needed)
    return {Needed, Status::BufferTooSmall};
  return {encodeUnchecked(V, Dst.data())};
}

inline Result<size_t> encode(const BigDecimal &V, std::span<uint8_t> Dst) {
  if (!detail::encodable(V))
    return {0, Status::ValueTooLarge};
  size_t Needed = encodedLength(V);
  if (Dst.size() < Needed)
    return {Needed, Status::BufferTooSmall};
  return {encodeUnchecked(V, Dst.data())};
}

template <ByteSink S> Result<size_t> encode(const DFloat &V, S &Sink) {
  uint8_t Buf[DFloatLayout::max_encode_length];
  size_t N = encodeUnchecked(V, Buf);
  if (!Sink.write(Buf, N))
    return {0, Status::IoError};
  return {N};
}

template <ByteSink S> Result<size_t> encode(const BigDecimal &V, S &Sink) {
  if (!detail::encodable(V))
    return {0, Status::ValueTooLarge};
  std::vector<uint8_t> Buf(encodedLength(V));
  size_t N = encodeUnchecked(V, Buf.data());
  if (!Sink.write(Buf.data(), N))
    return {0, Status::IoError};
  return {N};
}

// Appends to Out; growable destinations cannot run out of room.
inline void append(const DFloat &V, std::vector<uint8_t> &Out) {
  size_t Start = Out.size();
  Out.resize(Start + encodedLength(V));
  encodeUnchecked(V, Out.data() + Start);
}

// Leaves Out untouched on ValueTooLarge.
inline Status append(const BigDecimal &V, std::vector<uint8_t> &Out) {
  if (!detail::encodable(V))
    return Status::ValueTooLarge;
  size_t Start = Out.size();
  Out.resize(Start + encodedLength(V));
  encodeUnchecked(V, Out.data() + Start);
  return Status::Ok;
}

// Exactly one alternative of Value is meaningful when ok().
struct DecodeResult {
  std::variant<DFloat, BigDecimal> Value;
  size_t Bytes = 0;
  Status Code = Status::Ok;

  bool ok() const { return Code == Status::Ok; }
  bool isBig() const { return std::holds_alternative<BigDecimal>(Value); }
  const DFloat &dfloat() const { return std::get<DFloat>(Value); }
  const BigDecimal &bigDecimal() const { return std::get<BigDecimal>(Value); }
};

template <ByteSource S> DecodeResult decode(S &Source) {
  DecodeResult R;

  uleb128::Decoded Field = uleb128::decode(Source);
  R.Bytes = Field.Bytes;
  if (Field.Code != Status::Ok) {
    R.Code = Field.Code;
    return R;
  }
  if (Field.isBig() || Field.Value > DFloatLayout::max_exponent_field) {
    R.Code = Status::ValueTooLarge;
    return R;
  }

  // No normal value has a one-byte field of 2 or 3, and no minimal encoding
  // spends two bytes on 0..3.
  if (Field.Bytes == 1 &&
      (Field.Value == EncodedZero || Field.Value == EncodedNegativeZero)) {
    R.Value = Field.Value == EncodedZero ? DFloat::zero()
                                         : DFloat::negativeZero();
    return R;
  }
  if (Field.Bytes == 2 && Field.Value <= EncodedNegativeInfinity) {
    switch (Field.Value) {
    case EncodedQuietNaN:
      R.Value = DFloat::quietNaN();
      break;
    case EncodedSignalingNaN:
      R.Value = DFloat::signalingNaN();
      break;
    case EncodedInfinity:
      R.Value = DFloat::infinity();
      break;
    default:
      R.Value = DFloat::negativeInfinity();
      break;
    }
    return R;
  }

  bool NegativeCoefficient =
      (Field.Value >> DFloatLayout::coefficient_sign_offset) & 1;
  bool NegativeExponent =
      (Field.Value >> DFloatLayout::exponent_sign_offset) & 1;
  int64_t Exponent =
      static_cast<int64_t>(Field.Value >> DFloatLayout::exponent_offset);
  if (NegativeExponent)
    Exponent = -Exponent;

  uleb128::Decoded Coefficient = uleb128::decode(Source);
  R.Bytes += Coefficient.Bytes;
  if (Coefficient.Code != Status::Ok) {
    R.Code = Coefficient.Code;
    return R;
  }

  if (Coefficient.isBig() ||
      Coefficient.Value > static_cast<uint64_t>(INT64_MAX)) {
    BigInt Magnitude = Coefficient.isBig() ? std::move(*Coefficient.Big)
                                           : BigInt(Coefficient.Value);
    R.Value = BigDecimal(std::move(Magnitude), static_cast<int32_t>(Exponent),
                         NegativeCoefficient);
    return R;
  }

  if (Coefficient.Value == 0) {
    R.Value = NegativeCoefficient ? DFloat::negativeZero() : DFloat::zero();
    return R;
  }

  int64_t Signed = static_cast<int64_t>(Coefficient.Value);
  R.Value = DFloat::raw(static_cast<int32_t>(Exponent),
                        NegativeCoefficient ? -Signed : Signed);
  return R;
}

inline DecodeResult decode(std::span<const uint8_t> Bytes) {
  BufferSource Source(Bytes);
  return decode(Source);
}

} // namespace compactfloat

#endif // COMPACTFLOAT_CORE_CODEC_HPP
