#ifndef COMPACTFLOAT_CORE_ULEB128_HPP
#define COMPACTFLOAT_CORE_ULEB128_HPP

// Unsigned LEB128: 7 value bits per byte, least significant group first,
// high bit set on every byte but the last.
//
// Encoding is always minimal. Decoding accepts redundant high zero groups
// (the compact float special values depend on that) and switches to a
// BigInt once the magnitude needs more than 64 bits.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include <gmp.h>

#include "compactfloat/core/bigint.hpp"
#include "compactfloat/core/status.hpp"
#include "compactfloat/core/stream.hpp"

namespace compactfloat::uleb128 {

inline constexpr uint8_t GroupMask = 0x7F;
inline constexpr uint8_t MoreBit = 0x80;
inline constexpr int GroupBits = 7;

inline size_t encodedLength(uint64_t V) {
  size_t N = 1;
  while (V >>= GroupBits)
    ++N;
  return N;
}

inline size_t encodedLength(const BigInt &V) {
  size_t Bits = V.bitLength();
  return Bits == 0 ? 1 : (Bits + GroupBits - 1) / GroupBits;
}

// Dst must hold encodedLength(V) bytes.
inline size_t encodeUnchecked(uint64_t V, uint8_t *Dst) {
  size_t N = 0;
  while (V > GroupMask) {
    Dst[N++] = static_cast<uint8_t>(V & GroupMask) | MoreBit;
    V >>= GroupBits;
  }
  Dst[N++] = static_cast<uint8_t>(V);
  return N;
}

// Dst must hold encodedLength(V) bytes. Only the magnitude is encoded.
inline size_t encodeUnchecked(const BigInt &V, uint8_t *Dst) {
  if (V.isZero()) {
    Dst[0] = 0;
    return 1;
  }
  // One byte per word with one nail bit: GMP lays out the 7-bit groups.
  size_t Count = 0;
  mpz_export(Dst, &Count, -1, 1, 0, 1, V.get());
  for (size_t I = 0; I + 1 < Count; ++I)
    Dst[I] |= MoreBit;
  return Count;
}

template <typename T>
Result<size_t> encode(const T &V, std::span<uint8_t> Dst) {
  size_t Needed = encodedLength(V);
  if (Dst.size() < Needed)
    return {Needed, Status::BufferTooSmall};
  return {encodeUnchecked(V, Dst.data())};
}

inline void append(uint64_t V, std::vector<uint8_t> &Out) {
  size_t Start = Out.size();
  Out.resize(Start + encodedLength(V));
  encodeUnchecked(V, Out.data() + Start);
}

inline void append(const BigInt &V, std::vector<uint8_t> &Out) {
  size_t Start = Out.size();
  Out.resize(Start + encodedLength(V));
  encodeUnchecked(V, Out.data() + Start);
}

struct Decoded {
  uint64_t Value = 0;
  std::optional<BigInt> Big; // set iff the magnitude needs more than 64 bits
  size_t Bytes = 0;
  Status Code = Status::Ok;

  bool isBig() const { return Big.has_value(); }
};

template <ByteSource S> Decoded decode(S &Source) {
  Decoded R;
  std::vector<uint8_t> Groups; // filled only once the value outgrows 64 bits
  int Shift = 0;
  uint8_t Byte = 0;

  for (;;) {
    if (!Source.next(Byte)) {
      R.Code = Status::Incomplete;
      R.Big.reset();
      R.Value = 0;
      return R;
    }
    ++R.Bytes;
    uint8_t Group = Byte & GroupMask;

    if (Groups.empty()) {
      bool Fits = Shift <= 64 - GroupBits ||
                  (Shift < 64 && (Group >> (64 - Shift)) == 0) ||
                  Group == 0;
      if (Fits) {
        if (Shift < 64)
          R.Value |= uint64_t{Group} << Shift;
      } else {
        // Replay the groups seen so far, then continue in big mode.
        for (int Off = 0; Off < Shift; Off += GroupBits)
          Groups.push_back(
              Off < 64 ? static_cast<uint8_t>((R.Value >> Off) & GroupMask)
                       : 0);
        Groups.push_back(Group);
      }
    } else {
      Groups.push_back(Group);
    }

    Shift += GroupBits;
    if ((Byte & MoreBit) == 0)
      break;
  }

  if (!Groups.empty()) {
    R.Big.emplace();
    mpz_import(R.Big->get(), Groups.size(), -1, 1, 0, 1, Groups.data());
    R.Value = 0;
  }
  return R;
}

inline Decoded decode(std::span<const uint8_t> Bytes) {
  BufferSource Source(Bytes);
  return decode(Source);
}

} // namespace compactfloat::uleb128

#endif // COMPACTFLOAT_CORE_ULEB128_HPP
