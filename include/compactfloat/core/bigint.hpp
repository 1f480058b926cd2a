#ifndef COMPACTFLOAT_CORE_BIGINT_HPP
#define COMPACTFLOAT_CORE_BIGINT_HPP

// BigInt: RAII wrapper around GMP's mpz_t.
//
// Used for coefficients that do not fit in 64 bits. Conversions to and from
// machine words go through an explicit little-endian byte sequence
// (mpz_import / mpz_export), so nothing depends on the limb width.

#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>

#include <gmp.h>

namespace compactfloat {

class BigInt {
public:
  BigInt() { mpz_init(Val); }

  explicit BigInt(uint64_t V) {
    mpz_init(Val);
    setUint64(V);
  }

  ~BigInt() { mpz_clear(Val); }

  BigInt(const BigInt &Other) { mpz_init_set(Val, Other.Val); }

  BigInt &operator=(const BigInt &Other) {
    if (this != &Other)
      mpz_set(Val, Other.Val);
    return *this;
  }

  // Move: steal contents, leave source as zero
  BigInt(BigInt &&Other) noexcept {
    Val[0] = Other.Val[0];
    mpz_init(Other.Val);
  }

  BigInt &operator=(BigInt &&Other) noexcept {
    if (this != &Other) {
      mpz_clear(Val);
      Val[0] = Other.Val[0];
      mpz_init(Other.Val);
    }
    return *this;
  }

  static BigInt fromInt64(int64_t V) {
    BigInt R(V < 0 ? 0 - static_cast<uint64_t>(V) : static_cast<uint64_t>(V));
    if (V < 0)
      mpz_neg(R.Val, R.Val);
    return R;
  }

  // 10^Exponent
  static BigInt pow10(unsigned long Exponent) {
    BigInt R;
    mpz_ui_pow_ui(R.Val, 10, Exponent);
    return R;
  }

  // Parses an unsigned run of decimal digits. Returns false on anything else.
  static bool parseDigits(std::string_view Digits, BigInt &Out) {
    if (Digits.empty())
      return false;
    for (char C : Digits)
      if (C < '0' || C > '9')
        return false;
    std::string Buf(Digits);
    return mpz_set_str(Out.Val, Buf.c_str(), 10) == 0;
  }

  mpz_ptr get() { return Val; }
  mpz_srcptr get() const { return Val; }
  operator mpz_ptr() { return Val; }
  operator mpz_srcptr() const { return Val; }

  int sign() const { return mpz_sgn(Val); }
  bool isZero() const { return mpz_sgn(Val) == 0; }
  size_t bitLength() const { return isZero() ? 0 : mpz_sizeinbase(Val, 2); }
  size_t limbCount() const { return mpz_size(Val); }

  bool fitsInt64() const {
    if (sign() >= 0)
      return bitLength() <= 63;
    // -2^63 is the only 64-bit magnitude that fits
    return bitLength() <= 63 ||
           (bitLength() == 64 && mpz_scan1(Val, 0) == 63);
  }

  // Low 64 bits of the magnitude.
  uint64_t magnitudeUint64() const {
    BigInt Low;
    mpz_tdiv_r_2exp(Low.Val, Val, 64);
    unsigned char Bytes[8] = {};
    mpz_export(Bytes, nullptr, -1, 1, 0, 0, Low.Val);
    uint64_t V = 0;
    for (int I = 7; I >= 0; --I)
      V = (V << 8) | Bytes[I];
    return V;
  }

  int64_t toInt64() const {
    uint64_t M = magnitudeUint64();
    return sign() < 0 ? static_cast<int64_t>(0 - M) : static_cast<int64_t>(M);
  }

  void setUint64(uint64_t V) {
    unsigned char Bytes[8];
    for (int I = 0; I < 8; ++I) {
      Bytes[I] = static_cast<unsigned char>(V & 0xFF);
      V >>= 8;
    }
    mpz_import(Val, 8, -1, 1, 0, 0, Bytes);
  }

  std::string toString() const {
    std::string S(mpz_sizeinbase(Val, 10) + 2, '\0');
    mpz_get_str(S.data(), 10, Val);
    S.resize(std::strlen(S.c_str()));
    return S;
  }

  int compare(const BigInt &Other) const { return mpz_cmp(Val, Other.Val); }

  friend bool operator==(const BigInt &A, const BigInt &B) {
    return mpz_cmp(A.Val, B.Val) == 0;
  }

private:
  mpz_t Val;
};

} // namespace compactfloat

#endif // COMPACTFLOAT_CORE_BIGINT_HPP
