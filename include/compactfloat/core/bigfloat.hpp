#ifndef COMPACTFLOAT_CORE_BIGFLOAT_HPP
#define COMPACTFLOAT_CORE_BIGFLOAT_HPP

// BigFloat: RAII wrapper around MPFR's mpfr_t, the arbitrary-precision
// binary float that DFloat converts to and from.

#include <mpfr.h>

namespace compactfloat {

// Precision used when a caller does not name one: enough for any
// 19-digit DFloat coefficient to survive the trip.
inline constexpr mpfr_prec_t DefaultBigFloatPrecision = 64;

class BigFloat {
public:
  explicit BigFloat(mpfr_prec_t Prec = DefaultBigFloatPrecision) {
    mpfr_init2(Val, Prec);
  }

  ~BigFloat() { mpfr_clear(Val); }

  // Non-copyable (mpfr_t holds heap-allocated limb data)
  BigFloat(const BigFloat &) = delete;
  BigFloat &operator=(const BigFloat &) = delete;

  // Move: steal contents, leave source in a valid NaN state
  BigFloat(BigFloat &&Other) noexcept {
    Val[0] = Other.Val[0];
    mpfr_init2(Other.Val, 2);
    mpfr_set_nan(Other.Val);
  }

  BigFloat &operator=(BigFloat &&Other) noexcept {
    if (this != &Other) {
      mpfr_clear(Val);
      Val[0] = Other.Val[0];
      mpfr_init2(Other.Val, 2);
      mpfr_set_nan(Other.Val);
    }
    return *this;
  }

  operator mpfr_ptr() { return Val; }
  operator mpfr_srcptr() const { return Val; }

  mpfr_prec_t precision() const { return mpfr_get_prec(Val); }

  bool isNan() const { return mpfr_nan_p(Val) != 0; }
  bool isInf() const { return mpfr_inf_p(Val) != 0; }
  bool isZero() const { return mpfr_zero_p(Val) != 0; }
  bool isNegative() const { return mpfr_signbit(Val) != 0; }

private:
  mpfr_t Val;
};

} // namespace compactfloat

#endif // COMPACTFLOAT_CORE_BIGFLOAT_HPP
