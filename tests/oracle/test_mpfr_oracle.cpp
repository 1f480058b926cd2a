// Oracle validation: DFloat's binary64 conversions against MPFR.
//
// Every check is an instance of the "this against that" harness: two
// independent routes from the same 64 input bits to a binary64 result.
// MPFR parses decimal text with correct rounding at 53 bits, so it is the
// reference for DFloat::toFloat64; the identity function is the reference
// for double -> DFloat -> double round trips.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <string>

#include "harness/test_harness.hpp"

using namespace compactfloat;
using namespace compactfloat::testing;

namespace {

// Spreads 64 random bits over a DFloat whose value stays inside the
// binary64 normal range: |coefficient| < 2^62, exponent in [-290, 270].
DFloat dfloatFromSeed(uint64_t Bits) {
  int64_t Magnitude = static_cast<int64_t>(Bits >> 2);
  int64_t Coefficient = (Bits & 1) ? -Magnitude : Magnitude;
  uint64_t Mixed = Bits * 0x9E3779B97F4A7C15ull;
  int32_t Exponent = static_cast<int32_t>((Mixed >> 40) % 561) - 290;
  return DFloat(Exponent, Coefficient);
}

// MPFR reference: exact decimal text, rounded once to 53 bits.
double mpfrFloat64(const DFloat &V) {
  BigFloat F(53);
  std::string Text = V.text('e');
  mpfr_strtofr(F, Text.c_str(), nullptr, 10, MPFR_RNDN);
  return mpfr_get_d(F, MPFR_RNDN);
}

} // namespace

// ===================================================================
// DFloat -> binary64
// ===================================================================

TEST_CASE("toFloat64 agrees with MPFR") {
  const uint64_t Targeted[] = {
      0x0000000000000004ull, // coefficient 1
      0x0000000000000005ull, // coefficient -1
      0xFFFFFFFFFFFFFFFCull, // largest coefficient
      0x0000000000000028ull, // coefficient 10, minimized to 1
      0x8000000000000000ull, // coefficient 2^61
  };

  auto Iter = combined(TargetedValues{Targeted, 5}, RandomValues{42, 200000});

  auto ImplA = [](uint64_t Seed) -> TestOutput {
    return {bitsOf(dfloatFromSeed(Seed).toFloat64())};
  };
  auto ImplB = [](uint64_t Seed) -> TestOutput {
    return {bitsOf(mpfrFloat64(dfloatFromSeed(Seed)))};
  };

  auto R = testAgainst("toFloat64 vs mpfr_strtofr", Iter, ImplA, ImplB,
                       BitExact{});
  CHECK(R.Failed == 0);
}

TEST_CASE("toBigFloat agrees with MPFR") {
  auto ImplA = [](uint64_t Seed) -> TestOutput {
    BigFloat F = dfloatFromSeed(Seed).toBigFloat(53);
    return {bitsOf(mpfr_get_d(F, MPFR_RNDN))};
  };
  auto ImplB = [](uint64_t Seed) -> TestOutput {
    return {bitsOf(mpfrFloat64(dfloatFromSeed(Seed)))};
  };

  auto R = testAgainst("toBigFloat(53) vs mpfr_strtofr",
                       RandomValues{7, 50000}, ImplA, ImplB, BitExact{});
  CHECK(R.Failed == 0);
}

// ===================================================================
// binary64 -> DFloat -> binary64
// ===================================================================

TEST_CASE("binary64 round trips") {
  constexpr auto Interesting = interestingFloat64();
  auto Iter = combined(
      TargetedValues{Interesting.data(), static_cast<int>(Interesting.size())},
      RandomValues{42, 200000});

  auto Identity = [](uint64_t Bits) -> TestOutput { return {Bits}; };

  SUBCASE("through DFloat") {
    auto ViaDFloat = [](uint64_t Bits) -> TestOutput {
      auto R = DFloat::fromFloat64(doubleFrom(Bits));
      return {bitsOf(R.Value.toFloat64()), R.Code};
    };
    auto R = testAgainst("fromFloat64/toFloat64", Iter, Identity, ViaDFloat,
                         NanAwareFloat64{});
    CHECK(R.Failed == 0);
  }

  SUBCASE("through the wire format") {
    auto ViaWire = [](uint64_t Bits) -> TestOutput {
      DFloat V = DFloat::fromFloat64(doubleFrom(Bits)).Value;
      std::vector<uint8_t> Bytes = encodeToVector(V);
      DecodeResult D = decode(Bytes);
      if (!D.ok() || D.isBig())
        return {0, D.ok() ? Status::Malformed : D.Code};
      return {bitsOf(D.dfloat().toFloat64())};
    };
    auto R = testAgainst("fromFloat64/encode/decode/toFloat64", Iter,
                         Identity, ViaWire, NanAwareFloat64{});
    CHECK(R.Failed == 0);
  }

  SUBCASE("through BigFloat") {
    // 64 bits print as 19 digits, enough to bring any double back.
    // MPFR has a single NaN, so only NaN-ness is compared.
    auto ViaBigFloat = [](uint64_t Bits) -> TestOutput {
      BigFloat F(64);
      mpfr_set_d(F, doubleFrom(Bits), MPFR_RNDN);
      auto R = DFloat::fromBigFloat(F);
      return {bitsOf(R.Value.toFloat64())};
    };
    auto R = testAgainst("mpfr(64)/fromBigFloat/toFloat64", Iter, Identity,
                         ViaBigFloat, NanAwareFloat64{false});
    CHECK(R.Failed == 0);
  }
}
