#ifndef COMPACTFLOAT_TESTS_HARNESS_TEST_HARNESS_HPP
#define COMPACTFLOAT_TESTS_HARNESS_TEST_HARNESS_HPP

// Generic "this against that" test harness.
//
// testAgainst(Name, Iter, ImplA, ImplB, Cmp)
//   runs ImplA and ImplB on every 64-bit input yielded by Iter,
//   compares outputs using Cmp, and prints results.
//
// Both ImplA and ImplB are opaque callables:
//   (uint64_t) -> TestOutput
// What the input bits mean (a double, a DFloat seed) is up to the
// callables; the harness only moves bits around.

#include <array>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <random>
#include <span>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include "compactfloat/compactfloat.hpp"

namespace compactfloat::testing {

// ===================================================================
// Hex printing
// ===================================================================

inline void printHex(FILE *Out, uint64_t Val, int Width) {
  for (int I = Width - 1; I >= 0; --I) {
    int Nibble = static_cast<int>((Val >> (I * 4)) & 0xF);
    std::fputc("0123456789ABCDEF"[Nibble], Out);
  }
}

// "06 0f" style dump of an encoding, for CHECKs against literal vectors.
inline std::string hexBytes(std::span<const uint8_t> Bytes) {
  static constexpr char Digits[] = "0123456789abcdef";
  std::string S;
  for (size_t I = 0; I < Bytes.size(); ++I) {
    if (I != 0)
      S += ' ';
    S += Digits[Bytes[I] >> 4];
    S += Digits[Bytes[I] & 0xF];
  }
  return S;
}

// Inverse of hexBytes; whitespace separated pairs.
inline std::vector<uint8_t> bytesFromHex(std::string_view Hex) {
  auto nibble = [](char C) {
    return C <= '9' ? C - '0' : (C | 0x20) - 'a' + 10;
  };
  std::vector<uint8_t> Out;
  for (size_t I = 0; I + 1 < Hex.size(); ++I) {
    if (Hex[I] == ' ')
      continue;
    Out.push_back(
        static_cast<uint8_t>((nibble(Hex[I]) << 4) | nibble(Hex[I + 1])));
    ++I;
  }
  return Out;
}

inline std::vector<uint8_t> encodeToVector(const DFloat &V) {
  std::vector<uint8_t> Out;
  append(V, Out);
  return Out;
}

// Empty when V has no encoding.
inline std::vector<uint8_t> encodeToVector(const BigDecimal &V) {
  std::vector<uint8_t> Out;
  if (append(V, Out) != Status::Ok)
    Out.clear();
  return Out;
}

inline uint64_t bitsOf(double D) {
  uint64_t Bits;
  std::memcpy(&Bits, &D, sizeof(double));
  return Bits;
}

inline double doubleFrom(uint64_t Bits) {
  double D;
  std::memcpy(&D, &Bits, sizeof(double));
  return D;
}

// ===================================================================
// Output and failure records
// ===================================================================

struct TestOutput {
  uint64_t Bits = 0;
  Status Code = Status::Ok;
};

struct Failure {
  uint64_t Input;
  TestOutput OutputA;
  TestOutput OutputB;
};

struct TestResult {
  int Total = 0;
  int Passed = 0;
  int Failed = 0;
};

// ===================================================================
// testAgainst: the harness
// ===================================================================

static constexpr int MaxReportedFailures = 10;

template <typename IterFn, typename ImplA, typename ImplB,
          typename Comparator>
TestResult testAgainst(const char *Name, IterFn Iter, ImplA A, ImplB B,
                       Comparator Cmp) {
  TestResult R;
  Failure Failures[MaxReportedFailures];
  int NumReported = 0;

  Iter([&](uint64_t Input) {
    R.Total++;
    TestOutput OA = A(Input);
    TestOutput OB = B(Input);
    if (Cmp(OA, OB)) {
      R.Passed++;
    } else {
      R.Failed++;
      if (NumReported < MaxReportedFailures) {
        Failures[NumReported++] = {Input, OA, OB};
      }
    }
  });

  std::printf("%s: %d/%d passed", Name, R.Passed, R.Total);
  if (R.Failed > 0) {
    std::printf(" (%d FAILED)", R.Failed);
  }
  std::printf("\n");

  for (int I = 0; I < NumReported; ++I) {
    auto &F = Failures[I];
    std::fprintf(stderr, "  FAIL %s: in=0x", Name);
    printHex(stderr, F.Input, 16);
    std::fprintf(stderr, "  implA=0x");
    printHex(stderr, F.OutputA.Bits, 16);
    std::fprintf(stderr, " (%s) implB=0x", statusMessage(F.OutputA.Code));
    printHex(stderr, F.OutputB.Bits, 16);
    std::fprintf(stderr, " (%s)\n", statusMessage(F.OutputB.Code));
  }

  return R;
}

// ===================================================================
// Iteration strategies
// ===================================================================

// Every value from a list of interesting inputs.
struct TargetedValues {
  const uint64_t *Values;
  int Count;

  template <typename Fn> void operator()(Fn &&Callback) const {
    for (int I = 0; I < Count; ++I)
      Callback(Values[I]);
  }
};

// Uniform random 64-bit inputs.
struct RandomValues {
  uint64_t Seed;
  int Count;

  template <typename Fn> void operator()(Fn &&Callback) const {
    std::mt19937_64 Rng(Seed);
    for (int I = 0; I < Count; ++I)
      Callback(Rng());
  }
};

// Run multiple strategies in sequence.
template <typename... Strategies> struct Combined {
  std::tuple<Strategies...> Strats;

  template <typename Fn> void operator()(Fn &&Callback) const {
    std::apply([&](const auto &...S) { (S(Callback), ...); }, Strats);
  }
};

template <typename... Strategies>
Combined<Strategies...> combined(Strategies... S) {
  return {std::tuple{std::move(S)...}};
}

// ===================================================================
// Comparators
// ===================================================================

struct BitExact {
  bool operator()(TestOutput A, TestOutput B) const {
    return A.Bits == B.Bits && A.Code == B.Code;
  }
};

// Outputs are binary64 bit patterns. Two NaNs match when they agree on
// the quiet bit (or always, if MatchQuietBit is off); payload and sign are
// not carried through a DFloat.
struct NanAwareFloat64 {
  bool MatchQuietBit = true;

  static bool isNan(uint64_t Bits) {
    return (Bits & 0x7FF0000000000000ull) == 0x7FF0000000000000ull &&
           (Bits & 0x000FFFFFFFFFFFFFull) != 0;
  }

  bool operator()(TestOutput A, TestOutput B) const {
    if (isNan(A.Bits) && isNan(B.Bits))
      return !MatchQuietBit ||
             (A.Bits & Float64QuietBit) == (B.Bits & Float64QuietBit);
    return A.Bits == B.Bits;
  }
};

// ===================================================================
// Interesting values
// ===================================================================

// Edge-case binary64 bit patterns.
constexpr auto interestingFloat64() {
  return std::array<uint64_t, 20>{{
      0x0000000000000000ull, // +0
      0x8000000000000000ull, // -0
      0x7FF0000000000000ull, // +Inf
      0xFFF0000000000000ull, // -Inf
      0x7FF8000000000000ull, // QNaN
      0x7FF0000000000001ull, // SNaN min
      0x7FF7FFFFFFFFFFFFull, // SNaN max
      0x0000000000000001ull, // min +subnormal
      0x8000000000000001ull, // min -subnormal
      0x000FFFFFFFFFFFFFull, // max subnormal
      0x0010000000000000ull, // min +normal
      0x7FEFFFFFFFFFFFFFull, // max +finite
      0xFFEFFFFFFFFFFFFFull, // max -finite
      0x3FF0000000000000ull, // 1.0
      0xBFF0000000000000ull, // -1.0
      0x4000000000000000ull, // 2.0
      0x3FE0000000000000ull, // 0.5
      0x3FF0000000000001ull, // 1.0 + 1 ULP
      0x3FEFFFFFFFFFFFFFull, // 1.0 - 1 ULP
      0x3FB999999999999Aull, // 0.1
  }};
}

} // namespace compactfloat::testing

#endif // COMPACTFLOAT_TESTS_HARNESS_TEST_HARNESS_HPP
