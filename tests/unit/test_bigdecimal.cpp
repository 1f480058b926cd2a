// BigDecimal: exact parsing, canonical text, value comparison.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "harness/test_harness.hpp"

using namespace compactfloat;

namespace {

BigDecimal parsed(std::string_view Text) {
  auto R = BigDecimal::fromString(Text);
  REQUIRE(R.Code == Status::Ok);
  return std::move(R.Value);
}

} // namespace

TEST_CASE("parse keeps every digit") {
  BigDecimal D = parsed("1.0");
  CHECK(D.Coefficient == BigInt(10));
  CHECK(D.Exponent == -1);
  CHECK_FALSE(D.Negative);

  D = parsed("-12.5e3");
  CHECK(D.Coefficient == BigInt(125));
  CHECK(D.Exponent == 2);
  CHECK(D.Negative);

  D = parsed("123456789012345678901234567890");
  CHECK(D.Coefficient.toString() == "123456789012345678901234567890");
  CHECK(D.Exponent == 0);

  D = parsed(".5");
  CHECK(D.Coefficient == BigInt(5));
  CHECK(D.Exponent == -1);

  D = parsed("");
  CHECK(D.isZero());
  CHECK_FALSE(D.Negative);

  D = parsed("-0");
  CHECK(D.isZero());
  CHECK(D.Negative);
}

TEST_CASE("parse specials") {
  CHECK(parsed("inf").Form == DecimalForm::Infinite);
  CHECK(parsed("-Infinity").Negative);
  CHECK(parsed("NaN").Form == DecimalForm::NaN);
  CHECK(parsed("sNaN").Form == DecimalForm::NaNSignaling);

  CHECK(BigDecimal::fromString("-nan").Code == Status::Malformed);
  CHECK(BigDecimal::fromString("+snan").Code == Status::Malformed);
}

TEST_CASE("parse rejects malformed text") {
  for (const char *Bad : {"-", ".", "1e", "1e+", "1.2.3", "12a", "e5", "--1",
                          "infinite", "0x10", " 1"}) {
    CAPTURE(Bad);
    CHECK(BigDecimal::fromString(Bad).Code == Status::Malformed);
  }
}

TEST_CASE("parse exponent range") {
  CHECK(BigDecimal::fromString("1e2147483647").Code == Status::Ok);
  CHECK(BigDecimal::fromString("1e2147483648").Code ==
        Status::ValueTooLarge);
  CHECK(BigDecimal::fromString("1e-2147483647").Code == Status::Ok);
  CHECK(BigDecimal::fromString("1e-2147483648").Code ==
        Status::ValueTooLarge);
  CHECK(BigDecimal::fromString("0.1e-2147483647").Code ==
        Status::ValueTooLarge);
  CHECK(BigDecimal::fromString("1e99999999999999").Code ==
        Status::ValueTooLarge);
}

TEST_CASE("text formats") {
  SUBCASE("scientific") {
    CHECK(parsed("1.0").text('e') == "1.0e+0");
    CHECK(parsed("123.45678901234").text('e') == "1.2345678901234e+2");
    CHECK(parsed("-0.00012").text('E') == "-1.2E-4");
    CHECK(parsed("5").text('e') == "5e+0");
  }

  SUBCASE("plain") {
    CHECK(parsed("1.5e3").text('f') == "1500");
    CHECK(parsed("-1.25").text('f') == "-1.25");
    CHECK(parsed("1.2e-5").text('f') == "0.000012");
    CHECK(parsed("0.5").text('f') == "0.5");
  }

  SUBCASE("general") {
    CHECK(parsed("1.25").text('g') == "1.25");
    CHECK(parsed("1e+100").text('g') == "1e+100");
    CHECK(parsed("1e+100").text('G') == "1E+100");
    CHECK(parsed("1.2e-6").text('g') == "0.0000012");
    CHECK(parsed("1.2e-7").text('g') == "1.2e-7");
    CHECK(parsed("1500").text('g') == "1500");
    CHECK(parsed("15e2").text('g') == "1.5e+3");
  }

  SUBCASE("zeros and specials") {
    for (char F : {'e', 'E', 'f', 'g', 'G'}) {
      CAPTURE(F);
      CHECK(parsed("0").text(F) == "0");
      CHECK(parsed("-0").text(F) == "-0");
      CHECK(parsed("inf").text(F) == "Infinity");
      CHECK(parsed("-inf").text(F) == "-Infinity");
      CHECK(parsed("nan").text(F) == "NaN");
      CHECK(parsed("snan").text(F) == "sNaN");
    }
  }

  SUBCASE("unknown format") {
    CHECK(parsed("1.5").text('x') == "%x");
    CHECK(parsed("nan").text('q') == "%q");
  }
}

TEST_CASE("compare") {
  CHECK(compare(parsed("1.0"), parsed("1")) == 0);
  CHECK(compare(parsed("1.5"), parsed("15e-1")) == 0);
  CHECK(compare(parsed("1.5"), parsed("1.49999999999999999999999")) == 1);
  CHECK(compare(parsed("-1.5"), parsed("1.4")) == -1);
  CHECK(compare(parsed("-1.5"), parsed("-1.4")) == -1);
  CHECK(compare(parsed("1e10"), parsed("9999999999")) == 1);
  CHECK(compare(parsed("0"), parsed("-0")) == 0);
  CHECK(compare(parsed("-0.1"), parsed("0")) == -1);
  CHECK(compare(parsed("inf"), parsed("1e2000000000")) == 1);
  CHECK(compare(parsed("-inf"), parsed("-1e2000000000")) == -1);
  CHECK(compare(parsed("inf"), parsed("inf")) == 0);

  CHECK(equalValue(parsed("100"), parsed("1e2")));
  CHECK(equalValue(parsed("nan"), parsed("NaN")));
  CHECK_FALSE(equalValue(parsed("nan"), parsed("snan")));
  CHECK_FALSE(equalValue(parsed("0"), parsed("-0")));
  CHECK_FALSE(equalValue(parsed("1"), parsed("1.0000000000000000000001")));
}
