#include <doctest/doctest.h>

#include "asymunc/stats/rounding.hpp"

TEST_CASE("PDG rounding keeps two digits for small leading digits") {
  const auto r = asymunc::round_pdg(0.827, 0.119, 0.119);
  CHECK(r.value == doctest::Approx(0.83));
  CHECK(r.lower == doctest::Approx(0.12));
  CHECK(r.upper == doctest::Approx(0.12));
  CHECK(r.decimals == 2);
}

TEST_CASE("PDG rounding keeps one digit between 355 and 949") {
  const auto r = asymunc::round_pdg(0.827, 0.367, 0.367);
  CHECK(r.value == doctest::Approx(0.8));
  CHECK(r.lower == doctest::Approx(0.4));
  CHECK(r.upper == doctest::Approx(0.4));
  CHECK(r.decimals == 1);
}

TEST_CASE("PDG rounding uses the smallest magnitude") {
  const auto asymmetric = asymunc::round_pdg(0.827, 0.119, 0.367);
  CHECK(asymmetric.value == doctest::Approx(0.83));
  CHECK(asymmetric.lower == doctest::Approx(0.12));
  CHECK(asymmetric.upper == doctest::Approx(0.37));

  const auto value_smallest = asymunc::round_pdg(0.827, 0.960, 0.970);
  CHECK(value_smallest.value == doctest::Approx(0.8));
  CHECK(value_smallest.lower == doctest::Approx(1.0));
  CHECK(value_smallest.upper == doctest::Approx(1.0));
}

TEST_CASE("values far below their uncertainty are shown as zero") {
  const auto r = asymunc::round_pdg(0.00827, 0.96, 0.97);
  CHECK(r.value == 0.0);
  CHECK(r.lower == doctest::Approx(0.96));
  CHECK(r.upper == doctest::Approx(0.97));
  CHECK(asymunc::format_uncertain(0.00827, 0.96, 0.97) == "0.00 - 0.96 + 0.97");
}

TEST_CASE("formatted triples") {
  CHECK(asymunc::format_uncertain(0.0456, 0.123, 0.321) == "0.05 - 0.12 + 0.32");
  CHECK(asymunc::format_uncertain(0.827, 0.119, 0.367) == "0.83 - 0.12 + 0.37");
  CHECK(asymunc::format_uncertain(1234.5, 23.4, 23.4) == "1234 - 23 + 23");
  CHECK(asymunc::format_uncertain(12345.0, 456.0, 456.0) == "12300 - 500 + 500");
  CHECK(asymunc::format_uncertain(3.0, 0.0, 0.0) == "3");
}

TEST_CASE("values and results print with PDG rounding") {
  CHECK(asymunc::to_string(asymunc::UncertainValue::create(0.827, 0.119, 0.367)) == "0.83 - 0.12 + 0.37");

  asymunc::Result result;
  result.mode = 0.827;
  result.lower_bound = 0.708;
  result.upper_bound = 1.194;
  CHECK(asymunc::to_string(result) == "0.83 - 0.12 + 0.37");
}
