#include <doctest/doctest.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include "asymunc/core/errors.hpp"
#include "asymunc/core/random_stream.hpp"
#include "asymunc/sampling/sampler.hpp"
#include "asymunc/stats/aggregator.hpp"

namespace {

std::vector<double> sorted_normal(std::size_t n, std::uint64_t seed) {
  const auto value = asymunc::UncertainValue::create(0.0, 1.0, 1.0);
  asymunc::RandomStream stream(seed);
  auto samples = asymunc::draw_samples(value, n, stream).data();
  std::sort(samples.begin(), samples.end());
  return samples;
}

}  // namespace

TEST_CASE("shortest interval picks the narrowest window") {
  const std::vector<double> sorted = {0.0, 1.0, 2.0, 3.0, 10.0};
  const auto interval = asymunc::shortest_coverage_interval(sorted, 0.6);

  CHECK(interval.covered == 3);
  CHECK(interval.first_index == 0);
  CHECK(interval.lower == doctest::Approx(0.0));
  CHECK(interval.upper == doctest::Approx(2.0));
  CHECK(interval.contains(1.5));
  CHECK_FALSE(interval.contains(3.0));
}

TEST_CASE("shortest interval resolves ties to the lowest start") {
  std::vector<double> sorted(100);
  for (std::size_t i = 0; i < sorted.size(); ++i) {
    sorted[i] = static_cast<double>(i);
  }

  const auto interval = asymunc::shortest_coverage_interval(sorted, 0.95);
  CHECK(interval.covered == 95);
  CHECK(interval.first_index == 0);
  CHECK(interval.width() == doctest::Approx(94.0));

  const auto full = asymunc::shortest_coverage_interval(sorted, 1.0);
  CHECK(full.lower == doctest::Approx(0.0));
  CHECK(full.upper == doctest::Approx(99.0));
}

TEST_CASE("interval end uncertainty follows the local width change") {
  const std::vector<double> sorted = {0.0, 1.0, 2.0, 4.0, 10.0};

  const auto plain = asymunc::shortest_coverage_interval(sorted, 0.6);
  CHECK_FALSE(plain.has_end_uncertainty);
  CHECK(plain.lower_end_uncertainty == 0.0);

  const auto interval = asymunc::shortest_coverage_interval(sorted, 0.6, true);
  REQUIRE(interval.has_end_uncertainty);
  CHECK(interval.first_index == 0);
  CHECK(interval.lower_end_uncertainty == doctest::Approx(0.02));
  CHECK(interval.upper_end_uncertainty == doctest::Approx(0.02));
}

TEST_CASE("interval end uncertainty falls back to a tenth of the width") {
  std::vector<double> linear(100);
  for (std::size_t i = 0; i < linear.size(); ++i) {
    linear[i] = static_cast<double>(i);
  }
  const auto flat = asymunc::shortest_coverage_interval(linear, 0.95, true);
  CHECK(flat.lower_end_uncertainty == doctest::Approx(9.4));

  const std::vector<double> tiny = {1.0, 2.0, 5.0};
  const auto whole = asymunc::shortest_coverage_interval(tiny, 1.0, true);
  CHECK(whole.lower_end_uncertainty == doctest::Approx(0.4));
  CHECK(whole.upper_end_uncertainty == doctest::Approx(0.4));
}

TEST_CASE("interval end uncertainty is small for a large normal sample") {
  const auto sorted = sorted_normal(50'000, 23);
  const auto interval = asymunc::shortest_coverage_interval(sorted, 0.95, true);

  REQUIRE(interval.has_end_uncertainty);
  CHECK(std::isfinite(interval.lower_end_uncertainty));
  CHECK(interval.lower_end_uncertainty > 0.0);
  CHECK(interval.lower_end_uncertainty <= 0.1 * interval.width());
  CHECK(interval.upper_end_uncertainty == interval.lower_end_uncertainty);
}

TEST_CASE("interval width grows with coverage") {
  const auto sorted = sorted_normal(50'000, 21);

  double previous = 0.0;
  for (const double coverage : {0.5, 0.68, 0.9, 0.95, 0.99}) {
    const double width = asymunc::shortest_coverage_interval(sorted, coverage).width();
    CHECK(width > previous);
    previous = width;
  }
}

TEST_CASE("interval and quantile reject bad inputs") {
  const std::vector<double> sorted = {1.0, 2.0};
  const std::vector<double> empty;
  CHECK_THROWS_AS(asymunc::shortest_coverage_interval(sorted, 0.0), asymunc::InvalidParameterError);
  CHECK_THROWS_AS(asymunc::shortest_coverage_interval(sorted, 1.01), asymunc::InvalidParameterError);
  CHECK_THROWS_AS(asymunc::shortest_coverage_interval(empty, 0.5), asymunc::InsufficientSamplesError);
  CHECK_THROWS_AS(asymunc::empirical_quantile(sorted, -0.1), asymunc::InvalidParameterError);
}

TEST_CASE("empirical quantile interpolates between ranks") {
  const std::vector<double> sorted = {1.0, 2.0, 3.0, 4.0};
  CHECK(asymunc::empirical_quantile(sorted, 0.0) == doctest::Approx(1.0));
  CHECK(asymunc::empirical_quantile(sorted, 0.5) == doctest::Approx(2.5));
  CHECK(asymunc::empirical_quantile(sorted, 1.0) == doctest::Approx(4.0));
}

TEST_CASE("most probable value locates the peak of a skewed sample") {
  const auto value = asymunc::UncertainValue::create(5.0, 0.5, 3.0);
  asymunc::RandomStream stream(17);
  auto sorted = asymunc::draw_samples(value, 200'000, stream).data();
  std::sort(sorted.begin(), sorted.end());

  const auto interval = asymunc::shortest_coverage_interval(sorted, 0.95);
  const double mode = asymunc::most_probable_value(sorted, interval.lower, interval.upper);
  CHECK(mode == doctest::Approx(5.0).epsilon(0.06));
  CHECK(asymunc::most_probable_value(sorted, 2.0, 2.0) == doctest::Approx(2.0));
}

TEST_CASE("most probable value is the centre of the fullest bin") {
  const std::vector<double> sorted = {0.5, 2.5, 3.0, 3.5};
  CHECK(asymunc::most_probable_value(sorted, 0.0, 4.0) == doctest::Approx(3.0));
  CHECK(asymunc::most_probable_value(sorted, 1.0, 1.0) == doctest::Approx(1.0));
}

TEST_CASE("summary reports location, spread and invalid trials") {
  std::vector<double> values = sorted_normal(20'000, 4);
  for (std::size_t i = 0; i < 5'000; ++i) {
    values.push_back(std::numeric_limits<double>::quiet_NaN());
  }
  const asymunc::SampleSet samples(values);

  const auto result = asymunc::summarize(samples, 0.95, 100);
  CHECK(result.trial_count == 25'000);
  CHECK(result.valid_count == 20'000);
  CHECK(result.invalid_fraction == doctest::Approx(0.2));
  CHECK(result.coverage == doctest::Approx(0.95));
  CHECK(std::fabs(result.mean) < 0.03);
  CHECK(std::fabs(result.median) < 0.03);
  CHECK(result.standard_deviation == doctest::Approx(1.0).epsilon(0.03));
  CHECK(result.lower_bound == doctest::Approx(-1.96).epsilon(0.05));
  CHECK(result.upper_bound == doctest::Approx(1.96).epsilon(0.05));
  CHECK(result.lower_bound <= result.mode);
  CHECK(result.mode <= result.upper_bound);
}

TEST_CASE("summary refuses populations with too few valid trials") {
  const asymunc::SampleSet samples(std::vector<double>(10, 1.0));
  try {
    (void)asymunc::summarize(samples, 0.95, 100);
    FAIL("expected InsufficientSamplesError");
  } catch (const asymunc::InsufficientSamplesError& error) {
    CHECK(error.valid_count() == 10);
    CHECK(error.required() == 100);
    CHECK(std::string(error.what()).find("10 of 10") != std::string::npos);
  }

  const asymunc::SampleSet all_invalid(500, std::numeric_limits<double>::infinity());
  CHECK_THROWS_AS(asymunc::summarize(all_invalid, 0.95, 1), asymunc::InsufficientSamplesError);
}

TEST_CASE("reduced chi square") {
  const std::vector<double> data = {1.0, 2.0, 3.0};
  const std::vector<double> uncertainties = {1.0, 1.0, 2.0};
  const std::vector<double> fit = {0.0, 0.0, 1.0};

  CHECK(asymunc::chi_square(data, uncertainties, fit) == doctest::Approx(6.0));
  CHECK(asymunc::chi_square(data, uncertainties, fit, 2) == doctest::Approx(3.0));

  const std::vector<double> short_fit = {0.0};
  const std::vector<double> zero_sigma = {1.0, 0.0, 1.0};
  CHECK_THROWS_AS(asymunc::chi_square(data, uncertainties, short_fit), asymunc::InvalidParameterError);
  CHECK_THROWS_AS(asymunc::chi_square(data, zero_sigma, fit), asymunc::InvalidParameterError);
  CHECK_THROWS_AS(asymunc::chi_square(data, uncertainties, fit, 0), asymunc::InvalidParameterError);
}
