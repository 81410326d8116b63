#include <doctest/doctest.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <numbers>
#include <vector>

#include "../test_common.hpp"
#include "asymunc/core/errors.hpp"
#include "asymunc/core/random_stream.hpp"
#include "asymunc/sampling/sampler.hpp"
#include "asymunc/stats/aggregator.hpp"

TEST_CASE("random stream is reproducible and open on both ends") {
  asymunc::RandomStream a(7);
  asymunc::RandomStream b(7);
  for (int i = 0; i < 1000; ++i) {
    const double u = a.uniform_open01();
    CHECK(u == b.uniform_open01());
    CHECK(u > 0.0);
    CHECK(u < 1.0);
  }
  CHECK(a.seed() == 7);
}

TEST_CASE("unit interval mapping excludes both ends") {
  CHECK(asymunc::open_unit_interval(0) > 0.0);
  CHECK(asymunc::open_unit_interval(~std::uint64_t{0}) < 1.0);
  CHECK(asymunc::open_unit_interval(std::uint64_t{1} << 63) == doctest::Approx(0.5));
}

TEST_CASE("seeded and session streams never share a seed") {
  for (std::uint64_t key : {std::uint64_t{0}, std::uint64_t{1}, std::uint64_t{1} << 63}) {
    CAPTURE(key);
    CHECK(asymunc::derive_stream_seed(42, key, 0, asymunc::StreamDomain::Seeded) !=
          asymunc::derive_stream_seed(42, key, 0, asymunc::StreamDomain::Session));
  }
}

TEST_CASE("derived stream seeds separate keys and blocks") {
  const auto base = asymunc::derive_stream_seed(42, 1, 0);
  CHECK(base == asymunc::derive_stream_seed(42, 1, 0));
  CHECK(base != asymunc::derive_stream_seed(42, 2, 0));
  CHECK(base != asymunc::derive_stream_seed(42, 1, 1));
  CHECK(base != asymunc::derive_stream_seed(43, 1, 0));
}

TEST_CASE("split normal puts the nominal value at the median") {
  asymunc::ValueSpec spec;
  spec.nominal = 10.0;
  spec.lower_uncertainty = 1.0;
  spec.upper_uncertainty = 3.0;

  CHECK(asymunc::distribution_cdf(spec, 10.0) == doctest::Approx(0.5));
  CHECK(asymunc::distribution_quantile(spec, 0.5) == doctest::Approx(10.0));
  CHECK(asymunc::distribution_quantile(spec, 0.15865525393145707) == doctest::Approx(9.0).epsilon(1e-9));
  CHECK(asymunc::distribution_quantile(spec, 0.8413447460685429) == doctest::Approx(13.0).epsilon(1e-9));
  CHECK_THROWS_AS(asymunc::distribution_quantile(spec, 1.5), asymunc::InvalidParameterError);
}

TEST_CASE("uniform and triangular quantiles span their support") {
  asymunc::ValueSpec uniform;
  uniform.nominal = 2.0;
  uniform.lower_uncertainty = 1.0;
  uniform.upper_uncertainty = 3.0;
  uniform.kind = asymunc::DistributionKind::Uniform;
  CHECK(asymunc::distribution_quantile(uniform, 0.0) == doctest::Approx(1.0));
  CHECK(asymunc::distribution_quantile(uniform, 1.0) == doctest::Approx(5.0));
  CHECK(asymunc::distribution_cdf(uniform, 3.0) == doctest::Approx(0.5));

  asymunc::ValueSpec triangular;
  triangular.nominal = 1.0;
  triangular.lower_uncertainty = 1.0;
  triangular.upper_uncertainty = 2.0;
  triangular.kind = asymunc::DistributionKind::Triangular;
  CHECK(asymunc::distribution_cdf(triangular, 1.0) == doctest::Approx(1.0 / 3.0));
  CHECK(asymunc::distribution_quantile(triangular, 1.0 / 3.0) == doctest::Approx(1.0));
  CHECK(asymunc::distribution_quantile(triangular, 0.0) == doctest::Approx(0.0));
  CHECK(asymunc::distribution_quantile(triangular, 1.0) == doctest::Approx(3.0));
}

TEST_CASE("draw_samples rejects an empty population") {
  const auto value = asymunc::UncertainValue::create(1.0, 0.1, 0.1);
  asymunc::RandomStream stream(1);
  CHECK_THROWS_AS(asymunc::draw_samples(value, 0, stream), asymunc::InvalidParameterError);
}

TEST_CASE("exact values are drawn without consuming randomness") {
  const auto value = asymunc::UncertainValue::exact(4.25);
  asymunc::RandomStream stream(99);
  asymunc::RandomStream fresh(99);

  const auto samples = asymunc::draw_samples(value, 128, stream);
  CHECK(std::all_of(samples.begin(), samples.end(), [](double v) { return v == 4.25; }));
  CHECK(stream.next_u64() == fresh.next_u64());
}

TEST_CASE("truncated samples respect the limits") {
  const auto value = asymunc::UncertainValue::create(0.0, 1.0, 1.0).with_limits(0.0, 1.5);
  asymunc::RandomStream stream(5);
  const auto samples = asymunc::draw_samples(value, 50'000, stream);

  CHECK(std::all_of(samples.begin(), samples.end(), [](double v) { return v >= 0.0 && v <= 1.5; }));
  CHECK(samples.invalid_count() == 0);
}

TEST_CASE("half-normal truncation matches its analytic mean") {
  const auto value = asymunc::UncertainValue::create(0.0, 1.0, 1.0)
                         .with_limits(0.0, std::numeric_limits<double>::infinity());
  asymunc::RandomStream stream(11);
  const auto samples = asymunc::draw_samples(value, 200'000, stream);

  CHECK(test_common::mean(samples.data()) == doctest::Approx(std::sqrt(2.0 / std::numbers::pi)).epsilon(0.01));
}

TEST_CASE("asymmetric normal reproduces both one-sigma quantiles") {
  const auto value = asymunc::UncertainValue::create(10.0, 1.0, 2.0);
  asymunc::RandomStream stream(3);
  auto sorted = asymunc::draw_samples(value, 200'000, stream).data();
  std::sort(sorted.begin(), sorted.end());

  CHECK(asymunc::empirical_quantile(sorted, 0.5) == doctest::Approx(10.0).epsilon(0.002));
  CHECK(asymunc::empirical_quantile(sorted, 0.15865525393145707) == doctest::Approx(9.0).epsilon(0.003));
  CHECK(asymunc::empirical_quantile(sorted, 0.8413447460685429) == doctest::Approx(12.0).epsilon(0.003));
}

TEST_CASE("uniform samples stay inside their support") {
  const auto value = asymunc::UncertainValue::create(2.0, 1.0, 3.0, asymunc::DistributionKind::Uniform);
  asymunc::RandomStream stream(8);
  const auto samples = asymunc::draw_samples(value, 20'000, stream);

  const auto [lo, hi] = std::minmax_element(samples.begin(), samples.end());
  CHECK(*lo >= 1.0);
  CHECK(*hi <= 5.0);
  CHECK(test_common::mean(samples.data()) == doctest::Approx(3.0).epsilon(0.01));
}

TEST_CASE("mean-conserving split normal keeps the nominal value as its mean") {
  asymunc::ValueSpec spec;
  spec.nominal = 10.0;
  spec.lower_uncertainty = 1.0;
  spec.upper_uncertainty = 3.0;
  spec.conserve_mean = true;

  CHECK(asymunc::distribution_cdf(spec, 10.0) == doctest::Approx(0.75));
  CHECK(asymunc::distribution_quantile(spec, 0.75) == doctest::Approx(10.0));
  CHECK(asymunc::distribution_quantile(spec, asymunc::distribution_cdf(spec, 8.5)) == doctest::Approx(8.5));
  CHECK(asymunc::distribution_quantile(spec, asymunc::distribution_cdf(spec, 14.0)) == doctest::Approx(14.0));

  const asymunc::UncertainValue value(spec);
  CHECK(value.conserves_mean());
  asymunc::RandomStream stream(21);
  const auto samples = asymunc::draw_samples(value, 200'000, stream).data();

  CHECK(test_common::mean(samples) == doctest::Approx(10.0).epsilon(0.002));
  CHECK(test_common::fraction_below(samples, 10.0) == doctest::Approx(0.75).epsilon(0.01));
}

TEST_CASE("plain split normal shifts its mean towards the wider side") {
  const auto value = asymunc::UncertainValue::create(10.0, 1.0, 3.0);
  CHECK_FALSE(value.conserves_mean());
  asymunc::RandomStream stream(21);
  const auto samples = asymunc::draw_samples(value, 200'000, stream).data();

  CHECK(test_common::mean(samples) == doctest::Approx(10.0 + 2.0 * std::sqrt(2.0 / std::numbers::pi)).epsilon(0.003));
}
