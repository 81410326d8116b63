#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

namespace asymunc {

// Fixed-size population of Monte Carlo trial values. Invalid trials hold NaN.
class SampleSet {
 public:
  SampleSet() = default;

  explicit SampleSet(std::size_t trials, double value = 0.0) : values_(trials, value) {}

  explicit SampleSet(std::vector<double> values) : values_(std::move(values)) {}

  std::size_t size() const { return values_.size(); }
  bool empty() const { return values_.empty(); }

  double& operator[](std::size_t trial) { return values_[trial]; }
  double operator[](std::size_t trial) const { return values_[trial]; }

  double& at(std::size_t trial) { return values_.at(trial); }
  double at(std::size_t trial) const { return values_.at(trial); }

  std::span<double> block(std::size_t begin, std::size_t end) {
    if (begin > end || end > values_.size()) {
      throw std::out_of_range("SampleSet block out of range");
    }
    return std::span<double>(values_.data() + begin, end - begin);
  }

  std::span<const double> block(std::size_t begin, std::size_t end) const {
    if (begin > end || end > values_.size()) {
      throw std::out_of_range("SampleSet block out of range");
    }
    return std::span<const double>(values_.data() + begin, end - begin);
  }

  std::size_t invalid_count() const {
    return static_cast<std::size_t>(
        std::count_if(values_.begin(), values_.end(), [](double v) { return !std::isfinite(v); }));
  }

  std::vector<double> valid_values() const {
    std::vector<double> out;
    out.reserve(values_.size());
    for (double v : values_) {
      if (std::isfinite(v)) {
        out.push_back(v);
      }
    }
    return out;
  }

  std::vector<double>& data() { return values_; }
  const std::vector<double>& data() const { return values_; }

  auto begin() const { return values_.begin(); }
  auto end() const { return values_.end(); }

 private:
  std::vector<double> values_;
};

}  // namespace asymunc
