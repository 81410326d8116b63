#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace asymunc {

// Malformed distribution parameters, limits, configuration or expression text.
class InvalidParameterError : public std::invalid_argument {
 public:
  explicit InvalidParameterError(const std::string& message) : std::invalid_argument(message) {}
};

// Fewer valid trials than required to compute the requested coverage interval.
class InsufficientSamplesError : public std::runtime_error {
 public:
  InsufficientSamplesError(const std::string& message, std::size_t valid_count, std::size_t required)
      : std::runtime_error(message), valid_count_(valid_count), required_(required) {}

  std::size_t valid_count() const { return valid_count_; }
  std::size_t required() const { return required_; }

 private:
  std::size_t valid_count_ = 0;
  std::size_t required_ = 0;
};

}  // namespace asymunc
