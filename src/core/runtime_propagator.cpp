#include "runtime_propagator.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "asymunc/api/validation.hpp"
#include "asymunc/core/errors.hpp"
#include "asymunc/core/logging.hpp"
#include "asymunc/core/random_stream.hpp"
#include "asymunc/core/threading.hpp"
#include "asymunc/sampling/sampler.hpp"
#include "asymunc/stats/aggregator.hpp"

namespace asymunc {
namespace {

double combine(NodeKind kind, double lhs, double rhs) {
  switch (kind) {
    case NodeKind::Add:
      return lhs + rhs;
    case NodeKind::Sub:
      return lhs - rhs;
    case NodeKind::Mul:
      return lhs * rhs;
    case NodeKind::Div:
      return lhs / rhs;
    case NodeKind::Pow:
      return std::pow(lhs, rhs);
    case NodeKind::Min:
      return std::isnan(lhs) || std::isnan(rhs) ? std::numeric_limits<double>::quiet_NaN() : std::min(lhs, rhs);
    case NodeKind::Max:
      return std::isnan(lhs) || std::isnan(rhs) ? std::numeric_limits<double>::quiet_NaN() : std::max(lhs, rhs);
    default:
      break;
  }
  return std::numeric_limits<double>::quiet_NaN();
}

class RuntimePropagator final : public IPropagator {
 public:
  void initialize(const PropagationConfig& config) override {
    throw_if_invalid(config);
    for (const auto& issue : validate_config(config)) {
      if (!issue.fatal) {
        log_message(LogLevel::Warn, issue.message);
      }
    }

    config_ = config;
    samples_.clear();
    stream_keys_.clear();
    next_session_index_ = 0;
    evaluations_ = 0;
    last_valid_count_ = 0;
    last_invalid_fraction_ = 0.0;
    initialized_ = true;
  }

  const PropagationConfig& config() const override {
    require_initialized();
    return config_;
  }

  Result evaluate(const Expression& expression) override {
    const SampleSet output = sample(expression);
    Result result = summarize(output, config_.coverage, config_.minimum_valid_samples);
    if (log_level() <= LogLevel::Debug) {
      log_message(
          LogLevel::Debug,
          "evaluated " + expression.to_string() + " mean=" + std::to_string(result.mean) + " interval=[" +
              std::to_string(result.lower_bound) + ", " + std::to_string(result.upper_bound) + "]");
    }
    return result;
  }

  SampleSet sample(const Expression& expression) override {
    require_initialized();

    const std::vector<UncertainValue> values = expression.values();
    if (log_level() <= LogLevel::Debug) {
      log_message(
          LogLevel::Debug,
          "propagating " + std::to_string(values.size()) + " quantities over " +
              std::to_string(config_.trial_count) + " trials");
    }

    for (const auto& value : values) {
      ensure_sampled(value);
    }

    const Program program = compile_program(expression);
    SampleSet output(config_.trial_count);
    parallel_for_blocks(
        config_.trial_count,
        config_.block_size,
        config_.threads,
        [&](std::size_t, std::size_t begin, std::size_t end) {
          run_program(program, begin, output.block(begin, end));
        });

    const std::size_t invalid = output.invalid_count();
    ++evaluations_;
    last_valid_count_ = output.size() - invalid;
    last_invalid_fraction_ = static_cast<double>(invalid) / static_cast<double>(output.size());
    if (invalid > 0) {
      std::ostringstream out;
      out << invalid << " of " << output.size() << " trials produced no finite result (fraction "
          << last_invalid_fraction_ << ")";
      log_message(LogLevel::Warn, out.str());
    }

    if (!config_.cache_samples) {
      samples_.clear();
    }
    return output;
  }

  const SampleSet& samples_for(const UncertainValue& value) override {
    require_initialized();
    return ensure_sampled(value);
  }

  void clear_cache() override { samples_.clear(); }

  std::size_t cached_values() const override { return samples_.size(); }

  std::string diagnostics_json() const override {
    std::ostringstream out;
    out << "{"
        << "\"trial_count\":" << config_.trial_count << ","
        << "\"coverage\":" << config_.coverage << ","
        << "\"seed\":" << config_.seed << ","
        << "\"threads\":" << config_.threads << ","
        << "\"block_size\":" << config_.block_size << ","
        << "\"evaluations\":" << evaluations_ << ","
        << "\"cached_values\":" << samples_.size() << ","
        << "\"known_values\":" << stream_keys_.size() << ","
        << "\"last_valid_count\":" << last_valid_count_ << ","
        << "\"last_invalid_fraction\":" << last_invalid_fraction_ << "}";
    return out.str();
  }

 private:
  struct KeyedValue {
    UncertainValue value;
    std::uint64_t key = 0;
    StreamDomain domain = StreamDomain::Seeded;
  };

  void require_initialized() const {
    if (!initialized_) {
      throw std::logic_error("RuntimePropagator is not initialized");
    }
  }

  // Explicit seeds pin the stream; otherwise the session's first-seen order does.
  // The stored copy keeps the quantity alive so its identity cannot be reused.
  // Entries live until initialize(), so redraws after clear_cache() repeat.
  const KeyedValue& stream_key(const UncertainValue& value) {
    const auto it = stream_keys_.find(value.identity());
    if (it != stream_keys_.end()) {
      return it->second;
    }
    KeyedValue keyed{value, 0, StreamDomain::Seeded};
    if (value.seed().has_value()) {
      keyed.key = *value.seed();
    } else {
      keyed.key = next_session_index_++;
      keyed.domain = StreamDomain::Session;
    }
    return stream_keys_.emplace(value.identity(), std::move(keyed)).first->second;
  }

  const SampleSet& ensure_sampled(const UncertainValue& value) {
    const auto it = samples_.find(value.identity());
    if (it != samples_.end()) {
      return it->second;
    }

    const KeyedValue& keyed = stream_key(value);
    const std::uint64_t key = keyed.key;
    const StreamDomain domain = keyed.domain;
    SampleSet drawn(config_.trial_count);
    const ValueSpec& spec = value.spec();
    parallel_for_blocks(
        config_.trial_count,
        config_.block_size,
        config_.threads,
        [&](std::size_t block, std::size_t begin, std::size_t end) {
          RandomStream stream(derive_stream_seed(config_.seed, key, block, domain));
          draw_into(spec, stream, drawn.block(begin, end));
        });

    return samples_.emplace(value.identity(), std::move(drawn)).first->second;
  }

  struct Step {
    NodeKind kind = NodeKind::Constant;
    double constant = 0.0;
    UnaryFunction function = UnaryFunction::Sqrt;
    const SampleSet* source = nullptr;
  };

  struct Program {
    std::vector<Step> steps;
    std::size_t max_depth = 0;
  };

  // Flattens the tree to postfix steps bound to the cached sample sets.
  Program compile_program(const Expression& expression) const {
    Program program;
    std::size_t depth = 0;
    for (const ExprNode* node : expression.postorder()) {
      Step step;
      step.kind = node->kind;
      step.constant = node->constant;
      step.function = node->function;
      switch (node->kind) {
        case NodeKind::Value:
          step.source = &samples_.at(node->value->identity());
          ++depth;
          break;
        case NodeKind::Constant:
          ++depth;
          break;
        case NodeKind::Neg:
        case NodeKind::Unary:
          break;
        default:
          --depth;
          break;
      }
      program.max_depth = std::max(program.max_depth, depth);
      program.steps.push_back(step);
    }
    return program;
  }

  // Stack machine over the postfix steps, one trial at a time; dest covers
  // trials [begin, begin + dest.size()).
  static void run_program(const Program& program, std::size_t begin, std::span<double> dest) {
    std::vector<double> stack(std::max<std::size_t>(1, program.max_depth), 0.0);

    for (std::size_t i = 0; i < dest.size(); ++i) {
      const std::size_t trial = begin + i;
      std::size_t top = 0;
      for (const Step& step : program.steps) {
        switch (step.kind) {
          case NodeKind::Value:
            stack[top++] = (*step.source)[trial];
            break;
          case NodeKind::Constant:
            stack[top++] = step.constant;
            break;
          case NodeKind::Neg:
            stack[top - 1] = -stack[top - 1];
            break;
          case NodeKind::Unary:
            stack[top - 1] = apply_unary(step.function, stack[top - 1]);
            break;
          case NodeKind::Add:
          case NodeKind::Sub:
          case NodeKind::Mul:
          case NodeKind::Div:
          case NodeKind::Pow:
          case NodeKind::Min:
          case NodeKind::Max:
            --top;
            stack[top - 1] = combine(step.kind, stack[top - 1], stack[top]);
            break;
        }
      }
      dest[i] = stack[0];
    }
  }

  PropagationConfig config_;
  std::unordered_map<const void*, SampleSet> samples_;
  std::unordered_map<const void*, KeyedValue> stream_keys_;
  std::uint64_t next_session_index_ = 0;
  std::size_t evaluations_ = 0;
  std::size_t last_valid_count_ = 0;
  double last_invalid_fraction_ = 0.0;
  bool initialized_ = false;
};

}  // namespace

std::unique_ptr<IPropagator> make_runtime_propagator() {
  return std::make_unique<RuntimePropagator>();
}

}  // namespace asymunc
