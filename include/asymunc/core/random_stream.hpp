#pragma once

#include <cstdint>
#include <random>

namespace asymunc {

std::uint64_t splitmix64(std::uint64_t state);

// Explicit value seeds and session-assigned keys are mixed separately, so no
// explicit seed can reproduce the stream of a session key.
enum class StreamDomain { Seeded, Session };

// Seed of an independent sub-stream, fixed by the run seed, the value's stream key
// and the trial-block index. Independent of how blocks are spread over threads.
std::uint64_t derive_stream_seed(
    std::uint64_t run_seed,
    std::uint64_t stream_key,
    std::uint64_t block_index,
    StreamDomain domain = StreamDomain::Seeded);

// Maps the top 52 bits of a raw draw to the open interval (0, 1); never 0 or 1.
double open_unit_interval(std::uint64_t bits);

class RandomStream {
 public:
  explicit RandomStream(std::uint64_t seed);

  // Uniform on the open interval (0, 1), 52-bit resolution.
  double uniform_open01();

  std::uint64_t next_u64() { return engine_(); }
  std::uint64_t seed() const { return seed_; }

 private:
  std::uint64_t seed_ = 0;
  std::mt19937_64 engine_;
};

}  // namespace asymunc
