#include "asymunc/core/random_stream.hpp"

namespace asymunc {

std::uint64_t splitmix64(std::uint64_t state) {
  std::uint64_t z = state + 0x9E3779B97F4A7C15ull;
  z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ull;
  z = (z ^ (z >> 27)) * 0x94D049BB133111EBull;
  return z ^ (z >> 31);
}

std::uint64_t derive_stream_seed(
    std::uint64_t run_seed,
    std::uint64_t stream_key,
    std::uint64_t block_index,
    StreamDomain domain) {
  const std::uint64_t tag = domain == StreamDomain::Session ? 0xA0761D6478BD642Full : 0ull;
  std::uint64_t state = splitmix64(run_seed ^ tag);
  state = splitmix64(state ^ stream_key);
  return splitmix64(state ^ (block_index * 0xD1B54A32D192ED03ull));
}

double open_unit_interval(std::uint64_t bits) {
  const std::uint64_t mantissa = bits >> 12;
  return (static_cast<double>(mantissa) + 0.5) * 0x1p-52;
}

RandomStream::RandomStream(std::uint64_t seed) : seed_(seed), engine_(seed) {}

double RandomStream::uniform_open01() {
  return open_unit_interval(engine_());
}

}  // namespace asymunc
