#pragma once

#include <memory>

#include "asymunc/api/propagator.hpp"

namespace asymunc {

std::unique_ptr<IPropagator> make_runtime_propagator();

}  // namespace asymunc
