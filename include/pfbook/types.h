#pragma once
#include <cstddef>
#include <cstdint>

namespace pfbook {

// Price level in [0, max_ticks). Signed so that tick - 1 == -1 is a valid
// "nothing below tick 0" argument to prefix queries.
using Tick = int64_t;

// Fenwick node value. Prefix sums over these are cumulative volumes.
using Volume = uint64_t;

using Gas = uint64_t;

} // namespace pfbook
