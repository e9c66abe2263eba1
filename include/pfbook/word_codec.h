#pragma once
#include <array>
#include <cstdint>
#include <limits>
#include <boost/multiprecision/cpp_int.hpp>
#include "pfbook/types.h"

namespace pfbook {

// 256-bit storage word holding four 64-bit lanes.
//
// Lane i lives at bits [64*i, 64*i + 64). Tick t is stored in word t / 4,
// lane t % 4, so Fenwick neighbours that differ only in the low two bits of
// their index share a single storage word:
//
//   Word 0: [ tick 3 | tick 2 | tick 1 | tick 0 ]   <- 256 bits
//   Word 1: [ tick 7 | tick 6 | tick 5 | tick 4 ]
//
// Unpacking costs 4 shifts + 4 masks, packing 4 shifts + 4 ORs.

using Word = boost::multiprecision::uint256_t;
using Lanes = std::array<uint64_t, 4>;

static constexpr int kLanesPerWord = 4;
static constexpr unsigned kLaneBits = 64;

struct WordPosition {
    int64_t word_index;
    int lane;
};

inline WordPosition word_position(Tick tick) {
    return {tick / kLanesPerWord, static_cast<int>(tick % kLanesPerWord)};
}

inline const Word& lane_mask() {
    static const Word mask{std::numeric_limits<uint64_t>::max()};
    return mask;
}

inline Word pack_word(const Lanes& lanes) {
    Word packed = 0;
    for (int i = 0; i < kLanesPerWord; ++i) {
        packed |= (Word{lanes[i]} & lane_mask()) << (i * kLaneBits);
    }
    return packed;
}

inline Lanes unpack_word(const Word& packed) {
    Lanes lanes{};
    for (int i = 0; i < kLanesPerWord; ++i) {
        lanes[i] = static_cast<uint64_t>((packed >> (i * kLaneBits)) & lane_mask());
    }
    return lanes;
}

} // namespace pfbook
