#pragma once
#include <cstdint>
#include "pfbook/types.h"

namespace pfbook {

// --- Configuration -----------------------------------------------------------
static constexpr Tick kDefaultMaxTicks = 10'000;
static constexpr Volume kDefaultSaleSupply = 1'000;

// Frontier bitmap: one 256-bit mask per block of 256 ticks
static constexpr Tick kBlockBits = 256;
static constexpr Tick kBlockShift = 8;
static_assert((Tick{1} << kBlockShift) == kBlockBits, "block size must be 2^shift");

enum class AuctionModel {
    kFenwick,   // packed Fenwick tree + binary-search clearing
    kFrontier,  // monotone frontier + presence bitmap
};

struct AuctionConfig {
    AuctionModel model = AuctionModel::kFenwick;
    Tick max_ticks = kDefaultMaxTicks;
    Volume sale_supply = kDefaultSaleSupply;  // frontier model only
};

} // namespace pfbook
