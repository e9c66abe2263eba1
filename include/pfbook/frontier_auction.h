#pragma once
#include <cstdint>
#include <stdexcept>
#include <unordered_map>
#include <vector>
#include <boost/multiprecision/cpp_int.hpp>
#include "pfbook/config.h"
#include "pfbook/gas_model.h"
#include "pfbook/types.h"
#include "pfbook/word_codec.h"

namespace pfbook {

// --- Bit helpers for 256-bit masks -------------------------------------------

// Isolate the lowest set bit: mask & -mask, with -mask as ~mask + 1.
inline Word lowest_set_bit(const Word& mask) {
    return mask & (~mask + 1);
}

// Position of the lowest set bit, or kBlockBits for an all-zero mask.
inline unsigned count_trailing_zeros(const Word& mask) {
    if (mask == 0) return static_cast<unsigned>(kBlockBits);
    return static_cast<unsigned>(boost::multiprecision::lsb(lowest_set_bit(mask)));
}

// --- Monotone frontier auction -----------------------------------------------
//
// Keeps the lowest admitted tick (pstar) and the volume at or above it
// (vstar). A bid adds volume; while vstar exceeds the sale supply the whole
// level at pstar is evicted and pstar moves to the next occupied tick.
//
// Occupied ticks are tracked in a presence bitmap: block b = tick >> 8 owns
// a 256-bit mask, bit (tick & 255) set while the tick holds volume. Finding
// the next occupied tick loads at most one mask per block, so a bid costs a
// constant number of writes plus the amortised scan.
//
// pstar never decreases. A bid below pstar is not admitted and leaves the
// book untouched, which keeps vstar equal to the volume at or above pstar.

enum class FrontierStep {
    kVolumeWrite,
    kBitSet,
    kClear,
};

struct FrontierGasItem {
    FrontierStep step;
    Tick tick;  // bid tick, or the evicted tick for kClear
    Gas gas;
};

struct FrontierGasReport {
    Gas total = 0;
    std::vector<FrontierGasItem> items;

    void add(FrontierStep step, Tick tick, Gas gas) {
        items.push_back({step, tick, gas});
        total += gas;
    }
};

struct ClearEvent {
    Tick from;
    Tick to;
    Gas gas;
};

struct FrontierBid {
    Tick tick;
    Volume amount;
    bool admitted;
    Tick pstar;
    Volume vstar;
    std::vector<ClearEvent> clear_events;
    FrontierGasReport gas;
};

struct FrontierState {
    Tick max_ticks;
    Tick pstar;
    Volume vstar;
    Volume sale_supply;
    size_t active_ticks;
    size_t active_blocks;
};

class FrontierAuction {
public:
    using VolumeMap = std::unordered_map<Tick, Volume>;
    using BlockMap = std::unordered_map<int64_t, Word>;

    FrontierAuction(Tick max_ticks, Volume sale_supply = kDefaultSaleSupply)
        : max_ticks_(max_ticks), sale_supply_(sale_supply)
    {
        if (sale_supply_ == 0)
            throw std::invalid_argument("FrontierAuction: sale supply must be positive");
    }

    FrontierBid bid(Tick tick, Volume amount) {
        FrontierBid result{tick, amount, false, pstar_, vstar_, {}, {}};
        if (tick < pstar_) return result;
        result.admitted = true;

        // 1. per-tick volume (SLOAD + SSTORE folded into the write price)
        Volume& level = volume_[tick];
        result.gas.add(FrontierStep::kVolumeWrite, tick, write_gas(level == 0));
        level += amount;

        // 2. running volume above the frontier
        vstar_ += amount;

        // 3. presence bit
        const int64_t block = tick >> kBlockShift;
        const unsigned bit = static_cast<unsigned>(tick & (kBlockBits - 1));
        Word& mask = block_bits_[block];
        if (!boost::multiprecision::bit_test(mask, bit)) {
            result.gas.add(FrontierStep::kBitSet, tick, write_gas(mask == 0));
            boost::multiprecision::bit_set(mask, bit);
        }

        // 4. evict whole levels from the bottom while oversubscribed
        while (vstar_ > sale_supply_ && pstar_ < max_ticks_) {
            ClearEvent event = evict_frontier();
            result.gas.add(FrontierStep::kClear, event.from, event.gas);
            result.clear_events.push_back(event);
        }

        result.pstar = pstar_;
        result.vstar = vstar_;
        return result;
    }

    // Next occupied tick at or after start_tick, or max_ticks if none.
    // gas accumulates one cold mask load per block inspected.
    Tick find_next_set_bit(Tick start_tick, Gas& gas) const {
        const int64_t num_blocks = (max_ticks_ + kBlockBits - 1) >> kBlockShift;
        int64_t block = start_tick >> kBlockShift;
        unsigned from_bit = static_cast<unsigned>(start_tick & (kBlockBits - 1));

        for (; block < num_blocks; ++block, from_bit = 0) {
            gas += kColdReadGas;
            auto it = block_bits_.find(block);
            if (it == block_bits_.end()) continue;

            Word mask = it->second & (~Word{0} << from_bit);
            if (mask != 0) {
                return (block << kBlockShift) + count_trailing_zeros(mask);
            }
        }
        return max_ticks_;
    }

    FrontierState state() const {
        return {max_ticks_, pstar_, vstar_, sale_supply_, volume_.size(), block_bits_.size()};
    }

    Volume volume_at(Tick tick) const {
        auto it = volume_.find(tick);
        return it == volume_.end() ? 0 : it->second;
    }

    bool is_occupied(Tick tick) const {
        auto it = block_bits_.find(tick >> kBlockShift);
        return it != block_bits_.end() &&
               boost::multiprecision::bit_test(it->second,
                                               static_cast<unsigned>(tick & (kBlockBits - 1)));
    }

    Tick pstar() const { return pstar_; }
    Volume vstar() const { return vstar_; }
    Volume sale_supply() const { return sale_supply_; }
    Tick max_ticks() const { return max_ticks_; }
    const VolumeMap& volumes() const { return volume_; }
    const BlockMap& block_bits() const { return block_bits_; }

private:
    ClearEvent evict_frontier() {
        const Tick from = pstar_;
        Gas gas = 0;

        auto it = volume_.find(pstar_);
        if (it != volume_.end()) {
            vstar_ -= it->second;
            volume_.erase(it);
        }
        gas += kWarmWriteGas;

        auto block_it = block_bits_.find(pstar_ >> kBlockShift);
        if (block_it != block_bits_.end()) {
            boost::multiprecision::bit_unset(block_it->second,
                                             static_cast<unsigned>(pstar_ & (kBlockBits - 1)));
            if (block_it->second == 0) block_bits_.erase(block_it);
        }
        gas += kWarmWriteGas;

        pstar_ = find_next_set_bit(pstar_ + 1, gas);
        return {from, pstar_, gas};
    }

    Tick max_ticks_;
    Volume sale_supply_;
    Tick pstar_ = 0;
    Volume vstar_ = 0;
    VolumeMap volume_;
    BlockMap block_bits_;
};

} // namespace pfbook
