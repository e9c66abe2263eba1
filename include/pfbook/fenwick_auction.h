#pragma once
#include <algorithm>
#include <cstdint>
#include <utility>
#include <vector>
#include "pfbook/gas_model.h"
#include "pfbook/packed_fenwick.h"
#include "pfbook/types.h"

namespace pfbook {

// Auction book on a packed Fenwick tree.
//
// Bids are single Fenwick updates (O(log n) nodes, one transaction each).
// Clearing runs in two phases:
//   search - binary search over prefix sums for the clearing price, read only
//   write  - walk ticks downward from the top of the book, removing filled
//            volume with negative updates, in one fresh transaction
//
// The write phase recovers per-tick volume as query(t) - query(t - 1) and is
// linear in the scanned range. That is the cost being compared against the
// frontier model, so it is left as is.

static constexpr Tick kNoClearingPrice = -1;

struct FenwickBid {
    Tick tick;
    Volume amount;
    std::vector<UpdateOp> operations;
    GasReport gas;
};

struct ClearingSearch {
    Tick clearing_price = kNoClearingPrice;
    std::vector<QueryOp> operations;  // every query issued, in order
};

struct TickFill {
    Tick tick;
    Volume amount;
};

struct ClearingResult {
    ClearingSearch search;
    GasReport search_gas;
    std::vector<TickFill> filled;
    std::vector<UpdateOp> update_operations;
    GasReport write_gas;
    Volume unfilled = 0;

    bool cleared() const { return search.clearing_price != kNoClearingPrice; }
};

struct FenwickState {
    Tick max_ticks;
    size_t word_count;
    Volume total_volume;
};

class FenwickAuction {
public:
    explicit FenwickAuction(Tick max_ticks) : tree_(max_ticks) {}

    FenwickBid bid(Tick tick, Volume amount) {
        tree_.begin_tx();
        FenwickBid result{tick, amount, tree_.update(tick, amount), {}};
        result.gas = cost_of_update(result.operations);
        return result;
    }

    // Highest tick p such that the volume at or above p covers target_volume.
    // Returns kNoClearingPrice with no operations if the whole book is short.
    ClearingSearch find_clearing_price(Volume target_volume) {
        const Tick max_ticks = tree_.max_ticks();
        ClearingSearch search;

        QueryResult total = tree_.query(max_ticks - 1);
        if (total.sum < target_volume) return search;
        search.operations = std::move(total.operations);
        search.clearing_price = 0;

        Tick low = 0;
        Tick high = max_ticks;
        while (low <= high) {
            Tick mid = low + (high - low) / 2;
            if (mid == 0) {
                low = mid + 1;
                continue;
            }

            QueryResult below = tree_.query(mid - 1);
            search.operations.insert(search.operations.end(),
                                     below.operations.begin(), below.operations.end());

            Volume volume_from_mid = total.sum - below.sum;
            if (volume_from_mid >= target_volume) {
                search.clearing_price = mid;
                low = mid + 1;
            } else {
                high = mid - 1;
            }
        }
        return search;
    }

    ClearingResult clear(Volume target_volume) {
        ClearingResult result;
        result.search = find_clearing_price(target_volume);
        result.search_gas = cost_of_query(result.search.operations);
        if (!result.cleared()) {
            result.unfilled = target_volume;
            return result;
        }

        tree_.begin_tx();
        Volume remaining = target_volume;
        for (Tick tick = tree_.max_ticks() - 1;
             tick >= result.search.clearing_price && remaining > 0; --tick) {
            Volume at_tick = tree_.query(tick).sum - tree_.query(tick - 1).sum;
            if (at_tick == 0) continue;

            Volume take = std::min(remaining, at_tick);
            std::vector<UpdateOp> ops = tree_.update(tick, Volume{0} - take);
            result.update_operations.insert(result.update_operations.end(),
                                            ops.begin(), ops.end());
            result.filled.push_back({tick, take});
            remaining -= take;
        }
        result.unfilled = remaining;
        result.write_gas = cost_of_update(result.update_operations);
        return result;
    }

    // --- Pass-throughs ---
    QueryResult query(Tick tick) { return tree_.query(tick); }
    std::vector<UpdateOp> update(Tick tick, Volume delta) { return tree_.update(tick, delta); }
    void begin_tx() { tree_.begin_tx(); }

    FenwickState state() const {
        return {tree_.max_ticks(), tree_.word_count(), tree_.peek_prefix(tree_.max_ticks() - 1)};
    }

    const PackedFenwick& tree() const { return tree_; }
    Tick max_ticks() const { return tree_.max_ticks(); }

private:
    PackedFenwick tree_;
};

} // namespace pfbook
