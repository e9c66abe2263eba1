#pragma once
#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "pfbook/types.h"
#include "pfbook/word_codec.h"

namespace pfbook {

// Packed Fenwick tree over a metered word store.
//
// Tick t is Fenwick position t + 1. Parent/child links are never stored:
// update walks idx += idx & -idx (towards the root), query walks
// idx -= idx & -idx (towards zero). Four consecutive positions share one
// 256-bit word, so the short hops near the leaves often stay in one word.
//
// Words are sparse: a missing entry is four zero slots and is materialised
// on first write only.
//
// Every slot access is classified against two independent sets:
//   read_seen_   - monotone for the lifetime of the tree. A word is cold for
//                  its first read only, the way a storage slot is warm once
//                  loaded.
//   write_dirty_ - cleared by begin_tx(). A word is cold for its first write
//                  in each transaction.
//
// Ticks outside [0, max_ticks) are a caller precondition and are not checked.

struct Access {
    int64_t word_index;
    bool cold;
};

// One Fenwick node touched by update(): exactly one read and one write
struct UpdateOp {
    Tick tick;
    int64_t word_index;
    std::vector<Access> reads;
    std::vector<Access> writes;
};

// One Fenwick node touched by query()
struct QueryOp {
    Tick tick;
    int64_t word_index;
    bool cold;
};

struct QueryResult {
    Volume sum = 0;
    std::vector<QueryOp> operations;
};

struct SlotRead {
    Volume value;
    int64_t word_index;
    bool cold;
};

struct SlotWrite {
    int64_t word_index;
    bool cold;
};

class PackedFenwick {
public:
    using WordMap = std::unordered_map<int64_t, Word>;

    explicit PackedFenwick(Tick max_ticks) : max_ticks_(max_ticks) {}

    SlotRead read_slot(Tick tick) {
        auto [word_index, lane] = word_position(tick);
        Volume value = unpack_word(load(word_index))[lane];
        bool cold = read_seen_.insert(word_index).second;
        return {value, word_index, cold};
    }

    SlotWrite write_slot(Tick tick, Volume value) {
        auto [word_index, lane] = word_position(tick);
        Lanes lanes = unpack_word(load(word_index));
        lanes[lane] = value;
        words_[word_index] = pack_word(lanes);
        bool cold = write_dirty_.insert(word_index).second;
        return {word_index, cold};
    }

    // Start a new transaction: writes become cold again, reads stay warm.
    void begin_tx() { write_dirty_.clear(); }

    // Add delta to tick. Arithmetic is mod 2^64, so subtracting v is
    // update(tick, 0 - v); the caller keeps the slot from going negative.
    std::vector<UpdateOp> update(Tick tick, Volume delta) {
        std::vector<UpdateOp> operations;
        for (int64_t idx = tick + 1; idx <= max_ticks_; idx += idx & -idx) {
            SlotRead read = read_slot(idx - 1);
            SlotWrite write = write_slot(idx - 1, read.value + delta);
            operations.push_back({idx - 1, read.word_index,
                                  {{read.word_index, read.cold}},
                                  {{write.word_index, write.cold}}});
        }
        return operations;
    }

    // Sum of all deltas applied to ticks <= tick. query(-1) is (0, []).
    QueryResult query(Tick tick) {
        QueryResult result;
        for (int64_t idx = tick + 1; idx > 0; idx -= idx & -idx) {
            SlotRead read = read_slot(idx - 1);
            result.sum += read.value;
            result.operations.push_back({idx - 1, read.word_index, read.cold});
        }
        return result;
    }

    // --- Side-effect-free inspection (no access classification) -------------

    // Raw Fenwick node value stored for tick
    Volume slot(Tick tick) const {
        auto [word_index, lane] = word_position(tick);
        auto it = words_.find(word_index);
        return it == words_.end() ? 0 : unpack_word(it->second)[lane];
    }

    Volume peek_prefix(Tick tick) const {
        Volume sum = 0;
        for (int64_t idx = tick + 1; idx > 0; idx -= idx & -idx) {
            sum += slot(idx - 1);
        }
        return sum;
    }

    Tick max_ticks() const { return max_ticks_; }
    size_t word_count() const { return words_.size(); }
    const WordMap& words() const { return words_; }

    bool is_read_seen(int64_t word_index) const { return read_seen_.count(word_index) != 0; }
    bool is_write_dirty(int64_t word_index) const { return write_dirty_.count(word_index) != 0; }

private:
    Word load(int64_t word_index) const {
        auto it = words_.find(word_index);
        return it == words_.end() ? Word{0} : it->second;
    }

    Tick max_ticks_;
    WordMap words_;
    std::unordered_set<int64_t> read_seen_;
    std::unordered_set<int64_t> write_dirty_;
};

} // namespace pfbook
