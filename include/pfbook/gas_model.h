#pragma once
#include <algorithm>
#include <cstdint>
#include <vector>
#include "pfbook/packed_fenwick.h"
#include "pfbook/types.h"

namespace pfbook {

// --- Gas schedule ------------------------------------------------------------
static constexpr Gas kColdReadGas = 2100;    // cold SLOAD
static constexpr Gas kWarmReadGas = 100;     // warm SLOAD
static constexpr Gas kColdWriteGas = 20000;  // SSTORE, first write in tx
static constexpr Gas kWarmWriteGas = 5000;   // SSTORE, already dirty
static constexpr Gas kBitOpGas = 3;
static constexpr Gas kUnpackGas = 8 * kBitOpGas;  // 4 shifts + 4 masks
static constexpr Gas kPackGas = 8 * kBitOpGas;    // 4 shifts + 4 ORs

inline Gas read_gas(bool cold) { return cold ? kColdReadGas : kWarmReadGas; }
inline Gas write_gas(bool cold) { return cold ? kColdWriteGas : kWarmWriteGas; }

struct GasDetail {
    Tick tick;
    int64_t word_index;
    Gas gas;
};

struct GasReport {
    Gas total = 0;
    std::vector<GasDetail> details;

    // Distinct words in the order they were first touched
    std::vector<int64_t> words_touched() const {
        std::vector<int64_t> words;
        for (const auto& d : details) {
            if (std::find(words.begin(), words.end(), d.word_index) == words.end())
                words.push_back(d.word_index);
        }
        return words;
    }
};

// Per node: read + unpack + write + pack
inline GasReport cost_of_update(const std::vector<UpdateOp>& operations) {
    GasReport report;
    report.details.reserve(operations.size());
    for (const auto& op : operations) {
        Gas gas = 0;
        for (const auto& read : op.reads) gas += read_gas(read.cold);
        gas += kUnpackGas;
        for (const auto& write : op.writes) gas += write_gas(write.cold);
        gas += kPackGas;

        report.details.push_back({op.tick, op.word_index, gas});
        report.total += gas;
    }
    return report;
}

// Per node: read + unpack
inline GasReport cost_of_query(const std::vector<QueryOp>& operations) {
    GasReport report;
    report.details.reserve(operations.size());
    for (const auto& op : operations) {
        Gas gas = read_gas(op.cold) + kUnpackGas;
        report.details.push_back({op.tick, op.word_index, gas});
        report.total += gas;
    }
    return report;
}

} // namespace pfbook
