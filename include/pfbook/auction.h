#pragma once
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include "pfbook/config.h"
#include "pfbook/fenwick_auction.h"
#include "pfbook/frontier_auction.h"
#include "pfbook/types.h"

namespace pfbook {

// The two clearing backends expose the same bid/state capability but share
// no state. The backend is picked from AuctionConfig and held by value.

using Auction = std::variant<FenwickAuction, FrontierAuction>;
using BidSummary = std::variant<FenwickBid, FrontierBid>;
using AuctionState = std::variant<FenwickState, FrontierState>;

struct BidOutcome {
    Gas total_gas;
    BidSummary summary;
};

inline const char* model_name(AuctionModel model) {
    switch (model) {
        case AuctionModel::kFenwick: return "fenwick";
        case AuctionModel::kFrontier: return "frontier";
    }
    return "unknown";
}

inline AuctionModel parse_model(const std::string& name) {
    if (name == "fenwick") return AuctionModel::kFenwick;
    if (name == "frontier") return AuctionModel::kFrontier;
    throw std::invalid_argument("unknown auction model: " + name);
}

inline Auction make_auction(const AuctionConfig& config) {
    if (config.max_ticks <= 0)
        throw std::invalid_argument("make_auction: max_ticks must be positive");

    if (config.model == AuctionModel::kFrontier)
        return Auction{std::in_place_type<FrontierAuction>, config.max_ticks, config.sale_supply};
    return Auction{std::in_place_type<FenwickAuction>, config.max_ticks};
}

inline BidOutcome bid(Auction& auction, Tick tick, Volume amount) {
    return std::visit(
        [&](auto& backend) {
            auto result = backend.bid(tick, amount);
            Gas total = result.gas.total;
            return BidOutcome{total, BidSummary{std::move(result)}};
        },
        auction);
}

inline AuctionState state(const Auction& auction) {
    return std::visit([](const auto& backend) { return AuctionState{backend.state()}; }, auction);
}

inline AuctionModel model_of(const Auction& auction) {
    return std::holds_alternative<FrontierAuction>(auction) ? AuctionModel::kFrontier
                                                            : AuctionModel::kFenwick;
}

} // namespace pfbook
