#include "pfbook/auction.h"
#include <algorithm>
#include <cstdio>
#include <random>
#include <vector>

using namespace pfbook;

// Replays one fixed bid stream through both backends and prints the gas
// each one pays, then clears half of the Fenwick book.
int main() {
    constexpr Tick kMaxTicks = kDefaultMaxTicks;
    constexpr int kBids = 2'000;
    std::mt19937_64 rng(42);
    std::uniform_int_distribution<Tick> offset_dist(0, 49);
    std::uniform_int_distribution<Volume> amount_dist(1, 50);

    struct Bid { Tick tick; Volume amount; };
    std::vector<Bid> bids;
    bids.reserve(kBids);
    for (int i = 0; i < kBids; ++i) {
        Tick tick = std::min<Tick>(kMaxTicks - 1, 100 + i / 10 + offset_dist(rng));
        bids.push_back({tick, amount_dist(rng)});
    }

    for (AuctionModel model : {AuctionModel::kFenwick, AuctionModel::kFrontier}) {
        Auction auction = make_auction({model, kMaxTicks, kDefaultSaleSupply});
        Gas total = 0;
        Gas worst = 0;
        for (const auto& b : bids) {
            Gas gas = bid(auction, b.tick, b.amount).total_gas;
            total += gas;
            worst = std::max(worst, gas);
        }
        std::printf("%-8s %d bids: %.1f gas/bid (max %lu, total %lu)\n",
                    model_name(model), kBids, static_cast<double>(total) / kBids,
                    static_cast<unsigned long>(worst), static_cast<unsigned long>(total));

        if (auto* frontier = std::get_if<FrontierAuction>(&auction)) {
            auto s = frontier->state();
            std::printf("         frontier at tick %ld, %lu volume above, %zu active ticks\n",
                        static_cast<long>(s.pstar), static_cast<unsigned long>(s.vstar),
                        s.active_ticks);
        }

        if (auto* fenwick = std::get_if<FenwickAuction>(&auction)) {
            auto s = fenwick->state();
            std::printf("         %zu words hold %lu volume\n", s.word_count,
                        static_cast<unsigned long>(s.total_volume));

            ClearingResult cleared = fenwick->clear(s.total_volume / 2);
            if (!cleared.cleared()) {
                std::printf("         not enough volume to clear\n");
                continue;
            }
            std::printf("         clearing price %ld: search %lu gas over %zu words, "
                        "write %lu gas over %zu ticks\n",
                        static_cast<long>(cleared.search.clearing_price),
                        static_cast<unsigned long>(cleared.search_gas.total),
                        cleared.search_gas.words_touched().size(),
                        static_cast<unsigned long>(cleared.write_gas.total),
                        cleared.filled.size());
        }
    }

    return 0;
}
