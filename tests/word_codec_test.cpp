#include "pfbook/word_codec.h"
#include <gtest/gtest.h>
#include <limits>
#include <random>

using pfbook::Lanes;
using pfbook::Word;

TEST(WordCodecTest, ZeroWordUnpacksToZeroLanes) {
    Lanes lanes = pfbook::unpack_word(Word{0});
    for (auto v : lanes) EXPECT_EQ(v, 0u);
    EXPECT_EQ(pfbook::pack_word({0, 0, 0, 0}), Word{0});
}

TEST(WordCodecTest, LaneIsPlacedAtSixtyFourBitOffset) {
    // [100, 50, 25, 0] from lane 3 down to lane 0
    Word packed = pfbook::pack_word({0, 25, 50, 100});
    Word expected = (Word{100} << 192) | (Word{50} << 128) | (Word{25} << 64);
    EXPECT_EQ(packed, expected);
}

TEST(WordCodecTest, MaxValuesDoNotBleedIntoNeighbours) {
    constexpr uint64_t kMax = std::numeric_limits<uint64_t>::max();
    for (int lane = 0; lane < pfbook::kLanesPerWord; ++lane) {
        Lanes in{};
        in[lane] = kMax;
        Lanes out = pfbook::unpack_word(pfbook::pack_word(in));
        for (int i = 0; i < pfbook::kLanesPerWord; ++i) {
            EXPECT_EQ(out[i], i == lane ? kMax : 0u) << "lane=" << lane << " i=" << i;
        }
    }

    Lanes all{kMax, kMax, kMax, kMax};
    EXPECT_EQ(pfbook::unpack_word(pfbook::pack_word(all)), all);
    EXPECT_EQ(pfbook::pack_word(all), ~Word{0});
}

TEST(WordCodecTest, RoundTripRandomLanes) {
    std::mt19937_64 rng(12345);
    for (int i = 0; i < 1000; ++i) {
        Lanes in{rng(), rng(), rng(), rng()};
        ASSERT_EQ(pfbook::unpack_word(pfbook::pack_word(in)), in) << "iteration=" << i;
    }
}

TEST(WordCodecTest, WordPosition) {
    auto p0 = pfbook::word_position(0);
    EXPECT_EQ(p0.word_index, 0);
    EXPECT_EQ(p0.lane, 0);

    auto p5 = pfbook::word_position(5);
    EXPECT_EQ(p5.word_index, 1);
    EXPECT_EQ(p5.lane, 1);

    auto p2537 = pfbook::word_position(2537);
    EXPECT_EQ(p2537.word_index, 634);
    EXPECT_EQ(p2537.lane, 1);
}
