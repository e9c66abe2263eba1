#include "pfbook/gas_model.h"
#include <gtest/gtest.h>

using namespace pfbook;

TEST(GasModelTest, Schedule) {
    EXPECT_EQ(kUnpackGas, 24u);
    EXPECT_EQ(kPackGas, 24u);
    EXPECT_EQ(read_gas(true), 2100u);
    EXPECT_EQ(read_gas(false), 100u);
    EXPECT_EQ(write_gas(true), 20000u);
    EXPECT_EQ(write_gas(false), 5000u);
}

TEST(GasModelTest, EmptyLogsCostNothing) {
    EXPECT_EQ(cost_of_update({}).total, 0u);
    EXPECT_TRUE(cost_of_update({}).details.empty());
    EXPECT_EQ(cost_of_query({}).total, 0u);
}

TEST(GasModelTest, UpdateCostItemised) {
    PackedFenwick tree(16);
    auto report = cost_of_update(tree.update(5, 10));

    ASSERT_EQ(report.details.size(), 3u);
    EXPECT_EQ(report.details[0].tick, 5);
    EXPECT_EQ(report.details[0].word_index, 1);
    EXPECT_EQ(report.details[0].gas, 2100u + 24 + 20000 + 24);
    EXPECT_EQ(report.details[1].tick, 7);
    EXPECT_EQ(report.details[1].gas, 100u + 24 + 5000 + 24);
    EXPECT_EQ(report.details[2].tick, 15);
    EXPECT_EQ(report.details[2].word_index, 3);
    EXPECT_EQ(report.details[2].gas, 2100u + 24 + 20000 + 24);
    EXPECT_EQ(report.total, 22148u * 2 + 5148u);

    std::vector<int64_t> words{1, 3};
    EXPECT_EQ(report.words_touched(), words);
}

TEST(GasModelTest, SecondTransactionPaysColdWritesWarmReads) {
    PackedFenwick tree(16);
    tree.begin_tx();
    tree.update(5, 10);
    tree.begin_tx();
    auto report = cost_of_update(tree.update(5, 10));

    ASSERT_EQ(report.details.size(), 3u);
    EXPECT_EQ(report.details[0].gas, 100u + 24 + 20000 + 24);
    EXPECT_EQ(report.details[1].gas, 100u + 24 + 5000 + 24);
    EXPECT_EQ(report.details[2].gas, 100u + 24 + 20000 + 24);
}

TEST(GasModelTest, QueryCostItemised) {
    PackedFenwick tree(16);
    tree.update(5, 10);
    auto report = cost_of_query(tree.query(5).operations);

    ASSERT_EQ(report.details.size(), 2u);
    EXPECT_EQ(report.details[0].gas, 100u + 24);   // word 1 already read
    EXPECT_EQ(report.details[1].gas, 2100u + 24);  // word 0 first read
    EXPECT_EQ(report.total, 124u + 2124u);
}

TEST(GasModelTest, HandBuiltLog) {
    std::vector<UpdateOp> ops;
    ops.push_back({0, 0, {{0, false}}, {{0, true}}});
    auto report = cost_of_update(ops);
    EXPECT_EQ(report.total, 100u + 24 + 20000 + 24);

    std::vector<QueryOp> reads{{4, 1, true}, {4, 1, false}};
    EXPECT_EQ(cost_of_query(reads).total, 2124u + 124u);
}
