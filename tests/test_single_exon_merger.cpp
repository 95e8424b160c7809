#include <gtest/gtest.h>

#include "single_exon_merger.hpp"

TEST(SingleExonMergerTest, OverlappingIntervalsMerge) {
    single_exon_table table;
    table["chr1"] = {{50, 150}, {120, 200}};

    auto merged = merge_single_exons(table);
    ASSERT_EQ(merged["chr1"].size(), 1u);
    EXPECT_EQ(merged["chr1"][0], exon_span(50, 200));
}

TEST(SingleExonMergerTest, DisjointIntervalsKeptInOrder) {
    single_exon_table table;
    table["chr1"] = {{500, 600}, {50, 150}, {140, 160}};
    table["chr2"] = {{10, 20}};

    auto merged = merge_single_exons(table);
    ASSERT_EQ(merged.size(), 2u);
    ASSERT_EQ(merged["chr1"].size(), 2u);
    EXPECT_EQ(merged["chr1"][0], exon_span(50, 160));
    EXPECT_EQ(merged["chr1"][1], exon_span(500, 600));
    EXPECT_EQ(merged["chr2"][0], exon_span(10, 20));
}

TEST(SingleExonMergerTest, NoPairwiseOverlapRemains) {
    single_exon_table table;
    table["chr1"] = {{0, 10}, {5, 30}, {30, 40}, {100, 110}, {105, 107}, {200, 300}, {250, 260}};

    auto merged = merge_single_exons(table)["chr1"];
    for (size_t i = 1; i < merged.size(); ++i) {
        EXPECT_GT(merged[i].start, merged[i - 1].end);
    }
}

TEST(SingleExonMergerTest, EmptySequencesDropped) {
    single_exon_table table;
    table["chr1"];
    EXPECT_TRUE(merge_single_exons(table).empty());
}
