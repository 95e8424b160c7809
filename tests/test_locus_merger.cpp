#include <gtest/gtest.h>

#include "locus_merger.hpp"

class LocusMergerTest : public ::testing::Test {
protected:
    exon_registry exons;
    intron_clusters introns;

    void add_run(const std::string& seqid, const std::vector<exon_span>& run) {
        auto ids = exons.add_exons(seqid, run);
        introns.link_introns(exons, ids, 100000);
    }
};

TEST_F(LocusMergerTest, SharedExonJoinsClusters) {
    add_run("chr1", {{100, 200}, {300, 400}});
    add_run("chr1", {{300, 400}, {500, 600}});
    ASSERT_EQ(introns.cluster_count(), 2u);

    auto loci = merge_loci(exons, introns);
    ASSERT_EQ(loci.size(), 1u);
    EXPECT_EQ(loci[0].clusters.size(), 2u);
    EXPECT_EQ(loci[0].seqid, "chr1");
    EXPECT_EQ(loci[0].start, 100u);
}

TEST_F(LocusMergerTest, ChainedClustersFormOneComponent) {
    add_run("chr1", {{100, 200}, {300, 400}});
    add_run("chr1", {{300, 400}, {500, 600}});
    add_run("chr1", {{500, 600}, {700, 800}});
    add_run("chr1", {{700, 800}, {900, 1000}});
    ASSERT_EQ(introns.cluster_count(), 4u);

    auto loci = merge_loci(exons, introns);
    ASSERT_EQ(loci.size(), 1u);
    EXPECT_EQ(loci[0].clusters.size(), 4u);
}

TEST_F(LocusMergerTest, UnrelatedClustersStaySeparate) {
    add_run("chr1", {{5000, 5100}, {5200, 5300}});
    add_run("chr1", {{100, 200}, {300, 400}});

    auto loci = merge_loci(exons, introns);
    ASSERT_EQ(loci.size(), 2u);
    EXPECT_EQ(loci[0].start, 100u);
    EXPECT_EQ(loci[1].start, 5000u);
}

TEST_F(LocusMergerTest, SequencesInOrderOfAppearance) {
    add_run("chr2", {{100, 200}, {300, 400}});
    add_run("chr1", {{50, 80}, {300, 400}});

    auto loci = merge_loci(exons, introns);
    ASSERT_EQ(loci.size(), 2u);
    EXPECT_EQ(loci[0].seqid, "chr2");
    EXPECT_EQ(loci[1].seqid, "chr1");
}

TEST_F(LocusMergerTest, SameCoordinatesOnOtherSequenceDoNotJoin) {
    add_run("chr1", {{100, 200}, {300, 400}});
    add_run("chr2", {{300, 400}, {500, 600}});

    EXPECT_EQ(merge_loci(exons, introns).size(), 2u);
}

TEST_F(LocusMergerTest, EmptyState) {
    EXPECT_TRUE(merge_loci(exons, introns).empty());
}
