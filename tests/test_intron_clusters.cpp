#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>

#include "intron_clusters.hpp"

namespace {

// register a run and link its introns, as the assembler does
std::optional<cluster_id> add_run(exon_registry& exons, intron_clusters& introns,
                                  const std::vector<exon_span>& run, long long max_intron = 100000) {
    auto ids = exons.add_exons("chr1", run);
    return introns.link_introns(exons, ids, max_intron);
}

} // anonymous namespace

TEST(IntronClustersTest, IntronCoordinatesAndEdges) {
    exon_registry exons;
    intron_clusters introns;
    auto cluster = add_run(exons, introns, {{100, 200}, {300, 400}});

    ASSERT_TRUE(cluster.has_value());
    ASSERT_EQ(introns.size(), 1u);

    auto id = introns.find_intron("chr1", 201, 299);
    ASSERT_TRUE(id.has_value());
    const intron_node& intron = introns.get(*id);
    EXPECT_EQ(intron.get_key(), "chr1:201-299");
    ASSERT_EQ(intron.edges.size(), 1u);

    exon_id up = *exons.find("chr1", 100, 200);
    exon_id down = *exons.find("chr1", 300, 400);
    EXPECT_EQ(*intron.edges.begin(), std::make_pair(up, down));
    EXPECT_TRUE(exons.get(up).next_exons.count(down));
    EXPECT_TRUE(exons.get(up).introns.count(*id));
    EXPECT_TRUE(exons.get(down).introns.count(*id));
}

TEST(IntronClustersTest, AllIntronsOfOneAlignmentShareCluster) {
    exon_registry exons;
    intron_clusters introns;
    add_run(exons, introns, {{100, 200}, {300, 400}, {500, 600}, {700, 800}});

    EXPECT_EQ(introns.size(), 3u);
    EXPECT_EQ(introns.cluster_count(), 1u);

    cluster_id cl = introns.cluster_of(0);
    for (intron_id id = 0; id < introns.size(); ++id) {
        EXPECT_EQ(introns.cluster_of(id), cl);
    }
    EXPECT_EQ(introns.members(cl).size(), 3u);
}

TEST(IntronClustersTest, SharedIntronMergesClusters) {
    exon_registry exons;
    intron_clusters introns;
    auto a = add_run(exons, introns, {{100, 200}, {300, 400}});
    auto b = add_run(exons, introns, {{1000, 1100}, {1200, 1300}});
    ASSERT_TRUE(a.has_value() && b.has_value());
    EXPECT_NE(*a, *b);
    EXPECT_EQ(introns.cluster_count(), 2u);

    // spans both earlier introns
    auto merged = add_run(exons, introns, {{100, 200}, {300, 400}, {1000, 1100}, {1200, 1300}});
    ASSERT_TRUE(merged.has_value());
    EXPECT_EQ(introns.cluster_count(), 1u);
    EXPECT_EQ(introns.members(*merged).size(), 3u);
    EXPECT_THROW(introns.members(*merged == *a ? *b : *a), std::out_of_range);
}

TEST(IntronClustersTest, DistinctIntronsSharingExonStaySeparate) {
    exon_registry exons;
    intron_clusters introns;
    add_run(exons, introns, {{100, 200}, {300, 400}});
    add_run(exons, introns, {{300, 400}, {500, 600}});

    // clusters only merge through a common alignment or intron
    EXPECT_EQ(introns.cluster_count(), 2u);
}

TEST(IntronClustersTest, LongIntronNotLinked) {
    exon_registry exons;
    intron_clusters introns;
    auto cluster = add_run(exons, introns, {{100, 200}, {500, 600}}, 100);

    EXPECT_FALSE(cluster.has_value());
    EXPECT_EQ(introns.size(), 0u);
    EXPECT_TRUE(exons.get(*exons.find("chr1", 100, 200)).next_exons.empty());
}

TEST(IntronClustersTest, IntronSizeBoundary) {
    exon_registry exons;
    intron_clusters introns;
    // intron 201-301: end - start == 100, not greater than max
    auto kept = add_run(exons, introns, {{100, 200}, {302, 400}}, 100);
    EXPECT_TRUE(kept.has_value());
    // intron 201-302: end - start == 101
    auto skipped = add_run(exons, introns, {{100, 200}, {303, 400}}, 100);
    EXPECT_FALSE(skipped.has_value());
}

TEST(IntronClustersTest, EveryMemberReportsItsCluster) {
    exon_registry exons;
    intron_clusters introns;
    add_run(exons, introns, {{100, 200}, {300, 400}});
    add_run(exons, introns, {{500, 600}, {700, 800}});
    add_run(exons, introns, {{900, 1000}, {1100, 1200}});
    add_run(exons, introns, {{300, 400}, {500, 600}, {700, 800}, {900, 1000}});

    size_t total = 0;
    for (const auto& [cl, members] : introns.clusters()) {
        for (intron_id id : members) {
            EXPECT_EQ(introns.cluster_of(id), cl);
        }
        total += members.size();
    }
    EXPECT_EQ(total, introns.size());
}
