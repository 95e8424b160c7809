#include <gtest/gtest.h>

#include <set>

#include "path_enumerator.hpp"

class PathEnumeratorTest : public ::testing::Test {
protected:
    exon_registry exons;
    std::vector<exon_id> ids;

    void SetUp() override {
        // a: 100-200, b: 300-400, c: 500-600, d: 700-800
        ids = exons.add_exons("chr1", {{100, 200}, {300, 400}, {500, 600}, {700, 800}});
    }
};

TEST_F(PathEnumeratorTest, LinearChain) {
    splice_graph graph;
    graph.add_edge(ids[0], ids[1]);
    graph.add_edge(ids[1], ids[2]);

    auto paths = enumerate_paths(graph, exons);
    ASSERT_EQ(paths.size(), 1u);
    EXPECT_EQ(paths[0], (transcript_path{ids[0], ids[1], ids[2]}));
}

TEST_F(PathEnumeratorTest, BranchesInPositionOrder) {
    splice_graph graph;
    graph.add_edge(ids[0], ids[2]);
    graph.add_edge(ids[0], ids[1]);
    graph.add_edge(ids[1], ids[3]);
    graph.add_edge(ids[2], ids[3]);

    auto paths = enumerate_paths(graph, exons);
    ASSERT_EQ(paths.size(), 2u);
    EXPECT_EQ(paths[0], (transcript_path{ids[0], ids[1], ids[3]}));
    EXPECT_EQ(paths[1], (transcript_path{ids[0], ids[2], ids[3]}));
}

TEST_F(PathEnumeratorTest, MultipleRoots) {
    splice_graph graph;
    graph.add_edge(ids[1], ids[3]);
    graph.add_edge(ids[0], ids[3]);

    auto paths = enumerate_paths(graph, exons);
    ASSERT_EQ(paths.size(), 2u);
    EXPECT_EQ(paths[0].front(), ids[0]);
    EXPECT_EQ(paths[1].front(), ids[1]);
}

TEST_F(PathEnumeratorTest, CycleTerminates) {
    splice_graph graph;
    graph.add_edge(ids[0], ids[1]);
    graph.add_edge(ids[1], ids[2]);
    graph.add_edge(ids[2], ids[1]);

    auto paths = enumerate_paths(graph, exons);
    ASSERT_EQ(paths.size(), 1u);
    EXPECT_EQ(paths[0], (transcript_path{ids[0], ids[1], ids[2]}));
}

TEST_F(PathEnumeratorTest, NoExonRepeatsWithinPath) {
    splice_graph graph;
    graph.add_edge(ids[0], ids[1]);
    graph.add_edge(ids[1], ids[2]);
    graph.add_edge(ids[2], ids[3]);
    graph.add_edge(ids[3], ids[1]);
    graph.add_edge(ids[2], ids[1]);

    for (const auto& path : enumerate_paths(graph, exons)) {
        std::set<exon_id> unique(path.begin(), path.end());
        EXPECT_EQ(unique.size(), path.size());
    }
}

TEST_F(PathEnumeratorTest, DeepChainDoesNotRecurse) {
    std::vector<exon_span> run;
    for (size_t i = 0; i < 20000; ++i) {
        run.emplace_back(10000 + i * 100, 10000 + i * 100 + 50);
    }
    auto chain = exons.add_exons("chr2", run);

    splice_graph graph;
    for (size_t i = 0; i + 1 < chain.size(); ++i) {
        graph.add_edge(chain[i], chain[i + 1]);
    }

    auto paths = enumerate_paths(graph, exons);
    ASSERT_EQ(paths.size(), 1u);
    EXPECT_EQ(paths[0].size(), chain.size());
}

TEST_F(PathEnumeratorTest, LengthFilterIsStrict) {
    // 100 + 100 + 100 = 300
    transcript_path path{ids[0], ids[1], ids[2]};
    EXPECT_EQ(transcript_length(path, exons), 300u);
    EXPECT_FALSE(passes_length_filter(path, exons, 300));
    EXPECT_TRUE(passes_length_filter(path, exons, 299));
}
