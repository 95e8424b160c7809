#include <gtest/gtest.h>

#include <stdexcept>

#include "exon_registry.hpp"

TEST(ExonRegistryTest, SameCoordinatesShareHandle) {
    exon_registry registry;
    auto first = registry.add_exons("chr1", {{100, 200}, {300, 400}});
    auto second = registry.add_exons("chr1", {{100, 200}, {300, 450}});

    EXPECT_EQ(registry.size(), 3u);
    EXPECT_EQ(first[0], second[0]);
    EXPECT_NE(first[1], second[1]);

    auto found = registry.find("chr1", 300, 450);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, second[1]);
    EXPECT_FALSE(registry.find("chr2", 100, 200).has_value());
}

TEST(ExonRegistryTest, TerminalFlagsAssigned) {
    exon_registry registry;
    auto ids = registry.add_exons("chr1", {{100, 200}, {300, 400}, {500, 600}});

    EXPECT_EQ(registry.get(ids[0]).terminal, terminal_type::LEFT);
    EXPECT_EQ(registry.get(ids[1]).terminal, terminal_type::NONE);
    EXPECT_EQ(registry.get(ids[2]).terminal, terminal_type::RIGHT);
    EXPECT_EQ(registry.get(ids[0]).get_key(), "chr1:100-200");
    EXPECT_EQ(registry.get(ids[2]).length(), 100u);
}

TEST(ExonRegistryTest, InternalOccurrenceClearsTerminal) {
    exon_registry registry;
    auto ids = registry.add_exons("chr1", {{300, 400}, {500, 600}});
    ASSERT_EQ(registry.get(ids[0]).terminal, terminal_type::LEFT);

    registry.add_exons("chr1", {{100, 200}, {300, 400}, {500, 600}, {700, 800}});
    EXPECT_EQ(registry.get(ids[0]).terminal, terminal_type::NONE);
    EXPECT_EQ(registry.get(ids[1]).terminal, terminal_type::NONE);
}

TEST(ExonRegistryTest, InternalExonStaysInternal) {
    exon_registry registry;
    auto ids = registry.add_exons("chr1", {{100, 200}, {300, 400}, {500, 600}});
    registry.add_exons("chr1", {{300, 400}, {700, 800}});

    EXPECT_EQ(registry.get(ids[1]).terminal, terminal_type::NONE);
}

TEST(ExonRegistryTest, LeftRightConflictKeepsFirstFlag) {
    exon_registry registry;
    auto ids = registry.add_exons("chr1", {{300, 400}, {500, 600}});
    registry.add_exons("chr1", {{100, 200}, {300, 400}});

    EXPECT_EQ(registry.get(ids[0]).terminal, terminal_type::LEFT);
}

TEST(ExonRegistryTest, SequenceRanksFollowFirstAppearance) {
    exon_registry registry;
    registry.add_exons("chr2", {{100, 200}, {300, 400}});
    registry.add_exons("chr1", {{100, 200}, {300, 400}});

    EXPECT_EQ(registry.seqid_rank("chr2"), 0u);
    EXPECT_EQ(registry.seqid_rank("chr1"), 1u);
    EXPECT_THROW(registry.seqid_rank("chrX"), std::out_of_range);
}
