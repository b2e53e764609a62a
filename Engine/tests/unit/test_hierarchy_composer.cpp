/**
 * @file test_hierarchy_composer.cpp
 * @brief Level-by-level resolution into a draft hierarchy
 */

#include <gtest/gtest.h>
#include <lookup/hierarchy_composer.hpp>
#include "../support/feature_builders.hpp"

using namespace Cadis;
using namespace CadisTest;
using Geometry::Vec2;

TEST(HierarchyComposerTest, ResolvesNestedLevelsCoarsestFirst) {
    auto manifest = manifest_with_levels({{2, std::nullopt}, {4, 2}, {7, 4}});
    auto index = Spatial::SpatialIndex::from_features({
        square_feature("country", 2, 0, 0, 100, 100),
        square_feature("city", 4, 10, 10, 20, 20, "country"),
        square_feature("district", 7, 12, 12, 14, 14, "city"),
    }, manifest.level_numbers(), Spatial::IndexOptions{});

    HierarchyComposer composer(manifest, index);
    DraftHierarchy draft = composer.resolve(Vec2(13, 13));

    ASSERT_EQ(draft.entries.size(), 3u);
    EXPECT_TRUE(draft.complete());
    EXPECT_EQ(draft.entries[0].node->id, "country");
    EXPECT_EQ(draft.entries[1].node->id, "city");
    EXPECT_EQ(draft.entries[2].node->id, "district");
    EXPECT_EQ(draft.entries[2].node->source, Source::Polygon);
    EXPECT_EQ(draft.entries[2].node->parent_id, "city");
    EXPECT_EQ(draft.point, Vec2(13, 13));
}

TEST(HierarchyComposerTest, MissingLevelBecomesHoleAndResolutionContinues) {
    auto manifest = manifest_with_levels({{2, std::nullopt}, {4, 2}, {7, 4}});
    auto index = Spatial::SpatialIndex::from_features({
        square_feature("country", 2, 0, 0, 100, 100),
        square_feature("district", 7, 12, 12, 14, 14),
    }, manifest.level_numbers(), Spatial::IndexOptions{});

    DraftHierarchy draft = HierarchyComposer(manifest, index).resolve(Vec2(13, 13));
    ASSERT_EQ(draft.entries.size(), 3u);
    EXPECT_FALSE(draft.entries[0].is_hole());
    EXPECT_TRUE(draft.entries[1].is_hole());
    EXPECT_EQ(draft.entries[1].level, 4);
    EXPECT_FALSE(draft.entries[2].is_hole());
    EXPECT_EQ(draft.hole_count(), 1u);
    EXPECT_EQ(draft.resolved_count(), 2u);
}

TEST(HierarchyComposerTest, OutsideCoverageIsAllHoles) {
    auto manifest = manifest_with_levels({{4, std::nullopt}, {7, 4}});
    auto index = Spatial::SpatialIndex::from_features({square_feature("city", 4, 0, 0, 1, 1)},
                                                      manifest.level_numbers(), Spatial::IndexOptions{});

    DraftHierarchy draft = HierarchyComposer(manifest, index).resolve(Vec2(50, 50));
    EXPECT_EQ(draft.entries.size(), 2u);
    EXPECT_EQ(draft.resolved_count(), 0u);
}

TEST(HierarchyComposerTest, ParentHintOutranksArea) {
    auto manifest = manifest_with_levels({{4, std::nullopt}, {7, 4}});
    auto index = Spatial::SpatialIndex::from_features({
        square_feature("city", 4, 0, 0, 10, 10),
        // Smaller, but claims a different parent
        square_feature("stray", 7, 4, 4, 6, 6, "elsewhere"),
        square_feature("district", 7, 2, 2, 8, 8, "city"),
    }, manifest.level_numbers(), Spatial::IndexOptions{});

    DraftHierarchy draft = HierarchyComposer(manifest, index).resolve(Vec2(5, 5));
    EXPECT_EQ(draft.find(7)->node->id, "district");
}

TEST(HierarchyComposerTest, NoHintMatchFallsBackToMostSpecific) {
    auto manifest = manifest_with_levels({{4, std::nullopt}, {7, 4}});
    auto index = Spatial::SpatialIndex::from_features({
        square_feature("city", 4, 0, 0, 10, 10),
        square_feature("small", 7, 4, 4, 6, 6, "x"),
        square_feature("large", 7, 2, 2, 8, 8, "y"),
    }, manifest.level_numbers(), Spatial::IndexOptions{});

    DraftHierarchy draft = HierarchyComposer(manifest, index).resolve(Vec2(5, 5));
    EXPECT_EQ(draft.find(7)->node->id, "small");
}

TEST(HierarchyComposerTest, DeclaredParentLevelIsPreferredOverNearestLevel) {
    // Level 7 declares level 4 as its parent although level 6 sits between them.
    auto manifest = manifest_with_levels({{4, std::nullopt}, {6, 4}, {7, 4}});
    auto index = Spatial::SpatialIndex::from_features({
        square_feature("city", 4, 0, 0, 10, 10),
        square_feature("zone", 6, 0, 0, 10, 10, "city"),
        square_feature("by_zone", 7, 4, 4, 6, 6, "zone"),
        square_feature("by_city", 7, 2, 2, 8, 8, "city"),
    }, manifest.level_numbers(), Spatial::IndexOptions{});

    DraftHierarchy draft = HierarchyComposer(manifest, index).resolve(Vec2(5, 5));
    EXPECT_EQ(draft.find(7)->node->id, "by_city");
}

TEST(HierarchyComposerTest, IsDeterministic) {
    auto manifest = manifest_with_levels({{4, std::nullopt}, {7, 4}});
    auto index = Spatial::SpatialIndex::from_features({
        square_feature("city", 4, 0, 0, 10, 10),
        square_feature("b", 7, 0, 0, 5, 5),
        square_feature("a", 7, 0, 0, 5, 5),
    }, manifest.level_numbers(), Spatial::IndexOptions{});

    HierarchyComposer composer(manifest, index);
    DraftHierarchy first = composer.resolve(Vec2(2, 2));
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(composer.resolve(Vec2(2, 2)), first);
    }
    EXPECT_EQ(first.find(7)->node->id, "a");
}
