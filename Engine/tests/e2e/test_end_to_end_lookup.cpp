/**
 * @file test_end_to_end_lookup.cpp
 * @brief Dataset directory -> snapshot -> lookup result, through the public entry points
 */

#include <gtest/gtest.h>
#include <core/errors.hpp>
#include <lookup/dataset_snapshot.hpp>
#include "../support/dataset_fixture.hpp"
#include <cmath>
#include <limits>

using namespace Cadis;
using namespace CadisTest;

TEST(EndToEndLookupTest, TaipeiXinyi) {
    DatasetFixture fx("e2e");
    add_taipei(fx);
    fx.write();

    SnapshotHandle snapshot = Cadis::initialize(fx.path());
    ASSERT_NE(snapshot, nullptr);

    HierarchyResult r = Cadis::lookup(snapshot, kTaipeiLat, kTaipeiLon);
    EXPECT_EQ(r.status, LookupStatus::Ok);
    EXPECT_STREQ(to_string(r.status), "ok");
    ASSERT_EQ(r.nodes.size(), 2u);

    EXPECT_EQ(r.nodes[0].level, 4);
    EXPECT_EQ(r.nodes[0].id, "tw_r1293250");
    EXPECT_EQ(r.nodes[0].name, "臺北市");
    EXPECT_EQ(r.nodes[0].rank, 0);
    EXPECT_EQ(r.nodes[0].source, "polygon");

    EXPECT_EQ(r.nodes[1].level, 7);
    EXPECT_EQ(r.nodes[1].id, "tw_r2881027");
    EXPECT_EQ(r.nodes[1].name, "信義區");
    EXPECT_EQ(r.nodes[1].rank, 1);

    EXPECT_EQ(r.summary_text, "臺北市, 信義區");
    EXPECT_EQ(r.iso_context.iso2, "TW");
    EXPECT_EQ(r.iso_context.name, "Taiwan");
    EXPECT_EQ(r.engine, "cadis");
    EXPECT_EQ(r.dataset_id, "tw");
    EXPECT_EQ(r.version, "2026.01.0");
}

TEST(EndToEndLookupTest, FarAwayIsNotFound) {
    DatasetFixture fx("e2e");
    add_taipei(fx);
    fx.write();

    HierarchyResult r = Cadis::lookup(Cadis::initialize(fx.path()), 48.8566, 2.3522);
    EXPECT_EQ(r.status, LookupStatus::NotFound);
    EXPECT_STREQ(to_string(r.status), "not_found");
    EXPECT_TRUE(r.nodes.empty());
    EXPECT_EQ(r.summary_text, "");
    EXPECT_EQ(r.iso_context.iso2, "TW");
}

TEST(EndToEndLookupTest, HoleGivesPartial) {
    DatasetFixture fx("e2e");
    add_taipei(fx);
    fx.write();

    // Inside the city, outside the district
    HierarchyResult r = Cadis::lookup(Cadis::initialize(fx.path()), 25.15, 121.50);
    EXPECT_EQ(r.status, LookupStatus::Partial);
    ASSERT_EQ(r.nodes.size(), 1u);
    EXPECT_EQ(r.nodes[0].id, "tw_r1293250");
    EXPECT_EQ(r.nodes[0].rank, 0);
}

TEST(EndToEndLookupTest, RepeatedLookupsAreIdentical) {
    DatasetFixture fx("e2e");
    add_taipei(fx);
    fx.add_policy("nearest_centroid_fill").add_policy("name_normalize");
    fx.write();

    SnapshotHandle snapshot = Cadis::initialize(fx.path());
    for (double lat : {25.033, 25.15, 24.0}) {
        HierarchyResult first = Cadis::lookup(snapshot, lat, kTaipeiLon);
        for (int i = 0; i < 5; ++i) {
            EXPECT_EQ(Cadis::lookup(snapshot, lat, kTaipeiLon), first);
        }
    }
}

TEST(EndToEndLookupTest, LevelsStrictlyIncrease) {
    DatasetFixture fx("e2e");
    add_taipei(fx);
    fx.add_policy("parent_link_repair").add_policy("nearest_centroid_fill");
    fx.write();

    SnapshotHandle snapshot = Cadis::initialize(fx.path());
    for (double lat = 24.95; lat <= 25.22; lat += 0.01) {
        for (double lon = 121.44; lon <= 121.68; lon += 0.02) {
            HierarchyResult r = Cadis::lookup(snapshot, lat, lon);
            for (size_t i = 1; i < r.nodes.size(); ++i) {
                EXPECT_LT(r.nodes[i - 1].level, r.nodes[i].level);
                EXPECT_EQ(r.nodes[i].rank, static_cast<int>(i));
            }
        }
    }
}

TEST(EndToEndLookupTest, LocaleControlsSummary) {
    DatasetFixture fx("e2e");
    add_taipei(fx);
    fx.manifest["locale"] = {
        {"name_fields", {"name:en", "name"}},
        {"summary_order", "fine_to_coarse"},
        {"summary_separator", " / "}
    };
    fx.add_policy("localize_names");
    fx.write();

    HierarchyResult r = Cadis::lookup(Cadis::initialize(fx.path()), kTaipeiLat, kTaipeiLon);
    EXPECT_EQ(r.summary_text, "Xinyi District / Taipei City");
    EXPECT_EQ(r.nodes[0].name, "Taipei City");
}

TEST(EndToEndLookupTest, InvalidCoordinatesAreRejected) {
    DatasetFixture fx("e2e");
    add_taipei(fx);
    fx.write();
    SnapshotHandle snapshot = Cadis::initialize(fx.path());

    const double nan = std::numeric_limits<double>::quiet_NaN();
    const std::vector<std::pair<double, double>> bad = {
        {90.0001, 0}, {-91, 0}, {0, 180.5}, {0, -181}, {nan, 0}, {0, nan},
        {std::numeric_limits<double>::infinity(), 0}
    };
    for (const auto& [lat, lon] : bad) {
        try {
            Cadis::lookup(snapshot, lat, lon);
            FAIL() << "accepted " << lat << ", " << lon;
        } catch (const InvalidCoordinateError& e) {
            EXPECT_EQ(e.code(), ErrorCode::InvalidCoordinate);
        }
    }

    // Extremes are valid
    EXPECT_NO_THROW(Cadis::lookup(snapshot, 90, 180));
    EXPECT_NO_THROW(Cadis::lookup(snapshot, -90, -180));
}

TEST(EndToEndLookupTest, LookupOnNullSnapshotFails) {
    EXPECT_THROW(Cadis::lookup(SnapshotHandle{}, 25.0, 121.5), DatasetLoadError);
}

TEST(EndToEndLookupTest, InitializeReportsLoadErrors) {
    DatasetFixture missing("e2e");
    EXPECT_THROW(Cadis::initialize(missing.path()), ManifestError);

    DatasetFixture unknown("e2e");
    add_taipei(unknown);
    unknown.add_policy("summon_district");
    unknown.write();
    EXPECT_THROW(Cadis::initialize(unknown.path()), UnknownPolicyError);

    DatasetFixture broken("e2e");
    add_taipei(broken);
    broken.write();
    broken.write_text(DatasetFixture::level_file(4), "{\"type\": \"FeatureCollection\", \"features\": [");
    try {
        Cadis::initialize(broken.path());
        FAIL() << "expected DatasetLoadError";
    } catch (const DatasetLoadError& e) {
        EXPECT_EQ(e.dataset_dir(), broken.path().string());
        EXPECT_NE(e.reason().find(DatasetFixture::level_file(4)), std::string::npos);
    }
}
