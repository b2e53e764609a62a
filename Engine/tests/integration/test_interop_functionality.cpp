/**
 * @file test_interop_functionality.cpp
 * @brief Functional tests for the C Interop API.
 *
 * These follow the call pattern a foreign-language binding uses: create,
 * load, lookup, free, destroy, reading cadis_get_last_error() after failures.
 */

#include <gtest/gtest.h>
#include <interop_api.h>
#include <core/errors.hpp>
#include "../support/dataset_fixture.hpp"
#include <string>

using namespace CadisTest;

class InteropTest : public ::testing::Test {
protected:
    void SetUp() override {
        add_taipei(fx);
        fx.write();

        engine = cadis_engine_create();
        ASSERT_NE(engine, nullptr) << cadis_get_last_error();
    }

    void TearDown() override {
        if (engine) {
            cadis_engine_destroy(engine);
            engine = nullptr;
        }
    }

    DatasetFixture fx{"interop"};
    h_cadis_engine_t engine = nullptr;
};

TEST_F(InteropTest, VersionIsReported) {
    EXPECT_STRNE(cadis_get_version(), "");
}

TEST_F(InteropTest, LookupBeforeLoadFails) {
    HLookupResult result{};
    EXPECT_FALSE(cadis_lookup(engine, 25.0, 121.5, &result));
    EXPECT_NE(std::string(cadis_get_last_error()).find("Dataset load failed"), std::string::npos);
    EXPECT_EQ(cadis_get_last_error_code(), static_cast<int>(Cadis::ErrorCode::DatasetLoadFailed));
}

TEST_F(InteropTest, FullLookupCycle) {
    ASSERT_TRUE(cadis_engine_load(engine, fx.path().string().c_str())) << cadis_get_last_error();
    EXPECT_EQ(cadis_engine_generation(engine), 1u);
    EXPECT_EQ(cadis_get_last_error_code(), 0);

    HLookupResult result{};
    ASSERT_TRUE(cadis_lookup(engine, kTaipeiLat, kTaipeiLon, &result)) << cadis_get_last_error();

    EXPECT_EQ(result.status, CADIS_STATUS_OK);
    ASSERT_EQ(result.nodes_count, 2u);
    EXPECT_EQ(result.nodes[0].level, 4);
    EXPECT_EQ(result.nodes[0].rank, 0);
    EXPECT_STREQ(result.nodes[0].osm_id, "tw_r1293250");
    EXPECT_STREQ(result.nodes[0].source, "polygon");
    EXPECT_STREQ(result.nodes[1].osm_id, "tw_r2881027");
    EXPECT_STREQ(result.nodes[1].name, "信義區");
    EXPECT_STREQ(result.summary_text, "臺北市, 信義區");
    EXPECT_STREQ(result.iso2, "TW");
    EXPECT_STREQ(result.dataset_id, "tw");
    EXPECT_STREQ(result.version, "2026.01.0");

    cadis_free_result(&result);
    EXPECT_EQ(result.nodes, nullptr);
    EXPECT_EQ(result.nodes_count, 0u);
}

TEST_F(InteropTest, NotFoundHasNoNodes) {
    ASSERT_TRUE(cadis_engine_load(engine, fx.path().string().c_str()));

    HLookupResult result{};
    ASSERT_TRUE(cadis_lookup(engine, -33.86, 151.21, &result));
    EXPECT_EQ(result.status, CADIS_STATUS_NOT_FOUND);
    EXPECT_EQ(result.nodes_count, 0u);
    EXPECT_EQ(result.nodes, nullptr);
    cadis_free_result(&result);
}

TEST_F(InteropTest, InvalidCoordinateSetsError) {
    ASSERT_TRUE(cadis_engine_load(engine, fx.path().string().c_str()));

    HLookupResult result{};
    EXPECT_FALSE(cadis_lookup(engine, 123.0, 0.0, &result));
    EXPECT_EQ(cadis_get_last_error_code(), static_cast<int>(Cadis::ErrorCode::InvalidCoordinate));
    EXPECT_NE(std::string(cadis_get_last_error()).find("Invalid coordinate"), std::string::npos);
}

TEST_F(InteropTest, FailedLoadKeepsActiveDataset) {
    ASSERT_TRUE(cadis_engine_load(engine, fx.path().string().c_str()));

    DatasetFixture empty("interop");
    EXPECT_FALSE(cadis_engine_load(engine, empty.path().string().c_str()));
    EXPECT_EQ(cadis_get_last_error_code(), static_cast<int>(Cadis::ErrorCode::ManifestInvalid));
    EXPECT_EQ(cadis_engine_generation(engine), 1u);

    HLookupResult result{};
    ASSERT_TRUE(cadis_lookup(engine, kTaipeiLat, kTaipeiLon, &result));
    EXPECT_EQ(result.status, CADIS_STATUS_OK);
    cadis_free_result(&result);
}

TEST_F(InteropTest, NullArgumentsAreRejected) {
    EXPECT_FALSE(cadis_engine_load(nullptr, fx.path().string().c_str()));
    EXPECT_FALSE(cadis_engine_load(engine, nullptr));
    EXPECT_FALSE(cadis_lookup(engine, 0, 0, nullptr));
    EXPECT_EQ(cadis_engine_generation(nullptr), 0u);
    cadis_free_result(nullptr);
    cadis_engine_destroy(nullptr);
}
