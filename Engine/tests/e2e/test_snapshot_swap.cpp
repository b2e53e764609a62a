/**
 * @file test_snapshot_swap.cpp
 * @brief LookupEngine load/swap semantics under failure, cancellation and concurrency
 */

#include <gtest/gtest.h>
#include <core/errors.hpp>
#include <lookup/lookup_engine.hpp>
#include "../support/dataset_fixture.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace Cadis;
using namespace CadisTest;

namespace {

// Every feature name carries the dataset version, so a mixed result is detectable.
void write_versioned(DatasetFixture& fx, const std::string& version) {
    fx.manifest["version"] = version;
    fx.add_level(4, "city").add_level(7, "district", 4).add_level(8, "village", 7);
    fx.add_feature(4, {"c", "city-" + version, rect(0, 0, 10, 10), "", {}, {}});
    fx.add_feature(7, {"d", "district-" + version, rect(0, 0, 5, 5), "c", {}, {}});
    fx.add_feature(8, {"v", "village-" + version, rect(1, 1, 2, 2), "d", {}, {}});
    fx.write();
}

} // namespace

TEST(SnapshotSwapTest, LookupBeforeLoadFails) {
    LookupEngine engine;
    EXPECT_EQ(engine.snapshot(), nullptr);
    EXPECT_EQ(engine.generation(), 0u);
    EXPECT_THROW(engine.lookup(1.5, 1.5), DatasetLoadError);
}

TEST(SnapshotSwapTest, LoadActivatesAndCountsGenerations) {
    DatasetFixture a("swap"), b("swap");
    write_versioned(a, "A");
    write_versioned(b, "B");

    LookupEngine engine;
    ASSERT_TRUE(engine.load(a.path()));
    EXPECT_EQ(engine.generation(), 1u);
    EXPECT_EQ(engine.lookup(1.5, 1.5).version, "A");

    ASSERT_TRUE(engine.load(b.path()));
    EXPECT_EQ(engine.generation(), 2u);
    EXPECT_EQ(engine.lookup(1.5, 1.5).version, "B");
}

TEST(SnapshotSwapTest, HeldSnapshotOutlivesSwap) {
    DatasetFixture a("swap"), b("swap");
    write_versioned(a, "A");
    write_versioned(b, "B");

    LookupEngine engine;
    engine.load(a.path());
    SnapshotHandle held = engine.snapshot();
    engine.load(b.path());

    EXPECT_EQ(held->lookup(1.5, 1.5).version, "A");
    EXPECT_EQ(held->lookup(1.5, 1.5).nodes[0].name, "city-A");
    EXPECT_EQ(engine.lookup(1.5, 1.5).nodes[0].name, "city-B");
}

TEST(SnapshotSwapTest, FailedLoadKeepsPreviousSnapshot) {
    DatasetFixture good("swap"), bad("swap");
    write_versioned(good, "A");
    write_versioned(bad, "B");
    bad.write_text(DatasetFixture::level_file(7), "[]");

    LookupEngine engine;
    engine.load(good.path());
    SnapshotHandle before = engine.snapshot();

    EXPECT_THROW(engine.load(bad.path()), DatasetLoadError);
    EXPECT_EQ(engine.snapshot(), before);
    EXPECT_EQ(engine.generation(), 1u);
    EXPECT_EQ(engine.lookup(1.5, 1.5).version, "A");
}

TEST(SnapshotSwapTest, CancelledLoadKeepsPreviousSnapshot) {
    DatasetFixture a("swap"), b("swap");
    write_versioned(a, "A");
    write_versioned(b, "B");

    LookupEngine engine;
    engine.load(a.path());

    CancelToken cancel;
    cancel.cancel();
    EXPECT_FALSE(engine.load(b.path(), &cancel));
    EXPECT_EQ(engine.generation(), 1u);
    EXPECT_EQ(engine.lookup(1.5, 1.5).version, "A");

    EXPECT_EQ(DatasetSnapshot::build(b.path(), EngineConfig{}, &cancel), nullptr);
}

TEST(SnapshotSwapTest, ConcurrentLookupsNeverSeeMixedSnapshots) {
    DatasetFixture a("swap"), b("swap");
    write_versioned(a, "A");
    write_versioned(b, "B");

    LookupEngine engine;
    engine.load(a.path());

    std::atomic<bool> stop{false};
    std::atomic<int> mixed{0};
    std::atomic<int> lookups{0};

    std::vector<std::thread> readers;
    for (int t = 0; t < 4; ++t) {
        readers.emplace_back([&] {
            while (!stop.load()) {
                HierarchyResult r = engine.lookup(1.5, 1.5);
                if (r.status != LookupStatus::Ok || r.nodes.size() != 3) {
                    ++mixed;
                    continue;
                }
                for (const auto& node : r.nodes) {
                    const std::string suffix = "-" + r.version;
                    if (node.name.size() < suffix.size() ||
                        node.name.compare(node.name.size() - suffix.size(), suffix.size(), suffix) != 0) {
                        ++mixed;
                    }
                }
                ++lookups;
            }
        });
    }

    while (lookups.load() == 0) std::this_thread::yield();
    for (int i = 0; i < 10; ++i) {
        engine.load(i % 2 == 0 ? b.path() : a.path());
    }
    stop.store(true);
    for (auto& t : readers) t.join();

    EXPECT_EQ(mixed.load(), 0);
    EXPECT_GT(lookups.load(), 0);
    EXPECT_EQ(engine.generation(), 11u);
}
