#include "engine/snapshot_manager.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <fstream>
#include <thread>

using namespace cadence;
using namespace cadence::engine;
using cadence::test::json;
using cadence::test::song;

namespace {

    json bigger_catalog() {
        auto catalog = test::abc_catalog();
        catalog.push_back(song("Song D", "Artist D", {"calm"}, {"jazz"}, "brushed drums in a small room"));
        return catalog;
    }

    // Fails only while the flag is set.
    class SwitchableEmbedder : public Embedder {
    public:
        std::vector<float> embed(const std::string& text) override {
            if (failing) throw EmbedderError("backend down");
            return {static_cast<float>(text.size()), 1.0f};
        }
        size_t dimension() const override { return 2; }
        std::string name() const override { return "switchable"; }

        std::atomic<bool> failing{false};
    };

}

TEST(SnapshotManagerTest, NothingBeforeFirstPublish)
{
    SnapshotManager manager(create_hashing_embedder(16), BuildOptions{});
    EXPECT_FALSE(manager.current());
}

TEST(SnapshotManagerTest, PublishBuildsEveryIndex)
{
    SnapshotManager manager(create_hashing_embedder(16), BuildOptions{});
    SnapshotId id = manager.publish(test::abc_catalog());
    auto snap = manager.current();
    ASSERT_NE(snap, nullptr);
    EXPECT_EQ(snap->id, id);
    EXPECT_EQ(snap->catalog.size(), 3u);
    EXPECT_EQ(snap->facets.all().size(), 3u);
    EXPECT_EQ(snap->vectors.count(), 3u);
    EXPECT_EQ(snap->embedder, "hash:16");
}

TEST(SnapshotManagerTest, IdsIncreaseFromOne)
{
    SnapshotManager manager(create_hashing_embedder(16), BuildOptions{});
    EXPECT_EQ(manager.publish(test::abc_catalog()), 1u);
    EXPECT_EQ(manager.publish(bigger_catalog()), 2u);
    EXPECT_EQ(manager.publish(test::abc_catalog()), 3u);
    EXPECT_EQ(manager.current()->id, 3u);
}

TEST(SnapshotManagerTest, InvalidRevisionKeepsServingSnapshot)
{
    SnapshotManager manager(create_hashing_embedder(16), BuildOptions{});
    manager.publish(test::abc_catalog());
    auto before = manager.current();

    auto bad = bigger_catalog();
    bad[3]["mood"] = json::array({"sad"});
    EXPECT_THROW(manager.publish(bad), ValidationError);
    EXPECT_EQ(manager.current(), before);
    EXPECT_EQ(manager.current()->catalog.size(), 3u);
}

TEST(SnapshotManagerTest, EmbedderFailureKeepsServingSnapshot)
{
    auto embedder = std::make_shared<SwitchableEmbedder>();
    SnapshotManager manager(embedder, BuildOptions{});
    manager.publish(test::abc_catalog());
    auto before = manager.current();

    embedder->failing = true;
    EXPECT_THROW(manager.publish(bigger_catalog()), EmbedderError);
    EXPECT_EQ(manager.current(), before);

    embedder->failing = false;
    EXPECT_EQ(manager.publish(bigger_catalog()), 2u);
    EXPECT_EQ(manager.current()->catalog.size(), 4u);
}

TEST(SnapshotManagerTest, RebuildOfSameRevisionIsEquivalent)
{
    SnapshotManager manager(create_hashing_embedder(32), BuildOptions{});
    manager.publish(test::abc_catalog());
    auto first = manager.current();
    manager.publish(test::abc_catalog());
    auto second = manager.current();

    EXPECT_EQ(first->facets, second->facets);
    EXPECT_EQ(first->catalog.fingerprint(), second->catalog.fingerprint());
    for (const auto& [id, record] : first->catalog) {
        ASSERT_NE(second->catalog.find(id), nullptr);
        EXPECT_EQ(second->catalog.find(id)->embedding_text(), record.embedding_text());
        EXPECT_EQ(*second->vectors.vector(id), *first->vectors.vector(id));
    }
}

TEST(SnapshotManagerTest, CacheIsPrunedToLiveRecords)
{
    auto cache = std::make_shared<EmbeddingCache>();
    ASSERT_TRUE(cache->open(":memory:"));
    SnapshotManager manager(create_hashing_embedder(16), BuildOptions{}, cache);

    manager.publish(bigger_catalog());
    EXPECT_EQ(cache->count(), 4u);
    manager.publish(test::abc_catalog());
    EXPECT_EQ(cache->count(), 3u);
}

TEST(SnapshotManagerTest, ReadersAlwaysSeeACompleteSnapshot)
{
    SnapshotManager manager(create_hashing_embedder(16), BuildOptions{2});
    manager.publish(test::abc_catalog());

    std::atomic<bool> done{false};
    std::atomic<int> inconsistent{0};
    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&]() {
            while (!done) {
                auto snap = manager.current();
                const size_t n = snap->catalog.size();
                if (snap->facets.all().size() != n || snap->vectors.count() != n || (n != 3 && n != 4)) {
                    ++inconsistent;
                }
            }
        });
    }

    for (int i = 0; i < 10; ++i) {
        manager.publish(i % 2 ? test::abc_catalog() : bigger_catalog());
    }
    done = true;
    for (auto& t : readers) t.join();

    EXPECT_EQ(inconsistent.load(), 0);
    EXPECT_EQ(manager.current()->id, 11u);
}

TEST(SnapshotManagerTest, PublishFile)
{
    auto path = std::filesystem::temp_directory_path() / "cadence_snapshot_test.json";
    {
        std::ofstream out(path);
        out << test::abc_catalog().dump();
    }
    SnapshotManager manager(create_hashing_embedder(16), BuildOptions{});
    EXPECT_EQ(manager.publish_file(path), 1u);
    std::filesystem::remove(path);
    EXPECT_THROW(manager.publish_file(path), ValidationError);
    EXPECT_EQ(manager.current()->id, 1u);
}

TEST(SnapshotManagerTest, EmbedderTimeoutFailsTheBuild)
{
    auto slow = with_deadline(std::make_shared<test::SlowEmbedder>(std::chrono::milliseconds(300)),
                              std::chrono::milliseconds(20));
    SnapshotManager manager(slow, BuildOptions{2});
    EXPECT_THROW(manager.publish(test::abc_catalog()), EmbedderError);
    EXPECT_FALSE(manager.current());
}
