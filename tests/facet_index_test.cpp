#include "engine/facet_index.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <filesystem>

using namespace cadence;
using namespace cadence::engine;
using cadence::test::json;
using cadence::test::song;

namespace {

    const std::string kA = test::id_of("Song A", "Artist A");
    const std::string kB = test::id_of("Song B", "Artist B");
    const std::string kC = test::id_of("Song C", "Artist C");

    class FacetIndexTest : public ::testing::Test {
    protected:
        CatalogStore catalog = CatalogStore::load(test::abc_catalog());
        FacetIndex index = FacetIndex::build(catalog);
    };

}

TEST_F(FacetIndexTest, SingleDimension)
{
    EXPECT_EQ(index.filter({{Facet::Genre, {"pop"}}}), (IdSet{kA, kB}));
}

TEST_F(FacetIndexTest, DimensionsAreIntersected)
{
    EXPECT_EQ(index.filter({{Facet::Genre, {"pop"}}, {Facet::Mood, {"dreamy"}}}), IdSet{kA});
}

TEST_F(FacetIndexTest, ValuesWithinDimensionAreUnitedByDefault)
{
    EXPECT_EQ(index.filter({{Facet::Genre, {"pop", "rock"}}}), (IdSet{kA, kB, kC}));
}

TEST_F(FacetIndexTest, MatchAllRequiresEveryValue)
{
    EXPECT_TRUE(index.filter({{Facet::Genre, {"pop", "rock"}}}, MatchMode::All).empty());
    EXPECT_EQ(index.filter({{Facet::Mood, {"dreamy"}}}, MatchMode::All), (IdSet{kA, kC}));
}

TEST_F(FacetIndexTest, EmptyConstraintsMatchEverything)
{
    EXPECT_EQ(index.filter({}), (IdSet{kA, kB, kC}));
    EXPECT_EQ(index.filter({{Facet::Genre, {}}}), (IdSet{kA, kB, kC}));
}

TEST_F(FacetIndexTest, UnknownOrAbsentValuesMatchNothing)
{
    EXPECT_TRUE(index.filter({{Facet::Genre, {"jazz"}}}).empty());
    EXPECT_TRUE(index.filter({{Facet::Mood, {"sad"}}}).empty());
    EXPECT_TRUE(index.postings(Facet::Mood, "sad").empty());
}

TEST_F(FacetIndexTest, EnergyIsAFacet)
{
    EXPECT_EQ(index.filter({{Facet::Energy, {"medium"}}}), (IdSet{kA, kB, kC}));
    EXPECT_TRUE(index.filter({{Facet::Energy, {"high"}}}).empty());
}

TEST_F(FacetIndexTest, ValuesListsPresentValuesInVocabularyOrder)
{
    auto genres = index.values(Facet::Genre);
    ASSERT_EQ(genres.size(), 2u);
    EXPECT_EQ(genres[0].value, "pop");
    EXPECT_EQ(genres[0].count, 2u);
    EXPECT_EQ(genres[1].value, "rock");
    EXPECT_EQ(genres[1].count, 1u);

    auto moods = index.values(Facet::Mood);
    ASSERT_EQ(moods.size(), 2u);
    EXPECT_EQ(moods[0].value, "dreamy");
    EXPECT_EQ(moods[1].value, "energetic");
}

TEST_F(FacetIndexTest, FilterResultIsSubsetOfCatalog)
{
    for (Facet facet : kAllFacets) {
        for (auto value : vocabulary_of(facet)) {
            for (const auto& id : index.filter({{facet, {std::string(value)}}})) {
                ASSERT_NE(catalog.find(id), nullptr);
            }
        }
    }
}

TEST_F(FacetIndexTest, RebuildIsIdentical)
{
    EXPECT_EQ(FacetIndex::build(catalog), index);
    auto other = CatalogStore::load(json::array({song("Solo", "Someone", {"calm"}, {"jazz"}, "d")}));
    EXPECT_NE(FacetIndex::build(other), index);
}

TEST(FacetIndexPropertyTest, EveryReturnedRecordSatisfiesEveryDimension)
{
    auto catalog = CatalogStore::load_file(std::filesystem::path(CADENCE_SOURCE_DIR) / "data" / "songs.json");
    auto index = FacetIndex::build(catalog);

    const std::vector<FacetConstraints> cases = {
        {{Facet::Mood, {"dreamy", "calm"}}},
        {{Facet::Mood, {"dreamy", "calm"}}, {Facet::Activity, {"studying"}}},
        {{Facet::Genre, {"jazz", "folk", "pop"}}, {Facet::Energy, {"low"}}},
        {{Facet::VibeTags, {"cozy"}}, {Facet::Mood, {"happy"}}},
    };
    for (const auto& constraints : cases) {
        for (const auto& id : index.filter(constraints)) {
            const SongRecord* record = catalog.find(id);
            ASSERT_NE(record, nullptr);
            for (const auto& [facet, wanted] : constraints) {
                bool any = false;
                for (auto value : record->values(facet)) any = any || wanted.count(std::string(value)) > 0;
                EXPECT_TRUE(any) << record->title << " fails " << to_string(facet);
            }
        }
    }
    EXPECT_EQ(index.filter(cases[1]).size(), 2u);
}
