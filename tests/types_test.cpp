#include "cadence/types.hpp"
#include <gtest/gtest.h>

using namespace cadence;

TEST(VocabularyTest, RoundTripsEveryMood)
{
    for (auto name : Vocabulary<Mood>::names) {
        auto parsed = parse_value<Mood>(name);
        ASSERT_TRUE(parsed.has_value()) << name;
        EXPECT_EQ(to_string(*parsed), name);
    }
}

TEST(VocabularyTest, SadIsNotAMood)
{
    EXPECT_FALSE(parse_value<Mood>("sad").has_value());
    EXPECT_FALSE(is_known_value(Facet::Mood, "sad"));
    EXPECT_TRUE(is_known_value(Facet::Mood, "melancholic"));
}

TEST(VocabularyTest, ParsingIsCaseSensitive)
{
    EXPECT_FALSE(parse_value<Genre>("Pop").has_value());
    EXPECT_TRUE(parse_value<Genre>("pop").has_value());
}

TEST(VocabularyTest, FacetNames)
{
    for (Facet f : kAllFacets) {
        auto parsed = parse_facet(to_string(f));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, f);
    }
    EXPECT_FALSE(parse_facet("tempo").has_value());
    EXPECT_EQ(to_string(Facet::VibeTags), "vibe_tags");
}

TEST(VocabularyTest, VocabularyOfEnergy)
{
    auto values = vocabulary_of(Facet::Energy);
    ASSERT_EQ(values.size(), 3u);
    EXPECT_EQ(values[0], "low");
    EXPECT_EQ(values[2], "high");
}

TEST(SongRecordTest, EmbeddingTextLayout)
{
    SongRecord r;
    r.mood = {Mood::Calm, Mood::Dreamy};
    r.activity = {Activity::Studying};
    r.genre = {Genre::LoFi};
    r.vibe_tags = {VibeTag::RainyDay};
    r.energy = Energy::Low;
    r.description = "Soft keys and tape hiss.";

    EXPECT_EQ(r.embedding_text(),
              "mood: dreamy, calm | activity: studying | genre: lo-fi | vibe: rainy-day\nSoft keys and tape hiss.");
}

TEST(SongRecordTest, ValuesOfEnergyIsSingle)
{
    SongRecord r;
    r.energy = Energy::High;
    auto values = r.values(Facet::Energy);
    ASSERT_EQ(values.size(), 1u);
    EXPECT_EQ(values[0], "high");
}

TEST(RecordIdTest, StableAndDistinct)
{
    auto a = make_record_id("Song", {"Artist"});
    EXPECT_EQ(a.size(), 16u);
    EXPECT_EQ(a, make_record_id("Song", {"Artist"}));
    EXPECT_NE(a, make_record_id("Song", {"Other"}));
    EXPECT_NE(make_record_id("ab", {"c"}), make_record_id("a", {"bc"}));
}
