#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace cadence {

    /**
     * @brief The facet dimensions a record can be filtered on.
     */
    enum class Facet : uint8_t { Mood, Activity, Genre, VibeTags, Energy };

    inline constexpr std::array<Facet, 5> kAllFacets = {
        Facet::Mood, Facet::Activity, Facet::Genre, Facet::VibeTags, Facet::Energy
    };

    enum class Mood : uint8_t {
        Dreamy, Melancholic, Energetic, Happy, Calm, Romantic, Nostalgic, Hopeful,
        Angry, Bittersweet, Chill, Dark, Euphoric, Playful, Confident, Yearning
    };

    enum class Activity : uint8_t {
        Studying, WorkingOut, Running, Driving, Walking, Commuting, Relaxing, Sleeping,
        Partying, Dancing, Cooking, Cleaning, Reading, Focusing, Gaming, GettingReady
    };

    enum class Genre : uint8_t {
        Pop, Rock, Indie, Alternative, Jazz, HipHop, RnB, Soul, Funk, Electronic, Dance,
        House, Folk, Country, Classical, Metal, Punk, LoFi, Ambient, KPop, Latin, Blues,
        Shoegaze, DreamPop, SynthPop, BedroomPop, SingerSongwriter
    };

    enum class VibeTag : uint8_t {
        LateNight, RainyDay, Summer, GoldenHour, RoadTrip, Heartbreak, ComingOfAge,
        MainCharacter, Cozy, Ethereal, Cinematic, Groovy, Atmospheric, Anthemic, Intimate,
        Nostalgic, Sunset, CityLights, CoffeeShop, SlowBurn
    };

    enum class Energy : uint8_t { Low, Medium, High };

    /**
     * @brief Closed vocabulary of a facet value type.
     * names[i] is the catalog spelling of the enumerator with underlying value i.
     */
    template <typename E>
    struct Vocabulary;

    template <>
    struct Vocabulary<Mood> {
        static constexpr Facet facet = Facet::Mood;
        static constexpr std::array<std::string_view, 16> names = {
            "dreamy", "melancholic", "energetic", "happy", "calm", "romantic", "nostalgic", "hopeful",
            "angry", "bittersweet", "chill", "dark", "euphoric", "playful", "confident", "yearning"
        };
    };

    template <>
    struct Vocabulary<Activity> {
        static constexpr Facet facet = Facet::Activity;
        static constexpr std::array<std::string_view, 16> names = {
            "studying", "working-out", "running", "driving", "walking", "commuting", "relaxing", "sleeping",
            "partying", "dancing", "cooking", "cleaning", "reading", "focusing", "gaming", "getting-ready"
        };
    };

    template <>
    struct Vocabulary<Genre> {
        static constexpr Facet facet = Facet::Genre;
        static constexpr std::array<std::string_view, 27> names = {
            "pop", "rock", "indie", "alternative", "jazz", "hip-hop", "r&b", "soul", "funk", "electronic",
            "dance", "house", "folk", "country", "classical", "metal", "punk", "lo-fi", "ambient", "k-pop",
            "latin", "blues", "shoegaze", "dream-pop", "synth-pop", "bedroom-pop", "singer-songwriter"
        };
    };

    template <>
    struct Vocabulary<VibeTag> {
        static constexpr Facet facet = Facet::VibeTags;
        static constexpr std::array<std::string_view, 20> names = {
            "late-night", "rainy-day", "summer", "golden-hour", "road-trip", "heartbreak", "coming-of-age",
            "main-character", "cozy", "ethereal", "cinematic", "groovy", "atmospheric", "anthemic", "intimate",
            "nostalgic", "sunset", "city-lights", "coffee-shop", "slow-burn"
        };
    };

    template <>
    struct Vocabulary<Energy> {
        static constexpr Facet facet = Facet::Energy;
        static constexpr std::array<std::string_view, 3> names = { "low", "medium", "high" };
    };

    template <typename E>
    std::string_view to_string(E value) {
        return Vocabulary<E>::names[static_cast<size_t>(value)];
    }

    template <typename E>
    std::optional<E> parse_value(std::string_view text) {
        const auto& names = Vocabulary<E>::names;
        for (size_t i = 0; i < names.size(); ++i) {
            if (names[i] == text) return static_cast<E>(i);
        }
        return std::nullopt;
    }

    std::string_view to_string(Facet facet);
    std::optional<Facet> parse_facet(std::string_view name);

    /**
     * @brief Every permitted value of a facet, in vocabulary order.
     */
    std::vector<std::string_view> vocabulary_of(Facet facet);

    bool is_known_value(Facet facet, std::string_view value);

    struct SongRecord {
        std::string id;
        std::string title;
        std::vector<std::string> artists;
        std::set<Mood> mood;
        std::set<Activity> activity;
        std::set<Genre> genre;
        std::set<VibeTag> vibe_tags;
        Energy energy = Energy::Medium;
        std::string description;

        /**
         * @brief Catalog spellings of the record's values for a facet, in vocabulary order.
         */
        std::vector<std::string_view> values(Facet facet) const;

        /**
         * @brief The text handed to the embedder.
         * Built from the mood, activity, genre and vibe values plus the description.
         * Energy, title and artists are not part of it.
         */
        std::string embedding_text() const;

        bool operator==(const SongRecord& other) const;
    };

    /**
     * @brief Derives the stable record id from title and artists.
     */
    std::string make_record_id(const std::string& title, const std::vector<std::string>& artists);

}
