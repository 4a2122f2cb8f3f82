#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "cadence/types.hpp"
#include "engine/embedder.hpp"

namespace cadence::test {

    using json = nlohmann::json;

    inline json song(const std::string& title, const std::string& artist, std::vector<std::string> mood,
                     std::vector<std::string> genre, const std::string& description,
                     std::vector<std::string> activity = {"relaxing"},
                     std::vector<std::string> vibe_tags = {"cozy"}, const std::string& energy = "medium") {
        return {
            {"title", title},
            {"artist", artist},
            {"mood", mood},
            {"activity", activity},
            {"genre", genre},
            {"vibe_tags", vibe_tags},
            {"energy", energy},
            {"description", description}
        };
    }

    inline std::string id_of(const std::string& title, const std::string& artist) {
        return make_record_id(title, {artist});
    }

    // A: pop/dreamy, B: pop/energetic, C: rock/dreamy
    inline json abc_catalog() {
        return json::array({
            song("Song A", "Artist A", {"dreamy"}, {"pop"}, "soft shimmering synths at night"),
            song("Song B", "Artist B", {"energetic"}, {"pop"}, "loud driving drums for the gym", {"working-out"}),
            song("Song C", "Artist C", {"dreamy"}, {"rock"}, "hazy guitars drifting slowly")
        });
    }

    /**
     * Scores by keyword counts: component i counts occurrences of keywords[i].
     */
    class KeywordEmbedder : public engine::Embedder {
    public:
        explicit KeywordEmbedder(std::vector<std::string> keywords) : m_keywords(std::move(keywords)) {}

        std::vector<float> embed(const std::string& text) override {
            ++calls;
            std::vector<float> v(m_keywords.size() + 1, 0.0f);
            v.back() = 0.01f;
            for (size_t i = 0; i < m_keywords.size(); ++i) {
                size_t pos = 0;
                while ((pos = text.find(m_keywords[i], pos)) != std::string::npos) {
                    v[i] += 1.0f;
                    pos += m_keywords[i].size();
                }
            }
            return v;
        }

        size_t dimension() const override { return m_keywords.size() + 1; }
        std::string name() const override { return "keyword:" + std::to_string(m_keywords.size()); }

        std::atomic<int> calls{0};

    private:
        std::vector<std::string> m_keywords;
    };

    /**
     * Returns the same vector for every text.
     */
    class ConstantEmbedder : public engine::Embedder {
    public:
        explicit ConstantEmbedder(std::vector<float> value, std::string name = "constant")
            : m_value(std::move(value)), m_name(std::move(name)) {}

        std::vector<float> embed(const std::string&) override {
            ++calls;
            return m_value;
        }

        size_t dimension() const override { return m_value.size(); }
        std::string name() const override { return m_name; }

        std::atomic<int> calls{0};

    private:
        std::vector<float> m_value;
        std::string m_name;
    };

    /**
     * Fails on texts containing a marker (every text when the marker is empty).
     */
    class FailingEmbedder : public engine::Embedder {
    public:
        explicit FailingEmbedder(std::string marker = "") : m_marker(std::move(marker)) {}

        std::vector<float> embed(const std::string& text) override {
            ++calls;
            if (m_marker.empty() || text.find(m_marker) != std::string::npos) {
                throw EmbedderError("backend unreachable");
            }
            return {1.0f, 0.0f, 0.0f};
        }

        size_t dimension() const override { return 3; }
        std::string name() const override { return "failing"; }

        std::atomic<int> calls{0};

    private:
        std::string m_marker;
    };

    /**
     * Sleeps before answering and records the peak number of concurrent calls.
     */
    class SlowEmbedder : public engine::Embedder {
    public:
        explicit SlowEmbedder(std::chrono::milliseconds delay) : m_delay(delay) {}

        std::vector<float> embed(const std::string& text) override {
            int now = ++m_in_flight;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
            std::this_thread::sleep_for(m_delay);
            --m_in_flight;
            ++calls;
            return {1.0f, static_cast<float>(text.size() % 7), 0.5f};
        }

        size_t dimension() const override { return 3; }
        std::string name() const override { return "slow"; }

        std::atomic<int> calls{0};
        std::atomic<int> peak{0};

    private:
        std::chrono::milliseconds m_delay;
        std::atomic<int> m_in_flight{0};
    };

}
