#include "cadence/types.hpp"
#include "cadence/errors.hpp"
#include "cadence/sha256.h"
#include <sstream>

namespace cadence {

    namespace {

        template <typename E>
        std::vector<std::string_view> names_of(const std::set<E>& values) {
            std::vector<std::string_view> out;
            out.reserve(values.size());
            for (E v : values) out.push_back(to_string(v));
            return out;
        }

        template <typename E>
        std::vector<std::string_view> all_names() {
            const auto& names = Vocabulary<E>::names;
            return std::vector<std::string_view>(names.begin(), names.end());
        }

        void append_joined(std::string& out, const std::vector<std::string_view>& values) {
            for (size_t i = 0; i < values.size(); ++i) {
                if (i > 0) out += ", ";
                out += values[i];
            }
        }

        std::string describe(const std::vector<ValidationError::Issue>& issues) {
            std::ostringstream ss;
            ss << "catalog rejected with " << issues.size() << (issues.size() == 1 ? " issue" : " issues");
            if (!issues.empty()) {
                const auto& i = issues.front();
                ss << "; entry " << i.index << ", field '" << i.field << "': " << i.reason;
            }
            return ss.str();
        }

    }

    ValidationError::ValidationError(std::vector<Issue> issues)
        : Error(describe(issues)), m_issues(std::move(issues)) {}

    std::string_view to_string(Facet facet) {
        switch (facet) {
            case Facet::Mood: return "mood";
            case Facet::Activity: return "activity";
            case Facet::Genre: return "genre";
            case Facet::VibeTags: return "vibe_tags";
            case Facet::Energy: return "energy";
        }
        return "";
    }

    std::optional<Facet> parse_facet(std::string_view name) {
        for (Facet f : kAllFacets) {
            if (to_string(f) == name) return f;
        }
        return std::nullopt;
    }

    std::vector<std::string_view> vocabulary_of(Facet facet) {
        switch (facet) {
            case Facet::Mood: return all_names<Mood>();
            case Facet::Activity: return all_names<Activity>();
            case Facet::Genre: return all_names<Genre>();
            case Facet::VibeTags: return all_names<VibeTag>();
            case Facet::Energy: return all_names<Energy>();
        }
        return {};
    }

    bool is_known_value(Facet facet, std::string_view value) {
        switch (facet) {
            case Facet::Mood: return parse_value<Mood>(value).has_value();
            case Facet::Activity: return parse_value<Activity>(value).has_value();
            case Facet::Genre: return parse_value<Genre>(value).has_value();
            case Facet::VibeTags: return parse_value<VibeTag>(value).has_value();
            case Facet::Energy: return parse_value<Energy>(value).has_value();
        }
        return false;
    }

    std::vector<std::string_view> SongRecord::values(Facet facet) const {
        switch (facet) {
            case Facet::Mood: return names_of(mood);
            case Facet::Activity: return names_of(activity);
            case Facet::Genre: return names_of(genre);
            case Facet::VibeTags: return names_of(vibe_tags);
            case Facet::Energy: return { to_string(energy) };
        }
        return {};
    }

    std::string SongRecord::embedding_text() const {
        std::string text = "mood: ";
        append_joined(text, values(Facet::Mood));
        text += " | activity: ";
        append_joined(text, values(Facet::Activity));
        text += " | genre: ";
        append_joined(text, values(Facet::Genre));
        text += " | vibe: ";
        append_joined(text, values(Facet::VibeTags));
        text += "\n";
        text += description;
        return text;
    }

    bool SongRecord::operator==(const SongRecord& other) const {
        return id == other.id && title == other.title && artists == other.artists &&
               mood == other.mood && activity == other.activity && genre == other.genre &&
               vibe_tags == other.vibe_tags && energy == other.energy &&
               description == other.description;
    }

    std::string make_record_id(const std::string& title, const std::vector<std::string>& artists) {
        crypto::SHA256 sha;
        sha.update(title);
        for (const auto& artist : artists) {
            sha.update("\x1f", 1);
            sha.update(artist);
        }
        return sha.final().substr(0, 16);
    }

}
