#include "catalog.hpp"
#include "cadence/sha256.h"
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace cadence::engine {

    namespace {

        using Issues = std::vector<ValidationError::Issue>;

        std::string trim(const std::string& s) {
            const char* ws = " \t\r\n";
            auto first = s.find_first_not_of(ws);
            if (first == std::string::npos) return "";
            auto last = s.find_last_not_of(ws);
            return s.substr(first, last - first + 1);
        }

        std::string read_text(const json& entry, const char* field, size_t index, Issues& issues) {
            if (!entry.contains(field)) {
                issues.push_back({index, field, "missing required field"});
                return "";
            }
            const auto& value = entry.at(field);
            if (!value.is_string()) {
                issues.push_back({index, field, "must be a string"});
                return "";
            }
            std::string text = trim(value.get<std::string>());
            if (text.empty()) {
                issues.push_back({index, field, "must not be empty"});
            }
            return text;
        }

        // A single string is accepted where a list is expected.
        bool read_list(const json& entry, const char* field, size_t index, Issues& issues,
                       std::vector<std::string>& out) {
            if (!entry.contains(field)) {
                issues.push_back({index, field, "missing required field"});
                return false;
            }
            const auto& value = entry.at(field);
            if (value.is_string()) {
                std::string v = trim(value.get<std::string>());
                if (!v.empty()) out.push_back(v);
                return true;
            }
            if (!value.is_array()) {
                issues.push_back({index, field, "must be a string or an array of strings"});
                return false;
            }
            for (const auto& item : value) {
                if (!item.is_string()) {
                    issues.push_back({index, field, "values must be strings"});
                    return false;
                }
                std::string v = trim(item.get<std::string>());
                if (!v.empty()) out.push_back(v);
            }
            return true;
        }

        template <typename E>
        std::set<E> read_facet(const json& entry, const char* field, size_t index, Issues& issues) {
            std::set<E> result;
            std::vector<std::string> raw;
            if (!read_list(entry, field, index, issues, raw)) return result;

            bool bad_value = false;
            for (const auto& v : raw) {
                if (auto parsed = parse_value<E>(v)) {
                    result.insert(*parsed);
                } else {
                    issues.push_back({index, field, "'" + v + "' is not a valid " + std::string(field) + " value"});
                    bad_value = true;
                }
            }
            if (result.empty() && !bad_value) {
                issues.push_back({index, field, "must not be empty"});
            }
            return result;
        }

        std::string fingerprint_of(const CatalogStore& store) {
            crypto::SHA256 sha;
            for (const auto& [id, record] : store) {
                sha.update(to_json(record).dump());
                sha.update("\n", 1);
            }
            return sha.final();
        }

    }

    CatalogStore CatalogStore::load(const json& entries) {
        if (!entries.is_array()) {
            throw ValidationError({{0, "catalog", "catalog revision must be a JSON array"}});
        }
        if (entries.empty()) {
            throw ValidationError({{0, "catalog", "catalog revision must contain at least one entry"}});
        }

        CatalogStore store;
        Issues issues;
        std::map<std::string, size_t> first_seen;

        for (size_t i = 0; i < entries.size(); ++i) {
            const auto& entry = entries[i];
            if (!entry.is_object()) {
                issues.push_back({i, "entry", "must be a JSON object"});
                continue;
            }

            const size_t before = issues.size();
            SongRecord record;
            record.title = read_text(entry, "title", i, issues);

            std::vector<std::string> artists;
            if (read_list(entry, "artist", i, issues, artists)) {
                if (artists.empty()) issues.push_back({i, "artist", "must name at least one artist"});
            }
            record.artists = std::move(artists);

            record.mood = read_facet<Mood>(entry, "mood", i, issues);
            record.activity = read_facet<Activity>(entry, "activity", i, issues);
            record.genre = read_facet<Genre>(entry, "genre", i, issues);
            record.vibe_tags = read_facet<VibeTag>(entry, "vibe_tags", i, issues);

            std::string energy = read_text(entry, "energy", i, issues);
            if (!energy.empty()) {
                if (auto parsed = parse_value<Energy>(energy)) {
                    record.energy = *parsed;
                } else {
                    issues.push_back({i, "energy", "'" + energy + "' is not a valid energy value"});
                }
            }

            record.description = read_text(entry, "description", i, issues);

            if (issues.size() != before) continue;

            record.id = make_record_id(record.title, record.artists);
            auto [it, inserted] = first_seen.emplace(record.id, i);
            if (!inserted) {
                issues.push_back({i, "title", "duplicate of entry " + std::to_string(it->second)});
                continue;
            }
            store.m_records.emplace(record.id, std::move(record));
        }

        if (!issues.empty()) {
            std::cerr << "[CatalogStore] Rejected revision: " << issues.size() << " issue(s)\n";
            throw ValidationError(std::move(issues));
        }

        store.m_fingerprint = fingerprint_of(store);
        return store;
    }

    CatalogStore CatalogStore::load_file(const std::filesystem::path& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw ValidationError({{0, "catalog", "cannot open " + path.string()}});
        }
        json entries;
        try {
            entries = json::parse(file);
        } catch (const json::parse_error& e) {
            throw ValidationError({{0, "catalog", std::string("malformed JSON: ") + e.what()}});
        }
        return load(entries);
    }

    const SongRecord* CatalogStore::find(const std::string& id) const {
        auto it = m_records.find(id);
        return it == m_records.end() ? nullptr : &it->second;
    }

    std::vector<std::string> CatalogStore::ids() const {
        std::vector<std::string> out;
        out.reserve(m_records.size());
        for (const auto& entry : m_records) out.push_back(entry.first);
        return out;
    }

    json to_json(const SongRecord& record) {
        auto list = [&](Facet f) {
            json arr = json::array();
            for (auto v : record.values(f)) arr.push_back(std::string(v));
            return arr;
        };
        return {
            {"id", record.id},
            {"title", record.title},
            {"artist", record.artists},
            {"mood", list(Facet::Mood)},
            {"activity", list(Facet::Activity)},
            {"genre", list(Facet::Genre)},
            {"vibe_tags", list(Facet::VibeTags)},
            {"energy", std::string(to_string(record.energy))},
            {"description", record.description}
        };
    }

}
