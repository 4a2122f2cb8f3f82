#include "recommend_tool.hpp"
#include "cadence/types.hpp"
#include "engine/query_planner.hpp"
#include <iostream>

namespace cadence::mcp {

    namespace {

        json facet_property(Facet facet, const std::string& description) {
            json values = json::array();
            for (auto value : vocabulary_of(facet)) values.push_back(std::string(value));
            return {
                {"type", "array"},
                {"items", {{"type", "string"}, {"enum", values}}},
                {"description", description}
            };
        }

        std::string join(const json& values) {
            std::string out;
            for (const auto& v : values) {
                if (!out.empty()) out += ", ";
                out += v.get<std::string>();
            }
            return out;
        }

    }

    json text_content(const std::string& text, bool is_error) {
        json result = {{"content", json::array({{{"type", "text"}, {"text", text}}})}};
        if (is_error) result["isError"] = true;
        return result;
    }

    json recommend_tool() {
        return {
            {"name", "cadence_recommend"},
            {"description", "Recommend songs from the catalog. Filters narrow the candidates exactly; "
                            "the optional query ranks what remains by meaning. Without a query, matching songs are listed."},
            {"inputSchema", {
                {"type", "object"},
                {"properties", {
                    {"query", {{"type", "string"}, {"description", "Free-text description of the music wanted."}}},
                    {"mood", facet_property(Facet::Mood, "Moods; a song matches if it has any of them.")},
                    {"activity", facet_property(Facet::Activity, "Activities the song suits.")},
                    {"genre", facet_property(Facet::Genre, "Genres.")},
                    {"vibe_tags", facet_property(Facet::VibeTags, "Vibe tags.")},
                    {"energy", facet_property(Facet::Energy, "Energy levels.")},
                    {"match", {{"type", "string"}, {"enum", json::array({"any", "all"})},
                               {"description", "\"all\" requires every listed value of a facet instead of any."}}},
                    {"limit", {{"type", "integer"}, {"minimum", 0}, {"description", "Maximum number of songs."}}}
                }}
            }}
        };
    }

    json build_query(const json& args) {
        json params = json::object();
        if (args.contains("query") && args["query"].is_string()) params["text"] = args["query"];
        if (args.contains("limit")) params["limit"] = args["limit"];
        if (args.contains("match")) params["match"] = args["match"];

        json filters = json::object();
        for (Facet facet : kAllFacets) {
            const std::string name(to_string(facet));
            if (args.contains(name) && !args[name].is_null()) filters[name] = args[name];
        }
        if (!filters.empty()) params["filters"] = filters;

        return {{"method", "query"}, {"params", params}};
    }

    std::string format_hits(const json& result) {
        const json hits = result.value("hits", json::array());
        std::string text = "Songs in scope: " + std::to_string(result.value("in_scope", 0)) + "\n";
        if (hits.empty()) {
            return text + "No songs matched. Try loosening filters or changing wording.\n";
        }

        int rank = 1;
        for (const auto& hit : hits) {
            text += std::to_string(rank++) + ". " + hit.value("title", "Untitled") + " - " +
                    join(hit.value("artist", json::array()));
            if (hit.contains("score") && !hit["score"].is_null()) {
                auto strength = engine::match_strength(hit["score"].get<float>());
                text += " (" + strength.label + ", " + strength.value + ")";
            }
            text += "\n   " + hit.value("description", "") + "\n";
            text += "   mood: " + join(hit.value("mood", json::array())) + " | genre: " +
                    join(hit.value("genre", json::array())) + " | energy: " + hit.value("energy", "") + "\n";
        }
        return text;
    }

    json tool_result(const std::string& reply) {
        const json parsed = json::parse(reply, nullptr, false);
        if (parsed.is_discarded() || !parsed.is_object()) {
            std::cerr << "[CadenceMCP] Unreadable daemon reply (" << reply.size() << " bytes)\n";
            return text_content("The cadenced daemon sent an unreadable reply.", true);
        }

        try {
            if (parsed.contains("error")) {
                const auto& err = parsed["error"];
                return text_content(err.value("code", "error") + ": " + err.value("message", ""), true);
            }
            if (!parsed.contains("result") || !parsed["result"].is_object()) {
                return text_content("The cadenced daemon reply has no result.", true);
            }
            return text_content(format_hits(parsed["result"]));
        } catch (const json::exception& e) {
            std::cerr << "[CadenceMCP] Malformed daemon reply: " << e.what() << "\n";
            return text_content(std::string("The cadenced daemon sent a malformed reply: ") + e.what(), true);
        }
    }

}
