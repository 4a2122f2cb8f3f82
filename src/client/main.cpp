#include <iostream>
#include <vector>
#include <string>
#include <optional>
#include <nlohmann/json.hpp>
#include "platform.hpp"
#include "engine/config.hpp"
#include "engine/query_planner.hpp"

using json = nlohmann::json;

namespace {

    void usage() {
        std::cerr << "Usage: cadence <command> [args...]\n";
        std::cerr << "Commands:\n";
        std::cerr << "  ping                      - Test connection\n";
        std::cerr << "  status                    - Show the serving snapshot\n";
        std::cerr << "  facets                    - List filter values present in the catalog\n";
        std::cerr << "  query <text> [filters]    - Rank songs by similarity to text\n";
        std::cerr << "  browse [filters]          - List songs matching filters\n";
        std::cerr << "  publish [path]            - Rebuild and publish the catalog\n";
        std::cerr << "  shutdown                  - Stop the daemon\n";
        std::cerr << "Filters: --mood v --activity v --genre v --vibe_tags v --energy v (repeatable),\n";
        std::cerr << "         --limit n, --all (require every listed value per dimension)\n";
    }

    // Parses the trailing filter flags of query/browse into params; returns false on bad usage.
    bool parse_filters(const std::vector<std::string>& args, size_t start, json& params) {
        json filters = json::object();
        for (size_t i = start; i < args.size(); ++i) {
            const std::string& arg = args[i];
            if (arg == "--all") {
                params["match"] = "all";
            } else if (arg == "--limit" && i + 1 < args.size()) {
                try {
                    params["limit"] = std::stoll(args[++i]);
                } catch (const std::exception&) {
                    std::cerr << "Error: --limit expects a number.\n";
                    return false;
                }
            } else if (arg.rfind("--", 0) == 0 && i + 1 < args.size()) {
                filters[arg.substr(2)].push_back(args[++i]);
            } else {
                std::cerr << "Error: unexpected argument '" << arg << "'.\n";
                return false;
            }
        }
        if (!filters.empty()) params["filters"] = filters;
        return true;
    }

    std::string join(const json& values) {
        std::string out;
        for (const auto& v : values) {
            if (!out.empty()) out += ", ";
            out += v.get<std::string>();
        }
        return out;
    }

    void print_hits(const json& result) {
        const auto& hits = result["hits"];
        std::cout << "Songs in scope: " << result.value("in_scope", 0) << "\n";
        if (hits.empty()) {
            std::cout << "No songs matched. Try loosening filters or changing wording.\n";
            return;
        }

        int rank = 1;
        for (const auto& hit : hits) {
            std::cout << rank++ << ". " << hit.value("title", "Untitled") << " - " << join(hit["artist"]);
            std::optional<float> score;
            if (hit.contains("score") && !hit["score"].is_null()) score = hit["score"].get<float>();
            if (score) {
                auto strength = cadence::engine::match_strength(score);
                std::cout << "  [" << strength.label << " " << strength.value << "]";
            }
            std::cout << "\n   " << hit.value("description", "") << "\n";
            std::cout << "   mood: " << join(hit["mood"]) << " | activity: " << join(hit["activity"])
                      << " | genre: " << join(hit["genre"]) << " | energy: " << hit.value("energy", "")
                      << " | vibe: " << join(hit["vibe_tags"]) << "\n";
        }
    }

    void print_facets(const json& result) {
        for (const auto& facet : result.items()) {
            std::cout << facet.key() << ":";
            for (const auto& v : facet.value()) {
                std::cout << " " << v.value("value", "") << "(" << v.value("count", 0) << ")";
            }
            std::cout << "\n";
        }
    }

}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage();
        return 1;
    }

    std::string command = argv[1];
    std::vector<std::string> args;
    for (int i = 2; i < argc; ++i) {
        args.push_back(argv[i]);
    }

    json request = {{"method", command}, {"params", json::object()}};
    if (command == "query") {
        if (args.empty()) {
            usage();
            return 1;
        }
        request["params"]["text"] = args[0];
        if (!parse_filters(args, 1, request["params"])) return 1;
    } else if (command == "browse") {
        request["method"] = "query";
        if (!parse_filters(args, 0, request["params"])) return 1;
    } else if (command == "publish") {
        if (!args.empty()) request["params"]["path"] = args[0];
    }

    auto client = cadence::platform::Client::create();
    if (!client) {
        std::cerr << "Error: Failed to create client platform interface.\n";
        return 1;
    }

    const auto config = cadence::engine::Config::load(
        cadence::engine::Config::locate(cadence::platform::system::get_config_dir()));
    if (!client->connect(config.socket_name)) {
        std::cerr << "Error: Could not connect to cadenced daemon. Is it running?\n";
        return 1;
    }

    std::string response = client->send(request.dump());
    json reply;
    try {
        reply = json::parse(response);
    } catch (const json::parse_error& e) {
        std::cerr << "Error: Malformed response from daemon: " << e.what() << "\n";
        return 1;
    }

    if (reply.contains("error")) {
        const auto& err = reply["error"];
        std::cerr << "Error (" << err.value("code", "") << "): " << err.value("message", "") << "\n";
        if (err.contains("issues")) {
            for (const auto& issue : err["issues"]) {
                std::cerr << "  entry " << issue.value("index", 0) << " [" << issue.value("field", "") << "] "
                          << issue.value("reason", "") << "\n";
            }
        }
        return 2;
    }

    const auto& result = reply["result"];
    if (request["method"] == "query") print_hits(result);
    else if (command == "facets") print_facets(result);
    else std::cout << result.dump(2) << "\n";

    return 0;
}
