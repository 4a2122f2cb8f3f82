#include <iostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../platform.hpp"
#include "../engine/config.hpp"
#include "recommend_tool.hpp"

using json = nlohmann::json;
using cadence::mcp::text_content;

// Helper to send JSON-RPC response
void send_response(const json& id, const json& result) {
    json response = {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
    std::cout << response.dump() << std::endl;
}

void send_error(const json& id, int code, const std::string& message) {
    json response = {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {{"code", code}, {"message", message}}}
    };
    std::cout << response.dump() << std::endl;
}

int main() {
    const auto config = cadence::engine::Config::load(
        cadence::engine::Config::locate(cadence::platform::system::get_config_dir()));

    std::string line;
    while (std::getline(std::cin, line)) {
        try {
            auto req = json::parse(line);
            auto id = req.value("id", json(nullptr));
            std::string method = req.value("method", "");

            if (method == "initialize") {
                json result = {
                    {"protocolVersion", "2024-11-05"},
                    {"capabilities", {{"tools", json::object()}}},
                    {"serverInfo", {
                        {"name", "cadence-mcp"},
                        {"version", "0.1.0"}
                    }}
                };
                send_response(id, result);
                continue;
            }

            if (method == "notifications/initialized") {
                continue;
            }

            if (method == "tools/list") {
                send_response(id, {{"tools", json::array({cadence::mcp::recommend_tool()})}});
                continue;
            }

            if (method == "tools/call") {
                auto params = req.value("params", json::object());
                std::string name = params.value("name", "");
                auto args = params.value("arguments", json::object());

                if (name != "cadence_recommend") {
                    send_error(id, -32601, "Tool not found");
                    continue;
                }

                // The daemon answers one request per connection.
                auto client = cadence::platform::Client::create();
                if (!client || !client->connect(config.socket_name)) {
                    send_response(id, text_content("The cadenced daemon is not running.", true));
                    continue;
                }

                send_response(id, cadence::mcp::tool_result(client->send(cadence::mcp::build_query(args).dump())));
                continue;
            }

            // Notifications carry no id and get no reply.
            if (!req.contains("id")) continue;

            send_error(id, -32601, "Method not found");

        } catch (const json::exception& e) {
            // Log to stderr to avoid breaking Stdio transport
            std::cerr << "[CadenceMCP] Error: " << e.what() << "\n";
        }
    }

    return 0;
}
