#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace cadence::mcp {

    using json = nlohmann::json;

    /**
     * @brief An MCP tool result holding one text block.
     */
    json text_content(const std::string& text, bool is_error = false);

    /**
     * @brief Descriptor of the cadence_recommend tool for tools/list.
     * Each facet property lists its closed vocabulary as a JSON Schema enum.
     */
    json recommend_tool();

    /**
     * @brief Maps tool arguments onto a daemon query request.
     */
    json build_query(const json& args);

    std::string format_hits(const json& result);

    /**
     * @brief Turns a raw daemon reply into a tool result.
     * Never throws: daemon errors, empty and unreadable replies become error results.
     */
    json tool_result(const std::string& reply);

}
