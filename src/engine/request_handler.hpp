#pragma once

#include <functional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "query_planner.hpp"
#include "snapshot_manager.hpp"

namespace cadence::engine {

    /**
     * @brief JSON front end of the query and admin interfaces.
     *
     * Requests look like {"method": "query", "params": {...}}. Responses carry either
     * "result" or "error": {"code", "message"}. "No matches" is a result with count 0.
     */
    class RequestHandler {
    public:
        RequestHandler(SnapshotManager& snapshots, const Config& config, std::function<void()> on_shutdown = {});

        /**
         * @brief Handles one serialized request. Never throws; failures become error responses.
         */
        std::string handle(const std::string& request);

        /**
         * @brief Handles one parsed request; exceptions propagate to the caller.
         */
        nlohmann::json dispatch(const nlohmann::json& request);

    private:
        nlohmann::json do_query(const nlohmann::json& params);
        nlohmann::json do_publish(const nlohmann::json& params);
        nlohmann::json do_facets();
        nlohmann::json do_status();

        SnapshotManager& m_snapshots;
        QueryPlanner m_planner;
        Config m_config;
        std::function<void()> m_on_shutdown;
    };

    /**
     * @brief A request that is well-formed JSON but not a valid call.
     */
    class RequestError : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

    nlohmann::json error_response(const std::string& code, const std::string& message);

}
