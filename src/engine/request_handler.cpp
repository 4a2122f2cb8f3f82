#include "request_handler.hpp"
#include "catalog.hpp"
#include <iostream>

using json = nlohmann::json;

namespace cadence::engine {

    namespace {

        std::set<std::string> read_values(const std::string& dimension, const json& value) {
            std::set<std::string> values;
            if (value.is_string()) {
                values.insert(value.get<std::string>());
            } else if (value.is_array()) {
                for (const auto& item : value) {
                    if (!item.is_string()) throw RequestError("filter values for '" + dimension + "' must be strings");
                    values.insert(item.get<std::string>());
                }
            } else if (!value.is_null()) {
                throw RequestError("filter '" + dimension + "' must be a string or an array of strings");
            }
            return values;
        }

        json hit_to_json(const Hit& hit) {
            json j = to_json(*hit.record);
            if (hit.score) j["score"] = *hit.score;
            else j["score"] = nullptr;
            j["strength"] = match_strength(hit.score).label;
            return j;
        }

    }

    json error_response(const std::string& code, const std::string& message) {
        return {{"error", {{"code", code}, {"message", message}}}};
    }

    RequestHandler::RequestHandler(SnapshotManager& snapshots, const Config& config, std::function<void()> on_shutdown)
        : m_snapshots(snapshots), m_planner(snapshots), m_config(config), m_on_shutdown(std::move(on_shutdown)) {}

    std::string RequestHandler::handle(const std::string& request) {
        json response;
        try {
            response = dispatch(json::parse(request));
        } catch (const ValidationError& e) {
            response = error_response("validation_error", e.what());
            json issues = json::array();
            for (const auto& issue : e.issues()) {
                issues.push_back({{"index", issue.index}, {"field", issue.field}, {"reason", issue.reason}});
            }
            response["error"]["issues"] = issues;
        } catch (const InvalidFacet& e) {
            response = error_response("invalid_facet", e.what());
            response["error"]["dimension"] = e.dimension();
        } catch (const EmbedderError& e) {
            response = error_response("embedder_error", e.what());
        } catch (const RetrievalUnavailable& e) {
            response = error_response("retrieval_unavailable", e.what());
        } catch (const RequestError& e) {
            response = error_response("invalid_request", e.what());
        } catch (const json::exception& e) {
            response = error_response("invalid_request", e.what());
        } catch (const std::exception& e) {
            std::cerr << "[RequestHandler] Internal error: " << e.what() << "\n";
            response = error_response("internal_error", e.what());
        }
        return response.dump(-1, ' ', false, json::error_handler_t::replace);
    }

    json RequestHandler::dispatch(const json& request) {
        if (!request.is_object()) throw RequestError("request must be a JSON object");
        const std::string method = request.value("method", "");
        const json params = request.value("params", json::object());
        if (!params.is_object()) throw RequestError("params must be a JSON object");

        if (method == "ping") return {{"result", "pong"}};
        if (method == "query") return {{"result", do_query(params)}};
        if (method == "publish") return {{"result", do_publish(params)}};
        if (method == "facets") return {{"result", do_facets()}};
        if (method == "status") return {{"result", do_status()}};
        if (method == "shutdown") {
            if (m_on_shutdown) m_on_shutdown();
            return {{"result", "shutting down"}};
        }
        return error_response("unknown_method", "unknown method: " + method);
    }

    json RequestHandler::do_query(const json& params) {
        Query query;

        if (params.contains("text") && !params["text"].is_null()) {
            if (!params["text"].is_string()) throw RequestError("text must be a string");
            query.text = params["text"].get<std::string>();
        }

        if (params.contains("filters") && !params["filters"].is_null()) {
            const auto& filters = params["filters"];
            if (!filters.is_object()) throw RequestError("filters must be an object");
            for (const auto& entry : filters.items()) {
                query.filters[entry.key()] = read_values(entry.key(), entry.value());
            }
        }

        const bool has_text = query.text && query.text->find_first_not_of(" \t\r\n") != std::string::npos;
        query.limit = has_text ? m_config.default_limit : m_config.browse_limit;
        if (params.contains("limit") && !params["limit"].is_null()) {
            const auto& limit = params["limit"];
            if (!limit.is_number_integer() || (!limit.is_number_unsigned() && limit.get<int64_t>() < 0)) {
                throw RequestError("limit must be a non-negative integer");
            }
            query.limit = limit.get<size_t>();
        }

        const std::string match = params.value("match", "any");
        if (match == "all") query.match = MatchMode::All;
        else if (match != "any") throw RequestError("match must be \"any\" or \"all\"");

        auto result = m_planner.query(query);

        json hits = json::array();
        for (const auto& hit : result.hits) hits.push_back(hit_to_json(hit));
        return {
            {"count", result.hits.size()},
            {"in_scope", result.in_scope},
            {"snapshot", result.snapshot->id},
            {"hits", hits}
        };
    }

    json RequestHandler::do_publish(const json& params) {
        if (params.contains("catalog") && params.contains("path")) {
            throw RequestError("give either catalog or path, not both");
        }

        SnapshotId id;
        if (params.contains("catalog")) {
            if (!params["catalog"].is_array()) throw RequestError("catalog must be an array of songs");
            id = m_snapshots.publish(params["catalog"]);
        } else {
            std::filesystem::path path = m_config.catalog_path;
            if (params.contains("path")) {
                if (!params["path"].is_string()) throw RequestError("path must be a string");
                path = params["path"].get<std::string>();
            }
            id = m_snapshots.publish_file(path);
        }
        auto snap = m_snapshots.current();
        return {{"snapshot", id}, {"records", snap ? snap->catalog.size() : 0}};
    }

    json RequestHandler::do_facets() {
        auto snap = m_snapshots.current();
        if (!snap) throw RetrievalUnavailable("no catalog snapshot has been published");

        json facets = json::object();
        for (Facet facet : kAllFacets) {
            json values = json::array();
            for (const auto& v : snap->facets.values(facet)) {
                values.push_back({{"value", v.value}, {"count", v.count}});
            }
            facets[std::string(to_string(facet))] = values;
        }
        return facets;
    }

    json RequestHandler::do_status() {
        auto snap = m_snapshots.current();
        json status = {{"embedder", m_snapshots.embedder().name()}};
        if (!snap) {
            status["snapshot"] = nullptr;
            return status;
        }
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(snap->published_at.time_since_epoch()).count();
        status["snapshot"] = snap->id;
        status["records"] = snap->catalog.size();
        status["dimension"] = snap->vectors.dimension();
        status["fingerprint"] = snap->catalog.fingerprint();
        status["published_at"] = millis;
        return status;
    }

}
