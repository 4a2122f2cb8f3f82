#pragma once

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "snapshot_manager.hpp"

namespace cadence::engine {

    struct Query {
        std::optional<std::string> text;
        std::map<std::string, std::set<std::string>> filters; // dimension name -> values
        size_t limit = 5;
        MatchMode match = MatchMode::Any;
    };

    struct Hit {
        const SongRecord* record;
        std::optional<float> score; // absent for filter-only queries
    };

    struct QueryResult {
        std::vector<Hit> hits;
        size_t in_scope = 0; // records passing the filters, before the limit
        std::shared_ptr<const Snapshot> snapshot; // keeps the records behind hits alive
    };

    /**
     * @brief Serves queries against the current snapshot.
     *
     * With text, candidates surviving the filters are ranked by cosine similarity to
     * the embedded query. Without text, candidates are returned in ascending id order
     * and the embedder is never called.
     */
    class QueryPlanner {
    public:
        explicit QueryPlanner(const SnapshotManager& snapshots);

        /**
         * @throws InvalidFacet for an unknown dimension name.
         * @throws RetrievalUnavailable when no snapshot is published, or the embedder
         *         fails on a text query.
         */
        QueryResult query(const Query& query) const;

        /**
         * @brief Maps dimension names to facets.
         * @throws InvalidFacet for an unknown dimension name.
         */
        static FacetConstraints resolve_filters(const std::map<std::string, std::set<std::string>>& filters);

    private:
        const SnapshotManager& m_snapshots;
    };

    struct MatchStrength {
        std::string label;
        std::string value; // score with three decimals, or "n/a"
    };

    /**
     * @brief Human-readable band for a similarity score.
     */
    MatchStrength match_strength(std::optional<float> score);

}
