#include "query_planner.hpp"
#include <cctype>
#include <cstdio>
#include <iostream>
#include <stdexcept>

namespace cadence::engine {

    namespace {
        bool is_blank(const std::optional<std::string>& text) {
            if (!text) return true;
            for (unsigned char c : *text) {
                if (!std::isspace(c)) return false;
            }
            return true;
        }
    }

    QueryPlanner::QueryPlanner(const SnapshotManager& snapshots) : m_snapshots(snapshots) {}

    FacetConstraints QueryPlanner::resolve_filters(const std::map<std::string, std::set<std::string>>& filters) {
        FacetConstraints constraints;
        for (const auto& [name, values] : filters) {
            auto facet = parse_facet(name);
            if (!facet) throw InvalidFacet(name);
            constraints[*facet].insert(values.begin(), values.end());
        }
        return constraints;
    }

    QueryResult QueryPlanner::query(const Query& query) const {
        const auto constraints = resolve_filters(query.filters);

        QueryResult result;
        result.snapshot = m_snapshots.current();
        if (!result.snapshot) throw RetrievalUnavailable("no catalog snapshot has been published");
        const Snapshot& snap = *result.snapshot;

        const IdSet candidates = constraints.empty() ? snap.facets.all()
                                                     : snap.facets.filter(constraints, query.match);
        result.in_scope = candidates.size();
        if (candidates.empty() || query.limit == 0) return result;

        if (is_blank(query.text)) {
            for (const auto& id : candidates) {
                if (result.hits.size() == query.limit) break;
                result.hits.push_back({snap.catalog.find(id), std::nullopt});
            }
            return result;
        }

        std::vector<float> query_vector;
        try {
            query_vector = m_snapshots.embedder().embed(*query.text);
        } catch (const std::exception& e) {
            std::cerr << "[QueryPlanner] Embedder unavailable: " << e.what() << "\n";
            throw RetrievalUnavailable(std::string("embedder unavailable: ") + e.what());
        }
        if (!all_finite(query_vector)) {
            std::cerr << "[QueryPlanner] Embedder returned a non-finite query vector\n";
            throw RetrievalUnavailable("embedder returned a non-finite query vector");
        }

        std::vector<ScoredId> ranked;
        try {
            ranked = snap.vectors.nearest(query_vector, candidates, query.limit);
        } catch (const std::invalid_argument& e) {
            // The embedder no longer produces vectors of the snapshot's dimension.
            throw RetrievalUnavailable(e.what());
        }

        result.hits.reserve(ranked.size());
        for (const auto& scored : ranked) {
            result.hits.push_back({snap.catalog.find(scored.id), scored.score});
        }
        return result;
    }

    MatchStrength match_strength(std::optional<float> score) {
        if (!score) return {"n/a", "n/a"};
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%.3f", *score);
        if (*score >= 0.45f) return {"very strong", buf};
        if (*score >= 0.30f) return {"good", buf};
        if (*score >= 0.20f) return {"weak", buf};
        return {"unlikely", buf};
    }

}
