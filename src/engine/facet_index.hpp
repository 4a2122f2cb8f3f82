#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>
#include "cadence/types.hpp"
#include "catalog.hpp"

namespace cadence::engine {

    using IdSet = std::set<std::string>;

    /**
     * @brief Required values per facet dimension.
     * A dimension with an empty value set places no constraint.
     */
    using FacetConstraints = std::map<Facet, std::set<std::string>>;

    /**
     * @brief How the values listed for one dimension combine.
     * Dimensions themselves are always intersected.
     */
    enum class MatchMode {
        Any, // record carries at least one of the values (default)
        All  // record carries every value
    };

    class FacetIndex {
    public:
        struct ValueCount {
            std::string value;
            size_t count;
        };

        static FacetIndex build(const CatalogStore& catalog);

        /**
         * @brief Ids of the records satisfying every constrained dimension.
         * Values outside the vocabulary, or absent from the catalog, match nothing.
         */
        IdSet filter(const FacetConstraints& constraints, MatchMode mode = MatchMode::Any) const;

        /**
         * @brief Ids carrying a value; empty for unknown values.
         */
        const IdSet& postings(Facet facet, const std::string& value) const;

        /**
         * @brief Values present in the catalog for a facet, in vocabulary order.
         */
        std::vector<ValueCount> values(Facet facet) const;

        const IdSet& all() const { return m_all; }

        bool operator==(const FacetIndex& other) const {
            return m_all == other.m_all && m_postings == other.m_postings;
        }
        bool operator!=(const FacetIndex& other) const { return !(*this == other); }

    private:
        IdSet match_dimension(Facet facet, const std::set<std::string>& values, MatchMode mode) const;

        std::map<Facet, std::map<std::string, IdSet>> m_postings;
        IdSet m_all;
    };

}
