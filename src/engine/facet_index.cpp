#include "facet_index.hpp"
#include <algorithm>
#include <iterator>

namespace cadence::engine {

    namespace {
        const IdSet kNoIds;

        IdSet intersect(const IdSet& a, const IdSet& b) {
            IdSet out;
            std::set_intersection(a.begin(), a.end(), b.begin(), b.end(), std::inserter(out, out.end()));
            return out;
        }
    }

    FacetIndex FacetIndex::build(const CatalogStore& catalog) {
        FacetIndex index;
        for (const auto& [id, record] : catalog) {
            index.m_all.insert(id);
            for (Facet facet : kAllFacets) {
                for (auto value : record.values(facet)) {
                    index.m_postings[facet][std::string(value)].insert(id);
                }
            }
        }
        return index;
    }

    const IdSet& FacetIndex::postings(Facet facet, const std::string& value) const {
        auto dim = m_postings.find(facet);
        if (dim == m_postings.end()) return kNoIds;
        auto it = dim->second.find(value);
        return it == dim->second.end() ? kNoIds : it->second;
    }

    IdSet FacetIndex::match_dimension(Facet facet, const std::set<std::string>& values, MatchMode mode) const {
        IdSet matched;
        bool first = true;
        for (const auto& value : values) {
            const IdSet& ids = postings(facet, value);
            if (mode == MatchMode::Any) {
                matched.insert(ids.begin(), ids.end());
            } else {
                matched = first ? ids : intersect(matched, ids);
                if (matched.empty()) break;
            }
            first = false;
        }
        return matched;
    }

    IdSet FacetIndex::filter(const FacetConstraints& constraints, MatchMode mode) const {
        IdSet result = m_all;
        for (const auto& [facet, values] : constraints) {
            if (values.empty()) continue;
            result = intersect(result, match_dimension(facet, values, mode));
            if (result.empty()) break;
        }
        return result;
    }

    std::vector<FacetIndex::ValueCount> FacetIndex::values(Facet facet) const {
        std::vector<ValueCount> out;
        for (auto name : vocabulary_of(facet)) {
            const IdSet& ids = postings(facet, std::string(name));
            if (!ids.empty()) out.push_back({std::string(name), ids.size()});
        }
        return out;
    }

}
