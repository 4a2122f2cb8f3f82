#pragma once

#include <map>
#include <string>
#include <vector>
#include "catalog.hpp"
#include "embedder.hpp"
#include "embedding_cache.hpp"
#include "facet_index.hpp"

namespace cadence::engine {

    struct ScoredId {
        std::string id;
        float score;

        bool operator==(const ScoredId& other) const { return id == other.id && score == other.score; }
    };

    struct BuildOptions {
        size_t concurrency = 4; // max embedder calls in flight
    };

    struct BuildStats {
        size_t embedded = 0; // vectors computed by the embedder
        size_t reused = 0;   // vectors taken from the cache
    };

    /**
     * @brief True when no component is NaN or infinite.
     */
    bool all_finite(const std::vector<float>& v);

    /**
     * @brief One embedding per record; exact cosine ranking over a candidate set.
     */
    class VectorIndex {
    public:
        /**
         * @param dim Vector dimension; 0 adopts the dimension of the first item added.
         */
        explicit VectorIndex(size_t dim = 0);

        /**
         * @brief Embeds every record of the catalog.
         * Vectors found in the cache are reused; the rest are computed with at most
         * options.concurrency concurrent embedder calls. Any failure aborts the whole build.
         * Fresh vectors are written to the cache only once the build has succeeded.
         * @throws EmbedderError naming the number of failed records and the first failure.
         */
        static VectorIndex build(const CatalogStore& catalog, Embedder& embedder, const BuildOptions& options,
                                 EmbeddingCache* cache = nullptr, BuildStats* stats = nullptr);

        /**
         * @brief Adds or replaces the vector of a record.
         * @throws std::invalid_argument on an empty vector, a NaN or infinite component,
         *         or a dimension mismatch.
         */
        void add_item(const std::string& id, const std::vector<float>& vector);

        /**
         * @brief The k candidates most similar to the query, best first.
         * Ties are broken by ascending id. Candidates without a vector are skipped.
         * @throws std::invalid_argument if the query dimension differs from the index,
         *         or the query has a NaN or infinite component.
         */
        std::vector<ScoredId> nearest(const std::vector<float>& query_vector, const IdSet& candidates, size_t k) const;

        /**
         * @brief The stored (unit-length) vector of a record, or nullptr.
         */
        const std::vector<float>* vector(const std::string& id) const;

        size_t count() const { return m_vectors.size(); }
        size_t dimension() const { return m_dim; }

    private:
        std::map<std::string, std::vector<float>> m_vectors;
        size_t m_dim;
    };

    /**
     * @brief Cosine similarity; 0 when either vector has zero length.
     */
    float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b);

}
