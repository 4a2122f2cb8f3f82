#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include "catalog.hpp"
#include "embedder.hpp"
#include "embedding_cache.hpp"
#include "facet_index.hpp"
#include "vector_index.hpp"

namespace cadence::engine {

    using SnapshotId = uint64_t;

    /**
     * @brief One fully built, immutable catalog + facet index + vector index bundle.
     */
    struct Snapshot {
        SnapshotId id;
        CatalogStore catalog;
        FacetIndex facets;
        VectorIndex vectors;
        std::string embedder;
        std::chrono::system_clock::time_point published_at;
    };

    /**
     * @brief Builds snapshots from catalog revisions and publishes them atomically.
     *
     * A build happens entirely off to the side; only the final pointer swap is
     * synchronized with readers. Readers hold a shared_ptr to the snapshot they
     * started with, so a publish never disturbs a query in flight. Builds are
     * serialized and ids increase in publish order, starting at 1.
     */
    class SnapshotManager {
    public:
        SnapshotManager(std::shared_ptr<Embedder> embedder, BuildOptions options,
                        std::shared_ptr<EmbeddingCache> cache = nullptr);

        /**
         * @brief Validates and indexes a revision, then makes it current.
         * On failure the current snapshot keeps serving.
         * @throws ValidationError, EmbedderError
         */
        SnapshotId publish(const nlohmann::json& revision);

        /**
         * @brief Same as publish() for a revision stored in a JSON file.
         */
        SnapshotId publish_file(const std::filesystem::path& path);

        /**
         * @brief The snapshot serving queries right now; nullptr before the first publish.
         */
        std::shared_ptr<const Snapshot> current() const;

        Embedder& embedder() const { return *m_embedder; }

    private:
        SnapshotId publish_catalog(CatalogStore catalog);

        std::shared_ptr<Embedder> m_embedder;
        BuildOptions m_options;
        std::shared_ptr<EmbeddingCache> m_cache;

        std::mutex m_build_mutex;
        mutable std::mutex m_current_mutex;
        std::shared_ptr<const Snapshot> m_current;
        SnapshotId m_next_id = 1;
    };

}
