#include "snapshot_manager.hpp"
#include "cadence/sha256.h"
#include <iostream>
#include <set>

namespace cadence::engine {

    SnapshotManager::SnapshotManager(std::shared_ptr<Embedder> embedder, BuildOptions options,
                                     std::shared_ptr<EmbeddingCache> cache)
        : m_embedder(std::move(embedder)), m_options(options), m_cache(std::move(cache)) {}

    SnapshotId SnapshotManager::publish(const nlohmann::json& revision) {
        std::lock_guard<std::mutex> build_lock(m_build_mutex);
        return publish_catalog(CatalogStore::load(revision));
    }

    SnapshotId SnapshotManager::publish_file(const std::filesystem::path& path) {
        std::lock_guard<std::mutex> build_lock(m_build_mutex);
        std::cout << "[SnapshotManager] Loading catalog " << path << "\n";
        return publish_catalog(CatalogStore::load_file(path));
    }

    SnapshotId SnapshotManager::publish_catalog(CatalogStore catalog) {
        auto facets = FacetIndex::build(catalog);
        auto vectors = VectorIndex::build(catalog, *m_embedder, m_options, m_cache.get());

        auto snapshot = std::make_shared<Snapshot>(Snapshot{
            m_next_id, std::move(catalog), std::move(facets), std::move(vectors),
            m_embedder->name(), std::chrono::system_clock::now()
        });
        const SnapshotId id = m_next_id++;

        {
            std::lock_guard<std::mutex> lock(m_current_mutex);
            m_current = snapshot;
        }
        std::cout << "[SnapshotManager] Published snapshot " << id << " (" << snapshot->catalog.size()
                  << " records, " << snapshot->vectors.dimension() << " dims)\n";

        if (m_cache) {
            std::set<std::string> live;
            for (const auto& entry : snapshot->catalog) {
                live.insert(crypto::SHA256::hash(entry.second.embedding_text()));
            }
            int removed = m_cache->prune(m_embedder->name(), live);
            if (removed > 0) std::cout << "[SnapshotManager] Pruned " << removed << " stale cached vectors\n";
        }
        return id;
    }

    std::shared_ptr<const Snapshot> SnapshotManager::current() const {
        std::lock_guard<std::mutex> lock(m_current_mutex);
        return m_current;
    }

}
