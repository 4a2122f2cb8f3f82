#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <mutex>
#include <optional>
#include <set>
#include <sqlite3.h>

namespace cadence::engine {

    /**
     * @brief SQLite store of embedding vectors keyed by (text hash, embedder name).
     * A record whose embedding text is unchanged reuses its vector across rebuilds and restarts.
     * Every method is safe to call from several threads.
     */
    class EmbeddingCache {
    public:
        EmbeddingCache();
        ~EmbeddingCache();

        EmbeddingCache(const EmbeddingCache&) = delete;
        EmbeddingCache& operator=(const EmbeddingCache&) = delete;

        /**
         * @brief Opens (or creates) the cache. ":memory:" gives a private in-memory cache.
         */
        bool open(const std::filesystem::path& path);
        void close();

        /**
         * @brief Initializes the schema if it doesn't exist.
         */
        bool initialize_schema();

        /**
         * @brief Returns the cached vector, or nothing on a miss or a read error.
         */
        std::optional<std::vector<float>> lookup(const std::string& text_hash, const std::string& embedder);

        /**
         * @brief Inserts or replaces a vector.
         */
        bool store(const std::string& text_hash, const std::string& embedder, const std::vector<float>& embedding);

        /**
         * @brief Deletes the embedder's vectors whose hash is not in keep.
         * @return Number of rows removed, or -1 on error.
         */
        int prune(const std::string& embedder, const std::set<std::string>& keep);

        size_t count();

    private:
        sqlite3* m_db = nullptr;
        std::mutex m_mutex;
    };

}
