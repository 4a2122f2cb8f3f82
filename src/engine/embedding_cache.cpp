#include "embedding_cache.hpp"
#include <iostream>
#include <chrono>
#include <cstring>

namespace cadence::engine {

    EmbeddingCache::EmbeddingCache() = default;
    EmbeddingCache::~EmbeddingCache() { close(); }

    bool EmbeddingCache::open(const std::filesystem::path& path) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (sqlite3_open(path.c_str(), &m_db) != SQLITE_OK) {
            std::cerr << "[EmbeddingCache] Failed to open: " << sqlite3_errmsg(m_db) << "\n";
            sqlite3_close(m_db);
            m_db = nullptr;
            return false;
        }
        return initialize_schema();
    }

    void EmbeddingCache::close() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_db) {
            sqlite3_close(m_db);
            m_db = nullptr;
        }
    }

    bool EmbeddingCache::initialize_schema() {
        const char* sql =
            "CREATE TABLE IF NOT EXISTS embeddings ("
            "  text_hash TEXT NOT NULL,"
            "  embedder TEXT NOT NULL,"
            "  dimension INTEGER NOT NULL,"
            "  vector BLOB NOT NULL,"
            "  updated_at INTEGER,"
            "  PRIMARY KEY (text_hash, embedder)"
            ");";
        char* err_msg = nullptr;
        if (sqlite3_exec(m_db, sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
            std::cerr << "[EmbeddingCache] Schema error: " << err_msg << "\n";
            sqlite3_free(err_msg);
            return false;
        }
        return true;
    }

    std::optional<std::vector<float>> EmbeddingCache::lookup(const std::string& text_hash, const std::string& embedder) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_db) return std::nullopt;

        const char* sql = "SELECT dimension, vector FROM embeddings WHERE text_hash = ? AND embedder = ?;";
        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            std::cerr << "[EmbeddingCache] Lookup error: " << sqlite3_errmsg(m_db) << "\n";
            return std::nullopt;
        }

        sqlite3_bind_text(stmt, 1, text_hash.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 2, embedder.c_str(), -1, SQLITE_STATIC);

        std::optional<std::vector<float>> result;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            const auto dimension = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
            const void* blob = sqlite3_column_blob(stmt, 1);
            const int bytes = sqlite3_column_bytes(stmt, 1);

            if (blob && dimension > 0 && static_cast<size_t>(bytes) == dimension * sizeof(float)) {
                std::vector<float> vec(dimension);
                memcpy(vec.data(), blob, bytes);
                result = std::move(vec);
            } else {
                std::cerr << "[EmbeddingCache] Ignoring corrupt entry for " << text_hash << "\n";
            }
        }
        sqlite3_finalize(stmt);
        return result;
    }

    bool EmbeddingCache::store(const std::string& text_hash, const std::string& embedder, const std::vector<float>& embedding) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_db || embedding.empty()) return false;

        const char* sql =
            "INSERT INTO embeddings (text_hash, embedder, dimension, vector, updated_at) "
            "VALUES (?, ?, ?, ?, ?) "
            "ON CONFLICT(text_hash, embedder) DO UPDATE SET "
            "dimension = excluded.dimension, "
            "vector = excluded.vector, "
            "updated_at = excluded.updated_at;";

        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            std::cerr << "[EmbeddingCache] Store error: " << sqlite3_errmsg(m_db) << "\n";
            return false;
        }

        auto now = std::chrono::system_clock::now().time_since_epoch();
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now).count();

        sqlite3_bind_text(stmt, 1, text_hash.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 2, embedder.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(embedding.size()));
        sqlite3_bind_blob(stmt, 4, embedding.data(), static_cast<int>(embedding.size() * sizeof(float)), SQLITE_STATIC);
        sqlite3_bind_int64(stmt, 5, millis);

        bool success = (sqlite3_step(stmt) == SQLITE_DONE);
        if (!success) std::cerr << "[EmbeddingCache] Store error: " << sqlite3_errmsg(m_db) << "\n";
        sqlite3_finalize(stmt);
        return success;
    }

    int EmbeddingCache::prune(const std::string& embedder, const std::set<std::string>& keep) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_db) return -1;

        std::vector<std::string> stale;
        {
            const char* sql = "SELECT text_hash FROM embeddings WHERE embedder = ?;";
            sqlite3_stmt* stmt;
            if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) return -1;
            sqlite3_bind_text(stmt, 1, embedder.c_str(), -1, SQLITE_STATIC);
            while (sqlite3_step(stmt) == SQLITE_ROW) {
                std::string hash = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
                if (!keep.count(hash)) stale.push_back(std::move(hash));
            }
            sqlite3_finalize(stmt);
        }

        const char* sql = "DELETE FROM embeddings WHERE text_hash = ? AND embedder = ?;";
        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) return -1;

        int removed = 0;
        for (const auto& hash : stale) {
            sqlite3_bind_text(stmt, 1, hash.c_str(), -1, SQLITE_STATIC);
            sqlite3_bind_text(stmt, 2, embedder.c_str(), -1, SQLITE_STATIC);
            if (sqlite3_step(stmt) == SQLITE_DONE) ++removed;
            sqlite3_reset(stmt);
        }
        sqlite3_finalize(stmt);
        return removed;
    }

    size_t EmbeddingCache::count() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_db) return 0;

        size_t n = 0;
        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(m_db, "SELECT COUNT(*) FROM embeddings;", -1, &stmt, nullptr) == SQLITE_OK) {
            if (sqlite3_step(stmt) == SQLITE_ROW) n = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
            sqlite3_finalize(stmt);
        }
        return n;
    }

}
