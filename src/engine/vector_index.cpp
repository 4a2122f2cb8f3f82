#include "vector_index.hpp"
#include "job_queue.hpp"
#include "cadence/sha256.h"
#include <algorithm>
#include <atomic>
#include <cmath>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace cadence::engine {

    namespace {

        std::vector<float> normalized(const std::vector<float>& v) {
            double norm = 0.0;
            for (float x : v) norm += double(x) * x;
            std::vector<float> out(v.size(), 0.0f);
            if (norm == 0.0) return out;
            norm = std::sqrt(norm);
            for (size_t i = 0; i < v.size(); ++i) out[i] = static_cast<float>(v[i] / norm);
            return out;
        }

        double dot(const std::vector<float>& a, const std::vector<float>& b) {
            double sum = 0.0;
            for (size_t i = 0; i < a.size(); ++i) sum += double(a[i]) * b[i];
            return sum;
        }

        struct EmbedJob {
            std::string id;
            std::string text;
            std::string text_hash;
        };

        struct Failure {
            std::string id;
            std::string message;
        };

    }

    bool all_finite(const std::vector<float>& v) {
        return std::all_of(v.begin(), v.end(), [](float x) { return std::isfinite(x); });
    }

    float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) {
        if (a.size() != b.size() || a.empty()) return 0.0f;
        double na = dot(a, a), nb = dot(b, b);
        if (na == 0.0 || nb == 0.0) return 0.0f;
        return static_cast<float>(dot(a, b) / (std::sqrt(na) * std::sqrt(nb)));
    }

    VectorIndex::VectorIndex(size_t dim) : m_dim(dim) {}

    void VectorIndex::add_item(const std::string& id, const std::vector<float>& vector) {
        if (vector.empty()) {
            throw std::invalid_argument("[VectorIndex] Empty vector for " + id);
        }
        if (!all_finite(vector)) {
            throw std::invalid_argument("[VectorIndex] Non-finite component in vector for " + id);
        }
        if (m_dim == 0) m_dim = vector.size();
        if (vector.size() != m_dim) {
            throw std::invalid_argument("[VectorIndex] Vector dimension mismatch for " + id + ". Expected " +
                                        std::to_string(m_dim) + ", got " + std::to_string(vector.size()));
        }
        m_vectors[id] = normalized(vector);
    }

    const std::vector<float>* VectorIndex::vector(const std::string& id) const {
        auto it = m_vectors.find(id);
        return it == m_vectors.end() ? nullptr : &it->second;
    }

    std::vector<ScoredId> VectorIndex::nearest(const std::vector<float>& query_vector, const IdSet& candidates, size_t k) const {
        std::vector<ScoredId> results;
        if (k == 0 || candidates.empty() || m_vectors.empty()) return results;
        if (query_vector.size() != m_dim) {
            throw std::invalid_argument("[VectorIndex] Query dimension mismatch. Expected " + std::to_string(m_dim) +
                                        ", got " + std::to_string(query_vector.size()));
        }
        if (!all_finite(query_vector)) {
            throw std::invalid_argument("[VectorIndex] Non-finite component in query vector");
        }

        const auto query = normalized(query_vector);
        results.reserve(candidates.size());
        for (const auto& id : candidates) {
            auto it = m_vectors.find(id);
            if (it == m_vectors.end()) continue;
            results.push_back({id, static_cast<float>(dot(query, it->second))});
        }

        auto better = [](const ScoredId& a, const ScoredId& b) {
            if (a.score != b.score) return a.score > b.score;
            return a.id < b.id;
        };
        const size_t n = std::min(k, results.size());
        std::partial_sort(results.begin(), results.begin() + n, results.end(), better);
        results.resize(n);
        return results;
    }

    VectorIndex VectorIndex::build(const CatalogStore& catalog, Embedder& embedder, const BuildOptions& options,
                                   EmbeddingCache* cache, BuildStats* stats) {
        const std::string embedder_name = embedder.name();
        std::map<std::string, std::vector<float>> vectors;
        std::vector<EmbedJob> misses;
        BuildStats local;

        for (const auto& [id, record] : catalog) {
            EmbedJob job{id, record.embedding_text(), ""};
            job.text_hash = crypto::SHA256::hash(job.text);
            if (cache) {
                if (auto hit = cache->lookup(job.text_hash, embedder_name)) {
                    vectors[id] = std::move(*hit);
                    ++local.reused;
                    continue;
                }
            }
            misses.push_back(std::move(job));
        }

        JobQueue<const EmbedJob*> queue;
        for (const auto& job : misses) queue.push(&job);
        queue.stop();

        std::mutex result_mutex;
        std::vector<Failure> failures;
        std::atomic<bool> aborted{false};

        auto worker = [&]() {
            const EmbedJob* job = nullptr;
            while (queue.pop(job)) {
                if (aborted) continue; // drain without calling the embedder
                try {
                    auto vec = embedder.embed(job->text);
                    if (vec.empty()) throw EmbedderError("embedder returned an empty vector");
                    if (!all_finite(vec)) throw EmbedderError("embedder returned a non-finite component");
                    std::lock_guard<std::mutex> lock(result_mutex);
                    vectors[job->id] = std::move(vec);
                } catch (const std::exception& e) {
                    aborted = true;
                    std::lock_guard<std::mutex> lock(result_mutex);
                    failures.push_back({job->id, e.what()});
                }
            }
        };

        const size_t workers = std::min(std::max<size_t>(options.concurrency, 1), misses.size());
        std::vector<std::thread> threads;
        threads.reserve(workers);
        for (size_t i = 0; i < workers; ++i) threads.emplace_back(worker);
        for (auto& t : threads) t.join();

        if (!failures.empty()) {
            const auto& first = failures.front();
            std::cerr << "[VectorIndex] Build aborted: " << failures.size() << " record(s) failed, first "
                      << first.id << ": " << first.message << "\n";
            throw EmbedderError("embedding failed for " + std::to_string(failures.size()) + " record(s); first " +
                                first.id + ": " + first.message);
        }

        VectorIndex index;
        for (const auto& [id, vec] : vectors) {
            try {
                index.add_item(id, vec);
            } catch (const std::invalid_argument& e) {
                throw EmbedderError(std::string("inconsistent embeddings: ") + e.what());
            }
        }

        local.embedded = misses.size();
        if (cache) {
            for (const auto& job : misses) cache->store(job.text_hash, embedder_name, vectors[job.id]);
        }
        std::cout << "[VectorIndex] Indexed " << index.count() << " records (" << local.embedded
                  << " embedded, " << local.reused << " from cache)\n";
        if (stats) *stats = local;
        return index;
    }

}
