#include "embedder.hpp"
#include "config.hpp"
#include <cctype>
#include <cmath>
#include <atomic>
#include <future>
#include <iostream>
#include <iterator>
#include <list>
#include <mutex>
#include <thread>

namespace cadence::engine {

    namespace {

        uint64_t fnv1a(const std::string& token) {
            uint64_t hash = 1469598103934665603ull;
            for (unsigned char c : token) {
                hash ^= c;
                hash *= 1099511628211ull;
            }
            return hash;
        }

        /**
         * Bag-of-words feature hashing. Each lower-cased alphanumeric token adds +1 or -1 to
         * one bucket; the result is L2-normalized. Texts sharing words score higher under cosine.
         */
        class HashingEmbedder : public Embedder {
        public:
            explicit HashingEmbedder(size_t dimension) : m_dimension(dimension) {
                if (m_dimension == 0) throw EmbedderError("hashing embedder needs a non-zero dimension");
            }

            std::vector<float> embed(const std::string& text) override {
                std::vector<float> embedding(m_dimension, 0.0f);
                std::string token;
                auto flush = [&]() {
                    if (token.empty()) return;
                    uint64_t h = fnv1a(token);
                    embedding[h % m_dimension] += (h >> 63) ? -1.0f : 1.0f;
                    token.clear();
                };
                for (unsigned char c : text) {
                    if (std::isalnum(c)) token.push_back(static_cast<char>(std::tolower(c)));
                    else flush();
                }
                flush();

                double norm = 0.0;
                for (float v : embedding) norm += double(v) * v;
                if (norm > 0.0) {
                    norm = std::sqrt(norm);
                    for (float& v : embedding) v = static_cast<float>(v / norm);
                }
                return embedding;
            }

            size_t dimension() const override { return m_dimension; }
            std::string name() const override { return "hash:" + std::to_string(m_dimension); }

        private:
            size_t m_dimension;
        };

        class DeadlineEmbedder : public Embedder {
        public:
            DeadlineEmbedder(std::shared_ptr<Embedder> inner, std::chrono::milliseconds timeout)
                : m_inner(std::move(inner)), m_timeout(timeout) {}

            ~DeadlineEmbedder() override {
                std::list<Worker> workers;
                {
                    std::lock_guard<std::mutex> lock(m_workers_mutex);
                    workers.swap(m_workers);
                }
                for (auto& w : workers) w.thread.join();
            }

            std::vector<float> embed(const std::string& text) override {
                reap_finished();

                auto promise = std::make_shared<std::promise<std::vector<float>>>();
                auto future = promise->get_future();
                auto done = std::make_shared<std::atomic<bool>>(false);

                // The worker owns everything it touches, so it may outlive this call.
                std::thread thread([inner = m_inner, promise, done, text]() {
                    try {
                        promise->set_value(inner->embed(text));
                    } catch (...) {
                        promise->set_exception(std::current_exception());
                    }
                    *done = true;
                });
                {
                    std::lock_guard<std::mutex> lock(m_workers_mutex);
                    m_workers.push_back({std::move(thread), done});
                }

                if (future.wait_for(m_timeout) != std::future_status::ready) {
                    std::cerr << "[Embedder] " << m_inner->name() << " timed out after " << m_timeout.count() << " ms\n";
                    throw EmbedderError(m_inner->name() + " timed out after " + std::to_string(m_timeout.count()) + " ms");
                }
                return future.get();
            }

            size_t dimension() const override { return m_inner->dimension(); }
            std::string name() const override { return m_inner->name(); }

        private:
            struct Worker {
                std::thread thread;
                std::shared_ptr<std::atomic<bool>> done;
            };

            void reap_finished() {
                std::list<Worker> finished;
                {
                    std::lock_guard<std::mutex> lock(m_workers_mutex);
                    for (auto it = m_workers.begin(); it != m_workers.end();) {
                        auto next = std::next(it);
                        if (*it->done) finished.splice(finished.end(), m_workers, it);
                        it = next;
                    }
                }
                for (auto& w : finished) w.thread.join();
            }

            std::shared_ptr<Embedder> m_inner;
            std::chrono::milliseconds m_timeout;
            std::mutex m_workers_mutex;
            std::list<Worker> m_workers;
        };

    }

    std::unique_ptr<Embedder> create_hashing_embedder(size_t dimension) {
        return std::make_unique<HashingEmbedder>(dimension);
    }

    std::shared_ptr<Embedder> with_deadline(std::shared_ptr<Embedder> inner, std::chrono::milliseconds timeout) {
        return std::make_shared<DeadlineEmbedder>(std::move(inner), timeout);
    }

    std::shared_ptr<Embedder> create_embedder(const Config& config) {
        const std::chrono::milliseconds timeout(config.embed_timeout_ms);
        std::shared_ptr<Embedder> backend;

        if (config.embedding_backend == "openai") {
            if (config.openai_key.empty()) throw EmbedderError("openai backend selected but no API key configured");
            std::cout << "[Cadence] Using OpenAI Embedder.\n";
            // The Ollama default model name means nothing to OpenAI.
            std::string model = config.embedding_model == "all-minilm" ? "text-embedding-3-small" : config.embedding_model;
            backend = create_openai_embedder(config.openai_key, model, timeout);
        } else if (config.embedding_backend == "onnx") {
            std::cout << "[Cadence] Using Local ONNX Embedder.\n";
            backend = create_onnx_embedder(config.onnx_model_path, config.onnx_vocab_path);
        } else if (config.embedding_backend == "hash") {
            std::cout << "[Cadence] Using hashing Embedder (" << config.hash_dimension << " dims).\n";
            backend = create_hashing_embedder(config.hash_dimension);
        } else if (config.embedding_backend == "ollama") {
            std::cout << "[Cadence] Using Ollama Embedder (" << config.embedding_model << ").\n";
            backend = create_ollama_embedder(config.embedding_model, config.embedding_endpoint, timeout);
        } else {
            throw EmbedderError("unknown embedding backend: " + config.embedding_backend);
        }
        return with_deadline(std::move(backend), timeout);
    }

}
