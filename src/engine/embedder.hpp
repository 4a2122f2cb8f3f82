#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include "cadence/errors.hpp"

namespace cadence::engine {

    struct Config;

    /**
     * @brief Abstract base class for embedding generation.
     * Implementations must tolerate concurrent calls to embed().
     */
    class Embedder {
    public:
        virtual ~Embedder() = default;

        /**
         * @brief Generates an embedding vector for the given text.
         * @param text The embedding text of a record, or a query.
         * @return A non-empty vector of floats.
         * @throws EmbedderError if the backend fails.
         */
        virtual std::vector<float> embed(const std::string& text) = 0;

        /**
         * @brief Returns the dimension of the vectors produced by this embedder.
         * Zero when it is only known after the first call.
         */
        virtual size_t dimension() const = 0;

        /**
         * @brief Identifies backend and model, e.g. "ollama:all-minilm".
         * Vectors from embedders with different names are never mixed in the cache.
         */
        virtual std::string name() const = 0;
    };

    std::unique_ptr<Embedder> create_ollama_embedder(const std::string& model, const std::string& endpoint,
                                                     std::chrono::milliseconds timeout);
    std::unique_ptr<Embedder> create_onnx_embedder(const std::string& model_path, const std::string& vocab_path);
    std::unique_ptr<Embedder> create_openai_embedder(const std::string& api_key, const std::string& model,
                                                     std::chrono::milliseconds timeout);
    std::unique_ptr<Embedder> create_hashing_embedder(size_t dimension);

    /**
     * @brief Wraps an embedder so that every call fails with EmbedderError once the timeout expires.
     * A call that finishes after its deadline has its result discarded. Its worker thread keeps
     * running until the inner call returns, so timed-out calls can exceed a build's concurrency
     * bound; destroying the wrapper joins every outstanding worker.
     */
    std::shared_ptr<Embedder> with_deadline(std::shared_ptr<Embedder> inner, std::chrono::milliseconds timeout);

    /**
     * @brief Builds the backend selected by the configuration, wrapped with its deadline.
     */
    std::shared_ptr<Embedder> create_embedder(const Config& config);

}
