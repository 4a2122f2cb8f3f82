#pragma once

#include <cstdlib>
#include <string>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace cadence::engine {

    struct Config {
        std::filesystem::path catalog_path = "songs.json";
        std::string embedding_backend = "ollama"; // ollama, openai, onnx, hash
        std::string embedding_model = "all-minilm";
        std::string embedding_endpoint = "http://localhost:11434/api/embeddings"; // for ollama
        std::string openai_key = "";
        std::string onnx_model_path = "model.onnx";
        std::string onnx_vocab_path = "vocab.txt";
        size_t hash_dimension = 256;
        long embed_timeout_ms = 10000;
        size_t build_concurrency = 4; // parallel embedder calls while building a snapshot
        size_t default_limit = 5;     // results for a text query without a limit
        size_t browse_limit = 15;     // results for a filter-only query without a limit
        bool cache_enabled = true;
        std::string socket_name = "cadence.sock";
        bool watch_catalog = true;

        /**
         * @brief The config file shared by the daemon and its clients:
         * $CADENCE_CONFIG when set, otherwise config.json in config_dir.
         */
        static std::filesystem::path locate(const std::filesystem::path& config_dir) {
            if (const char* path = std::getenv("CADENCE_CONFIG")) {
                if (*path) return path;
            }
            return config_dir / "config.json";
        }

        /**
         * @brief Reads the JSON config file. Missing keys keep their defaults;
         * a missing file yields the defaults, a malformed one is reported and ignored.
         */
        static Config load(const std::filesystem::path& path) {
            Config cfg;
            if (!std::filesystem::exists(path)) return cfg;

            try {
                std::ifstream f(path);
                nlohmann::json j = nlohmann::json::parse(f);

                if (j.contains("catalog_path")) cfg.catalog_path = j["catalog_path"].get<std::string>();
                if (j.contains("embedding_backend")) cfg.embedding_backend = j["embedding_backend"].get<std::string>();
                if (j.contains("embedding_model")) cfg.embedding_model = j["embedding_model"].get<std::string>();
                if (j.contains("embedding_endpoint")) cfg.embedding_endpoint = j["embedding_endpoint"].get<std::string>();
                if (j.contains("openai_key")) cfg.openai_key = j["openai_key"].get<std::string>();
                if (j.contains("onnx_model_path")) cfg.onnx_model_path = j["onnx_model_path"].get<std::string>();
                if (j.contains("onnx_vocab_path")) cfg.onnx_vocab_path = j["onnx_vocab_path"].get<std::string>();
                if (j.contains("hash_dimension")) cfg.hash_dimension = j["hash_dimension"].get<size_t>();
                if (j.contains("embed_timeout_ms")) cfg.embed_timeout_ms = j["embed_timeout_ms"].get<long>();
                if (j.contains("build_concurrency")) cfg.build_concurrency = j["build_concurrency"].get<size_t>();
                if (j.contains("default_limit")) cfg.default_limit = j["default_limit"].get<size_t>();
                if (j.contains("browse_limit")) cfg.browse_limit = j["browse_limit"].get<size_t>();
                if (j.contains("cache_enabled")) cfg.cache_enabled = j["cache_enabled"].get<bool>();
                if (j.contains("socket_name")) cfg.socket_name = j["socket_name"].get<std::string>();
                if (j.contains("watch_catalog")) cfg.watch_catalog = j["watch_catalog"].get<bool>();
            } catch (const nlohmann::json::exception& e) {
                std::cerr << "[Config] Ignoring " << path << ": " << e.what() << "\n";
                return Config{};
            }
            if (cfg.build_concurrency == 0) cfg.build_concurrency = 1;
            return cfg;
        }

        /**
         * @brief Applies OPENAI_API_KEY and CADENCE_CATALOG when they are set.
         */
        void apply_environment() {
            if (const char* key = std::getenv("OPENAI_API_KEY")) openai_key = key;
            if (const char* catalog = std::getenv("CADENCE_CATALOG")) catalog_path = catalog;
        }

        void save(const std::filesystem::path& path) const {
            nlohmann::json j;
            j["catalog_path"] = catalog_path.string();
            j["embedding_backend"] = embedding_backend;
            j["embedding_model"] = embedding_model;
            j["embedding_endpoint"] = embedding_endpoint;
            j["onnx_model_path"] = onnx_model_path;
            j["onnx_vocab_path"] = onnx_vocab_path;
            j["hash_dimension"] = hash_dimension;
            j["embed_timeout_ms"] = embed_timeout_ms;
            j["build_concurrency"] = build_concurrency;
            j["default_limit"] = default_limit;
            j["browse_limit"] = browse_limit;
            j["cache_enabled"] = cache_enabled;
            j["socket_name"] = socket_name;
            j["watch_catalog"] = watch_catalog;
            if (!openai_key.empty()) j["openai_key"] = openai_key;

            std::ofstream f(path);
            f << j.dump(4);
        }
    };

}
