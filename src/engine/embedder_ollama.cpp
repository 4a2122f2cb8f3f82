#include "embedder.hpp"
#include <nlohmann/json.hpp>
#include <curl/curl.h>
#include <atomic>
#include <iostream>

using json = nlohmann::json;

namespace cadence::engine {

    class OllamaEmbedder : public Embedder {
    public:
        OllamaEmbedder(const std::string& model, const std::string& endpoint, std::chrono::milliseconds timeout)
            : m_model(model), m_endpoint(endpoint), m_timeout(timeout) {
            curl_global_init(CURL_GLOBAL_DEFAULT);
        }

        ~OllamaEmbedder() {
            curl_global_cleanup();
        }

        std::vector<float> embed(const std::string& text) override {
            CURL* curl = curl_easy_init();
            if (!curl) throw EmbedderError("[OllamaEmbedder] curl_easy_init() failed");

            std::string json_str;
            try {
                json body = {
                    {"model", m_model},
                    {"prompt", text}
                };
                json_str = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
            } catch (const json::exception& e) {
                curl_easy_cleanup(curl);
                throw EmbedderError(std::string("[OllamaEmbedder] JSON serialization error: ") + e.what());
            }

            struct curl_slist* headers = nullptr;
            headers = curl_slist_append(headers, "Content-Type: application/json");

            std::string response_string;
            curl_easy_setopt(curl, CURLOPT_URL, m_endpoint.c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, json_str.c_str());
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
            curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
            curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_string);
            curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(m_timeout.count()));
            curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

            CURLcode res = curl_easy_perform(curl);
            long status = 0;
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
            curl_slist_free_all(headers);
            curl_easy_cleanup(curl);

            if (res != CURLE_OK) {
                std::cerr << "[OllamaEmbedder] curl_easy_perform() failed: " << curl_easy_strerror(res) << "\n";
                throw EmbedderError(std::string("ollama request failed: ") + curl_easy_strerror(res));
            }
            if (status != 200) {
                std::cerr << "[OllamaEmbedder] HTTP " << status << ": " << response_string << "\n";
                throw EmbedderError("ollama returned HTTP " + std::to_string(status));
            }

            std::vector<float> embedding;
            try {
                auto resp_json = json::parse(response_string);
                if (resp_json.contains("embedding")) {
                    embedding = resp_json["embedding"].get<std::vector<float>>();
                }
            } catch (const json::exception& e) {
                std::cerr << "[OllamaEmbedder] JSON parse error: " << e.what() << "\n";
                throw EmbedderError(std::string("ollama returned malformed JSON: ") + e.what());
            }
            if (embedding.empty()) throw EmbedderError("ollama response carried no embedding");

            m_dimension = embedding.size();
            return embedding;
        }

        size_t dimension() const override { return m_dimension; }
        std::string name() const override { return "ollama:" + m_model; }

    private:
        std::string m_model;
        std::string m_endpoint;
        std::chrono::milliseconds m_timeout;
        std::atomic<size_t> m_dimension{0};

        static size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
            ((std::string*)userp)->append((char*)contents, size * nmemb);
            return size * nmemb;
        }
    };

    std::unique_ptr<Embedder> create_ollama_embedder(const std::string& model, const std::string& endpoint,
                                                     std::chrono::milliseconds timeout) {
        return std::make_unique<OllamaEmbedder>(model, endpoint, timeout);
    }

}
