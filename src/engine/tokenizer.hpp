#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <string>
#include <unordered_map>
#include <vector>
#include "cadence/errors.hpp"

namespace cadence::engine {

    /**
     * @brief WordPiece tokenizer for BERT-style sentence-transformer models.
     * Punctuation becomes its own token, so "r&b" and "lo-fi" keep their pieces.
     */
    class Tokenizer {
    public:
        static constexpr int64_t kUnk = 100;
        static constexpr int64_t kCls = 101;
        static constexpr int64_t kSep = 102;

        explicit Tokenizer(const std::string& vocab_path) {
            load_vocab(vocab_path);
        }

        std::vector<int64_t> encode(const std::string& text, size_t max_length = 256) const {
            std::vector<int64_t> ids;
            ids.push_back(kCls);

            for (const auto& word : split(text)) {
                if (ids.size() >= max_length - 1) break; // reserve 1 for [SEP]
                append_word_pieces(word, ids);
            }

            if (ids.size() > max_length - 1) ids.resize(max_length - 1);
            ids.push_back(kSep);
            return ids;
        }

        size_t vocab_size() const { return m_vocab.size(); }

    private:
        std::unordered_map<std::string, int64_t> m_vocab;

        void load_vocab(const std::string& path) {
            std::ifstream file(path);
            if (!file.is_open()) {
                throw EmbedderError("[Tokenizer] Failed to load vocab: " + path);
            }
            std::string line;
            int64_t id = 0;
            while (std::getline(file, line)) {
                if (!line.empty() && line.back() == '\r') line.pop_back();
                m_vocab[line] = id++;
            }
        }

        static std::vector<std::string> split(const std::string& text) {
            std::vector<std::string> words;
            std::string word;
            for (unsigned char c : text) {
                if (std::isspace(c)) {
                    if (!word.empty()) words.push_back(std::move(word));
                    word.clear();
                } else if (std::ispunct(c)) {
                    if (!word.empty()) words.push_back(std::move(word));
                    word.clear();
                    words.emplace_back(1, static_cast<char>(c));
                } else {
                    word.push_back(static_cast<char>(std::tolower(c)));
                }
            }
            if (!word.empty()) words.push_back(std::move(word));
            return words;
        }

        void append_word_pieces(const std::string& word, std::vector<int64_t>& ids) const {
            if (word.length() > 100) {
                ids.push_back(kUnk);
                return;
            }

            std::vector<int64_t> pieces;
            size_t start = 0;
            while (start < word.length()) {
                size_t end = word.length();
                int64_t found = -1;
                while (start < end) {
                    std::string piece = word.substr(start, end - start);
                    if (start > 0) piece = "##" + piece;
                    auto it = m_vocab.find(piece);
                    if (it != m_vocab.end()) {
                        found = it->second;
                        break;
                    }
                    end--;
                }
                if (found == -1) {
                    ids.push_back(kUnk);
                    return;
                }
                pieces.push_back(found);
                start = end;
            }
            ids.insert(ids.end(), pieces.begin(), pieces.end());
        }
    };

}
