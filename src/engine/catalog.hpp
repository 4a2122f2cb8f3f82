#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "cadence/types.hpp"
#include "cadence/errors.hpp"

namespace cadence::engine {

    /**
     * @brief The validated, immutable record set of one snapshot.
     */
    class CatalogStore {
    public:
        using Records = std::map<std::string, SongRecord>;

        /**
         * @brief Validates a catalog revision (a JSON array of song entries).
         * Every entry is checked before failing; all problems are reported together.
         * @throws ValidationError if the revision or any entry is invalid.
         */
        static CatalogStore load(const nlohmann::json& entries);

        /**
         * @brief Reads and validates a catalog revision from a JSON file.
         * @throws ValidationError if the file cannot be read or parsed, or is invalid.
         */
        static CatalogStore load_file(const std::filesystem::path& path);

        const SongRecord* find(const std::string& id) const;

        /**
         * @brief All record ids in ascending order.
         */
        std::vector<std::string> ids() const;

        size_t size() const { return m_records.size(); }
        bool empty() const { return m_records.empty(); }

        Records::const_iterator begin() const { return m_records.begin(); }
        Records::const_iterator end() const { return m_records.end(); }

        /**
         * @brief SHA-256 over the canonical content of every record, in id order.
         */
        const std::string& fingerprint() const { return m_fingerprint; }

    private:
        CatalogStore() = default;

        Records m_records;
        std::string m_fingerprint;
    };

    nlohmann::json to_json(const SongRecord& record);

}
