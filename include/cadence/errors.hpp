#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace cadence {

    class Error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @brief A catalog revision was rejected.
     * Carries every problem found in the revision, not only the first one.
     */
    class ValidationError : public Error {
    public:
        struct Issue {
            size_t index;       // position of the entry in the revision
            std::string field;  // "catalog" for problems with the revision as a whole
            std::string reason;
        };

        explicit ValidationError(std::vector<Issue> issues);

        const std::vector<Issue>& issues() const { return m_issues; }
        const Issue& first() const { return m_issues.front(); }

    private:
        std::vector<Issue> m_issues;
    };

    /**
     * @brief The embedder failed or timed out while a snapshot was being built.
     */
    class EmbedderError : public Error {
    public:
        using Error::Error;
    };

    /**
     * @brief A semantic query could not be served (embedder unreachable, no snapshot).
     */
    class RetrievalUnavailable : public Error {
    public:
        using Error::Error;
    };

    /**
     * @brief A query named a facet dimension that does not exist.
     */
    class InvalidFacet : public Error {
    public:
        explicit InvalidFacet(std::string dimension)
            : Error("unknown facet dimension: " + dimension), m_dimension(std::move(dimension)) {}

        const std::string& dimension() const { return m_dimension; }

    private:
        std::string m_dimension;
    };

}
