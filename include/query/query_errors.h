#pragma once

#include <stdexcept>
#include <utility>
#include <string>
#include <vector>

namespace trivium {

/**
 * @brief Generic top-level query failure (empty plan tree, malformed query document)
 */
class QueryError : public std::runtime_error {
public:
    explicit QueryError(const std::string& message)
        : std::runtime_error(message)
    {}
};

/**
 * @brief Unknown type/property/embedding/relation reference or invalid tree shape.
 *
 * The planner collects every problem before throwing; errors() holds them all,
 * what() joins them.
 */
class SchemaError : public QueryError {
public:
    explicit SchemaError(std::vector<std::string> errors)
        : QueryError("Schema validation failed: " + join(errors))
        , errors_(std::move(errors))
    {}

    const std::vector<std::string>& errors() const { return errors_; }

protected:
    SchemaError(const std::string& prefix, std::vector<std::string> errors)
        : QueryError(prefix + join(errors))
        , errors_(std::move(errors))
    {}

    static std::string join(const std::vector<std::string>& errors) {
        std::string out;
        for (size_t i = 0; i < errors.size(); ++i) {
            if (i > 0) out += "; ";
            out += errors[i];
        }
        return out;
    }

private:
    std::vector<std::string> errors_;
};

/**
 * @brief Filter value incompatible with its property's data type or operator
 */
class ValidationError : public SchemaError {
public:
    explicit ValidationError(std::vector<std::string> errors)
        : SchemaError("Query validation failed: ", std::move(errors))
    {}
};

/**
 * @brief A store collaborator call failed. Never escapes QueryEngine::execute().
 */
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& message)
        : std::runtime_error("Store error: " + message)
    {}
};

/**
 * @brief Query deadline exceeded during execution; reported as a query-level error
 */
class QueryTimeoutError : public QueryError {
public:
    explicit QueryTimeoutError(long long timeout_ms)
        : QueryError("query timed out after " + std::to_string(timeout_ms) + " ms")
    {}
};

} // namespace trivium
