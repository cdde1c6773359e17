#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace trivium {

/// Concrete instance of an ObjectTypeDefinition
struct ObjectInstance {
    std::string id;
    std::string object_type_name;
    double weight = 1.0;          // [0, 10]
    int64_t upsert_date_ms = 0;   // epoch milliseconds (UTC)
    nlohmann::json properties = nlohmann::json::object();
};

/// Fully materialized query outcome. errors may be non-empty even when
/// object_instances is not: partial success is a valid state.
struct QueryResult {
    std::vector<ObjectInstance> object_instances;
    std::vector<std::string> errors;

    bool ok() const { return errors.empty(); }
};

} // namespace trivium
