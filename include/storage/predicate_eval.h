#pragma once

#include "query/clause.h"
#include "query/query_result.h"
#include "schema/schema_types.h"

#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

namespace trivium {

/// Evaluates RelationalFilters against stored ObjectInstances.
///
/// Semantics:
///   ==, !=       JSON equality, numbers compare across int/float (integers exactly)
///   <, <=, >, >= numbers numerically, strings lexicographically
///   DATETIME properties and upsert_date compare ISO-8601 strings by instant;
///   without a type definition only upsert_date is temporal
///   CONTAINS     substring; STARTSWITH / ENDSWITH prefix / suffix
///   LIKE         '%' any run, '_' one character, ASCII case-insensitive
///   IN           membership in the filter's array
/// A missing or null property only matches "== null".
class PredicateEvaluator {
public:
    /// Property value including the metadata properties id, weight, upsert_date
    static nlohmann::json resolve(const ObjectInstance& obj, const std::string& property);

    static bool matches(const ObjectInstance& obj, const query::RelationalFilter& filter,
                        const ObjectTypeDefinition* type = nullptr);
    static bool matchesAll(const ObjectInstance& obj, const std::vector<query::RelationalFilter>& filters,
                           const ObjectTypeDefinition* type = nullptr);

    static bool compare(query::RelationalOperator op, const nlohmann::json& left, const nlohmann::json& right,
                        bool temporal = false);
    static bool isTemporal(const ObjectTypeDefinition* type, const std::string& property);
    static bool likeMatch(std::string_view text, std::string_view pattern);
};

} // namespace trivium
