#pragma once

#include "query/clause.h"
#include "query/query_planner.h"
#include "query/query_result.h"

#include <string>
#include <nlohmann/json.hpp>

namespace trivium {
namespace query {

/**
 * JSON form of a ComplexQuery:
 *
 *   { "description": "...",
 *     "query_root": <clause> }            // or, deprecated:
 *     "components": [<component>, ...] }  // implicit AND
 *
 *   <clause>    := <component> | <group> | <not>
 *   <component> := { "object_type_name", "relational_filters"?, "embedding_searches"?, "graph_traversals"? }
 *   <group>     := { "operator": "AND"|"OR", "clauses": [<clause>, ...] }
 *   <not>       := { "clause": <clause> }
 *
 * Malformed documents raise QueryError naming the offending path.
 */
ComplexQuery complexQueryFromJson(const nlohmann::json& j);
ComplexQuery complexQueryFromString(const std::string& text);

ClausePtr clauseFromJson(const nlohmann::json& j, const std::string& path = "query_root");

nlohmann::json toJson(const ComplexQuery& q);
nlohmann::json toJson(const QueryClause& clause);
nlohmann::json toJson(const RelationalFilter& f);

/// Plan inspection (EXPLAIN-style)
nlohmann::json toJson(const PlannedQuery& plan);

} // namespace query

/// upsert_date rendered as ISO-8601
nlohmann::json toJson(const ObjectInstance& obj);
/// Accepts upsert_date as ISO-8601 string or epoch milliseconds
ObjectInstance objectInstanceFromJson(const nlohmann::json& j);

nlohmann::json toJson(const QueryResult& result);

} // namespace trivium
