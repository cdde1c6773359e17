#pragma once

#include "query/clause.h"
#include "query/query_executor.h"
#include "query/query_planner.h"
#include "query/query_result.h"
#include "utils/config.h"

namespace trivium {

class SchemaProvider;
class RelationalStore;
class VectorStore;
class GraphStore;
class TextEmbedder;

/**
 * @brief Entry point: plans a ComplexQuery against the schema and runs it
 * across the relational, vector and graph stores.
 *
 * plan() and execute() throw QueryError / SchemaError / ValidationError for
 * queries that cannot be planned. Once planning succeeds, execute() always
 * returns a QueryResult; store failures and timeouts end up in its errors.
 *
 * The engine only reads. It holds references, the caller owns schema and stores.
 */
class QueryEngine {
public:
    QueryEngine(const SchemaProvider& schema,
                const RelationalStore& relational,
                const VectorStore& vector,
                const GraphStore& graph,
                QueryConfig config = {},
                const TextEmbedder* embedder = nullptr);

    /// Validate and decompose without touching any store
    query::PlannedQuery plan(const query::ComplexQuery& q) const;

    /// Plan, evaluate, fetch
    QueryResult execute(const query::ComplexQuery& q) const;

    /// Run an already planned query
    QueryResult execute(const query::PlannedQuery& plan) const;

    const QueryConfig& config() const { return config_; }

private:
    QueryConfig config_;
    query::QueryPlanner planner_;
    query::QueryExecutor executor_;
};

} // namespace trivium
