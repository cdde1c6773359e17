// Complex query engine: planning + hybrid execution

#include "query/query_engine.h"
#include "query/query_errors.h"
#include "schema/schema_registry.h"
#include "storage/store_interfaces.h"
#include "utils/logger.h"
#include "utils/tracing.h"

#include <chrono>

namespace trivium {

QueryEngine::QueryEngine(const SchemaProvider& schema,
                         const RelationalStore& relational,
                         const VectorStore& vector,
                         const GraphStore& graph,
                         QueryConfig config,
                         const TextEmbedder* embedder)
	: config_(config)
	, planner_(schema, embedder)
	, executor_(relational, vector, graph, embedder, config) {}

query::PlannedQuery QueryEngine::plan(const query::ComplexQuery& q) const {
	auto span = Tracer::startSpan("QueryEngine.plan");
	span.setAttribute("query.description", q.description());
	try {
		auto planned = planner_.plan(q);
		span.setAttribute("query.object_type", planned.object_type_name);
		span.setAttribute("query.components", static_cast<int64_t>(planned.component_count));
		span.setStatus(true);
		return planned;
	} catch (const QueryError& e) {
		span.recordError(e.what());
		throw;
	}
}

QueryResult QueryEngine::execute(const query::ComplexQuery& q) const {
	return execute(plan(q));
}

QueryResult QueryEngine::execute(const query::PlannedQuery& plan) const {
	auto span = Tracer::startSpan("QueryEngine.execute");
	span.setAttribute("query.description", plan.description);
	span.setAttribute("query.object_type", plan.object_type_name);
	span.setAttribute("query.parallel_siblings", config_.parallel_siblings);

	const auto start = std::chrono::steady_clock::now();
	QueryResult result;
	try {
		result = executor_.execute(plan);
	} catch (const QueryTimeoutError& e) {
		// Teilergebnisse sind bei Timeout nicht definiert
		TRIVIUM_WARN("QueryEngine: '{}' {}", plan.description, e.what());
		span.recordError(e.what());
		result = QueryResult{};
		result.errors.push_back(e.what());
		return result;
	}

	const auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
		std::chrono::steady_clock::now() - start).count();
	TRIVIUM_DEBUG("QueryEngine: '{}' -> {} {} object(s), {} error(s) in {} ms",
	              plan.description, result.object_instances.size(), plan.object_type_name,
	              result.errors.size(), elapsed_ms);

	span.setAttribute("query.result_count", static_cast<int64_t>(result.object_instances.size()));
	span.setAttribute("query.error_count", static_cast<int64_t>(result.errors.size()));
	span.setStatus(result.ok(), result.ok() ? "" : result.errors.front());
	return result;
}

} // namespace trivium
