// Recursive evaluation of planned clause trees

#include "query/query_executor.h"
#include "query/query_errors.h"
#include "storage/store_interfaces.h"
#include "utils/logger.h"
#include "utils/tracing.h"

#include <tbb/task_group.h>
#include <algorithm>
#include <exception>
#include <iterator>
#include <type_traits>

namespace trivium {
namespace query {

namespace {

void normalize(std::vector<std::string>& ids) {
	std::sort(ids.begin(), ids.end());
	ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
}

} // namespace

QueryExecutor::QueryExecutor(const RelationalStore& relational, const VectorStore& vector, const GraphStore& graph,
                             const TextEmbedder* embedder, QueryConfig config)
	: relational_(relational), vector_(vector), graph_(graph), embedder_(embedder), config_(config) {}

void QueryExecutor::Context::checkDeadline() const {
	if (deadline && std::chrono::steady_clock::now() > *deadline) {
		throw QueryTimeoutError(timeout_ms);
	}
}

QueryResult QueryExecutor::execute(const PlannedQuery& plan) const {
	QueryResult result;
	if (!plan.root) {
		result.errors.push_back("empty plan");
		return result;
	}

	Context ctx;
	if (config_.timeout_ms > 0) {
		ctx.timeout_ms = config_.timeout_ms;
		ctx.deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(config_.timeout_ms);
	}

	auto ids = evaluate(*plan.root, ctx, result.errors);
	if (!ids.empty()) {
		result.object_instances = fetchObjects(plan.object_type_name, ids, ctx, result.errors);
	}
	return result;
}

std::vector<std::string> QueryExecutor::evaluate(const PlannedNode& node, const Context& ctx,
                                                 std::vector<std::string>& errors) const {
	return visitPlan(node, [&](const auto& n) -> std::vector<std::string> {
		using T = std::decay_t<decltype(n)>;
		if constexpr (std::is_same_v<T, PlannedComponentExecution>) {
			return evaluateLeaf(n, ctx, errors);
		} else if constexpr (std::is_same_v<T, PlannedLogicalGroup>) {
			return evaluateGroup(n, ctx, errors);
		} else {
			return evaluateNot(n, ctx, errors);
		}
	});
}

std::vector<std::string> QueryExecutor::evaluateLeaf(const PlannedComponentExecution& leaf, const Context& ctx,
                                                     std::vector<std::string>& errors) const {
	auto span = Tracer::startSpan("executor.leaf");
	span.setAttribute("leaf.index", static_cast<int64_t>(leaf.component_index));
	span.setAttribute("leaf.object_type", leaf.object_type_name);
	span.setAttribute("leaf.steps", static_cast<int64_t>(leaf.steps.size()));

	try {
		if (leaf.steps.empty()) {
			auto ids = fullExtent(leaf.object_type_name, ctx);
			span.setAttribute("leaf.result_count", static_cast<int64_t>(ids.size()));
			span.setStatus(true);
			return ids;
		}

		std::optional<std::vector<std::string>> running; // nullopt = unbeschränkt
		for (size_t i = 0; i < leaf.steps.size(); ++i) {
			const auto* restrict = running ? &*running : nullptr;
			auto ids = runStep(leaf.steps[i], restrict, ctx);
			running = std::move(ids);
			if (running->empty()) {
				if (i + 1 < leaf.steps.size()) {
					TRIVIUM_DEBUG("Executor: component {} empty after step {}, skipping {} step(s)",
					              leaf.component_index, i, leaf.steps.size() - i - 1);
				}
				break;
			}
		}

		span.setAttribute("leaf.result_count", static_cast<int64_t>(running->size()));
		span.setStatus(true);
		return std::move(*running);
	} catch (const QueryTimeoutError&) {
		throw;
	} catch (const std::exception& e) {
		std::string msg = "component " + std::to_string(leaf.component_index) + " (" +
		                  leaf.object_type_name + "): " + e.what();
		TRIVIUM_ERROR("Executor: {}", msg);
		span.recordError(msg);
		errors.push_back(std::move(msg));
		return {};
	}
}

std::vector<std::string> QueryExecutor::evaluateGroup(const PlannedLogicalGroup& group, const Context& ctx,
                                                      std::vector<std::string>& errors) const {
	const size_t n = group.clauses.size();
	std::vector<std::vector<std::string>> all_lists(n);
	std::vector<std::vector<std::string>> all_errors(n);

	if (config_.parallel_siblings && n > 1) {
		std::vector<std::exception_ptr> timeouts(n);
		tbb::task_group tg;
		for (size_t i = 0; i < n; ++i) {
			tg.run([this, &group, &ctx, &all_lists, &all_errors, &timeouts, i]() {
				try {
					all_lists[i] = evaluate(*group.clauses[i], ctx, all_errors[i]);
				} catch (const QueryTimeoutError&) {
					timeouts[i] = std::current_exception();
				}
			});
		}
		tg.wait();
		for (const auto& t : timeouts) {
			if (t) std::rethrow_exception(t);
		}
	} else {
		for (size_t i = 0; i < n; ++i) {
			all_lists[i] = evaluate(*group.clauses[i], ctx, all_errors[i]);
		}
	}

	// Fehler in Kind-Reihenfolge übernehmen
	for (auto& e : all_errors) {
		errors.insert(errors.end(), std::make_move_iterator(e.begin()), std::make_move_iterator(e.end()));
	}

	if (group.op == LogicalOperator::And) {
		return intersectSortedLists(std::move(all_lists));
	}
	return unionSortedLists(std::move(all_lists));
}

std::vector<std::string> QueryExecutor::evaluateNot(const PlannedNotClause& notClause, const Context& ctx,
                                                    std::vector<std::string>& errors) const {
	std::vector<std::string> excluded;
	if (notClause.clause) {
		excluded = evaluate(*notClause.clause, ctx, errors);
	}

	std::vector<std::string> universe;
	try {
		universe = fullExtent(notClause.object_type_name, ctx);
	} catch (const QueryTimeoutError&) {
		throw;
	} catch (const std::exception& e) {
		std::string msg = "NOT (" + notClause.object_type_name + "): " + e.what();
		TRIVIUM_ERROR("Executor: {}", msg);
		errors.push_back(std::move(msg));
		return {};
	}
	return subtractSortedList(universe, excluded);
}

std::vector<std::string> QueryExecutor::runStep(const PlannedStep& step, const std::vector<std::string>* restrict,
                                                const Context& ctx) const {
	const char* kind = stepKindToString(step.kind());
	auto span = Tracer::startSpan(std::string("executor.step.") + kind);
	span.setAttribute("step.restricted", restrict != nullptr);
	if (restrict) span.setAttribute("step.restrict_count", static_cast<int64_t>(restrict->size()));

	ctx.checkDeadline();

	std::pair<StoreStatus, std::vector<std::string>> res;
	if (const auto* rel = std::get_if<RelationalFilterStep>(&step.params)) {
		res = relational_.filterIds(rel->object_type_name, rel->filters, restrict);
	} else if (const auto* emb = std::get_if<EmbeddingSearchStep>(&step.params)) {
		std::vector<float> queryVector = emb->search.similar_to_payload;
		if (queryVector.empty() && emb->search.query_text) {
			if (!embedder_) throw StoreError("no text embedder configured");
			auto [est, vec] = embedder_->embed(emb->embedding, *emb->search.query_text);
			if (!est.ok) throw StoreError("text embedding failed: " + est.message);
			queryVector = std::move(vec);
			ctx.checkDeadline();
		}
		res = vector_.searchIds(emb->embedding, queryVector, emb->search.limit,
		                        emb->search.threshold, emb->search.is_l2_distance, restrict);
	} else if (const auto* tr = std::get_if<GraphTraversalStep>(&step.params)) {
		res = graph_.filterByTraversal(tr->source_object_type_name, tr->traversal, restrict);
	}

	auto& [st, ids] = res;
	if (!st.ok) {
		span.setStatus(false, st.message);
		throw StoreError(std::string(kind) + ": " + st.message);
	}

	normalize(ids);
	if (restrict) {
		std::vector<std::string> clipped;
		clipped.reserve(std::min(ids.size(), restrict->size()));
		std::set_intersection(ids.begin(), ids.end(), restrict->begin(), restrict->end(), std::back_inserter(clipped));
		if (clipped.size() != ids.size()) {
			TRIVIUM_WARN("Executor: {} returned {} id(s) outside the restrict-to set, clipped",
			             kind, ids.size() - clipped.size());
			ids.swap(clipped);
		}
	}

	span.setAttribute("step.result_count", static_cast<int64_t>(ids.size()));
	span.setStatus(true);
	return std::move(ids);
}

std::vector<std::string> QueryExecutor::fullExtent(const std::string& objectType, const Context& ctx) const {
	ctx.checkDeadline();
	auto [st, ids] = relational_.allIds(objectType);
	if (!st.ok) throw StoreError("allIds(" + objectType + "): " + st.message);
	normalize(ids);
	return ids;
}

std::vector<ObjectInstance> QueryExecutor::fetchObjects(const std::string& objectType,
                                                        const std::vector<std::string>& ids,
                                                        const Context& ctx,
                                                        std::vector<std::string>& errors) const {
	ctx.checkDeadline();
	auto span = Tracer::startSpan("executor.fetch");
	span.setAttribute("fetch.object_type", objectType);
	span.setAttribute("fetch.id_count", static_cast<int64_t>(ids.size()));

	std::vector<ObjectInstance> objects;
	try {
		auto [st, fetched] = relational_.getObjectsByIds(objectType, ids);
		if (!st.ok) throw StoreError("getObjectsByIds(" + objectType + "): " + st.message);
		objects = std::move(fetched);
	} catch (const std::exception& e) {
		std::string msg = std::string("fetch: ") + e.what();
		TRIVIUM_ERROR("Executor: {}", msg);
		span.recordError(msg);
		errors.push_back(std::move(msg));
		return {};
	}

	objects.erase(std::remove_if(objects.begin(), objects.end(), [&ids](const ObjectInstance& o) {
		return !std::binary_search(ids.begin(), ids.end(), o.id);
	}), objects.end());
	std::sort(objects.begin(), objects.end(), [](const ObjectInstance& a, const ObjectInstance& b) { return a.id < b.id; });
	objects.erase(std::unique(objects.begin(), objects.end(), [](const ObjectInstance& a, const ObjectInstance& b) {
		return a.id == b.id;
	}), objects.end());

	span.setAttribute("fetch.result_count", static_cast<int64_t>(objects.size()));
	span.setStatus(true);
	return objects;
}

std::vector<std::string>
QueryExecutor::intersectSortedLists(std::vector<std::vector<std::string>> lists) {
	if (lists.empty()) return {};
	// Kleinste Liste zuerst
	std::sort(lists.begin(), lists.end(), [](const auto& a, const auto& b){ return a.size() < b.size(); });

	std::vector<std::string> result = std::move(lists.front());
	for (size_t i = 1; i < lists.size() && !result.empty(); ++i) {
		const auto& next = lists[i];
		std::vector<std::string> tmp;
		tmp.reserve(std::min(result.size(), next.size()));
		std::set_intersection(result.begin(), result.end(), next.begin(), next.end(), std::back_inserter(tmp));
		result.swap(tmp);
	}
	return result;
}

std::vector<std::string>
QueryExecutor::unionSortedLists(std::vector<std::vector<std::string>> lists) {
	if (lists.empty()) return {};
	if (lists.size() == 1) return std::move(lists.front());

	std::vector<std::string> result = std::move(lists.front());
	for (size_t i = 1; i < lists.size(); ++i) {
		const auto& next = lists[i];
		std::vector<std::string> tmp;
		tmp.reserve(result.size() + next.size());
		std::set_union(result.begin(), result.end(), next.begin(), next.end(), std::back_inserter(tmp));
		result.swap(tmp);
	}
	return result;
}

std::vector<std::string>
QueryExecutor::subtractSortedList(const std::vector<std::string>& universe, const std::vector<std::string>& remove) {
	std::vector<std::string> result;
	result.reserve(universe.size());
	std::set_difference(universe.begin(), universe.end(), remove.begin(), remove.end(), std::back_inserter(result));
	return result;
}

} // namespace query
} // namespace trivium
