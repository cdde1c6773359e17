#include "query/query_planner.h"
#include "query/query_errors.h"
#include "schema/schema_registry.h"
#include "storage/store_interfaces.h"
#include "utils/datetime.h"
#include "utils/logger.h"

#include <cctype>
#include <cmath>
#include <type_traits>

namespace trivium {
namespace query {

using json = nlohmann::json;

const char* stepKindToString(StepKind kind) {
	switch (kind) {
		case StepKind::RelationalFilter: return "relational_filter";
		case StepKind::EmbeddingSearch: return "embedding_search";
		case StepKind::GraphTraversal: return "graph_traversal";
	}
	return "relational_filter";
}

const std::string& PlannedNode::objectType() const {
	return std::visit([](const auto& n) -> const std::string& { return n.object_type_name; }, node);
}

namespace {

bool isCanonicalUuid(const std::string& s) {
	if (s.size() != 36) return false;
	for (size_t i = 0; i < s.size(); ++i) {
		if (i == 8 || i == 13 || i == 18 || i == 23) {
			if (s[i] != '-') return false;
		} else if (!std::isxdigit(static_cast<unsigned char>(s[i]))) {
			return false;
		}
	}
	return true;
}

// Leerer String = Wert passt zum Typ
std::string checkScalar(PropertyDataType t, const json& v) {
	switch (t) {
		case PropertyDataType::TEXT:
		case PropertyDataType::BLOB:
			return v.is_string() ? "" : "expects a string";
		case PropertyDataType::DATETIME:
			if (!v.is_string()) return "expects an ISO-8601 string";
			return utils::parseIso8601(v.get<std::string>()) ? "" : "'" + v.get<std::string>() + "' is not an ISO-8601 timestamp";
		case PropertyDataType::UUID:
			if (!v.is_string()) return "expects a UUID string";
			return isCanonicalUuid(v.get<std::string>()) ? "" : "'" + v.get<std::string>() + "' is not a canonical UUID";
		case PropertyDataType::INTEGER:
			return v.is_number_integer() ? "" : "expects an integer";
		case PropertyDataType::FLOAT:
			return v.is_number() ? "" : "expects a number";
		case PropertyDataType::BOOLEAN:
			return v.is_boolean() ? "" : "expects a boolean";
		case PropertyDataType::JSON:
			return "";
	}
	return "";
}

std::string indexed(const std::string& path, const char* member, size_t i) {
	return path + "." + member + "[" + std::to_string(i) + "]";
}

} // namespace

QueryPlanner::QueryPlanner(const SchemaProvider& schema, const TextEmbedder* embedder)
	: schema_(schema), embedder_(embedder) {}

PlannedQuery QueryPlanner::plan(const ComplexQuery& q) const {
	if (q.empty()) {
		throw QueryError("ComplexQuery has neither query_root nor components");
	}

	Context ctx;
	Planned root = planClause(*q.root(), "query_root", ctx);

	if (!ctx.schemaErrors.empty()) {
		std::vector<std::string> all = std::move(ctx.schemaErrors);
		all.insert(all.end(), ctx.valueErrors.begin(), ctx.valueErrors.end());
		TRIVIUM_WARN("Planner: query '{}' rejected with {} schema problem(s)", q.description(), all.size());
		throw SchemaError(std::move(all));
	}
	if (!ctx.valueErrors.empty()) {
		TRIVIUM_WARN("Planner: query '{}' rejected with {} invalid value(s)", q.description(), ctx.valueErrors.size());
		throw ValidationError(std::move(ctx.valueErrors));
	}

	PlannedQuery pq;
	pq.description = q.description();
	pq.object_type_name = root.objectType;
	pq.root = std::move(root.node);
	pq.component_count = ctx.nextComponentIndex;
	TRIVIUM_DEBUG("Planner: '{}' -> {} component(s) on {}", pq.description, pq.component_count, pq.object_type_name);
	return pq;
}

QueryPlanner::Planned QueryPlanner::planClause(const QueryClause& clause, const std::string& path, Context& ctx) const {
	return visitClause(clause, [&](const auto& node) -> Planned {
		using T = std::decay_t<decltype(node)>;
		if constexpr (std::is_same_v<T, QueryComponent>) {
			return planComponent(node, path, ctx);
		} else if constexpr (std::is_same_v<T, LogicalGroup>) {
			return planGroup(node, path, ctx);
		} else {
			return planNot(node, path, ctx);
		}
	});
}

QueryPlanner::Planned QueryPlanner::planComponent(const QueryComponent& comp, const std::string& path, Context& ctx) const {
	PlannedComponentExecution exec;
	exec.component_index = ctx.nextComponentIndex++;
	exec.object_type_name = comp.object_type_name;

	std::optional<ObjectTypeDefinition> type;
	if (comp.object_type_name.empty()) {
		ctx.schemaErrors.push_back(path + ": object_type_name must not be empty");
	} else {
		type = schema_.getObjectType(comp.object_type_name);
		if (!type) {
			ctx.schemaErrors.push_back(path + ": unknown object type '" + comp.object_type_name + "'");
		}
	}

	// 1) relationale Filter: ein Schritt für alle
	if (!comp.relational_filters.empty()) {
		if (type) {
			for (size_t i = 0; i < comp.relational_filters.size(); ++i) {
				validateFilter(*type, comp.relational_filters[i], indexed(path, "relational_filters", i), ctx);
			}
		}
		exec.steps.push_back(PlannedStep{RelationalFilterStep{comp.object_type_name, comp.relational_filters}});
	}

	// 2) Embedding-Suchen in Deklarationsreihenfolge
	for (size_t i = 0; i < comp.embedding_searches.size(); ++i) {
		auto step = planEmbeddingSearch(comp, comp.embedding_searches[i], indexed(path, "embedding_searches", i), ctx);
		if (step) exec.steps.push_back(PlannedStep{std::move(*step)});
	}

	// 3) Graph-Traversierungen
	for (size_t i = 0; i < comp.graph_traversals.size(); ++i) {
		const auto& t = comp.graph_traversals[i];
		validateTraversal(comp.object_type_name, type.has_value(), t, indexed(path, "graph_traversals", i), ctx);
		exec.steps.push_back(PlannedStep{GraphTraversalStep{comp.object_type_name, t}});
	}

	Planned out;
	out.objectType = comp.object_type_name;
	out.node = std::make_shared<PlannedNode>(PlannedNode{std::move(exec)});
	return out;
}

QueryPlanner::Planned QueryPlanner::planGroup(const LogicalGroup& group, const std::string& path, Context& ctx) const {
	PlannedLogicalGroup planned;
	planned.op = group.op;

	if (group.clauses.empty()) {
		ctx.schemaErrors.push_back(path + ": LogicalGroup (" + logicalOperatorToString(group.op) +
		                           ") must contain at least one clause");
	}

	std::string type;
	for (size_t i = 0; i < group.clauses.size(); ++i) {
		const auto childPath = indexed(path, "clauses", i);
		if (!group.clauses[i]) {
			ctx.schemaErrors.push_back(childPath + ": clause must not be null");
			continue;
		}
		Planned child = planClause(*group.clauses[i], childPath, ctx);
		if (type.empty()) {
			type = child.objectType;
		} else if (!child.objectType.empty() && child.objectType != type) {
			ctx.schemaErrors.push_back(childPath + ": LogicalGroup mixes object types '" + type +
			                           "' and '" + child.objectType + "'");
		}
		planned.clauses.push_back(std::move(child.node));
	}
	planned.object_type_name = type;

	Planned out;
	out.objectType = type;
	out.node = std::make_shared<PlannedNode>(PlannedNode{std::move(planned)});
	return out;
}

QueryPlanner::Planned QueryPlanner::planNot(const NotClause& notClause, const std::string& path, Context& ctx) const {
	PlannedNotClause planned;
	if (!notClause.clause) {
		ctx.schemaErrors.push_back(path + ": NotClause requires a child clause");
	} else {
		Planned child = planClause(*notClause.clause, path + ".clause", ctx);
		planned.object_type_name = child.objectType;
		planned.clause = std::move(child.node);
	}

	Planned out;
	out.objectType = planned.object_type_name;
	out.node = std::make_shared<PlannedNode>(PlannedNode{std::move(planned)});
	return out;
}

void QueryPlanner::validateFilter(const ObjectTypeDefinition& type, const RelationalFilter& filter,
                                  const std::string& path, Context& ctx) const {
	auto prop = type.findProperty(filter.property_name);
	if (!prop) {
		ctx.schemaErrors.push_back(path + ": unknown property '" + filter.property_name +
		                           "' on object type '" + type.name + "'");
		return;
	}

	const auto dt = prop->data_type;
	const std::string opName = operatorToString(filter.op);
	const std::string subject = std::string(dataTypeToString(dt)) + " property '" + prop->name + "'";

	if ((isOrderingOperator(filter.op) && !isOrderedType(dt)) ||
	    (isPatternOperator(filter.op) && !isTextLikeType(dt)) ||
	    (filter.op == RelationalOperator::In && (dt == PropertyDataType::BLOB || dt == PropertyDataType::JSON))) {
		ctx.schemaErrors.push_back(path + ": operator " + opName + " is not supported for " + subject);
		return;
	}

	const json& v = filter.value;
	if (v.is_null()) {
		if (filter.op != RelationalOperator::Eq && filter.op != RelationalOperator::Neq) {
			ctx.valueErrors.push_back(path + ": null value requires == or !=, got " + opName);
		} else if (!prop->is_nullable) {
			ctx.valueErrors.push_back(path + ": " + subject + " is not nullable");
		}
		return;
	}

	if (filter.op == RelationalOperator::In) {
		if (!v.is_array() || v.empty()) {
			ctx.valueErrors.push_back(path + ": IN requires a non-empty array");
			return;
		}
		for (size_t i = 0; i < v.size(); ++i) {
			std::string problem = v[i].is_null() ? "null is not allowed in IN" : checkScalar(dt, v[i]);
			if (!problem.empty()) {
				ctx.valueErrors.push_back(path + ".value[" + std::to_string(i) + "]: " + subject + " " + problem);
			}
		}
		return;
	}

	if (isPatternOperator(filter.op)) {
		if (!v.is_string()) {
			ctx.valueErrors.push_back(path + ": " + opName + " requires a string value");
		}
		return;
	}

	auto problem = checkScalar(dt, v);
	if (!problem.empty()) {
		ctx.valueErrors.push_back(path + ": " + subject + " " + problem + ", got " + v.dump());
	}
}

std::optional<EmbeddingSearchStep> QueryPlanner::planEmbeddingSearch(const QueryComponent& comp,
                                                                     const EmbeddingSearchClause& search,
                                                                     const std::string& path, Context& ctx) const {
	auto def = schema_.getEmbeddingDefinition(search.embedding_definition_name);
	if (!def) {
		ctx.schemaErrors.push_back(path + ": unknown embedding definition '" + search.embedding_definition_name + "'");
		return std::nullopt;
	}
	if (def->object_type_name != comp.object_type_name) {
		ctx.schemaErrors.push_back(path + ": embedding definition '" + def->name + "' belongs to object type '" +
		                           def->object_type_name + "', not '" + comp.object_type_name + "'");
	}

	const bool hasVector = !search.similar_to_payload.empty();
	const bool hasText = search.query_text.has_value() && !search.query_text->empty();
	if (!hasVector && !hasText) {
		ctx.valueErrors.push_back(path + ": similar_to_payload or query_text is required");
	} else if (hasVector && hasText) {
		ctx.valueErrors.push_back(path + ": similar_to_payload and query_text are mutually exclusive");
	}
	if (hasVector && def->dimensions > 0 && search.similar_to_payload.size() != def->dimensions) {
		ctx.valueErrors.push_back(path + ": query vector has " + std::to_string(search.similar_to_payload.size()) +
		                          " dimensions, embedding '" + def->name + "' expects " + std::to_string(def->dimensions));
	}
	if (hasText && !hasVector && embedder_ == nullptr) {
		ctx.valueErrors.push_back(path + ": query_text requires a configured text embedder");
	}
	if (search.limit == 0) {
		ctx.valueErrors.push_back(path + ": limit must be > 0");
	}
	if (search.threshold && !std::isfinite(*search.threshold)) {
		ctx.valueErrors.push_back(path + ": threshold must be a finite number");
	}

	return EmbeddingSearchStep{std::move(*def), search};
}

void QueryPlanner::validateTraversal(const std::string& sourceType, bool sourceKnown,
                                     const GraphTraversalClause& traversal,
                                     const std::string& path, Context& ctx) const {
	auto rel = schema_.getRelationType(traversal.relation_type_name);
	if (!rel) {
		ctx.schemaErrors.push_back(path + ": unknown relation type '" + traversal.relation_type_name + "'");
	}
	auto target = schema_.getObjectType(traversal.target_object_type_name);
	if (!target) {
		ctx.schemaErrors.push_back(path + ": unknown target object type '" + traversal.target_object_type_name + "'");
	}

	if (rel && sourceKnown && target) {
		const bool outgoing = traversal.direction == TraversalDirection::Outgoing;
		const bool leafOk = outgoing ? rel->allowsSource(sourceType) : rel->allowsTarget(sourceType);
		const bool targetOk = outgoing ? rel->allowsTarget(target->name) : rel->allowsSource(target->name);
		if (!leafOk || !targetOk) {
			ctx.schemaErrors.push_back(path + ": relation '" + rel->name + "' does not connect '" + sourceType +
			                           "' " + (outgoing ? "->" : "<-") + " '" + target->name + "' (" +
			                           directionToString(traversal.direction) + ")");
		}
	}

	if (traversal.target_object_id && traversal.target_object_id->empty()) {
		ctx.valueErrors.push_back(path + ": target_object_id must not be empty");
	}

	if (target) {
		for (size_t i = 0; i < traversal.target_object_properties.size(); ++i) {
			validateFilter(*target, traversal.target_object_properties[i],
			               indexed(path, "target_object_properties", i), ctx);
		}
	}
}

} // namespace query
} // namespace trivium
