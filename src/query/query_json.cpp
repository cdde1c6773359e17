#include "query/query_json.h"
#include "query/query_errors.h"
#include "utils/datetime.h"

#include <type_traits>

namespace trivium {

using json = nlohmann::json;

namespace query {

namespace {

const json& member(const json& j, const char* key, const std::string& path) {
	if (!j.contains(key)) throw QueryError(path + ": missing '" + key + "'");
	return j.at(key);
}

std::string stringMember(const json& j, const char* key, const std::string& path) {
	const auto& v = member(j, key, path);
	if (!v.is_string()) throw QueryError(path + "." + key + ": expected a string");
	return v.get<std::string>();
}

const json& arrayMember(const json& j, const char* key, const std::string& path) {
	static const json empty = json::array();
	if (!j.contains(key) || j.at(key).is_null()) return empty;
	const auto& v = j.at(key);
	if (!v.is_array()) throw QueryError(path + "." + key + ": expected an array");
	return v;
}

std::string at(const std::string& path, const char* key, size_t i) {
	return path + "." + key + "[" + std::to_string(i) + "]";
}

RelationalFilter filterFromJson(const json& j, const std::string& path) {
	if (!j.is_object()) throw QueryError(path + ": expected an object");
	RelationalFilter f;
	f.property_name = stringMember(j, "property_name", path);
	auto opText = stringMember(j, "operator", path);
	auto op = operatorFromString(opText);
	if (!op) throw QueryError(path + ".operator: unknown operator '" + opText + "'");
	f.op = *op;
	f.value = j.contains("value") ? j.at("value") : json(nullptr);
	return f;
}

EmbeddingSearchClause embeddingFromJson(const json& j, const std::string& path) {
	if (!j.is_object()) throw QueryError(path + ": expected an object");
	EmbeddingSearchClause e;
	e.embedding_definition_name = stringMember(j, "embedding_definition_name", path);
	try {
		if (j.contains("similar_to_payload") && !j.at("similar_to_payload").is_null()) {
			e.similar_to_payload = j.at("similar_to_payload").get<std::vector<float>>();
		}
		if (j.contains("query_text") && !j.at("query_text").is_null()) {
			e.query_text = j.at("query_text").get<std::string>();
		}
		if (j.contains("limit")) {
			auto limit = j.at("limit").get<long long>();
			e.limit = limit < 0 ? 0 : static_cast<size_t>(limit);
		}
		if (j.contains("threshold") && !j.at("threshold").is_null()) {
			e.threshold = j.at("threshold").get<double>();
		}
		e.is_l2_distance = j.value("is_l2_distance", false);
	} catch (const json::exception& ex) {
		throw QueryError(path + ": " + ex.what());
	}
	return e;
}

GraphTraversalClause traversalFromJson(const json& j, const std::string& path) {
	if (!j.is_object()) throw QueryError(path + ": expected an object");
	GraphTraversalClause t;
	t.relation_type_name = stringMember(j, "relation_type_name", path);
	t.target_object_type_name = stringMember(j, "target_object_type_name", path);
	if (j.contains("direction")) {
		auto dir = stringMember(j, "direction", path);
		if (dir == "outgoing") t.direction = TraversalDirection::Outgoing;
		else if (dir == "incoming") t.direction = TraversalDirection::Incoming;
		else throw QueryError(path + ".direction: expected 'outgoing' or 'incoming', got '" + dir + "'");
	}
	if (j.contains("target_object_id") && !j.at("target_object_id").is_null()) {
		t.target_object_id = stringMember(j, "target_object_id", path);
	}
	const auto& props = arrayMember(j, "target_object_properties", path);
	for (size_t i = 0; i < props.size(); ++i) {
		t.target_object_properties.push_back(filterFromJson(props[i], at(path, "target_object_properties", i)));
	}
	return t;
}

QueryComponent componentFromJson(const json& j, const std::string& path) {
	if (!j.is_object()) throw QueryError(path + ": expected an object");
	QueryComponent c;
	c.object_type_name = stringMember(j, "object_type_name", path);
	const auto& filters = arrayMember(j, "relational_filters", path);
	for (size_t i = 0; i < filters.size(); ++i) {
		c.relational_filters.push_back(filterFromJson(filters[i], at(path, "relational_filters", i)));
	}
	const auto& searches = arrayMember(j, "embedding_searches", path);
	for (size_t i = 0; i < searches.size(); ++i) {
		c.embedding_searches.push_back(embeddingFromJson(searches[i], at(path, "embedding_searches", i)));
	}
	const auto& traversals = arrayMember(j, "graph_traversals", path);
	for (size_t i = 0; i < traversals.size(); ++i) {
		c.graph_traversals.push_back(traversalFromJson(traversals[i], at(path, "graph_traversals", i)));
	}
	return c;
}

json embeddingToJson(const EmbeddingSearchClause& e) {
	json j{
		{"embedding_definition_name", e.embedding_definition_name},
		{"limit", e.limit},
		{"is_l2_distance", e.is_l2_distance}
	};
	if (!e.similar_to_payload.empty()) j["similar_to_payload"] = e.similar_to_payload;
	if (e.query_text) j["query_text"] = *e.query_text;
	if (e.threshold) j["threshold"] = *e.threshold;
	return j;
}

json traversalToJson(const GraphTraversalClause& t) {
	json j{
		{"relation_type_name", t.relation_type_name},
		{"direction", directionToString(t.direction)},
		{"target_object_type_name", t.target_object_type_name}
	};
	if (t.target_object_id) j["target_object_id"] = *t.target_object_id;
	if (!t.target_object_properties.empty()) {
		json props = json::array();
		for (const auto& f : t.target_object_properties) props.push_back(toJson(f));
		j["target_object_properties"] = std::move(props);
	}
	return j;
}

json componentToJson(const QueryComponent& c) {
	json j{{"object_type_name", c.object_type_name}};
	json filters = json::array();
	for (const auto& f : c.relational_filters) filters.push_back(toJson(f));
	json searches = json::array();
	for (const auto& e : c.embedding_searches) searches.push_back(embeddingToJson(e));
	json traversals = json::array();
	for (const auto& t : c.graph_traversals) traversals.push_back(traversalToJson(t));
	j["relational_filters"] = std::move(filters);
	j["embedding_searches"] = std::move(searches);
	j["graph_traversals"] = std::move(traversals);
	return j;
}

json stepToJson(const PlannedStep& step) {
	json j{{"kind", stepKindToString(step.kind())}};
	if (const auto* rel = std::get_if<RelationalFilterStep>(&step.params)) {
		json filters = json::array();
		for (const auto& f : rel->filters) filters.push_back(toJson(f));
		j["object_type_name"] = rel->object_type_name;
		j["filters"] = std::move(filters);
	} else if (const auto* emb = std::get_if<EmbeddingSearchStep>(&step.params)) {
		j["embedding"] = emb->embedding.name;
		j["dimensions"] = emb->embedding.dimensions;
		j["search"] = embeddingToJson(emb->search);
	} else if (const auto* tr = std::get_if<GraphTraversalStep>(&step.params)) {
		j["source_object_type_name"] = tr->source_object_type_name;
		j["traversal"] = traversalToJson(tr->traversal);
	}
	return j;
}

json plannedNodeToJson(const PlannedNode& node) {
	return visitPlan(node, [](const auto& n) -> json {
		using T = std::decay_t<decltype(n)>;
		if constexpr (std::is_same_v<T, PlannedComponentExecution>) {
			json steps = json::array();
			for (const auto& s : n.steps) steps.push_back(stepToJson(s));
			return json{{"component_index", n.component_index}, {"object_type_name", n.object_type_name},
			            {"steps", std::move(steps)}};
		} else if constexpr (std::is_same_v<T, PlannedLogicalGroup>) {
			json clauses = json::array();
			for (const auto& c : n.clauses) clauses.push_back(c ? plannedNodeToJson(*c) : json(nullptr));
			return json{{"operator", logicalOperatorToString(n.op)}, {"object_type_name", n.object_type_name},
			            {"clauses", std::move(clauses)}};
		} else {
			return json{{"not", true}, {"object_type_name", n.object_type_name},
			            {"clause", n.clause ? plannedNodeToJson(*n.clause) : json(nullptr)}};
		}
	});
}

} // namespace

ClausePtr clauseFromJson(const json& j, const std::string& path) {
	if (!j.is_object()) throw QueryError(path + ": expected an object");

	if (j.contains("clauses") || j.contains("operator")) {
		auto opText = stringMember(j, "operator", path);
		LogicalOperator op;
		if (opText == "AND" || opText == "and") op = LogicalOperator::And;
		else if (opText == "OR" || opText == "or") op = LogicalOperator::Or;
		else throw QueryError(path + ".operator: expected 'AND' or 'OR', got '" + opText + "'");

		const auto& children = member(j, "clauses", path);
		if (!children.is_array()) throw QueryError(path + ".clauses: expected an array");
		std::vector<ClausePtr> clauses;
		clauses.reserve(children.size());
		for (size_t i = 0; i < children.size(); ++i) {
			clauses.push_back(clauseFromJson(children[i], at(path, "clauses", i)));
		}
		return makeGroup(op, std::move(clauses));
	}
	if (j.contains("clause")) {
		return makeNot(clauseFromJson(j.at("clause"), path + ".clause"));
	}
	if (j.contains("object_type_name")) {
		return makeComponent(componentFromJson(j, path));
	}
	throw QueryError(path + ": not a query component, logical group or NOT clause");
}

ComplexQuery complexQueryFromJson(const json& j) {
	if (!j.is_object()) throw QueryError("query: expected an object");

	std::string description;
	if (j.contains("description") && !j.at("description").is_null()) {
		description = stringMember(j, "description", "query");
	}

	const bool hasRoot = j.contains("query_root") && !j.at("query_root").is_null();
	const bool hasComponents = j.contains("components") && !j.at("components").is_null();
	if (hasRoot && hasComponents) {
		throw QueryError("query: 'query_root' and 'components' are mutually exclusive");
	}
	if (hasRoot) {
		return ComplexQuery(std::move(description), clauseFromJson(j.at("query_root"), "query_root"));
	}
	if (hasComponents) {
		const auto& arr = arrayMember(j, "components", "query");
		std::vector<QueryComponent> components;
		for (size_t i = 0; i < arr.size(); ++i) {
			components.push_back(componentFromJson(arr[i], at("query", "components", i)));
		}
		return ComplexQuery::fromComponents(std::move(description), std::move(components));
	}
	throw QueryError("query: either 'query_root' or 'components' is required");
}

ComplexQuery complexQueryFromString(const std::string& text) {
	json j;
	try {
		j = json::parse(text);
	} catch (const json::parse_error& e) {
		throw QueryError(std::string("query: invalid JSON: ") + e.what());
	}
	return complexQueryFromJson(j);
}

json toJson(const RelationalFilter& f) {
	return json{{"property_name", f.property_name}, {"operator", operatorToString(f.op)}, {"value", f.value}};
}

json toJson(const QueryClause& clause) {
	return visitClause(clause, [](const auto& n) -> json {
		using T = std::decay_t<decltype(n)>;
		if constexpr (std::is_same_v<T, QueryComponent>) {
			return componentToJson(n);
		} else if constexpr (std::is_same_v<T, LogicalGroup>) {
			json clauses = json::array();
			for (const auto& c : n.clauses) clauses.push_back(c ? toJson(*c) : json(nullptr));
			return json{{"operator", logicalOperatorToString(n.op)}, {"clauses", std::move(clauses)}};
		} else {
			return json{{"clause", n.clause ? toJson(*n.clause) : json(nullptr)}};
		}
	});
}

json toJson(const ComplexQuery& q) {
	json j{{"description", q.description()}};
	j["query_root"] = q.root() ? toJson(*q.root()) : json(nullptr);
	return j;
}

json toJson(const PlannedQuery& plan) {
	return json{
		{"description", plan.description},
		{"object_type_name", plan.object_type_name},
		{"component_count", plan.component_count},
		{"root", plan.root ? plannedNodeToJson(*plan.root) : json(nullptr)}
	};
}

} // namespace query

json toJson(const ObjectInstance& obj) {
	return json{
		{"id", obj.id},
		{"object_type_name", obj.object_type_name},
		{"weight", obj.weight},
		{"upsert_date", utils::formatIso8601(obj.upsert_date_ms)},
		{"properties", obj.properties}
	};
}

ObjectInstance objectInstanceFromJson(const json& j) {
	if (!j.is_object()) throw QueryError("object instance: expected an object");
	ObjectInstance obj;
	try {
		j.at("id").get_to(obj.id);
		j.at("object_type_name").get_to(obj.object_type_name);
		obj.weight = j.value("weight", 1.0);
		if (j.contains("upsert_date")) {
			const auto& d = j.at("upsert_date");
			if (d.is_string()) {
				auto ms = utils::parseIso8601(d.get<std::string>());
				if (!ms) throw QueryError("object instance " + obj.id + ": invalid upsert_date '" + d.get<std::string>() + "'");
				obj.upsert_date_ms = *ms;
			} else {
				obj.upsert_date_ms = d.get<int64_t>();
			}
		}
		if (j.contains("properties")) {
			obj.properties = j.at("properties");
			if (!obj.properties.is_object()) throw QueryError("object instance " + obj.id + ": properties must be an object");
		}
	} catch (const json::exception& e) {
		throw QueryError(std::string("object instance: ") + e.what());
	}
	return obj;
}

json toJson(const QueryResult& result) {
	json objects = json::array();
	for (const auto& o : result.object_instances) objects.push_back(toJson(o));
	return json{{"object_instances", std::move(objects)}, {"errors", result.errors}};
}

} // namespace trivium
