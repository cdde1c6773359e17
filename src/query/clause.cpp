#include "query/clause.h"

#include <algorithm>
#include <cctype>
#include <type_traits>

namespace trivium {
namespace query {

const char* operatorToString(RelationalOperator op) {
	switch (op) {
		case RelationalOperator::Eq: return "==";
		case RelationalOperator::Neq: return "!=";
		case RelationalOperator::Gt: return ">";
		case RelationalOperator::Gte: return ">=";
		case RelationalOperator::Lt: return "<";
		case RelationalOperator::Lte: return "<=";
		case RelationalOperator::Contains: return "CONTAINS";
		case RelationalOperator::Like: return "LIKE";
		case RelationalOperator::StartsWith: return "STARTSWITH";
		case RelationalOperator::EndsWith: return "ENDSWITH";
		case RelationalOperator::In: return "IN";
	}
	return "==";
}

std::optional<RelationalOperator> operatorFromString(std::string_view s) {
	std::string v(s);
	std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
	if (v == "==" || v == "=") return RelationalOperator::Eq;
	if (v == "!=" || v == "<>") return RelationalOperator::Neq;
	if (v == ">") return RelationalOperator::Gt;
	if (v == ">=") return RelationalOperator::Gte;
	if (v == "<") return RelationalOperator::Lt;
	if (v == "<=") return RelationalOperator::Lte;
	if (v == "CONTAINS") return RelationalOperator::Contains;
	if (v == "LIKE") return RelationalOperator::Like;
	if (v == "STARTSWITH") return RelationalOperator::StartsWith;
	if (v == "ENDSWITH") return RelationalOperator::EndsWith;
	if (v == "IN") return RelationalOperator::In;
	return std::nullopt;
}

bool isOrderingOperator(RelationalOperator op) {
	return op == RelationalOperator::Gt || op == RelationalOperator::Gte ||
	       op == RelationalOperator::Lt || op == RelationalOperator::Lte;
}

bool isPatternOperator(RelationalOperator op) {
	return op == RelationalOperator::Contains || op == RelationalOperator::Like ||
	       op == RelationalOperator::StartsWith || op == RelationalOperator::EndsWith;
}

const char* directionToString(TraversalDirection d) {
	return d == TraversalDirection::Outgoing ? "outgoing" : "incoming";
}

const char* logicalOperatorToString(LogicalOperator op) {
	return op == LogicalOperator::And ? "AND" : "OR";
}

ClausePtr makeComponent(QueryComponent component) {
	return std::make_shared<QueryClause>(QueryClause{std::move(component)});
}

ClausePtr makeGroup(LogicalOperator op, std::vector<ClausePtr> clauses) {
	return std::make_shared<QueryClause>(QueryClause{LogicalGroup{op, std::move(clauses)}});
}

ClausePtr makeAnd(std::vector<ClausePtr> clauses) {
	return makeGroup(LogicalOperator::And, std::move(clauses));
}

ClausePtr makeOr(std::vector<ClausePtr> clauses) {
	return makeGroup(LogicalOperator::Or, std::move(clauses));
}

ClausePtr makeNot(ClausePtr clause) {
	return std::make_shared<QueryClause>(QueryClause{NotClause{std::move(clause)}});
}

size_t countLeaves(const QueryClause& clause) {
	return visitClause(clause, [](const auto& node) -> size_t {
		using T = std::decay_t<decltype(node)>;
		if constexpr (std::is_same_v<T, QueryComponent>) {
			return 1;
		} else if constexpr (std::is_same_v<T, LogicalGroup>) {
			size_t n = 0;
			for (const auto& c : node.clauses) {
				if (c) n += countLeaves(*c);
			}
			return n;
		} else {
			return node.clause ? countLeaves(*node.clause) : 0;
		}
	});
}

ComplexQuery::ComplexQuery(std::string description, ClausePtr root)
	: description_(std::move(description)), root_(std::move(root)) {}

ComplexQuery ComplexQuery::fromComponents(std::string description, std::vector<QueryComponent> components) {
	if (components.empty()) {
		return ComplexQuery(std::move(description), nullptr);
	}
	std::vector<ClausePtr> clauses;
	clauses.reserve(components.size());
	for (auto& c : components) {
		clauses.push_back(makeComponent(std::move(c)));
	}
	return ComplexQuery(std::move(description), makeAnd(std::move(clauses)));
}

} // namespace query
} // namespace trivium
