#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace trivium {
namespace query {

// ============================================================================
// Leaf conditions
// ============================================================================

enum class RelationalOperator {
    Eq,          // ==
    Neq,         // !=
    Gt,          // >
    Gte,         // >=
    Lt,          // <
    Lte,         // <=
    Contains,    // CONTAINS
    Like,        // LIKE ('%' / '_' Wildcards)
    StartsWith,  // STARTSWITH
    EndsWith,    // ENDSWITH
    In           // IN [..]
};

const char* operatorToString(RelationalOperator op);
std::optional<RelationalOperator> operatorFromString(std::string_view s);
bool isOrderingOperator(RelationalOperator op);
bool isPatternOperator(RelationalOperator op);

struct RelationalFilter {
    std::string property_name;
    RelationalOperator op = RelationalOperator::Eq;
    nlohmann::json value; // Skalar; Array für IN
};

struct EmbeddingSearchClause {
    std::string embedding_definition_name;
    std::vector<float> similar_to_payload;   // Query-Vektor ...
    std::optional<std::string> query_text;   // ... oder Text (benötigt TextEmbedder)
    size_t limit = 10;
    std::optional<double> threshold;
    // true: threshold ist obere Schranke der L2-Distanz, sonst untere Schranke der Cosine-Similarity
    bool is_l2_distance = false;
};

enum class TraversalDirection { Outgoing, Incoming };

const char* directionToString(TraversalDirection d);

struct GraphTraversalClause {
    std::string relation_type_name;
    TraversalDirection direction = TraversalDirection::Outgoing;
    std::string target_object_type_name;
    std::optional<std::string> target_object_id;
    std::vector<RelationalFilter> target_object_properties; // AND-verknüpft
};

/// Leaf: all conditions apply to one object type and are ANDed
struct QueryComponent {
    std::string object_type_name;
    std::vector<RelationalFilter> relational_filters;
    std::vector<EmbeddingSearchClause> embedding_searches;
    std::vector<GraphTraversalClause> graph_traversals;
};

// ============================================================================
// Logical tree
// ============================================================================

enum class LogicalOperator { And, Or };

const char* logicalOperatorToString(LogicalOperator op);

struct QueryClause;
using ClausePtr = std::shared_ptr<const QueryClause>;

struct LogicalGroup {
    LogicalOperator op = LogicalOperator::And;
    std::vector<ClausePtr> clauses;
};

struct NotClause {
    ClausePtr clause;
};

struct QueryClause {
    using Node = std::variant<QueryComponent, LogicalGroup, NotClause>;
    Node node;
};

/// Single dispatch point over the closed clause variant
template <typename Visitor>
decltype(auto) visitClause(const QueryClause& clause, Visitor&& visitor) {
    return std::visit(std::forward<Visitor>(visitor), clause.node);
}

ClausePtr makeComponent(QueryComponent component);
ClausePtr makeGroup(LogicalOperator op, std::vector<ClausePtr> clauses);
ClausePtr makeAnd(std::vector<ClausePtr> clauses);
ClausePtr makeOr(std::vector<ClausePtr> clauses);
ClausePtr makeNot(ClausePtr clause);

/// Number of QueryComponent leaves below (and including) clause
size_t countLeaves(const QueryClause& clause);

// ============================================================================
// ComplexQuery
// ============================================================================

/// Immutable query: description + clause tree. The deprecated flat component
/// list is turned into an implicit AND group here and nowhere else.
class ComplexQuery {
public:
    ComplexQuery() = default;
    ComplexQuery(std::string description, ClausePtr root);

    static ComplexQuery fromComponents(std::string description, std::vector<QueryComponent> components);

    const std::string& description() const { return description_; }
    const ClausePtr& root() const { return root_; }
    bool empty() const { return root_ == nullptr; }

private:
    std::string description_;
    ClausePtr root_;
};

} // namespace query
} // namespace trivium
