#pragma once

#include "query/clause.h"
#include "schema/schema_types.h"

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace trivium {

class SchemaProvider;
class TextEmbedder;

namespace query {

// ============================================================================
// Plan model
// ============================================================================

enum class StepKind { RelationalFilter, EmbeddingSearch, GraphTraversal };

const char* stepKindToString(StepKind kind);

/// All relational filters of a leaf, executed as one store call
struct RelationalFilterStep {
    std::string object_type_name;
    std::vector<RelationalFilter> filters;
};

struct EmbeddingSearchStep {
    EmbeddingDefinition embedding; // resolved definition
    EmbeddingSearchClause search;
};

struct GraphTraversalStep {
    std::string source_object_type_name;
    GraphTraversalClause traversal;
};

struct PlannedStep {
    // Reihenfolge der Alternativen entspricht StepKind
    using Params = std::variant<RelationalFilterStep, EmbeddingSearchStep, GraphTraversalStep>;
    Params params;

    StepKind kind() const { return static_cast<StepKind>(params.index()); }
};

struct PlannedComponentExecution {
    size_t component_index = 0; // pre-order leaf number in the clause tree
    std::string object_type_name;
    std::vector<PlannedStep> steps; // relational -> embedding -> graph
};

struct PlannedNode;
using PlannedNodePtr = std::shared_ptr<const PlannedNode>;

struct PlannedLogicalGroup {
    LogicalOperator op = LogicalOperator::And;
    std::string object_type_name;
    std::vector<PlannedNodePtr> clauses;
};

struct PlannedNotClause {
    std::string object_type_name;
    PlannedNodePtr clause;
};

struct PlannedNode {
    using Node = std::variant<PlannedComponentExecution, PlannedLogicalGroup, PlannedNotClause>;
    Node node;

    const std::string& objectType() const;
};

template <typename Visitor>
decltype(auto) visitPlan(const PlannedNode& plan, Visitor&& visitor) {
    return std::visit(std::forward<Visitor>(visitor), plan.node);
}

/// Plan tree isomorphic to the clause tree. Built per execution, never cached.
struct PlannedQuery {
    std::string description;
    std::string object_type_name;
    PlannedNodePtr root;
    size_t component_count = 0;
};

// ============================================================================
// Planner
// ============================================================================

/// Validates a ComplexQuery against a schema snapshot and decomposes every
/// leaf into ordered store steps. Collects all problems before throwing:
///   - QueryError       query has no root
///   - SchemaError      unknown references, invalid tree shape (also carries value problems)
///   - ValidationError  only filter/search values are wrong
/// Never touches a store.
class QueryPlanner {
public:
    explicit QueryPlanner(const SchemaProvider& schema, const TextEmbedder* embedder = nullptr);

    PlannedQuery plan(const ComplexQuery& q) const;

private:
    struct Context {
        std::vector<std::string> schemaErrors;
        std::vector<std::string> valueErrors;
        size_t nextComponentIndex = 0;
    };

    struct Planned {
        PlannedNodePtr node;
        std::string objectType; // declared type of the subtree (first leaf wins)
    };

    Planned planClause(const QueryClause& clause, const std::string& path, Context& ctx) const;
    Planned planComponent(const QueryComponent& comp, const std::string& path, Context& ctx) const;
    Planned planGroup(const LogicalGroup& group, const std::string& path, Context& ctx) const;
    Planned planNot(const NotClause& notClause, const std::string& path, Context& ctx) const;

    void validateFilter(const ObjectTypeDefinition& type, const RelationalFilter& filter,
                        const std::string& path, Context& ctx) const;
    std::optional<EmbeddingSearchStep> planEmbeddingSearch(const QueryComponent& comp,
                                                           const EmbeddingSearchClause& search,
                                                           const std::string& path, Context& ctx) const;
    void validateTraversal(const std::string& sourceType, bool sourceKnown,
                           const GraphTraversalClause& traversal,
                           const std::string& path, Context& ctx) const;

    const SchemaProvider& schema_;
    const TextEmbedder* embedder_ = nullptr;
};

} // namespace query
} // namespace trivium
