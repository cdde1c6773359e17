#pragma once

#include "query/query_planner.h"
#include "query/query_result.h"
#include "utils/config.h"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace trivium {

class RelationalStore;
class VectorStore;
class GraphStore;
class TextEmbedder;

namespace query {

/**
 * @brief Evaluates a PlannedQuery against the three stores.
 *
 * Every node evaluates to a sorted id set of one object type:
 *   - leaf:  steps run in plan order, each narrowing the running set (restrict-to);
 *            an empty set skips the remaining steps of that leaf
 *   - AND:   intersection of the children, OR: union
 *   - NOT:   full extent of the type minus the child set
 * Store failures are recorded per leaf and the leaf counts as empty. Only a
 * deadline overrun (QueryTimeoutError) leaves execute().
 */
class QueryExecutor {
public:
    QueryExecutor(const RelationalStore& relational, const VectorStore& vector, const GraphStore& graph,
                  const TextEmbedder* embedder = nullptr, QueryConfig config = {});

    /// Evaluate the tree and fetch the final objects (sorted by id)
    QueryResult execute(const PlannedQuery& plan) const;

    // Mengenoperationen auf sortierten, duplikatfreien Id-Listen
    static std::vector<std::string> intersectSortedLists(std::vector<std::vector<std::string>> lists);
    static std::vector<std::string> unionSortedLists(std::vector<std::vector<std::string>> lists);
    static std::vector<std::string> subtractSortedList(const std::vector<std::string>& universe,
                                                       const std::vector<std::string>& remove);

private:
    struct Context {
        std::optional<std::chrono::steady_clock::time_point> deadline;
        int64_t timeout_ms = 0;

        void checkDeadline() const;
    };

    std::vector<std::string> evaluate(const PlannedNode& node, const Context& ctx,
                                      std::vector<std::string>& errors) const;
    std::vector<std::string> evaluateLeaf(const PlannedComponentExecution& leaf, const Context& ctx,
                                          std::vector<std::string>& errors) const;
    std::vector<std::string> evaluateGroup(const PlannedLogicalGroup& group, const Context& ctx,
                                           std::vector<std::string>& errors) const;
    std::vector<std::string> evaluateNot(const PlannedNotClause& notClause, const Context& ctx,
                                         std::vector<std::string>& errors) const;

    std::vector<std::string> runStep(const PlannedStep& step, const std::vector<std::string>* restrict,
                                     const Context& ctx) const;
    std::vector<std::string> fullExtent(const std::string& objectType, const Context& ctx) const;
    std::vector<ObjectInstance> fetchObjects(const std::string& objectType, const std::vector<std::string>& ids,
                                             const Context& ctx, std::vector<std::string>& errors) const;

    const RelationalStore& relational_;
    const VectorStore& vector_;
    const GraphStore& graph_;
    const TextEmbedder* embedder_ = nullptr;
    QueryConfig config_;
};

} // namespace query
} // namespace trivium
