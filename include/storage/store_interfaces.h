#pragma once

#include "query/clause.h"
#include "query/query_result.h"
#include "schema/schema_types.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace trivium {

/// Status convention shared by all store collaborators (no exceptions across the seam
/// required; adapters may still throw StoreError)
struct StoreStatus {
    bool ok = true;
    std::string message;
    static StoreStatus OK() { return {}; }
    static StoreStatus Error(std::string msg) { return StoreStatus{false, std::move(msg)}; }
};

/// Restrict-to set: sorted ids, or nullptr for "unconstrained"
using RestrictSet = const std::vector<std::string>*;

/// Relational side: structured properties of object instances.
/// Contract: with restrict != nullptr the result is a subset of *restrict.
class RelationalStore {
public:
    using Status = StoreStatus;
    virtual ~RelationalStore() = default;

    /// Ids of objectType matching all filters (AND)
    virtual std::pair<Status, std::vector<std::string>> filterIds(
        const std::string& objectType,
        const std::vector<query::RelationalFilter>& filters,
        RestrictSet restrict = nullptr) const = 0;

    /// Full extent of objectType
    virtual std::pair<Status, std::vector<std::string>> allIds(const std::string& objectType) const = 0;

    /// Bulk fetch; unknown ids are skipped
    virtual std::pair<Status, std::vector<ObjectInstance>> getObjectsByIds(
        const std::string& objectType,
        const std::vector<std::string>& ids) const = 0;
};

/// Vector side: nearest-neighbour search per embedding definition.
/// Contract: with restrict != nullptr the result is a subset of *restrict.
class VectorStore {
public:
    using Status = StoreStatus;
    virtual ~VectorStore() = default;

    /// Top-limit ids ranked by similarity, optionally cut by threshold
    virtual std::pair<Status, std::vector<std::string>> searchIds(
        const EmbeddingDefinition& embedding,
        const std::vector<float>& queryVector,
        size_t limit,
        std::optional<double> threshold,
        bool isL2Distance,
        RestrictSet restrict = nullptr) const = 0;
};

/// Graph side: relationship existence checks.
/// Contract: with restrict != nullptr the result is a subset of *restrict.
class GraphStore {
public:
    using Status = StoreStatus;
    virtual ~GraphStore() = default;

    /// Ids of sourceType having a matching edge (per traversal.direction) of
    /// traversal.relation_type_name to a target satisfying the target-side filters
    virtual std::pair<Status, std::vector<std::string>> filterByTraversal(
        const std::string& sourceType,
        const query::GraphTraversalClause& traversal,
        RestrictSet restrict = nullptr) const = 0;
};

/// Text-to-vector generation for EmbeddingSearchClause::query_text (external)
class TextEmbedder {
public:
    using Status = StoreStatus;
    virtual ~TextEmbedder() = default;

    virtual std::pair<Status, std::vector<float>> embed(
        const EmbeddingDefinition& embedding,
        const std::string& text) const = 0;
};

} // namespace trivium
