#pragma once

#include "storage/rocksdb_wrapper.h"
#include "storage/store_interfaces.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace trivium {

class ObjectStore;

/// Directed, typed edge between two object instances
struct RelationInstance {
    std::string id;
    std::string relation_type_name;
    std::string source_object_instance_id;
    std::string target_object_instance_id;
    double weight = 1.0;
    int64_t upsert_date_ms = 0;
    nlohmann::json properties = nlohmann::json::object();
};

/// GraphIndexManager
/// - Verwaltet Adjazenz-Indizes für gerichtete, typisierte Kanten
/// - Key-Schema:
///   - Edge: rel:<relation>:<edge_id>              -> MessagePack(RelationInstance)
///   - Out:  rout:<relation>:<source>:<edge_id>    -> <target>
///   - In:   rin:<relation>:<target>:<edge_id>     -> <source>
/// - Atomare Operationen via WriteBatch
/// - Target-side filters of a traversal are resolved through the ObjectStore
class GraphIndexManager : public GraphStore {
public:
    GraphIndexManager(RocksDBWrapper& db, const ObjectStore& objects);

    Status addRelation(RelationInstance rel);
    /// Idempotent
    Status deleteRelation(std::string_view relationType, std::string_view edgeId);
    std::optional<RelationInstance> getRelation(std::string_view relationType, std::string_view edgeId) const;

    /// Neighbour ids over one relation type
    std::pair<Status, std::vector<std::string>> outNeighbors(std::string_view relationType, std::string_view sourceId) const;
    std::pair<Status, std::vector<std::string>> inNeighbors(std::string_view relationType, std::string_view targetId) const;

    // GraphStore
    std::pair<Status, std::vector<std::string>> filterByTraversal(
        const std::string& sourceType,
        const query::GraphTraversalClause& traversal,
        RestrictSet restrict = nullptr) const override;

private:
    RocksDBWrapper& db_;
    const ObjectStore& objects_;

    static std::string encode(const RelationInstance& rel);
    static std::optional<RelationInstance> decode(std::string_view blob);

    std::pair<Status, std::vector<std::string>> neighbors_(const std::string& prefix) const;
    /// Ids of targetType satisfying id + property constraints of the traversal
    std::pair<Status, std::vector<std::string>> matchingTargets_(const query::GraphTraversalClause& traversal) const;
};

} // namespace trivium
