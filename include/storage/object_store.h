#pragma once

#include "schema/schema_registry.h"
#include "storage/rocksdb_wrapper.h"
#include "storage/store_interfaces.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace trivium {

/// ObjectStore
/// - RelationalStore over RocksDB: obj:<type>:<id> -> MessagePack(ObjectInstance)
/// - Filters are evaluated with PredicateEvaluator; a restrict-to set turns
///   the prefix scan into point lookups
/// - Ids and type names must not contain ':' (key separator)
/// - With a SchemaProvider, DATETIME properties compare by instant
class ObjectStore : public RelationalStore {
public:
    explicit ObjectStore(RocksDBWrapper& db, const SchemaProvider* schema = nullptr);

    /// Insert or replace. weight must lie in [0, 10]; upsert_date_ms == 0 is stamped with now.
    Status upsert(ObjectInstance obj);
    /// Idempotent
    Status remove(std::string_view objectType, std::string_view id);

    std::optional<ObjectInstance> get(std::string_view objectType, std::string_view id) const;

    /// PredicateEvaluator::matchesAll with the object's type definition (if known)
    bool matches(const ObjectInstance& obj, const std::vector<query::RelationalFilter>& filters) const;

    // RelationalStore
    std::pair<Status, std::vector<std::string>> filterIds(
        const std::string& objectType,
        const std::vector<query::RelationalFilter>& filters,
        RestrictSet restrict = nullptr) const override;

    std::pair<Status, std::vector<std::string>> allIds(const std::string& objectType) const override;

    std::pair<Status, std::vector<ObjectInstance>> getObjectsByIds(
        const std::string& objectType,
        const std::vector<std::string>& ids) const override;

    static std::string encode(const ObjectInstance& obj);
    static std::optional<ObjectInstance> decode(std::string_view blob);

private:
    std::optional<ObjectTypeDefinition> typeDefinition_(const std::string& objectType) const;

    RocksDBWrapper& db_;
    const SchemaProvider* schema_ = nullptr;
};

} // namespace trivium
