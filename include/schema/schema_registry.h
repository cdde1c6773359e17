#pragma once

#include "schema/schema_types.h"

#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace trivium {

/// Read-only schema lookup consumed by the planner
class SchemaProvider {
public:
    virtual ~SchemaProvider() = default;

    virtual std::optional<ObjectTypeDefinition> getObjectType(const std::string& name) const = 0;
    virtual std::optional<RelationTypeDefinition> getRelationType(const std::string& name) const = 0;
    virtual std::optional<EmbeddingDefinition> getEmbeddingDefinition(const std::string& name) const = 0;
};

/// In-memory SchemaProvider, populated programmatically or from a JSON/YAML document:
///
///   object_types:          [{name, description?, properties: [{name, data_type, ...}]}]
///   relation_types:        [{name, source_object_type_names, target_object_type_names, properties?}]
///   embedding_definitions: [{name, object_type_name, source_property_name, embedding_model, dimensions?}]
///
/// Referential checks happen on add: embeddings and relations must point at
/// known object types, so object types have to be registered first.
class SchemaRegistry : public SchemaProvider {
public:
    struct Status {
        bool ok = true;
        std::string message;
        static Status OK() { return {}; }
        static Status Error(std::string msg) { return Status{false, std::move(msg)}; }
    };

    Status addObjectType(ObjectTypeDefinition def);
    Status addRelationType(RelationTypeDefinition def);
    Status addEmbeddingDefinition(EmbeddingDefinition def);

    std::vector<std::string> listObjectTypes() const;

    Status loadFromJson(const nlohmann::json& doc);
    Status loadFromFile(const std::string& path);

    std::optional<ObjectTypeDefinition> getObjectType(const std::string& name) const override;
    std::optional<RelationTypeDefinition> getRelationType(const std::string& name) const override;
    std::optional<EmbeddingDefinition> getEmbeddingDefinition(const std::string& name) const override;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, ObjectTypeDefinition> objectTypes_;
    std::map<std::string, RelationTypeDefinition> relationTypes_;
    std::map<std::string, EmbeddingDefinition> embeddings_;
};

// nlohmann::json ADL converters
void to_json(nlohmann::json& j, const PropertyDefinition& p);
void from_json(const nlohmann::json& j, PropertyDefinition& p);
void to_json(nlohmann::json& j, const ObjectTypeDefinition& d);
void from_json(const nlohmann::json& j, ObjectTypeDefinition& d);
void to_json(nlohmann::json& j, const RelationTypeDefinition& d);
void from_json(const nlohmann::json& j, RelationTypeDefinition& d);
void to_json(nlohmann::json& j, const EmbeddingDefinition& d);
void from_json(const nlohmann::json& j, EmbeddingDefinition& d);

} // namespace trivium
