#include "schema/schema_registry.h"
#include "utils/config.h"
#include "utils/logger.h"

#include <mutex>
#include <set>
#include <stdexcept>

namespace trivium {

using json = nlohmann::json;

// ---------------------------------------------------------------------------
// JSON converters
// ---------------------------------------------------------------------------

void to_json(json& j, const PropertyDefinition& p) {
    j = json{
        {"name", p.name},
        {"data_type", dataTypeToString(p.data_type)},
        {"is_primary_key", p.is_primary_key},
        {"is_nullable", p.is_nullable},
        {"is_unique", p.is_unique},
        {"is_indexed", p.is_indexed}
    };
    if (!p.description.empty()) j["description"] = p.description;
}

void from_json(const json& j, PropertyDefinition& p) {
    j.at("name").get_to(p.name);
    auto dt = dataTypeFromString(j.at("data_type").get<std::string>());
    if (!dt) {
        throw std::invalid_argument("unknown data_type '" + j.at("data_type").get<std::string>() + "'");
    }
    p.data_type = *dt;
    p.is_primary_key = j.value("is_primary_key", false);
    p.is_nullable = j.value("is_nullable", true);
    p.is_unique = j.value("is_unique", false);
    p.is_indexed = j.value("is_indexed", false);
    p.description = j.value("description", std::string{});
}

void to_json(json& j, const ObjectTypeDefinition& d) {
    j = json{{"name", d.name}, {"properties", d.properties}};
    if (!d.description.empty()) j["description"] = d.description;
}

void from_json(const json& j, ObjectTypeDefinition& d) {
    j.at("name").get_to(d.name);
    d.description = j.value("description", std::string{});
    d.properties = j.value("properties", std::vector<PropertyDefinition>{});
}

void to_json(json& j, const RelationTypeDefinition& d) {
    j = json{
        {"name", d.name},
        {"source_object_type_names", d.source_object_type_names},
        {"target_object_type_names", d.target_object_type_names},
        {"properties", d.properties}
    };
    if (!d.description.empty()) j["description"] = d.description;
}

void from_json(const json& j, RelationTypeDefinition& d) {
    j.at("name").get_to(d.name);
    d.description = j.value("description", std::string{});
    j.at("source_object_type_names").get_to(d.source_object_type_names);
    j.at("target_object_type_names").get_to(d.target_object_type_names);
    d.properties = j.value("properties", std::vector<PropertyDefinition>{});
}

void to_json(json& j, const EmbeddingDefinition& d) {
    j = json{
        {"name", d.name},
        {"object_type_name", d.object_type_name},
        {"source_property_name", d.source_property_name},
        {"embedding_model", d.embedding_model},
        {"dimensions", d.dimensions}
    };
    if (!d.description.empty()) j["description"] = d.description;
}

void from_json(const json& j, EmbeddingDefinition& d) {
    j.at("name").get_to(d.name);
    j.at("object_type_name").get_to(d.object_type_name);
    j.at("source_property_name").get_to(d.source_property_name);
    d.embedding_model = j.value("embedding_model", std::string{});
    d.dimensions = j.value("dimensions", size_t{0});
    d.description = j.value("description", std::string{});
}

// ---------------------------------------------------------------------------
// Registry
// ---------------------------------------------------------------------------

SchemaRegistry::Status SchemaRegistry::addObjectType(ObjectTypeDefinition def) {
    if (def.name.empty()) return Status::Error("addObjectType: name must not be empty");
    std::set<std::string> seen;
    for (const auto& p : def.properties) {
        if (p.name.empty()) return Status::Error("addObjectType(" + def.name + "): property without name");
        if (!seen.insert(p.name).second) {
            return Status::Error("addObjectType(" + def.name + "): duplicate property '" + p.name + "'");
        }
    }

    std::unique_lock lock(mutex_);
    if (objectTypes_.count(def.name)) {
        return Status::Error("addObjectType: object type '" + def.name + "' already exists");
    }
    TRIVIUM_DEBUG("Schema: registered object type {} ({} properties)", def.name, def.properties.size());
    auto name = def.name;
    objectTypes_.emplace(std::move(name), std::move(def));
    return Status::OK();
}

SchemaRegistry::Status SchemaRegistry::addRelationType(RelationTypeDefinition def) {
    if (def.name.empty()) return Status::Error("addRelationType: name must not be empty");
    if (def.source_object_type_names.empty() || def.target_object_type_names.empty()) {
        return Status::Error("addRelationType(" + def.name + "): source and target types are required");
    }

    std::unique_lock lock(mutex_);
    if (relationTypes_.count(def.name)) {
        return Status::Error("addRelationType: relation type '" + def.name + "' already exists");
    }
    for (const auto* names : {&def.source_object_type_names, &def.target_object_type_names}) {
        for (const auto& t : *names) {
            if (!objectTypes_.count(t)) {
                return Status::Error("addRelationType(" + def.name + "): unknown object type '" + t + "'");
            }
        }
    }
    auto name = def.name;
    relationTypes_.emplace(std::move(name), std::move(def));
    return Status::OK();
}

SchemaRegistry::Status SchemaRegistry::addEmbeddingDefinition(EmbeddingDefinition def) {
    if (def.name.empty()) return Status::Error("addEmbeddingDefinition: name must not be empty");

    std::unique_lock lock(mutex_);
    if (embeddings_.count(def.name)) {
        return Status::Error("addEmbeddingDefinition: embedding '" + def.name + "' already exists");
    }
    auto it = objectTypes_.find(def.object_type_name);
    if (it == objectTypes_.end()) {
        return Status::Error("addEmbeddingDefinition(" + def.name + "): unknown object type '" + def.object_type_name + "'");
    }
    if (!it->second.findProperty(def.source_property_name)) {
        return Status::Error("addEmbeddingDefinition(" + def.name + "): object type '" + def.object_type_name +
                             "' has no property '" + def.source_property_name + "'");
    }
    auto name = def.name;
    embeddings_.emplace(std::move(name), std::move(def));
    return Status::OK();
}

std::vector<std::string> SchemaRegistry::listObjectTypes() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> out;
    out.reserve(objectTypes_.size());
    for (const auto& [name, def] : objectTypes_) out.push_back(name);
    return out;
}

SchemaRegistry::Status SchemaRegistry::loadFromJson(const json& doc) {
    if (!doc.is_object()) return Status::Error("loadFromJson: document must be an object");
    try {
        for (const auto& ot : doc.value("object_types", json::array())) {
            auto st = addObjectType(ot.get<ObjectTypeDefinition>());
            if (!st.ok) return st;
        }
        for (const auto& rt : doc.value("relation_types", json::array())) {
            auto st = addRelationType(rt.get<RelationTypeDefinition>());
            if (!st.ok) return st;
        }
        for (const auto& ed : doc.value("embedding_definitions", json::array())) {
            auto st = addEmbeddingDefinition(ed.get<EmbeddingDefinition>());
            if (!st.ok) return st;
        }
    } catch (const std::exception& e) {
        // json::exception oder unbekannter data_type
        return Status::Error(std::string("loadFromJson: ") + e.what());
    }
    return Status::OK();
}

SchemaRegistry::Status SchemaRegistry::loadFromFile(const std::string& path) {
    try {
        auto st = loadFromJson(utils::loadDocument(path));
        if (st.ok) TRIVIUM_INFO("Schema loaded from {}", path);
        return st;
    } catch (const ConfigError& e) {
        return Status::Error(e.what());
    }
}

std::optional<ObjectTypeDefinition> SchemaRegistry::getObjectType(const std::string& name) const {
    std::shared_lock lock(mutex_);
    auto it = objectTypes_.find(name);
    if (it == objectTypes_.end()) return std::nullopt;
    return it->second;
}

std::optional<RelationTypeDefinition> SchemaRegistry::getRelationType(const std::string& name) const {
    std::shared_lock lock(mutex_);
    auto it = relationTypes_.find(name);
    if (it == relationTypes_.end()) return std::nullopt;
    return it->second;
}

std::optional<EmbeddingDefinition> SchemaRegistry::getEmbeddingDefinition(const std::string& name) const {
    std::shared_lock lock(mutex_);
    auto it = embeddings_.find(name);
    if (it == embeddings_.end()) return std::nullopt;
    return it->second;
}

} // namespace trivium
