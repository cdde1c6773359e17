#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace trivium {

enum class PropertyDataType {
    TEXT,
    INTEGER,
    FLOAT,
    BOOLEAN,
    DATETIME,
    BLOB,
    JSON,
    UUID
};

const char* dataTypeToString(PropertyDataType t);
std::optional<PropertyDataType> dataTypeFromString(std::string_view s);

/// Ordering operators (<, <=, >, >=) are defined for these types
bool isOrderedType(PropertyDataType t);
/// Pattern operators (CONTAINS, LIKE, STARTSWITH, ENDSWITH) are defined for these types
bool isTextLikeType(PropertyDataType t);

struct PropertyDefinition {
    std::string name;
    PropertyDataType data_type = PropertyDataType::TEXT;
    bool is_primary_key = false;
    bool is_nullable = true;
    bool is_unique = false;
    bool is_indexed = false;
    std::string description;
};

struct ObjectTypeDefinition {
    std::string name;
    std::string description;
    std::vector<PropertyDefinition> properties; // Reihenfolge wie deklariert

    /// Declared property or one of the implicit metadata properties (id, weight, upsert_date)
    std::optional<PropertyDefinition> findProperty(std::string_view property_name) const;
};

struct RelationTypeDefinition {
    std::string name;
    std::string description;
    std::vector<std::string> source_object_type_names;
    std::vector<std::string> target_object_type_names;
    std::vector<PropertyDefinition> properties;

    bool allowsSource(std::string_view object_type) const;
    bool allowsTarget(std::string_view object_type) const;
};

struct EmbeddingDefinition {
    std::string name;
    std::string object_type_name;
    std::string source_property_name;
    std::string embedding_model;
    size_t dimensions = 0; // 0 = nicht festgelegt
    std::string description;
};

/// Metadata every object instance carries besides its declared properties
namespace meta {
inline constexpr const char* kId = "id";
inline constexpr const char* kWeight = "weight";
inline constexpr const char* kUpsertDate = "upsert_date";
}

} // namespace trivium
