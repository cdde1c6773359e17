#include "schema/schema_types.h"

#include <algorithm>
#include <cctype>

namespace trivium {

const char* dataTypeToString(PropertyDataType t) {
    switch (t) {
        case PropertyDataType::TEXT: return "TEXT";
        case PropertyDataType::INTEGER: return "INTEGER";
        case PropertyDataType::FLOAT: return "FLOAT";
        case PropertyDataType::BOOLEAN: return "BOOLEAN";
        case PropertyDataType::DATETIME: return "DATETIME";
        case PropertyDataType::BLOB: return "BLOB";
        case PropertyDataType::JSON: return "JSON";
        case PropertyDataType::UUID: return "UUID";
    }
    return "TEXT";
}

std::optional<PropertyDataType> dataTypeFromString(std::string_view s) {
    std::string v(s);
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (v == "TEXT" || v == "STRING") return PropertyDataType::TEXT;
    if (v == "INTEGER" || v == "INT") return PropertyDataType::INTEGER;
    if (v == "FLOAT" || v == "DOUBLE") return PropertyDataType::FLOAT;
    if (v == "BOOLEAN" || v == "BOOL") return PropertyDataType::BOOLEAN;
    if (v == "DATETIME") return PropertyDataType::DATETIME;
    if (v == "BLOB") return PropertyDataType::BLOB;
    if (v == "JSON") return PropertyDataType::JSON;
    if (v == "UUID") return PropertyDataType::UUID;
    return std::nullopt;
}

bool isOrderedType(PropertyDataType t) {
    return t == PropertyDataType::INTEGER || t == PropertyDataType::FLOAT ||
           t == PropertyDataType::DATETIME || t == PropertyDataType::TEXT;
}

bool isTextLikeType(PropertyDataType t) {
    return t == PropertyDataType::TEXT || t == PropertyDataType::UUID;
}

std::optional<PropertyDefinition> ObjectTypeDefinition::findProperty(std::string_view property_name) const {
    for (const auto& p : properties) {
        if (p.name == property_name) return p;
    }

    // Metadaten-Felder existieren implizit auf jedem Typ
    PropertyDefinition implicit;
    implicit.name = std::string(property_name);
    implicit.is_nullable = false;
    if (property_name == meta::kId) {
        implicit.data_type = PropertyDataType::TEXT;
        implicit.is_primary_key = true;
        implicit.is_unique = true;
        return implicit;
    }
    if (property_name == meta::kWeight) {
        implicit.data_type = PropertyDataType::FLOAT;
        return implicit;
    }
    if (property_name == meta::kUpsertDate) {
        implicit.data_type = PropertyDataType::DATETIME;
        return implicit;
    }
    return std::nullopt;
}

bool RelationTypeDefinition::allowsSource(std::string_view object_type) const {
    return std::find(source_object_type_names.begin(), source_object_type_names.end(), object_type)
        != source_object_type_names.end();
}

bool RelationTypeDefinition::allowsTarget(std::string_view object_type) const {
    return std::find(target_object_type_names.begin(), target_object_type_names.end(), object_type)
        != target_object_type_names.end();
}

} // namespace trivium
