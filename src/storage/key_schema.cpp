#include "storage/key_schema.h"

#include <initializer_list>

namespace trivium {

namespace {

std::string join(std::initializer_list<std::string_view> parts, bool trailing) {
    std::string out;
    for (auto p : parts) {
        if (!out.empty()) out.push_back(':');
        out.append(p);
    }
    if (trailing) out.push_back(':');
    return out;
}

} // namespace

std::string KeySchema::makeObjectKey(std::string_view object_type, std::string_view id) {
    return join({"obj", object_type, id}, false);
}

std::string KeySchema::makeObjectPrefix(std::string_view object_type) {
    return join({"obj", object_type}, true);
}

std::string KeySchema::makeEmbeddingKey(std::string_view embedding, std::string_view id) {
    return join({"emb", embedding, id}, false);
}

std::string KeySchema::makeEmbeddingPrefix(std::string_view embedding) {
    return join({"emb", embedding}, true);
}

std::string KeySchema::makeRelationKey(std::string_view relation_type, std::string_view edge_id) {
    return join({"rel", relation_type, edge_id}, false);
}

std::string KeySchema::makeOutgoingKey(std::string_view relation_type, std::string_view source_id, std::string_view edge_id) {
    return join({"rout", relation_type, source_id, edge_id}, false);
}

std::string KeySchema::makeIncomingKey(std::string_view relation_type, std::string_view target_id, std::string_view edge_id) {
    return join({"rin", relation_type, target_id, edge_id}, false);
}

std::string KeySchema::makeOutgoingPrefix(std::string_view relation_type, std::string_view source_id) {
    if (source_id.empty()) return join({"rout", relation_type}, true);
    return join({"rout", relation_type, source_id}, true);
}

std::string KeySchema::makeIncomingPrefix(std::string_view relation_type, std::string_view target_id) {
    if (target_id.empty()) return join({"rin", relation_type}, true);
    return join({"rin", relation_type, target_id}, true);
}

KeySchema::KeyType KeySchema::parseKeyType(std::string_view key) {
    if (key.starts_with("obj:")) return KeyType::OBJECT;
    if (key.starts_with("emb:")) return KeyType::EMBEDDING;
    if (key.starts_with("rel:")) return KeyType::RELATION;
    if (key.starts_with("rout:")) return KeyType::RELATION_OUT;
    if (key.starts_with("rin:")) return KeyType::RELATION_IN;
    return KeyType::UNKNOWN;
}

std::string KeySchema::extractId(std::string_view key) {
    auto last_sep = key.rfind(SEPARATOR);
    if (last_sep != std::string_view::npos) {
        return std::string(key.substr(last_sep + 1));
    }
    return std::string(key);
}

std::string KeySchema::extractAdjacencyNode(std::string_view key) {
    // <rout|rin>:<relation>:<node>:<edge>
    auto last_sep = key.rfind(SEPARATOR);
    if (last_sep == std::string_view::npos || last_sep == 0) return {};
    auto node_sep = key.rfind(SEPARATOR, last_sep - 1);
    if (node_sep == std::string_view::npos) return {};
    return std::string(key.substr(node_sep + 1, last_sep - node_sep - 1));
}

bool KeySchema::isValidSegment(std::string_view segment) {
    return !segment.empty() && segment.find(SEPARATOR) == std::string_view::npos;
}

} // namespace trivium
