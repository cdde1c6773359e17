#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace trivium {

/// Key layout of the RocksDB reference backend.
/// Every model (objects, embeddings, relations) maps onto ':'-separated keys:
///
///   obj:<object_type>:<id>                 ObjectInstance (MessagePack)
///   emb:<embedding>:<id>                   vector (raw float32)
///   rel:<relation_type>:<edge_id>          RelationInstance (MessagePack)
///   rout:<relation_type>:<source>:<edge>   outgoing adjacency -> target id
///   rin:<relation_type>:<target>:<edge>    incoming adjacency -> source id
class KeySchema {
public:
    enum class KeyType : uint8_t {
        OBJECT,
        EMBEDDING,
        RELATION,
        RELATION_OUT,
        RELATION_IN,
        UNKNOWN
    };

    static std::string makeObjectKey(std::string_view object_type, std::string_view id);
    static std::string makeObjectPrefix(std::string_view object_type);

    static std::string makeEmbeddingKey(std::string_view embedding, std::string_view id);
    static std::string makeEmbeddingPrefix(std::string_view embedding);

    static std::string makeRelationKey(std::string_view relation_type, std::string_view edge_id);

    static std::string makeOutgoingKey(std::string_view relation_type, std::string_view source_id, std::string_view edge_id);
    static std::string makeIncomingKey(std::string_view relation_type, std::string_view target_id, std::string_view edge_id);
    /// All outgoing (incoming) adjacency entries of one node; empty node id = whole relation type
    static std::string makeOutgoingPrefix(std::string_view relation_type, std::string_view source_id = {});
    static std::string makeIncomingPrefix(std::string_view relation_type, std::string_view target_id = {});

    static KeyType parseKeyType(std::string_view key);

    /// Last segment of any key (id or edge id)
    static std::string extractId(std::string_view key);
    /// Node id segment of an adjacency key (source for rout, target for rin)
    static std::string extractAdjacencyNode(std::string_view key);

    /// Non-empty and free of the separator
    static bool isValidSegment(std::string_view segment);

private:
    static constexpr char SEPARATOR = ':';
};

} // namespace trivium
