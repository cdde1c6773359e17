#pragma once

#include "storage/rocksdb_wrapper.h"
#include "storage/store_interfaces.h"

#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace trivium {

/// VectorIndexManager
/// - One vector space per embedding definition: emb:<embedding>:<id> -> float32[]
/// - Brute-force k-NN (cosine or L2) over an in-memory cache, loaded lazily from RocksDB
/// - Optional whitelist (restrict-to) restricts the candidates before ranking
class VectorIndexManager : public VectorStore {
public:
    enum class Metric { L2, COSINE };

    struct Result {
        std::string pk;
        float distance = 0.0f; // kleiner = besser (COSINE: 1 - cosine, L2: euklidisch)
    };

    explicit VectorIndexManager(RocksDBWrapper& db);

    /// Store (or replace) the vector of one object; dimensions are checked when the definition sets them
    Status addVector(const EmbeddingDefinition& embedding, std::string_view pk, const std::vector<float>& vec);
    Status removeVector(std::string_view embedding, std::string_view pk);
    std::optional<std::vector<float>> getVector(std::string_view embedding, std::string_view pk) const;

    /// Reload the cache of one embedding from storage
    Status rebuildFromStorage(std::string_view embedding);
    size_t getVectorCount(std::string_view embedding) const;

    /// Top-k by distance, ties by pk. whitelist != nullptr limits candidates (empty whitelist = no result).
    std::pair<Status, std::vector<Result>> searchKnn(
        std::string_view embedding,
        const std::vector<float>& query,
        size_t k,
        Metric metric = Metric::COSINE,
        const std::vector<std::string>* whitelistPks = nullptr) const;

    // VectorStore
    std::pair<Status, std::vector<std::string>> searchIds(
        const EmbeddingDefinition& embedding,
        const std::vector<float>& queryVector,
        size_t limit,
        std::optional<double> threshold,
        bool isL2Distance,
        RestrictSet restrict = nullptr) const override;

    static float l2(const std::vector<float>& a, const std::vector<float>& b);
    static float cosineOneMinus(const std::vector<float>& a, const std::vector<float>& b);

private:
    using Space = std::unordered_map<std::string, std::vector<float>>;

    RocksDBWrapper& db_;
    mutable std::shared_mutex mutex_;
    mutable std::unordered_map<std::string, Space> cache_; // embedding -> pk -> vector

    static std::string encodeVector(const std::vector<float>& v);
    static std::optional<std::vector<float>> decodeVector(std::string_view blob);

    Status loadSpace_(const std::string& embedding) const;
    std::vector<Result> bruteForceSearch_(const Space& space, const std::vector<float>& query, size_t k,
                                          Metric metric, const std::vector<std::string>* whitelist) const;
};

} // namespace trivium
