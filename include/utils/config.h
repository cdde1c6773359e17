#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace trivium {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error("Config error: " + message)
    {}
};

/// RocksDB tuning for the embedded reference backend
struct StorageConfig {
    std::string db_path = "./data/trivium";
    size_t memtable_size_mb = 64;
    size_t block_cache_size_mb = 128;
    int bloom_bits_per_key = 10;
    bool enable_wal = true;
    // "none", "lz4", "zstd", "snappy", "zlib"
    std::string compression = "none";
};

struct LoggingConfig {
    std::string level = "info";
    std::string file = "trivium.log"; // leer = nur Konsole
};

struct TracingConfig {
    bool enabled = false;
    std::string service_name = "trivium";
    std::string endpoint = "http://localhost:4318";
};

struct QueryConfig {
    // Geschwister unter einer LogicalGroup parallel (TBB) auswerten
    bool parallel_siblings = false;
    // 0 = kein Timeout
    int64_t timeout_ms = 0;
};

struct EngineConfig {
    LoggingConfig logging;
    TracingConfig tracing;
    QueryConfig query;
    StorageConfig storage;

    /// Missing keys keep their defaults; wrong value types raise ConfigError
    static EngineConfig fromJson(const nlohmann::json& j);
    static EngineConfig loadFromFile(const std::string& path);

    nlohmann::json toJson() const;
};

namespace utils {

/// Parse a JSON (*.json) or YAML (*.yaml / *.yml) file into a JSON document
nlohmann::json loadDocument(const std::string& path);

/// YAML text to JSON; plain scalars become bool/int/double where they parse as such
nlohmann::json parseYaml(const std::string& text);

/// Logger + tracer setup from config
void applyLogging(const LoggingConfig& cfg);
void applyTracing(const TracingConfig& cfg);

} // namespace utils
} // namespace trivium
