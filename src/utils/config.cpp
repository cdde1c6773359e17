#include "utils/config.h"
#include "utils/logger.h"
#include "utils/tracing.h"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

namespace trivium {

using json = nlohmann::json;

namespace {

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// YAML -> JSON, rekursiv. Gequotete Skalare (Tag "!") bleiben Strings.
json yamlNodeToJson(const YAML::Node& n) {
    if (!n || n.IsNull()) return nullptr;
    if (n.IsScalar()) {
        if (n.Tag() == "!") return n.Scalar();
        bool b = false;
        if (YAML::convert<bool>::decode(n, b)) return b;
        long long i = 0;
        if (YAML::convert<long long>::decode(n, i)) return i;
        double d = 0.0;
        if (YAML::convert<double>::decode(n, d)) return d;
        return n.Scalar();
    }
    if (n.IsSequence()) {
        json arr = json::array();
        for (const auto& it : n) arr.push_back(yamlNodeToJson(it));
        return arr;
    }
    if (n.IsMap()) {
        json obj = json::object();
        for (auto it = n.begin(); it != n.end(); ++it) {
            obj[it->first.as<std::string>()] = yamlNodeToJson(it->second);
        }
        return obj;
    }
    return nullptr;
}

template <typename T>
void readField(const json& section, const char* key, T& out, const std::string& path) {
    if (!section.is_object() || !section.contains(key)) return;
    try {
        out = section.at(key).get<T>();
    } catch (const json::exception& e) {
        throw ConfigError(path + "." + key + ": " + e.what());
    }
}

const json& sectionOf(const json& root, const char* key) {
    static const json empty = json::object();
    if (!root.contains(key)) return empty;
    const auto& s = root.at(key);
    if (!s.is_object()) throw ConfigError(std::string("section '") + key + "' must be an object");
    return s;
}

} // namespace

EngineConfig EngineConfig::fromJson(const json& j) {
    if (!j.is_object()) throw ConfigError("root must be an object");

    EngineConfig cfg;

    const auto& logging = sectionOf(j, "logging");
    readField(logging, "level", cfg.logging.level, "logging");
    readField(logging, "file", cfg.logging.file, "logging");

    const auto& tracing = sectionOf(j, "tracing");
    readField(tracing, "enabled", cfg.tracing.enabled, "tracing");
    readField(tracing, "service_name", cfg.tracing.service_name, "tracing");
    readField(tracing, "endpoint", cfg.tracing.endpoint, "tracing");

    const auto& query = sectionOf(j, "query");
    readField(query, "parallel_siblings", cfg.query.parallel_siblings, "query");
    readField(query, "timeout_ms", cfg.query.timeout_ms, "query");
    if (cfg.query.timeout_ms < 0) throw ConfigError("query.timeout_ms must be >= 0");

    const auto& storage = sectionOf(j, "storage");
    readField(storage, "db_path", cfg.storage.db_path, "storage");
    readField(storage, "memtable_size_mb", cfg.storage.memtable_size_mb, "storage");
    readField(storage, "block_cache_size_mb", cfg.storage.block_cache_size_mb, "storage");
    readField(storage, "bloom_bits_per_key", cfg.storage.bloom_bits_per_key, "storage");
    readField(storage, "enable_wal", cfg.storage.enable_wal, "storage");
    readField(storage, "compression", cfg.storage.compression, "storage");

    return cfg;
}

EngineConfig EngineConfig::loadFromFile(const std::string& path) {
    auto cfg = fromJson(utils::loadDocument(path));
    TRIVIUM_INFO("Loaded config from {}", path);
    return cfg;
}

json EngineConfig::toJson() const {
    return json{
        {"logging", {{"level", logging.level}, {"file", logging.file}}},
        {"tracing", {{"enabled", tracing.enabled}, {"service_name", tracing.service_name}, {"endpoint", tracing.endpoint}}},
        {"query", {{"parallel_siblings", query.parallel_siblings}, {"timeout_ms", query.timeout_ms}}},
        {"storage", {
            {"db_path", storage.db_path},
            {"memtable_size_mb", storage.memtable_size_mb},
            {"block_cache_size_mb", storage.block_cache_size_mb},
            {"bloom_bits_per_key", storage.bloom_bits_per_key},
            {"enable_wal", storage.enable_wal},
            {"compression", storage.compression}
        }}
    };
}

namespace utils {

json parseYaml(const std::string& text) {
    try {
        return yamlNodeToJson(YAML::Load(text));
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("invalid YAML: ") + e.what());
    }
}

json loadDocument(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) throw ConfigError("cannot open " + path);
    std::stringstream buf;
    buf << f.rdbuf();

    if (endsWith(path, ".yaml") || endsWith(path, ".yml")) {
        return parseYaml(buf.str());
    }
    try {
        return json::parse(buf.str());
    } catch (const json::parse_error& e) {
        throw ConfigError(path + ": " + e.what());
    }
}

void applyLogging(const LoggingConfig& cfg) {
    Logger::init(cfg.file, Logger::levelFromString(cfg.level));
}

void applyTracing(const TracingConfig& cfg) {
    if (!cfg.enabled) return;
    if (!Tracer::initialize(cfg.service_name, cfg.endpoint)) {
        TRIVIUM_WARN("Tracing requested but not available (endpoint={})", cfg.endpoint);
    }
}

} // namespace utils
} // namespace trivium
