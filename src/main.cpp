#include "utils/config.h"
#include "utils/logger.h"
#include "utils/tracing.h"
#include "storage/rocksdb_wrapper.h"
#include "storage/object_store.h"
#include "index/graph_index.h"
#include "index/vector_index.h"
#include "schema/schema_registry.h"
#include "query/query_engine.h"
#include "query/query_errors.h"
#include "query/query_json.h"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <tuple>

using namespace trivium;

namespace {

void usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [--config <file.yaml|json>] [--schema <file>] [--query <file.json>] [--explain] [--demo]\n"
              << "  --demo     seed a small Car/City/User data set and run sample queries\n"
              << "  --explain  print the plan instead of executing\n";
}

std::string readFile(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) throw ConfigError("cannot open " + path);
    std::stringstream buf;
    buf << f.rdbuf();
    return buf.str();
}

bool seedDemo(SchemaRegistry& schema, ObjectStore& objects, VectorIndexManager& vectors, GraphIndexManager& graph) {
    auto st = schema.loadFromJson(nlohmann::json::parse(R"({
        "object_types": [
            {"name": "Car", "properties": [{"name": "color", "data_type": "TEXT"}]},
            {"name": "City", "properties": [{"name": "name", "data_type": "TEXT"}]},
            {"name": "User", "properties": [{"name": "dept", "data_type": "TEXT"},
                                             {"name": "bio", "data_type": "TEXT"}]}
        ],
        "relation_types": [
            {"name": "LocatedIn", "source_object_type_names": ["Car"], "target_object_type_names": ["City"]}
        ],
        "embedding_definitions": [
            {"name": "user_bio", "object_type_name": "User", "source_property_name": "bio",
             "embedding_model": "demo", "dimensions": 3}
        ]
    })"));
    if (!st.ok) {
        TRIVIUM_ERROR("Demo schema rejected: {}", st.message);
        return false;
    }

    auto put = [&objects](const char* type, const char* id, nlohmann::json props) {
        ObjectInstance o;
        o.id = id;
        o.object_type_name = type;
        o.properties = std::move(props);
        auto s = objects.upsert(std::move(o));
        if (!s.ok) TRIVIUM_ERROR("Seed {}:{} failed: {}", type, id, s.message);
        return s.ok;
    };
    bool ok = put("Car", "car1", {{"color", "Red"}}) && put("Car", "car2", {{"color", "Blue"}}) &&
              put("City", "testville", {{"name", "Testville"}}) &&
              put("User", "u1", {{"dept", "Engineering"}, {"bio", "builds storage engines"}}) &&
              put("User", "u2", {{"dept", "DataScience"}, {"bio", "trains ranking models"}}) &&
              put("User", "u3", {{"dept", "Sales"}, {"bio", "closes deals"}});
    if (!ok) return false;

    for (const auto& [id, from, to] : {std::tuple{"e1", "car1", "testville"}, std::tuple{"e2", "car2", "testville"}}) {
        RelationInstance r;
        r.id = id;
        r.relation_type_name = "LocatedIn";
        r.source_object_instance_id = from;
        r.target_object_instance_id = to;
        auto s = graph.addRelation(std::move(r));
        if (!s.ok) {
            TRIVIUM_ERROR("Seed relation {} failed: {}", id, s.message);
            return false;
        }
    }

    auto bio = *schema.getEmbeddingDefinition("user_bio");
    return vectors.addVector(bio, "u1", {0.9f, 0.1f, 0.0f}).ok &&
           vectors.addVector(bio, "u2", {0.7f, 0.7f, 0.0f}).ok &&
           vectors.addVector(bio, "u3", {0.0f, 0.2f, 0.9f}).ok;
}

const char* kDemoQueries[] = {
    R"({"description": "red cars in Testville",
        "query_root": {"object_type_name": "Car",
                       "relational_filters": [{"property_name": "color", "operator": "==", "value": "Red"}],
                       "graph_traversals": [{"relation_type_name": "LocatedIn", "target_object_type_name": "City",
                                             "target_object_properties": [{"property_name": "name", "operator": "==", "value": "Testville"}]}]}})",
    R"({"description": "cars that are not red",
        "query_root": {"clause": {"object_type_name": "Car",
                                  "relational_filters": [{"property_name": "color", "operator": "==", "value": "Red"}]}}})",
    R"({"description": "engineering or data science",
        "query_root": {"operator": "OR", "clauses": [
            {"object_type_name": "User", "relational_filters": [{"property_name": "dept", "operator": "==", "value": "Engineering"}]},
            {"object_type_name": "User", "relational_filters": [{"property_name": "dept", "operator": "==", "value": "DataScience"}]}]}})",
    R"({"description": "users like u1 outside sales",
        "query_root": {"object_type_name": "User",
                       "relational_filters": [{"property_name": "dept", "operator": "!=", "value": "Sales"}],
                       "embedding_searches": [{"embedding_definition_name": "user_bio",
                                               "similar_to_payload": [1.0, 0.0, 0.0], "limit": 5, "threshold": 0.5}]}})"
};

int runQuery(const QueryEngine& engine, const query::ComplexQuery& q, bool explain) {
    try {
        if (explain) {
            std::cout << query::toJson(engine.plan(q)).dump(2) << std::endl;
            return 0;
        }
        auto result = engine.execute(q);
        std::cout << toJson(result).dump(2) << std::endl;
        return result.ok() ? 0 : 2;
    } catch (const SchemaError& e) {
        // auch ValidationError
        TRIVIUM_ERROR("Query '{}' rejected: {}", q.description(), e.what());
        for (const auto& err : e.errors()) std::cerr << "  - " << err << "\n";
        return 1;
    } catch (const QueryError& e) {
        TRIVIUM_ERROR("Query '{}' failed: {}", q.description(), e.what());
        return 1;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    std::string configPath, schemaPath, queryPath;
    bool explain = false;
    bool demo = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "--schema" || arg == "--query") && i + 1 < argc) {
            (arg == "--config" ? configPath : arg == "--schema" ? schemaPath : queryPath) = argv[++i];
        } else if (arg == "--explain") {
            explain = true;
        } else if (arg == "--demo") {
            demo = true;
        } else {
            usage(argv[0]);
            return 1;
        }
    }
    if (!demo && queryPath.empty()) {
        usage(argv[0]);
        return 1;
    }

    EngineConfig config;
    try {
        if (!configPath.empty()) config = EngineConfig::loadFromFile(configPath);
    } catch (const ConfigError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    utils::applyLogging(config.logging);
    utils::applyTracing(config.tracing);

    TRIVIUM_INFO("=== Trivium Complex Query Engine ===");
    TRIVIUM_INFO("Storage: {}", config.storage.db_path);

    RocksDBWrapper db(config.storage);
    if (!db.open()) {
        TRIVIUM_ERROR("Failed to open database at {}", config.storage.db_path);
        return 1;
    }

    SchemaRegistry schema;
    ObjectStore objects(db, &schema);
    VectorIndexManager vectors(db);
    GraphIndexManager graph(db, objects);

    if (!schemaPath.empty()) {
        auto st = schema.loadFromFile(schemaPath);
        if (!st.ok) {
            TRIVIUM_ERROR("Schema: {}", st.message);
            return 1;
        }
    }

    QueryEngine engine(schema, objects, vectors, graph, config.query);

    int rc = 0;
    if (demo) {
        if (!seedDemo(schema, objects, vectors, graph)) return 1;
        for (const char* text : kDemoQueries) {
            auto q = query::complexQueryFromString(text);
            std::cout << "# " << q.description() << std::endl;
            rc = std::max(rc, runQuery(engine, q, explain));
        }
    }

    if (!queryPath.empty()) {
        try {
            auto q = query::complexQueryFromString(readFile(queryPath));
            rc = std::max(rc, runQuery(engine, q, explain));
        } catch (const ConfigError& e) {
            TRIVIUM_ERROR("{}", e.what());
            rc = 1;
        } catch (const QueryError& e) {
            TRIVIUM_ERROR("{}", e.what());
            rc = 1;
        }
    }

    Tracer::shutdown();
    utils::Logger::shutdown();
    return rc;
}
