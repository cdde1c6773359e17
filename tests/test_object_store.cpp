#include <gtest/gtest.h>
#include "storage/key_schema.h"
#include "storage/object_store.h"
#include "storage/rocksdb_wrapper.h"
#include <filesystem>

namespace fs = std::filesystem;
using namespace trivium;
using query::RelationalFilter;
using query::RelationalOperator;

class ObjectStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_db_path_ = "./data/trivium_object_store_test";
        fs::remove_all(test_db_path_);

        RocksDBWrapper::Config config;
        config.db_path = test_db_path_;
        config.memtable_size_mb = 16;
        config.block_cache_size_mb = 16;
        config.compression = "lz4";

        db_ = std::make_unique<RocksDBWrapper>(config);
        ASSERT_TRUE(db_->open());
        store_ = std::make_unique<ObjectStore>(*db_);

        put("car1", {{"color", "Red"}, {"seats", 4}});
        put("car2", {{"color", "Blue"}, {"seats", 2}});
        put("car3", {{"color", "Red"}, {"seats", 7}});
    }

    void TearDown() override {
        store_.reset();
        db_.reset();
        fs::remove_all(test_db_path_);
    }

    void put(const std::string& id, nlohmann::json props) {
        ObjectInstance o;
        o.id = id;
        o.object_type_name = "Car";
        o.properties = std::move(props);
        auto st = store_->upsert(std::move(o));
        ASSERT_TRUE(st.ok) << st.message;
    }

    std::string test_db_path_;
    std::unique_ptr<RocksDBWrapper> db_;
    std::unique_ptr<ObjectStore> store_;
};

TEST_F(ObjectStoreTest, UpsertStampsDateAndRoundTrips) {
    auto car = store_->get("Car", "car1");
    ASSERT_TRUE(car.has_value());
    EXPECT_EQ(car->properties.at("color"), "Red");
    EXPECT_GT(car->upsert_date_ms, 0);
    EXPECT_DOUBLE_EQ(car->weight, 1.0);
    EXPECT_EQ(store_->allIds("Car").second.size(), 3u);
    EXPECT_TRUE(store_->allIds("City").second.empty());
}

TEST_F(ObjectStoreTest, UpsertValidatesInput) {
    ObjectInstance bad;
    bad.object_type_name = "Car";
    bad.id = "a:b";
    EXPECT_FALSE(store_->upsert(bad).ok);
    bad.id = "ok";
    bad.weight = 11.0;
    EXPECT_FALSE(store_->upsert(bad).ok);
    bad.weight = 1.0;
    bad.properties = nlohmann::json::array();
    EXPECT_FALSE(store_->upsert(bad).ok);
}

TEST_F(ObjectStoreTest, FilterIdsScansType) {
    auto [st, ids] = store_->filterIds("Car", {RelationalFilter{"color", RelationalOperator::Eq, "Red"}});
    ASSERT_TRUE(st.ok) << st.message;
    EXPECT_EQ(ids, (std::vector<std::string>{"car1", "car3"}));

    auto [st2, none] = store_->filterIds("City", {});
    ASSERT_TRUE(st2.ok);
    EXPECT_TRUE(none.empty());
}

TEST_F(ObjectStoreTest, FilterIdsHonoursRestrictSet) {
    std::vector<std::string> restrict{"car2", "car3", "ghost"};
    auto [st, ids] = store_->filterIds("Car", {RelationalFilter{"seats", RelationalOperator::Gte, 2}}, &restrict);
    ASSERT_TRUE(st.ok);
    EXPECT_EQ(ids, (std::vector<std::string>{"car2", "car3"}));

    std::vector<std::string> empty;
    auto [st2, ids2] = store_->filterIds("Car", {}, &empty);
    ASSERT_TRUE(st2.ok);
    EXPECT_TRUE(ids2.empty());
}

TEST_F(ObjectStoreTest, GetObjectsByIdsSkipsUnknown) {
    auto [st, objs] = store_->getObjectsByIds("Car", {"car3", "nope", "car1"});
    ASSERT_TRUE(st.ok);
    ASSERT_EQ(objs.size(), 2u);
    EXPECT_EQ(objs[0].id, "car3");
    EXPECT_EQ(objs[1].id, "car1");
}

TEST_F(ObjectStoreTest, RemoveIsIdempotent) {
    ASSERT_TRUE(store_->remove("Car", "car2").ok);
    ASSERT_TRUE(store_->remove("Car", "car2").ok);
    auto [st, ids] = store_->allIds("Car");
    ASSERT_TRUE(st.ok);
    EXPECT_EQ(ids, (std::vector<std::string>{"car1", "car3"}));
}

TEST_F(ObjectStoreTest, CorruptRecordIsReported) {
    ASSERT_TRUE(db_->put(KeySchema::makeObjectKey("Car", "broken"), "\xff\xfe garbage"));
    auto [st, ids] = store_->filterIds("Car", {});
    EXPECT_FALSE(st.ok);
    EXPECT_NE(st.message.find("corrupt"), std::string::npos);
}

TEST_F(ObjectStoreTest, WriteBatchIsAtomic) {
    auto batch = db_->createWriteBatch();
    batch->put("x:1", "a");
    batch->put("x:2", "b");
    batch->rollback();
    EXPECT_FALSE(db_->get("x:1").has_value());

    batch->put("x:3", "c");
    ASSERT_TRUE(batch->commit());
    EXPECT_EQ(db_->get("x:3").value_or(""), "c");
}

TEST_F(ObjectStoreTest, ScanReportsWhetherRangeWasRead) {
    const auto prefix = KeySchema::makeObjectPrefix("Car");
    size_t seen = 0;
    EXPECT_TRUE(db_->scanPrefix(prefix, [&seen](std::string_view, std::string_view) {
        ++seen;
        return true;
    }));
    EXPECT_EQ(seen, 3u);

    // vorzeitiger Abbruch durch den Callback ist kein Fehler
    seen = 0;
    EXPECT_TRUE(db_->scanPrefix(prefix, [&seen](std::string_view, std::string_view) {
        ++seen;
        return false;
    }));
    EXPECT_EQ(seen, 1u);

    db_->close();
    EXPECT_FALSE(db_->scanPrefix(prefix, [](std::string_view, std::string_view) { return true; }));
}

TEST_F(ObjectStoreTest, SchemaMakesDatetimeFiltersTemporal) {
    SchemaRegistry schema;
    PropertyDefinition built;
    built.name = "built";
    built.data_type = PropertyDataType::DATETIME;
    ASSERT_TRUE(schema.addObjectType(ObjectTypeDefinition{"Car", "", {built}}).ok);
    ObjectStore typed(*db_, &schema);

    put("car4", {{"built", "2024-01-01T00:00:00Z"}});
    std::vector<RelationalFilter> f{{"built", RelationalOperator::Eq, "2024-01-01"}};
    EXPECT_EQ(typed.filterIds("Car", f).second, (std::vector<std::string>{"car4"}));
    EXPECT_TRUE(store_->filterIds("Car", f).second.empty());
}

TEST(KeySchemaTest, BuildAndParseKeys) {
    EXPECT_EQ(KeySchema::makeObjectKey("Car", "car1"), "obj:Car:car1");
    EXPECT_EQ(KeySchema::makeOutgoingKey("LocatedIn", "car1", "e1"), "rout:LocatedIn:car1:e1");
    EXPECT_EQ(KeySchema::makeIncomingPrefix("LocatedIn", "city1"), "rin:LocatedIn:city1:");
    EXPECT_EQ(KeySchema::makeOutgoingPrefix("LocatedIn"), "rout:LocatedIn:");

    EXPECT_EQ(KeySchema::parseKeyType("obj:Car:car1"), KeySchema::KeyType::OBJECT);
    EXPECT_EQ(KeySchema::parseKeyType("emb:bio:u1"), KeySchema::KeyType::EMBEDDING);
    EXPECT_EQ(KeySchema::parseKeyType("rin:R:t:e"), KeySchema::KeyType::RELATION_IN);
    EXPECT_EQ(KeySchema::parseKeyType("zzz"), KeySchema::KeyType::UNKNOWN);

    EXPECT_EQ(KeySchema::extractId("obj:Car:car1"), "car1");
    EXPECT_EQ(KeySchema::extractAdjacencyNode("rout:LocatedIn:car1:e1"), "car1");
    EXPECT_FALSE(KeySchema::isValidSegment(""));
    EXPECT_FALSE(KeySchema::isValidSegment("a:b"));
    EXPECT_TRUE(KeySchema::isValidSegment("car-1"));
}
