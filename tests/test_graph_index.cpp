#include <gtest/gtest.h>
#include "index/graph_index.h"
#include "storage/object_store.h"
#include "storage/rocksdb_wrapper.h"
#include <filesystem>

namespace fs = std::filesystem;
using namespace trivium;
using namespace trivium::query;

class GraphIndexTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_db_path_ = "./data/trivium_graph_index_test";
        fs::remove_all(test_db_path_);

        RocksDBWrapper::Config config;
        config.db_path = test_db_path_;
        config.memtable_size_mb = 16;
        config.compression = "zstd";

        db_ = std::make_unique<RocksDBWrapper>(config);
        ASSERT_TRUE(db_->open());
        objects_ = std::make_unique<ObjectStore>(*db_);
        graph_mgr_ = std::make_unique<GraphIndexManager>(*db_, *objects_);

        put("Car", "car1", {{"color", "Red"}});
        put("Car", "car2", {{"color", "Blue"}});
        put("City", "city1", {{"name", "Testville"}});
        put("City", "city2", {{"name", "Otherton"}});
    }

    void TearDown() override {
        graph_mgr_.reset();
        objects_.reset();
        db_.reset();
        fs::remove_all(test_db_path_);
    }

    void put(const std::string& type, const std::string& id, nlohmann::json props) {
        ObjectInstance o;
        o.id = id;
        o.object_type_name = type;
        o.properties = std::move(props);
        ASSERT_TRUE(objects_->upsert(std::move(o)).ok);
    }

    GraphIndexManager::Status link(const std::string& id, const std::string& from, const std::string& to) {
        RelationInstance r;
        r.id = id;
        r.relation_type_name = "LocatedIn";
        r.source_object_instance_id = from;
        r.target_object_instance_id = to;
        return graph_mgr_->addRelation(std::move(r));
    }

    static GraphTraversalClause toCity(std::vector<RelationalFilter> filters = {}) {
        GraphTraversalClause t;
        t.relation_type_name = "LocatedIn";
        t.target_object_type_name = "City";
        t.target_object_properties = std::move(filters);
        return t;
    }

    std::string test_db_path_;
    std::unique_ptr<RocksDBWrapper> db_;
    std::unique_ptr<ObjectStore> objects_;
    std::unique_ptr<GraphIndexManager> graph_mgr_;
};

TEST_F(GraphIndexTest, AddRelation_CreatesAdjacencyBothWays) {
    auto st = link("e1", "car1", "city1");
    ASSERT_TRUE(st.ok) << st.message;

    auto [st1, out] = graph_mgr_->outNeighbors("LocatedIn", "car1");
    ASSERT_TRUE(st1.ok) << st1.message;
    EXPECT_EQ(out, (std::vector<std::string>{"city1"}));

    auto [st2, in] = graph_mgr_->inNeighbors("LocatedIn", "city1");
    ASSERT_TRUE(st2.ok) << st2.message;
    EXPECT_EQ(in, (std::vector<std::string>{"car1"}));

    auto rel = graph_mgr_->getRelation("LocatedIn", "e1");
    ASSERT_TRUE(rel.has_value());
    EXPECT_GT(rel->upsert_date_ms, 0);
}

TEST_F(GraphIndexTest, DeleteRelation_RemovesIndices) {
    ASSERT_TRUE(link("e1", "car1", "city1").ok);
    ASSERT_TRUE(graph_mgr_->deleteRelation("LocatedIn", "e1").ok);
    ASSERT_TRUE(graph_mgr_->deleteRelation("LocatedIn", "e1").ok);

    auto [st1, out] = graph_mgr_->outNeighbors("LocatedIn", "car1");
    ASSERT_TRUE(st1.ok);
    EXPECT_TRUE(out.empty());
    auto [st2, in] = graph_mgr_->inNeighbors("LocatedIn", "city1");
    ASSERT_TRUE(st2.ok);
    EXPECT_TRUE(in.empty());
}

TEST_F(GraphIndexTest, ReplacingRelationMovesAdjacency) {
    ASSERT_TRUE(link("e1", "car1", "city1").ok);
    ASSERT_TRUE(link("e1", "car1", "city2").ok);
    auto [st, out] = graph_mgr_->outNeighbors("LocatedIn", "car1");
    ASSERT_TRUE(st.ok);
    EXPECT_EQ(out, (std::vector<std::string>{"city2"}));
    auto [st2, in] = graph_mgr_->inNeighbors("LocatedIn", "city1");
    ASSERT_TRUE(st2.ok);
    EXPECT_TRUE(in.empty());
}

TEST_F(GraphIndexTest, AddRelation_ValidatesInput) {
    EXPECT_FALSE(link("", "car1", "city1").ok);
    EXPECT_FALSE(link("e1", "", "city1").ok);
    EXPECT_FALSE(link("e:1", "car1", "city1").ok);
}

TEST_F(GraphIndexTest, FilterByTraversal_OutgoingWithTargetFilter) {
    ASSERT_TRUE(link("e1", "car1", "city1").ok);
    ASSERT_TRUE(link("e2", "car2", "city2").ok);

    auto [st, ids] = graph_mgr_->filterByTraversal("Car", toCity({{"name", RelationalOperator::Eq, "Testville"}}));
    ASSERT_TRUE(st.ok) << st.message;
    EXPECT_EQ(ids, (std::vector<std::string>{"car1"}));

    auto [st2, all] = graph_mgr_->filterByTraversal("Car", toCity());
    ASSERT_TRUE(st2.ok);
    EXPECT_EQ(all, (std::vector<std::string>{"car1", "car2"}));
}

TEST_F(GraphIndexTest, FilterByTraversal_Incoming) {
    ASSERT_TRUE(link("e1", "car1", "city1").ok);
    GraphTraversalClause t;
    t.relation_type_name = "LocatedIn";
    t.direction = TraversalDirection::Incoming;
    t.target_object_type_name = "Car";
    t.target_object_properties.push_back({"color", RelationalOperator::Eq, "Red"});

    auto [st, ids] = graph_mgr_->filterByTraversal("City", t);
    ASSERT_TRUE(st.ok);
    EXPECT_EQ(ids, (std::vector<std::string>{"city1"}));
}

TEST_F(GraphIndexTest, FilterByTraversal_TargetIdAndRestrict) {
    ASSERT_TRUE(link("e1", "car1", "city1").ok);
    ASSERT_TRUE(link("e2", "car2", "city1").ok);

    auto t = toCity();
    t.target_object_id = "city1";
    std::vector<std::string> restrict{"car2"};
    auto [st, ids] = graph_mgr_->filterByTraversal("Car", t, &restrict);
    ASSERT_TRUE(st.ok);
    EXPECT_EQ(ids, (std::vector<std::string>{"car2"}));

    t.target_object_id = "city2";
    auto [st2, none] = graph_mgr_->filterByTraversal("Car", t);
    ASSERT_TRUE(st2.ok);
    EXPECT_TRUE(none.empty());
}

TEST_F(GraphIndexTest, FilterByTraversal_IgnoresDanglingSources) {
    // Kante auf ein Objekt, das nicht (mehr) existiert
    ASSERT_TRUE(link("e1", "car9", "city1").ok);
    ASSERT_TRUE(link("e2", "car1", "city1").ok);
    auto [st, ids] = graph_mgr_->filterByTraversal("Car", toCity());
    ASSERT_TRUE(st.ok);
    EXPECT_EQ(ids, (std::vector<std::string>{"car1"}));
}
