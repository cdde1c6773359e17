#include <gtest/gtest.h>
#include "fake_stores.h"
#include "query/query_engine.h"
#include "query/query_errors.h"
#include "query/query_executor.h"
#include "query/query_planner.h"

using namespace trivium;
using namespace trivium::query;

namespace {

RelationalFilter eq(const std::string& prop, nlohmann::json value) {
    return RelationalFilter{prop, RelationalOperator::Eq, std::move(value)};
}

QueryComponent car(std::vector<RelationalFilter> filters = {}) {
    QueryComponent c;
    c.object_type_name = "Car";
    c.relational_filters = std::move(filters);
    return c;
}

GraphTraversalClause locatedIn(const std::string& city) {
    GraphTraversalClause t;
    t.relation_type_name = "LocatedIn";
    t.target_object_type_name = "City";
    t.target_object_properties.push_back(eq("name", city));
    return t;
}

std::vector<std::string> ids(const QueryResult& r) {
    std::vector<std::string> out;
    for (const auto& o : r.object_instances) out.push_back(o.id);
    return out;
}

} // namespace

class QueryExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        test::registerTestSchema(schema_);
        relational_.add("Car", "car1", {{"color", "Red"}, {"seats", 4}});
        relational_.add("Car", "car2", {{"color", "Blue"}, {"seats", 2}});
        relational_.add("Car", "car3", {{"color", "Green"}, {"seats", 7}});
        relational_.add("City", "c1", {{"name", "Testville"}});
        relational_.add("City", "c2", {{"name", "Elsewhere"}});
        relational_.add("User", "u1", {{"dept", "Engineering"}});
        relational_.add("User", "u2", {{"dept", "DataScience"}});
        relational_.add("User", "u3", {{"dept", "Sales"}});
        graph_.addEdge("LocatedIn", "car1", "c1");
        graph_.addEdge("LocatedIn", "car2", "c1");
        graph_.addEdge("LocatedIn", "car3", "c2");
        vector_.add("user_bio", "u1", {1.0f, 0.0f, 0.0f});
        vector_.add("user_bio", "u2", {0.9f, 0.1f, 0.0f});
        vector_.add("user_bio", "u3", {0.0f, 0.0f, 1.0f});
    }

    QueryResult run(ClausePtr root, QueryConfig cfg = {}) {
        QueryPlanner planner(schema_, &embedder_);
        QueryExecutor executor(relational_, vector_, graph_, &embedder_, cfg);
        return executor.execute(planner.plan(ComplexQuery("test", std::move(root))));
    }

    SchemaRegistry schema_;
    test::FakeRelationalStore relational_;
    test::FakeVectorStore vector_;
    test::FakeGraphStore graph_{relational_};
    test::FakeTextEmbedder embedder_;
};

TEST_F(QueryExecutorTest, AndIntersectsChildren) {
    auto c = car({eq("color", "Red")});
    auto located = car();
    located.graph_traversals.push_back(locatedIn("Testville"));
    auto r = run(makeAnd({makeComponent(c), makeComponent(located)}));
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(ids(r), (std::vector<std::string>{"car1"}));
}

TEST_F(QueryExecutorTest, OrUnitesChildren) {
    auto r = run(makeOr({makeComponent(car({eq("color", "Red")})), makeComponent(car({eq("color", "Green")}))}));
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(ids(r), (std::vector<std::string>{"car1", "car3"}));
}

TEST_F(QueryExecutorTest, NotIsComplementWithinType) {
    auto r = run(makeNot(makeComponent(car({eq("color", "Red")}))));
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(ids(r), (std::vector<std::string>{"car2", "car3"}));
}

TEST_F(QueryExecutorTest, DoubleNotRestoresChild) {
    auto r = run(makeNot(makeNot(makeComponent(car({eq("color", "Blue")})))));
    EXPECT_EQ(ids(r), (std::vector<std::string>{"car2"}));
}

TEST_F(QueryExecutorTest, LeafWithoutConditionsIsFullExtent) {
    auto r = run(makeComponent(car()));
    EXPECT_EQ(ids(r), (std::vector<std::string>{"car1", "car2", "car3"}));
    EXPECT_EQ(relational_.allIdsCalls.load(), 1);
}

TEST_F(QueryExecutorTest, EmptyIntermediateSkipsRemainingSteps) {
    auto c = car({eq("color", "Purple")});
    c.graph_traversals.push_back(locatedIn("Testville"));
    auto r = run(makeComponent(c));
    EXPECT_TRUE(r.ok());
    EXPECT_TRUE(r.object_instances.empty());
    EXPECT_EQ(relational_.filterCalls.load(), 1);
    EXPECT_EQ(graph_.traversalCalls.load(), 0);
    // Nothing to fetch
    EXPECT_EQ(relational_.fetchCalls.load(), 0);
}

TEST_F(QueryExecutorTest, StoreResultsAreClippedToRestrictSet) {
    vector_.ignoreRestrict = true;
    QueryComponent u;
    u.object_type_name = "User";
    u.relational_filters.push_back(RelationalFilter{"dept", RelationalOperator::In,
                                                    nlohmann::json::array({"Sales", "DataScience"})});
    EmbeddingSearchClause s;
    s.embedding_definition_name = "user_bio";
    s.similar_to_payload = {1.0f, 0.0f, 0.0f};
    s.limit = 5;
    u.embedding_searches.push_back(s);

    auto r = run(makeComponent(u));
    EXPECT_TRUE(r.ok());
    // u1 is the best match but outside the relational pre-filter
    EXPECT_EQ(ids(r), (std::vector<std::string>{"u2", "u3"}));
}

TEST_F(QueryExecutorTest, FailingOrBranchIsRecordedOtherBranchSurvives) {
    graph_.failTraversal = true;
    auto located = car();
    located.graph_traversals.push_back(locatedIn("Testville"));
    auto r = run(makeOr({makeComponent(car({eq("color", "Green")})), makeComponent(located)}));

    EXPECT_EQ(ids(r), (std::vector<std::string>{"car3"}));
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_NE(r.errors[0].find("component 1 (Car)"), std::string::npos);
    EXPECT_NE(r.errors[0].find("graph store timeout"), std::string::npos);
}

TEST_F(QueryExecutorTest, FailingAndBranchEmptiesTheGroup) {
    relational_.failFilter = true;
    auto located = car();
    located.graph_traversals.push_back(locatedIn("Testville"));
    auto r = run(makeAnd({makeComponent(car({eq("color", "Red")})), makeComponent(located)}));
    EXPECT_TRUE(r.object_instances.empty());
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_NE(r.errors[0].find("relational backend unavailable"), std::string::npos);
}

TEST_F(QueryExecutorTest, NotOverFailingChildKeepsUniverseAndRecordsError) {
    graph_.failTraversal = true;
    auto located = car();
    located.graph_traversals.push_back(locatedIn("Testville"));
    auto r = run(makeNot(makeComponent(located)));
    EXPECT_EQ(ids(r), (std::vector<std::string>{"car1", "car2", "car3"}));
    EXPECT_EQ(r.errors.size(), 1u);
}

TEST_F(QueryExecutorTest, NotWithFailingExtentIsEmpty) {
    relational_.failAllIds = true;
    auto r = run(makeNot(makeComponent(car({eq("color", "Red")}))));
    EXPECT_TRUE(r.object_instances.empty());
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_NE(r.errors[0].find("NOT (Car)"), std::string::npos);
}

TEST_F(QueryExecutorTest, FetchFailureIsReported) {
    relational_.failFetch = true;
    auto r = run(makeComponent(car({eq("color", "Red")})));
    EXPECT_TRUE(r.object_instances.empty());
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].rfind("fetch:", 0), 0u);
}

TEST_F(QueryExecutorTest, ErrorsKeepChildOrder) {
    relational_.failFilter = true;
    graph_.failTraversal = true;
    auto located = car();
    located.graph_traversals.push_back(locatedIn("Testville"));
    auto r = run(makeOr({makeComponent(located), makeComponent(car({eq("color", "Red")}))}));
    ASSERT_EQ(r.errors.size(), 2u);
    EXPECT_NE(r.errors[0].find("component 0"), std::string::npos);
    EXPECT_NE(r.errors[1].find("component 1"), std::string::npos);
}

TEST_F(QueryExecutorTest, ParallelSiblingsMatchSequentialResult) {
    QueryConfig parallel;
    parallel.parallel_siblings = true;
    auto tree = [] {
        auto located = car();
        located.graph_traversals.push_back(locatedIn("Testville"));
        return makeOr({
            makeAnd({makeComponent(car({eq("color", "Red")})), makeComponent(located)}),
            makeNot(makeComponent(car({eq("color", "Blue")}))),
            makeComponent(car({eq("seats", 7)}))
        });
    };
    auto seq = run(tree());
    auto par = run(tree(), parallel);
    EXPECT_EQ(ids(seq), ids(par));
    EXPECT_EQ(ids(par), (std::vector<std::string>{"car1", "car3"}));
}

TEST_F(QueryExecutorTest, ParallelSiblingsKeepErrorOrder) {
    QueryConfig parallel;
    parallel.parallel_siblings = true;
    relational_.failFilter = true;
    graph_.failTraversal = true;
    auto located = car();
    located.graph_traversals.push_back(locatedIn("Testville"));
    auto r = run(makeOr({makeComponent(located), makeComponent(car({eq("color", "Red")}))}), parallel);
    ASSERT_EQ(r.errors.size(), 2u);
    EXPECT_NE(r.errors[0].find("graph_traversal"), std::string::npos);
    EXPECT_NE(r.errors[1].find("relational_filter"), std::string::npos);
}

TEST_F(QueryExecutorTest, DeadlineAbortsEvaluation) {
    QueryConfig cfg;
    cfg.timeout_ms = 20;
    graph_.delay = std::chrono::milliseconds(60);
    auto located = car();
    located.graph_traversals.push_back(locatedIn("Testville"));
    QueryPlanner planner(schema_);
    QueryExecutor executor(relational_, vector_, graph_, nullptr, cfg);
    auto plan = planner.plan(ComplexQuery("slow", makeAnd({makeComponent(located), makeComponent(car({eq("color", "Red")}))})));
    EXPECT_THROW(executor.execute(plan), QueryTimeoutError);
    EXPECT_EQ(relational_.filterCalls.load(), 0);
}

TEST_F(QueryExecutorTest, EngineReportsTimeoutAsResultError) {
    QueryConfig cfg;
    cfg.timeout_ms = 20;
    graph_.delay = std::chrono::milliseconds(60);
    auto located = car();
    located.graph_traversals.push_back(locatedIn("Testville"));
    QueryEngine engine(schema_, relational_, vector_, graph_, cfg);
    auto r = engine.execute(ComplexQuery("slow", makeAnd({makeComponent(located), makeComponent(car({eq("color", "Red")}))})));
    EXPECT_TRUE(r.object_instances.empty());
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_NE(r.errors[0].find("timed out"), std::string::npos);
}

TEST_F(QueryExecutorTest, QueryTextIsEmbeddedBeforeSearch) {
    QueryComponent u;
    u.object_type_name = "User";
    EmbeddingSearchClause s;
    s.embedding_definition_name = "user_bio";
    s.query_text = "x"; // FakeTextEmbedder -> {0, 1, 0}
    s.limit = 1;
    u.embedding_searches.push_back(s);

    auto r = run(makeComponent(u));
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(embedder_.embedCalls.load(), 1);
    EXPECT_EQ(vector_.lastQuery, (std::vector<float>{0.0f, 1.0f, 0.0f}));
    EXPECT_EQ(ids(r), (std::vector<std::string>{"u2"}));
}

TEST_F(QueryExecutorTest, EmbedderFailureIsBranchError) {
    embedder_.fail = true;
    QueryComponent u;
    u.object_type_name = "User";
    EmbeddingSearchClause s;
    s.embedding_definition_name = "user_bio";
    s.query_text = "anything";
    u.embedding_searches.push_back(s);

    auto r = run(makeComponent(u));
    EXPECT_TRUE(r.object_instances.empty());
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_NE(r.errors[0].find("embedding model not loaded"), std::string::npos);
    EXPECT_EQ(vector_.searchCalls.load(), 0);
}

TEST(SortedListOpsTest, IntersectUnionSubtract) {
    std::vector<std::string> a{"a", "b", "c"}, b{"b", "c", "d"}, c{"c"};
    EXPECT_EQ(QueryExecutor::intersectSortedLists({a, b, c}), (std::vector<std::string>{"c"}));
    EXPECT_EQ(QueryExecutor::unionSortedLists({a, b}), (std::vector<std::string>{"a", "b", "c", "d"}));
    EXPECT_EQ(QueryExecutor::subtractSortedList(a, b), (std::vector<std::string>{"a"}));
    EXPECT_TRUE(QueryExecutor::intersectSortedLists({}).empty());
    EXPECT_TRUE(QueryExecutor::intersectSortedLists({a, {}}).empty());
    EXPECT_EQ(QueryExecutor::unionSortedLists({{}, c}), c);
}

TEST_F(QueryExecutorTest, RejectedQueryTouchesNoStore) {
    QueryEngine engine(schema_, relational_, vector_, graph_);
    QueryComponent ghost;
    ghost.object_type_name = "Spaceship";
    EXPECT_THROW(engine.execute(ComplexQuery("ghost", makeComponent(ghost))), SchemaError);
    EXPECT_EQ(relational_.filterCalls.load() + relational_.allIdsCalls.load() + relational_.fetchCalls.load(), 0);
    EXPECT_EQ(vector_.searchCalls.load(), 0);
    EXPECT_EQ(graph_.traversalCalls.load(), 0);
}

TEST_F(QueryExecutorTest, AndIsCommutative) {
    auto located = car();
    located.graph_traversals.push_back(locatedIn("Testville"));
    auto ab = run(makeAnd({makeComponent(car({eq("seats", 4)})), makeComponent(located)}));
    auto ba = run(makeAnd({makeComponent(located), makeComponent(car({eq("seats", 4)}))}));
    EXPECT_EQ(ids(ab), ids(ba));
    EXPECT_EQ(ids(ab), (std::vector<std::string>{"car1"}));
}
