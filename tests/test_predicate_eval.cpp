#include <gtest/gtest.h>
#include "storage/predicate_eval.h"
#include <cstdint>

using namespace trivium;
using query::RelationalOperator;
using json = nlohmann::json;

namespace {

ObjectInstance sample() {
    ObjectInstance o;
    o.id = "car1";
    o.object_type_name = "Car";
    o.weight = 2.5;
    o.upsert_date_ms = 1704067200000; // 2024-01-01T00:00:00Z
    o.properties = {{"color", "Red"}, {"seats", 4}, {"price", 19999.99}, {"model", "Roadster X"},
                    {"built", "2021-06-15T12:00:00Z"}, {"note", nullptr}};
    return o;
}

ObjectTypeDefinition carType() {
    PropertyDefinition built;
    built.name = "built";
    built.data_type = PropertyDataType::DATETIME;
    PropertyDefinition model;
    model.name = "model";
    return ObjectTypeDefinition{"Car", "", {built, model}};
}

bool match(const std::string& prop, RelationalOperator op, json value) {
    return PredicateEvaluator::matches(sample(), query::RelationalFilter{prop, op, std::move(value)});
}

bool matchTyped(const std::string& prop, RelationalOperator op, json value) {
    const auto type = carType();
    return PredicateEvaluator::matches(sample(), query::RelationalFilter{prop, op, std::move(value)}, &type);
}

} // namespace

TEST(PredicateEvalTest, EqualityAcrossNumericKinds) {
    EXPECT_TRUE(match("seats", RelationalOperator::Eq, 4));
    EXPECT_TRUE(match("seats", RelationalOperator::Eq, 4.0));
    EXPECT_FALSE(match("seats", RelationalOperator::Eq, "4"));
    EXPECT_TRUE(match("color", RelationalOperator::Neq, "Blue"));
}

TEST(PredicateEvalTest, Ordering) {
    EXPECT_TRUE(match("seats", RelationalOperator::Gt, 3));
    EXPECT_TRUE(match("seats", RelationalOperator::Gte, 4));
    EXPECT_FALSE(match("seats", RelationalOperator::Lt, 4));
    EXPECT_TRUE(match("price", RelationalOperator::Lte, 20000));
    EXPECT_TRUE(match("color", RelationalOperator::Gt, "Blue"));
    // Typkonflikt vergleicht nie
    EXPECT_FALSE(match("color", RelationalOperator::Gt, 1));
}

TEST(PredicateEvalTest, DatetimePropertiesCompareByInstant) {
    EXPECT_TRUE(matchTyped("built", RelationalOperator::Gt, "2021-06-15"));
    EXPECT_TRUE(matchTyped("built", RelationalOperator::Eq, "2021-06-15T12:00:00.000Z"));
    EXPECT_FALSE(matchTyped("built", RelationalOperator::Neq, "2021-06-15T12:00:00.000Z"));
    EXPECT_TRUE(matchTyped("built", RelationalOperator::Lt, "2021-06-15T12:00:01Z"));
    EXPECT_TRUE(matchTyped("built", RelationalOperator::In, json::array({"2021-06-15T12:00:00.000Z"})));
    // ohne Typdefinition nur String-Gleichheit
    EXPECT_FALSE(match("built", RelationalOperator::Eq, "2021-06-15T12:00:00.000Z"));
}

TEST(PredicateEvalTest, TextEqualityIsExact) {
    EXPECT_FALSE(PredicateEvaluator::compare(RelationalOperator::Eq, "2024-02-31", "2024-03-02"));
    EXPECT_FALSE(PredicateEvaluator::compare(RelationalOperator::Eq, "2024-01-01", "2024-01-01T00:00:00.000Z"));
    EXPECT_TRUE(PredicateEvaluator::compare(RelationalOperator::Neq, "2024-01-01", "2024-01-01T00:00:00.000Z"));
    EXPECT_FALSE(PredicateEvaluator::compare(RelationalOperator::In, "2024-01-01",
                                             json::array({"2024-01-01T00:00:00Z"})));
    // TEXT-Property bleibt exakt, auch mit Typdefinition
    EXPECT_FALSE(matchTyped("model", RelationalOperator::Eq, "roadster x"));
    EXPECT_TRUE(matchTyped("model", RelationalOperator::Eq, "Roadster X"));
    // Kalenderungültige Zeitpunkte sind keine Instants
    EXPECT_FALSE(PredicateEvaluator::compare(RelationalOperator::Eq, "2024-02-31", "2024-03-02", true));
}

TEST(PredicateEvalTest, IntegersCompareExactlyBeyondDoublePrecision) {
    const json big = int64_t{9007199254740993};   // 2^53 + 1
    const json bigger = int64_t{9007199254740992}; // 2^53
    EXPECT_TRUE(PredicateEvaluator::compare(RelationalOperator::Gt, big, bigger));
    EXPECT_FALSE(PredicateEvaluator::compare(RelationalOperator::Eq, big, bigger));
    EXPECT_TRUE(PredicateEvaluator::compare(RelationalOperator::Neq, big, bigger));

    const json huge = uint64_t{18446744073709551615u};
    EXPECT_TRUE(PredicateEvaluator::compare(RelationalOperator::Gt, huge, int64_t{-1}));
    EXPECT_TRUE(PredicateEvaluator::compare(RelationalOperator::Lt, int64_t{-1}, uint64_t{0}));
    EXPECT_TRUE(PredicateEvaluator::compare(RelationalOperator::Eq, json::parse("4"), int64_t{4}));
}

TEST(PredicateEvalTest, PatternOperators) {
    EXPECT_TRUE(match("model", RelationalOperator::Contains, "dst"));
    EXPECT_TRUE(match("model", RelationalOperator::StartsWith, "Road"));
    EXPECT_TRUE(match("model", RelationalOperator::EndsWith, " X"));
    EXPECT_FALSE(match("model", RelationalOperator::StartsWith, "road"));
    EXPECT_TRUE(match("model", RelationalOperator::Like, "road%"));
    EXPECT_TRUE(match("model", RelationalOperator::Like, "R_adster _"));
    EXPECT_FALSE(match("model", RelationalOperator::Like, "Road"));
}

TEST(PredicateEvalTest, LikeMatcher) {
    EXPECT_TRUE(PredicateEvaluator::likeMatch("", "%"));
    EXPECT_TRUE(PredicateEvaluator::likeMatch("abc", "%%c"));
    EXPECT_TRUE(PredicateEvaluator::likeMatch("abcabc", "%bc%bc"));
    EXPECT_FALSE(PredicateEvaluator::likeMatch("abc", "_"));
    EXPECT_FALSE(PredicateEvaluator::likeMatch("", "_"));
}

TEST(PredicateEvalTest, InMembership) {
    EXPECT_TRUE(match("color", RelationalOperator::In, json::array({"Blue", "Red"})));
    EXPECT_FALSE(match("color", RelationalOperator::In, json::array({"Green"})));
    EXPECT_TRUE(match("seats", RelationalOperator::In, json::array({2, 4})));
}

TEST(PredicateEvalTest, NullSemantics) {
    EXPECT_TRUE(match("note", RelationalOperator::Eq, nullptr));
    EXPECT_TRUE(match("missing", RelationalOperator::Eq, nullptr));
    EXPECT_FALSE(match("missing", RelationalOperator::Neq, "x"));
    EXPECT_FALSE(match("missing", RelationalOperator::Lt, 1));
    EXPECT_TRUE(match("color", RelationalOperator::Neq, nullptr));
    EXPECT_FALSE(match("color", RelationalOperator::Eq, nullptr));
}

TEST(PredicateEvalTest, MetadataProperties) {
    EXPECT_TRUE(match("id", RelationalOperator::Eq, "car1"));
    EXPECT_TRUE(match("weight", RelationalOperator::Gt, 2));
    EXPECT_TRUE(match("upsert_date", RelationalOperator::Gte, "2024-01-01"));
    EXPECT_FALSE(match("upsert_date", RelationalOperator::Lt, "2023-12-31T23:59:59Z"));
    EXPECT_EQ(PredicateEvaluator::resolve(sample(), "upsert_date"), "2024-01-01T00:00:00.000Z");
}

TEST(PredicateEvalTest, MatchesAllIsConjunction) {
    std::vector<query::RelationalFilter> filters{
        {"color", RelationalOperator::Eq, "Red"},
        {"seats", RelationalOperator::Gte, 4}};
    EXPECT_TRUE(PredicateEvaluator::matchesAll(sample(), filters));
    filters.push_back({"seats", RelationalOperator::Gt, 4});
    EXPECT_FALSE(PredicateEvaluator::matchesAll(sample(), filters));
    EXPECT_TRUE(PredicateEvaluator::matchesAll(sample(), {}));
}
