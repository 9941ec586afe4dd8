// tests/test_objective.cpp
// Tests for objective.hpp: prior pair resolution, term composition and
// assignment scoring.

#include "objective.hpp"
#include "partitioner.hpp"
#include "fixtures.hpp"
#include <gtest/gtest.h>

using namespace groupopt;
using groupopt::testing::MakeBatch;
using groupopt::testing::MakeEntity;

namespace {

const TermScore* FindTerm(const ScoreBreakdown& breakdown, const std::string& name) {
    for (const TermScore& term : breakdown.terms) {
        if (term.name == name) return &term;
    }
    return nullptr;
}

PartitionConfig MixedGroups(int group_size) {
    PartitionConfig config;
    config.group_size = group_size;
    config.sex_mode = SexMode::MIXED;
    return config;
}

std::vector<Entity> WithSubjects(const std::vector<std::string>& subjects) {
    std::vector<Entity> entities;
    for (size_t i = 0; i < subjects.size(); ++i) {
        entities.push_back(MakeEntity(static_cast<int>(i), "S" + std::to_string(i),
                                      i % 2 == 0 ? Sex::F : Sex::M, {{"subject", subjects[i]}}));
    }
    return entities;
}

}  // namespace

// =============================================================================
// Attribute values and prior pairs
// =============================================================================

TEST(DistinctAttributeValues, SortedAndSkipsBlank) {
    std::vector<Entity> entities = {
        MakeEntity(0, "a", Sex::F, {{"origin", "north"}}),
        MakeEntity(1, "b", Sex::M, {{"origin", "  "}}),
        MakeEntity(2, "c", Sex::F, {}),
        MakeEntity(3, "d", Sex::M, {{"origin", "east"}}),
        MakeEntity(4, "e", Sex::F, {{"origin", "north"}}),
    };
    std::vector<std::string> values = DistinctAttributeValues(entities, "origin");
    ASSERT_EQ(values.size(), 2u);
    EXPECT_EQ(values[0], "east");
    EXPECT_EQ(values[1], "north");
    EXPECT_TRUE(DistinctAttributeValues(entities, "subject").empty());
}

TEST(ResolvePriorPairs, TrimsNamesAndOrdersIds) {
    std::vector<Entity> entities = {
        MakeEntity(0, "Ana", Sex::F),
        MakeEntity(1, " Ben ", Sex::M),
        MakeEntity(2, "Cleo", Sex::F),
    };
    auto resolved = ResolvePriorPairs(entities, {{"Cleo", "Ana"}, {"Ben", " Cleo"}});
    ASSERT_EQ(resolved.size(), 2u);
    EXPECT_EQ(resolved[0], std::make_pair(0, 2));
    EXPECT_EQ(resolved[1], std::make_pair(1, 2));
}

TEST(ResolvePriorPairs, DropsUnknownSelfAndDuplicatePairs) {
    std::vector<Entity> entities = {
        MakeEntity(0, "Ana", Sex::F),
        MakeEntity(1, "Ben", Sex::M),
    };
    auto resolved = ResolvePriorPairs(entities, {{"Ana", "Zoe"},
                                                 {"Ana", "Ana"},
                                                 {"Ana", "Ben"},
                                                 {"Ben", "Ana"}});
    ASSERT_EQ(resolved.size(), 1u);
    EXPECT_EQ(resolved[0], std::make_pair(0, 1));
}

TEST(ResolvePriorPairs, RepeatedNameUsesLastOccurrence) {
    std::vector<Entity> entities = {
        MakeEntity(0, "Sam", Sex::F),
        MakeEntity(1, "Ana", Sex::F),
        MakeEntity(2, "Sam", Sex::M),
    };
    auto resolved = ResolvePriorPairs(entities, {{"Ana", "Sam"}});
    ASSERT_EQ(resolved.size(), 1u);
    EXPECT_EQ(resolved[0], std::make_pair(1, 2));
}

// =============================================================================
// Scoring
// =============================================================================

TEST(ScoreAssignment, GroupSizeDeviation) {
    std::vector<Entity> entities = MakeBatch(3, 4);
    PartitionConfig config;
    config.group_size = 4;
    BinGeometry geometry = ComputeBinGeometry(config, 7);
    ASSERT_EQ(geometry.num_bins, 2);

    // Sizes 4 and 3
    ScoreBreakdown score = ScoreAssignment(entities, config, geometry, {}, {0, 0, 0, 0, 1, 1, 1});
    const TermScore* size = FindTerm(score, "size_balance");
    ASSERT_NE(size, nullptr);
    EXPECT_EQ(size->value, 1);
    EXPECT_EQ(score.total, 1);

    // Sizes 2 and 5 are out of capacity but still score
    score = ScoreAssignment(entities, config, geometry, {}, {0, 0, 1, 1, 1, 1, 1});
    EXPECT_EQ(FindTerm(score, "size_balance")->value, 3);
}

TEST(ScoreAssignment, ClassSizeUsesNearestTarget) {
    std::vector<Entity> entities = MakeBatch(5, 5);
    PartitionConfig config;
    config.variant = Variant::CLASSES;
    config.num_bins = 3;
    config.max_bin_size = 10;
    BinGeometry geometry = ComputeBinGeometry(config, 10);

    // Targets are 3 and 4: sizes 4, 3, 3 deviate by nothing
    ScoreBreakdown score = ScoreAssignment(entities, config, geometry, {},
                                           {0, 0, 0, 0, 1, 1, 1, 2, 2, 2});
    EXPECT_EQ(FindTerm(score, "size_balance")->value, 0);

    // Sizes 6, 2, 2 deviate by 2, 1, 1
    score = ScoreAssignment(entities, config, geometry, {}, {0, 0, 0, 0, 0, 0, 1, 1, 2, 2});
    EXPECT_EQ(FindTerm(score, "size_balance")->value, 4);
}

TEST(ScoreAssignment, SexBalanceOnlyInMixedMode) {
    std::vector<Entity> entities = MakeBatch(5, 5);
    PartitionConfig config = MixedGroups(5);
    BinGeometry geometry = ComputeBinGeometry(config, 10);

    // 3F2M and 2F3M
    Assignment balanced = {0, 0, 0, 1, 1, 0, 0, 1, 1, 1};
    ScoreBreakdown score = ScoreAssignment(entities, config, geometry, {}, balanced);
    EXPECT_EQ(FindTerm(score, "sex_balance")->value, 2);
    EXPECT_EQ(FindTerm(score, "sex_balance")->weight, 2);
    EXPECT_EQ(score.total, 4);

    config.sex_mode = SexMode::NONE;
    score = ScoreAssignment(entities, config, geometry, {}, balanced);
    EXPECT_EQ(FindTerm(score, "sex_balance"), nullptr);
    EXPECT_EQ(score.total, 0);
}

TEST(ScoreAssignment, UnspecifiedSexCountsForNeither) {
    std::vector<Entity> entities = {
        MakeEntity(0, "a", Sex::F),
        MakeEntity(1, "b", Sex::UNSPECIFIED),
        MakeEntity(2, "c", Sex::M),
        MakeEntity(3, "d", Sex::UNSPECIFIED),
    };
    PartitionConfig config = MixedGroups(2);
    config.weights.size_balance = 0;
    BinGeometry geometry = ComputeBinGeometry(config, 4);
    ScoreBreakdown score = ScoreAssignment(entities, config, geometry, {}, {0, 0, 1, 1});
    EXPECT_EQ(FindTerm(score, "sex_balance")->value, 2);
}

TEST(ScoreAssignment, SpreadCountsExtraBinsPerValue) {
    std::vector<Entity> entities = WithSubjects({"math", "math", "math", "art", "art", "bio"});
    PartitionConfig config;
    config.variant = Variant::CLASSES;
    config.num_bins = 3;
    config.weights.size_balance = 0;
    config.attribute_rules.push_back({"subject", AttributeRuleKind::SPREAD, 5, 2});
    BinGeometry geometry = ComputeBinGeometry(config, 6);

    ScoreBreakdown score = ScoreAssignment(entities, config, geometry, {}, {0, 1, 2, 0, 0, 1});
    ASSERT_EQ(score.terms.size(), 3u);
    // Distinct values in sorted order
    EXPECT_EQ(score.terms[0].name, "spread:subject=art");
    EXPECT_EQ(score.terms[0].value, 0);
    EXPECT_EQ(score.terms[1].name, "spread:subject=bio");
    EXPECT_EQ(score.terms[1].value, 0);
    EXPECT_EQ(score.terms[2].name, "spread:subject=math");
    EXPECT_EQ(score.terms[2].value, 2);
    EXPECT_EQ(score.total, 10);
}

TEST(ScoreAssignment, CapCountsExcessPerBin) {
    std::vector<Entity> entities = WithSubjects({"x", "x", "x", "x", "x", "y"});
    PartitionConfig config;
    config.variant = Variant::CLASSES;
    config.num_bins = 2;
    config.weights.size_balance = 0;
    config.attribute_rules.push_back({"subject", AttributeRuleKind::CAP, 5, 2});
    BinGeometry geometry = ComputeBinGeometry(config, 6);

    ScoreBreakdown score = ScoreAssignment(entities, config, geometry, {}, {0, 0, 0, 0, 1, 1});
    const TermScore* x = FindTerm(score, "cap:subject=x");
    ASSERT_NE(x, nullptr);
    EXPECT_EQ(x->value, 2);
    EXPECT_EQ(FindTerm(score, "cap:subject=y")->value, 0);
    EXPECT_EQ(score.total, 10);
}

TEST(ScoreAssignment, ZeroWeightTermsAreOmitted) {
    std::vector<Entity> entities = WithSubjects({"x", "y"});
    PartitionConfig config = MixedGroups(2);
    config.weights = {0, 0, 0};
    config.attribute_rules.push_back({"subject", AttributeRuleKind::SPREAD, 0, 2});
    BinGeometry geometry = ComputeBinGeometry(config, 2);
    ScoreBreakdown score = ScoreAssignment(entities, config, geometry, {{"S0", "S1"}}, {0, 0});
    EXPECT_TRUE(score.terms.empty());
    EXPECT_EQ(score.total, 0);
}

TEST(ScoreAssignment, PriorPairTogetherCostsOneWeight) {
    std::vector<Entity> entities = {
        MakeEntity(0, "Ana", Sex::F),
        MakeEntity(1, "Ben", Sex::M),
        MakeEntity(2, "Cleo", Sex::F),
        MakeEntity(3, "Dan", Sex::M),
    };
    PartitionConfig config = MixedGroups(2);
    BinGeometry geometry = ComputeBinGeometry(config, 4);
    std::vector<PriorPair> pairs = {{"Ana", "Cleo"}};

    ScoreBreakdown together = ScoreAssignment(entities, config, geometry, pairs, {0, 1, 0, 1});
    ScoreBreakdown apart = ScoreAssignment(entities, config, geometry, pairs, {0, 0, 1, 1});
    EXPECT_EQ(FindTerm(together, "prior_pairing")->value, 1);
    EXPECT_EQ(FindTerm(apart, "prior_pairing")->value, 0);

    // Both layouts differ only in sex balance (4 vs 0) and the pairing penalty
    EXPECT_EQ(together.total - apart.total, 10 + 2 * 4);
}

TEST(ScoreAssignment, UnresolvedPairsAddNoTerm) {
    std::vector<Entity> entities = MakeBatch(2, 2);
    PartitionConfig config;
    config.group_size = 2;
    BinGeometry geometry = ComputeBinGeometry(config, 4);
    ScoreBreakdown score = ScoreAssignment(entities, config, geometry, {{"Nobody", "F0"}},
                                           {0, 0, 1, 1});
    EXPECT_EQ(FindTerm(score, "prior_pairing"), nullptr);
}

TEST(ScoreAssignment, RepeatedScoringIsStable) {
    std::vector<Entity> entities = WithSubjects({"x", "x", "y", "y", "x", "z", "y"});
    PartitionConfig config = MixedGroups(3);
    config.attribute_rules.push_back({"subject", AttributeRuleKind::SPREAD, 5, 2});
    config.attribute_rules.push_back({"subject", AttributeRuleKind::CAP, 3, 1});
    BinGeometry geometry = ComputeBinGeometry(config, 7);
    Assignment assignment = {0, 1, 2, 0, 1, 2, 0};
    std::vector<PriorPair> pairs = {{"S0", "S3"}};

    ScoreBreakdown first = ScoreAssignment(entities, config, geometry, pairs, assignment);
    ScoreBreakdown second = ScoreAssignment(entities, config, geometry, pairs, assignment);
    ASSERT_EQ(first.terms.size(), second.terms.size());
    for (size_t t = 0; t < first.terms.size(); ++t) {
        EXPECT_EQ(first.terms[t].name, second.terms[t].name);
        EXPECT_EQ(first.terms[t].value, second.terms[t].value);
    }
    EXPECT_EQ(first.total, second.total);
}

// =============================================================================
// Composer
// =============================================================================

TEST(ObjectiveComposer, TermOrderMatchesScorer) {
    std::vector<Entity> entities = WithSubjects({"x", "y", "x", "y"});
    PartitionConfig config = MixedGroups(2);
    config.attribute_rules.push_back({"subject", AttributeRuleKind::CAP, 5, 1});
    std::vector<PriorPair> pairs = {{"S0", "S2"}};
    BinGeometry geometry = ComputeBinGeometry(config, 4);

    sat::CpModelBuilder model;
    PartitionModel partition(entities, geometry, &model);
    partition.AddHardConstraints(config);
    ObjectiveComposer composer(&partition, config);
    EXPECT_EQ(composer.AddAllTerms(pairs), 1);

    ScoreBreakdown score = ScoreAssignment(entities, config, geometry, pairs, {0, 0, 1, 1});
    const std::vector<PenaltyTerm>& terms = composer.GetTerms();
    ASSERT_EQ(terms.size(), score.terms.size());
    for (size_t t = 0; t < terms.size(); ++t) {
        EXPECT_EQ(terms[t].name, score.terms[t].name);
        EXPECT_EQ(terms[t].weight, score.terms[t].weight);
    }
    EXPECT_EQ(terms.front().name, "size_balance");
    EXPECT_EQ(terms.back().name, "prior_pairing");
}

TEST(ObjectiveComposer, SkipsZeroWeightRules) {
    std::vector<Entity> entities = WithSubjects({"x", "y"});
    PartitionConfig config;
    config.group_size = 2;
    config.weights.size_balance = 0;
    config.attribute_rules.push_back({"subject", AttributeRuleKind::SPREAD, 0, 2});
    BinGeometry geometry = ComputeBinGeometry(config, 2);

    sat::CpModelBuilder model;
    PartitionModel partition(entities, geometry, &model);
    partition.AddHardConstraints(config);
    ObjectiveComposer composer(&partition, config);
    EXPECT_EQ(composer.AddAllTerms({}), 0);
    EXPECT_TRUE(composer.GetTerms().empty());
}

// =============================================================================
// Scoring a fixed assignment end to end
// =============================================================================

TEST(ScorePartition, FeasibleAssignmentMaterializes) {
    std::vector<Entity> entities = MakeBatch(5, 5);
    PartitionConfig config = MixedGroups(5);
    PartitionResult result = ScorePartition(entities, config, {}, {0, 0, 0, 1, 1, 0, 0, 1, 1, 1});
    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(result.status, SolveStatus::FEASIBLE);
    EXPECT_EQ(result.num_bins, 2);
    EXPECT_EQ(result.objective, 4);
    EXPECT_TRUE(result.mixed_rule_applied);
    ASSERT_EQ(result.bins.size(), 2u);
    EXPECT_EQ(result.bins[0].size(), 5u);
}

TEST(ScorePartition, HardViolationIsInfeasibleWithScore) {
    std::vector<Entity> entities = MakeBatch(5, 5);
    PartitionConfig config = MixedGroups(5);
    // All females in bin 0
    PartitionResult result = ScorePartition(entities, config, {}, {0, 0, 0, 0, 0, 1, 1, 1, 1, 1});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.status, SolveStatus::INFEASIBLE);
    EXPECT_EQ(result.objective, 20);
    EXPECT_TRUE(result.bins.empty());
}

TEST(ScorePartition, MalformedAssignmentIsRejected) {
    std::vector<Entity> entities = MakeBatch(2, 2);
    PartitionConfig config;
    config.group_size = 2;
    EXPECT_EQ(ScorePartition(entities, config, {}, {0, 1, 0}).status,
              SolveStatus::INVALID_CONFIGURATION);
    EXPECT_EQ(ScorePartition(entities, config, {}, {0, 1, 2, 0}).status,
              SolveStatus::INVALID_CONFIGURATION);
}
