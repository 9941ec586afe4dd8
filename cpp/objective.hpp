#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "ortools/sat/cp_model.h"

#include "config.hpp"
#include "entity.hpp"
#include "partition_model.hpp"

namespace groupopt {

// One weighted soft rule, its expression never goes below zero
struct PenaltyTerm {
    std::string name;
    int weight;
    sat::LinearExpr expr;
};

struct TermScore {
    std::string name;
    int weight;
    int64_t value;
};

struct ScoreBreakdown {
    std::vector<TermScore> terms;
    int64_t total = 0;
};

// Sorted distinct non-blank values of an attribute across the batch
std::vector<std::string> DistinctAttributeValues(const std::vector<Entity>& entities,
                                                 const std::string& attribute);

// Prior pairs as (lower id, higher id), duplicates and unresolved names dropped
std::vector<std::pair<int, int>> ResolvePriorPairs(const std::vector<Entity>& entities,
                                                   const std::vector<PriorPair>& pairs);

class ObjectiveComposer {
private:
    PartitionModel* partition;
    const PartitionConfig& config;
    std::vector<PenaltyTerm> terms;

    sat::LinearExpr SizeDeviation(int bin);
    sat::LinearExpr SpreadTerm(const std::vector<int>& holders);
    sat::LinearExpr CapExcessTerm(const std::vector<int>& holders, int max_per_bin);

public:
    explicit ObjectiveComposer(PartitionModel* partition, const PartitionConfig& config)
        : partition(partition), config(config) {}

    const std::vector<PenaltyTerm>& GetTerms() const { return terms; }

    // Per bin, |size - target|
    void AddSizeBalanceTerm();

    // Per bin, |female count - male count|
    void AddSexBalanceTerm();

    // One spread or cap term per rule and distinct value
    void AddAttributeTerms();

    // Counts bins that hold both members of a prior pair. Returns the number of pairs used.
    int AddPriorPairingTerm(const std::vector<PriorPair>& pairs);

    // Adds every term with a positive weight. Returns the number of prior pairs used.
    int AddAllTerms(const std::vector<PriorPair>& pairs);

    // Weighted sum of all registered terms
    sat::LinearExpr BuildObjective() const;
};

// Evaluates the same terms as ObjectiveComposer on a concrete, valid assignment.
// Must stay in step with the model built by AddAllTerms.
ScoreBreakdown ScoreAssignment(
    const std::vector<Entity>& entities,
    const PartitionConfig& config,
    const BinGeometry& geometry,
    const std::vector<PriorPair>& pairs,
    const Assignment& assignment
);

}  // namespace groupopt
