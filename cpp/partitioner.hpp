#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "config.hpp"
#include "entity.hpp"
#include "objective.hpp"
#include "solver_driver.hpp"

namespace groupopt {

struct PartitionResult {
    bool success = false;
    SolveStatus status = SolveStatus::INVALID_CONFIGURATION;
    std::string message;

    int num_bins = 0;
    Bins bins;                        // Points into the entities passed in
    Assignment assignment;

    int64_t objective = 0;            // Recomputed from the assignment
    double solver_objective = 0.0;    // As reported by CP-SAT
    double solve_time_secs = 0.0;
    ScoreBreakdown breakdown;

    bool mixed_rule_applied = false;
    int resolved_prior_pairs = 0;
};

// Builds, solves and materializes one partition. Holds no state between calls.
// The returned bins reference `entities`, which must outlive the result.
PartitionResult Partition(
    const std::vector<Entity>& entities,
    const PartitionConfig& config,
    const std::vector<PriorPair>& prior_pairs = {},
    const SolveOptions& options = SolveOptions()
);

// Scores a given assignment without solving. Hard rules are checked and a
// violation is reported as INFEASIBLE with the score still filled in.
PartitionResult ScorePartition(
    const std::vector<Entity>& entities,
    const PartitionConfig& config,
    const std::vector<PriorPair>& prior_pairs,
    const Assignment& assignment
);

}  // namespace groupopt
