#include "partitioner.hpp"

#include <utility>

#include "absl/strings/str_cat.h"
#include "ortools/base/logging.h"
#include "ortools/sat/cp_model.h"

#include "greedy_hint.hpp"
#include "materializer.hpp"
#include "partition_model.hpp"

namespace groupopt {

namespace {

PartitionResult Failure(SolveStatus status, const std::string& message) {
    PartitionResult result;
    result.success = false;
    result.status = status;
    result.message = message;
    return result;
}

bool CheckDenseIds(const std::vector<Entity>& entities, std::string* error) {
    for (size_t i = 0; i < entities.size(); ++i) {
        if (entities[i].id != static_cast<int>(i)) {
            *error = absl::StrCat("entity at position ", i, " has id ", entities[i].id);
            return false;
        }
    }
    return true;
}

bool CheckAssignmentShape(const Assignment& assignment, int num_entities, int num_bins,
                          std::string* error) {
    if (static_cast<int>(assignment.size()) != num_entities) {
        *error = absl::StrCat("assignment has ", assignment.size(), " entries for ",
                              num_entities, " entities");
        return false;
    }
    for (size_t i = 0; i < assignment.size(); ++i) {
        if (assignment[i] < 0 || assignment[i] >= num_bins) {
            *error = absl::StrCat("entry ", i, " names bin ", assignment[i], " of ", num_bins);
            return false;
        }
    }
    return true;
}

bool ValidateRequest(const std::vector<Entity>& entities, const PartitionConfig& config,
                     std::string* error) {
    return ValidateConfig(config, error) && CheckDenseIds(entities, error);
}

}  // namespace

PartitionResult Partition(
    const std::vector<Entity>& entities,
    const PartitionConfig& config,
    const std::vector<PriorPair>& prior_pairs,
    const SolveOptions& options
) {
    std::string error;
    if (!ValidateRequest(entities, config, &error) || !ValidateSolveOptions(options, &error)) {
        LOG(WARNING) << "Rejecting partition request: " << error;
        return Failure(SolveStatus::INVALID_CONFIGURATION, error);
    }

    const int n = static_cast<int>(entities.size());
    const BinGeometry geometry = ComputeBinGeometry(config, n);

    sat::SatParameters parameters;
    if (!BuildSatParameters(options, &parameters, &error)) {
        return Failure(SolveStatus::INVALID_CONFIGURATION, error);
    }
    if (!options.initial_assignment.empty() &&
        !CheckAssignmentShape(options.initial_assignment, n, geometry.num_bins, &error)) {
        return Failure(SolveStatus::INVALID_CONFIGURATION, absl::StrCat("bad hint: ", error));
    }

    LOG(INFO) << "Partitioning " << n << " entities into " << geometry.num_bins << " "
              << VariantName(config.variant) << " of size [" << geometry.min_size << ", "
              << geometry.max_size << "], sex mode " << SexModeName(config.sex_mode);

    PartitionResult result;
    result.num_bins = geometry.num_bins;

    // An empty batch of groups is a single empty group, nothing to search
    if (n == 0 && config.variant == Variant::GROUPS) {
        result.success = true;
        result.status = SolveStatus::OPTIMAL;
        result.bins.assign(1, {});
        result.breakdown = ScoreAssignment(entities, config, geometry, prior_pairs, result.assignment);
        result.objective = result.breakdown.total;
        result.solver_objective = static_cast<double>(result.objective);
        return result;
    }

    sat::CpModelBuilder model;
    PartitionModel partition(entities, geometry, &model);
    partition.AddHardConstraints(config);
    result.mixed_rule_applied = partition.MixedRuleApplied();

    ObjectiveComposer composer(&partition, config);
    result.resolved_prior_pairs = composer.AddAllTerms(prior_pairs);
    model.Minimize(composer.BuildObjective());

    if (!options.initial_assignment.empty()) {
        partition.AddAssignmentHint(options.initial_assignment);
    } else if (options.use_greedy_hint) {
        partition.AddAssignmentHint(BuildGreedyAssignment(entities, config, geometry));
    }

    SolverRun run = SolvePartition(partition, config, parameters);
    result.status = run.status;
    result.message = run.message;
    result.solve_time_secs = run.solve_time_secs;
    if (!run.success) {
        return result;
    }

    if (!MaterializeBins(entities, geometry.num_bins, run.assignment, &result.bins, &error)) {
        LOG(ERROR) << "Cannot materialize solver assignment: " << error;
        result.status = SolveStatus::MODEL_INVALID;
        result.message = error;
        return result;
    }

    result.success = true;
    result.assignment = std::move(run.assignment);
    result.solver_objective = run.objective;
    result.breakdown = ScoreAssignment(entities, config, geometry, prior_pairs, result.assignment);
    result.objective = result.breakdown.total;
    return result;
}

PartitionResult ScorePartition(
    const std::vector<Entity>& entities,
    const PartitionConfig& config,
    const std::vector<PriorPair>& prior_pairs,
    const Assignment& assignment
) {
    std::string error;
    if (!ValidateRequest(entities, config, &error)) {
        return Failure(SolveStatus::INVALID_CONFIGURATION, error);
    }

    const int n = static_cast<int>(entities.size());
    const BinGeometry geometry = ComputeBinGeometry(config, n);
    if (!CheckAssignmentShape(assignment, n, geometry.num_bins, &error)) {
        return Failure(SolveStatus::INVALID_CONFIGURATION, error);
    }

    PartitionResult result;
    result.num_bins = geometry.num_bins;
    result.assignment = assignment;
    if (config.weights.prior_pairing > 0) {
        result.resolved_prior_pairs = static_cast<int>(ResolvePriorPairs(entities, prior_pairs).size());
    }
    result.breakdown = ScoreAssignment(entities, config, geometry, prior_pairs, assignment);
    result.objective = result.breakdown.total;
    result.solver_objective = static_cast<double>(result.objective);

    result.mixed_rule_applied = config.sex_mode == SexMode::MIXED &&
                                MixedRuleApplies(entities, geometry.num_bins);

    if (!CheckHardConstraints(entities, config, geometry, result.mixed_rule_applied,
                              assignment, &error)) {
        result.status = SolveStatus::INFEASIBLE;
        result.message = error;
        return result;
    }

    if (!MaterializeBins(entities, geometry.num_bins, assignment, &result.bins, &error)) {
        return Failure(SolveStatus::INVALID_CONFIGURATION, error);
    }
    result.success = true;
    result.status = SolveStatus::FEASIBLE;
    return result;
}

}  // namespace groupopt
