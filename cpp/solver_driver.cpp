#include "solver_driver.hpp"

#include "absl/strings/str_cat.h"
#include "google/protobuf/text_format.h"
#include "ortools/base/logging.h"
#include "ortools/sat/cp_model_solver.h"
#include "ortools/sat/model.h"

#include "materializer.hpp"

namespace groupopt {

const char* SolveStatusName(SolveStatus status) {
    switch (status) {
        case SolveStatus::OPTIMAL: return "OPTIMAL";
        case SolveStatus::FEASIBLE: return "FEASIBLE";
        case SolveStatus::INFEASIBLE: return "INFEASIBLE";
        case SolveStatus::TIMEOUT_NO_SOLUTION: return "TIMEOUT_NO_SOLUTION";
        case SolveStatus::MODEL_INVALID: return "MODEL_INVALID";
        case SolveStatus::INVALID_CONFIGURATION: return "INVALID_CONFIGURATION";
    }
    return "UNKNOWN";
}

SolveStatus StatusFromCpSolver(sat::CpSolverStatus status) {
    switch (status) {
        case sat::CpSolverStatus::OPTIMAL: return SolveStatus::OPTIMAL;
        case sat::CpSolverStatus::FEASIBLE: return SolveStatus::FEASIBLE;
        case sat::CpSolverStatus::INFEASIBLE: return SolveStatus::INFEASIBLE;
        case sat::CpSolverStatus::UNKNOWN: return SolveStatus::TIMEOUT_NO_SOLUTION;
        default: return SolveStatus::MODEL_INVALID;
    }
}

bool BuildSatParameters(const SolveOptions& options, sat::SatParameters* parameters,
                        std::string* error) {
    parameters->set_max_time_in_seconds(options.time_limit_secs);
    parameters->set_random_seed(options.random_seed);
    parameters->set_randomize_search(false);
    parameters->set_log_search_progress(options.log_search_progress);
    if (options.num_workers > 0) {
        parameters->set_num_workers(options.num_workers);
    }

    if (!options.solver_parameters.empty() &&
        !google::protobuf::TextFormat::MergeFromString(options.solver_parameters, parameters)) {
        *error = absl::StrCat("cannot parse solver parameters: ", options.solver_parameters);
        return false;
    }
    return true;
}

bool CheckHardConstraints(
    const std::vector<Entity>& entities,
    const PartitionConfig& config,
    const BinGeometry& geometry,
    bool mixed_rule_applied,
    const Assignment& assignment,
    std::string* violation
) {
    const int num_bins = geometry.num_bins;
    if (assignment.size() != entities.size()) {
        *violation = absl::StrCat("assignment covers ", assignment.size(), " of ",
                                  entities.size(), " entities");
        return false;
    }

    std::vector<int> sizes(num_bins, 0), females(num_bins, 0), males(num_bins, 0);
    for (size_t i = 0; i < entities.size(); ++i) {
        const int b = assignment[i];
        if (b < 0 || b >= num_bins) {
            *violation = absl::StrCat("entity ", i, " in bin ", b, " outside [0, ", num_bins, ")");
            return false;
        }
        sizes[b]++;
        if (entities[i].sex == Sex::F) females[b]++;
        if (entities[i].sex == Sex::M) males[b]++;
    }

    const CompositionBounds& c = config.composition;
    for (int b = 0; b < num_bins; ++b) {
        if (sizes[b] < geometry.min_size || sizes[b] > geometry.max_size) {
            *violation = absl::StrCat("bin ", b, " holds ", sizes[b], " outside [",
                                      geometry.min_size, ", ", geometry.max_size, "]");
            return false;
        }
        if ((c.min_female >= 0 && females[b] < c.min_female) ||
            (c.max_female >= 0 && females[b] > c.max_female) ||
            (c.min_male >= 0 && males[b] < c.min_male) ||
            (c.max_male >= 0 && males[b] > c.max_male)) {
            *violation = absl::StrCat("bin ", b, " has ", females[b], " F and ", males[b],
                                      " M outside the composition bounds");
            return false;
        }
        if (config.sex_mode == SexMode::SAME && females[b] > 0 && males[b] > 0) {
            *violation = absl::StrCat("bin ", b, " mixes sexes in same-sex mode");
            return false;
        }
        if (config.sex_mode == SexMode::MIXED && mixed_rule_applied &&
            (females[b] == 0 || males[b] == 0)) {
            *violation = absl::StrCat("bin ", b, " lacks one sex in mixed mode");
            return false;
        }
    }
    return true;
}

SolverRun SolvePartition(
    const PartitionModel& partition,
    const PartitionConfig& config,
    const sat::SatParameters& parameters
) {
    const sat::CpModelProto model_proto = partition.GetModel()->Build();
    VLOG(1) << sat::CpModelStats(model_proto);

    sat::Model cp_model;
    cp_model.Add(sat::NewSatParameters(parameters));
    const sat::CpSolverResponse response = sat::SolveCpModel(model_proto, &cp_model);
    VLOG(1) << sat::CpSolverResponseStats(response);

    return ReadSolverResponse(partition, config, response);
}

SolverRun ReadSolverResponse(
    const PartitionModel& partition,
    const PartitionConfig& config,
    const sat::CpSolverResponse& response
) {
    SolverRun run;
    run.status = StatusFromCpSolver(response.status());
    run.solve_time_secs = response.wall_time();

    if (run.status != SolveStatus::OPTIMAL && run.status != SolveStatus::FEASIBLE) {
        run.message = absl::StrCat("no solution: ", SolveStatusName(run.status));
        LOG(WARNING) << "Partition solve failed with " << SolveStatusName(run.status)
                     << " after " << run.solve_time_secs << "s";
        return run;
    }

    run.objective = response.objective_value();

    std::string error;
    if (!ExtractAssignment(response, partition.GetAssignment(), &run.assignment, &error) ||
        !CheckHardConstraints(partition.GetEntities(), config, partition.GetGeometry(),
                              partition.MixedRuleApplied(), run.assignment, &error)) {
        LOG(ERROR) << "Rejecting solver solution: " << error;
        run.status = SolveStatus::MODEL_INVALID;
        run.message = error;
        run.assignment.clear();
        return run;
    }

    run.success = true;
    LOG(INFO) << "Partition solved: " << SolveStatusName(run.status) << ", objective "
              << run.objective << ", " << run.solve_time_secs << "s";
    return run;
}

}  // namespace groupopt
