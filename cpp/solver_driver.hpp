#pragma once
#include <string>
#include <vector>

#include "ortools/sat/cp_model.pb.h"
#include "ortools/sat/sat_parameters.pb.h"

#include "config.hpp"
#include "entity.hpp"
#include "partition_model.hpp"

namespace groupopt {

// Outcome codes, also returned across the C boundary
enum class SolveStatus {
    OPTIMAL = 0,
    FEASIBLE = 1,
    INFEASIBLE = 2,
    TIMEOUT_NO_SOLUTION = 3,
    MODEL_INVALID = 4,
    INVALID_CONFIGURATION = 5
};

struct SolverRun {
    SolveStatus status = SolveStatus::MODEL_INVALID;
    bool success = false;
    double objective = 0.0;          // As reported by CP-SAT
    double solve_time_secs = 0.0;
    Assignment assignment;           // Filled only on success
    std::string message;
};

const char* SolveStatusName(SolveStatus status);

SolveStatus StatusFromCpSolver(sat::CpSolverStatus status);

// Time limit, seed, workers and logging from the options, then any extra text
// proto parameters on top. Fails when the text proto does not parse.
bool BuildSatParameters(const SolveOptions& options, sat::SatParameters* parameters,
                        std::string* error);

// Re-checks a finished assignment against every hard rule of the configuration.
bool CheckHardConstraints(
    const std::vector<Entity>& entities,
    const PartitionConfig& config,
    const BinGeometry& geometry,
    bool mixed_rule_applied,
    const Assignment& assignment,
    std::string* violation
);

// Solves the model once within the parameter budget and reads the response.
SolverRun SolvePartition(
    const PartitionModel& partition,
    const PartitionConfig& config,
    const sat::SatParameters& parameters
);

// A feasible or optimal response is extracted and re-checked; any other
// outcome carries no assignment.
SolverRun ReadSolverResponse(
    const PartitionModel& partition,
    const PartitionConfig& config,
    const sat::CpSolverResponse& response
);

}  // namespace groupopt
