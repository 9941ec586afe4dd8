#pragma once
#include <string>
#include <vector>

#include "ortools/sat/cp_model.h"
#include "ortools/sat/cp_model.pb.h"

#include "entity.hpp"

namespace groupopt {

namespace sat = operations_research::sat;

// Reads the bin of every entity from a solved response. Fails when an entity
// has no bin or more than one.
bool ExtractAssignment(
    const sat::CpSolverResponse& response,
    const std::vector<std::vector<sat::BoolVar>>& variables,
    Assignment* assignment,
    std::string* error
);

// Groups the caller's entities by bin, in bin order and input order within a
// bin. Bins hold pointers into `entities`, which must outlive them.
bool MaterializeBins(
    const std::vector<Entity>& entities,
    int num_bins,
    const Assignment& assignment,
    Bins* bins,
    std::string* error
);

}  // namespace groupopt
