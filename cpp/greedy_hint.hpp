#pragma once
#include <vector>

#include "config.hpp"
#include "entity.hpp"

namespace groupopt {

// Deals entities into bins without search, for use as a CP-SAT solution hint.
// Same-sex mode fills bins one sex at a time; otherwise females and males are
// dealt round-robin so each bin gets a share of both. Bins never exceed
// max_size while room remains elsewhere. The result may violate other hard
// rules, a hint only steers the search.
Assignment BuildGreedyAssignment(
    const std::vector<Entity>& entities,
    const PartitionConfig& config,
    const BinGeometry& geometry
);

}  // namespace groupopt
