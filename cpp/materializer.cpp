#include "materializer.hpp"

#include <utility>

#include "absl/strings/str_cat.h"

namespace groupopt {

bool ExtractAssignment(
    const sat::CpSolverResponse& response,
    const std::vector<std::vector<sat::BoolVar>>& variables,
    Assignment* assignment,
    std::string* error
) {
    assignment->assign(variables.size(), -1);
    for (size_t i = 0; i < variables.size(); ++i) {
        for (size_t b = 0; b < variables[i].size(); ++b) {
            if (!sat::SolutionBooleanValue(response, variables[i][b])) continue;
            if ((*assignment)[i] != -1) {
                *error = absl::StrCat("entity ", i, " assigned to bins ", (*assignment)[i], " and ", b);
                return false;
            }
            (*assignment)[i] = static_cast<int>(b);
        }
        if ((*assignment)[i] == -1) {
            *error = absl::StrCat("entity ", i, " has no bin");
            return false;
        }
    }
    return true;
}

bool MaterializeBins(
    const std::vector<Entity>& entities,
    int num_bins,
    const Assignment& assignment,
    Bins* bins,
    std::string* error
) {
    if (assignment.size() != entities.size()) {
        *error = absl::StrCat("assignment covers ", assignment.size(), " entities, expected ",
                              entities.size());
        return false;
    }

    Bins grouped(num_bins);
    for (size_t i = 0; i < entities.size(); ++i) {
        const int b = assignment[i];
        if (b < 0 || b >= num_bins) {
            *error = absl::StrCat("entity ", i, " assigned to bin ", b, " outside [0, ", num_bins, ")");
            return false;
        }
        grouped[b].push_back(&entities[i]);
    }
    *bins = std::move(grouped);
    return true;
}

}  // namespace groupopt
