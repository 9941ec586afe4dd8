#pragma once
#include <map>
#include <string>
#include <vector>

namespace groupopt {

enum class Sex {
    F = 0,
    M = 1,
    UNSPECIFIED = 2
};

// Describes one person to be placed in a bin
struct Entity {
    int id;                                         // Dense, 0-based, equal to the position in the batch
    std::string name;
    Sex sex;
    std::map<std::string, std::string> attributes;  // Missing or blank values count as absent
};

// Two names that shared a bin in an earlier run
struct PriorPair {
    std::string first;
    std::string second;
};

// Entity index -> bin index
using Assignment = std::vector<int>;

// Bins in bin order, each holding references into the caller's entity batch
using Bins = std::vector<std::vector<const Entity*>>;

}  // namespace groupopt
