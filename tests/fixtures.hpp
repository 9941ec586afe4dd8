// tests/fixtures.hpp
// Entity batches shared by the test suites.

#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "entity.hpp"

namespace groupopt {
namespace testing {

inline Entity MakeEntity(int id, const std::string& name, Sex sex,
                         std::map<std::string, std::string> attributes = {}) {
    return Entity{id, name, sex, std::move(attributes)};
}

// num_female F entities named F0..F(k-1), then num_male M entities named M0..
inline std::vector<Entity> MakeBatch(int num_female, int num_male) {
    std::vector<Entity> entities;
    for (int i = 0; i < num_female; ++i) {
        entities.push_back(MakeEntity(static_cast<int>(entities.size()), "F" + std::to_string(i), Sex::F));
    }
    for (int i = 0; i < num_male; ++i) {
        entities.push_back(MakeEntity(static_cast<int>(entities.size()), "M" + std::to_string(i), Sex::M));
    }
    return entities;
}

inline int CountSex(const std::vector<const Entity*>& bin, Sex sex) {
    int count = 0;
    for (const Entity* e : bin) {
        if (e->sex == sex) count++;
    }
    return count;
}

inline int TotalSize(const Bins& bins) {
    int total = 0;
    for (const auto& bin : bins) total += static_cast<int>(bin.size());
    return total;
}

}  // namespace testing
}  // namespace groupopt
