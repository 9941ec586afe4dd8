#include "greedy_hint.hpp"

#include <algorithm>

namespace groupopt {

namespace {

// Females first, then males, then anyone without a recorded sex
std::vector<int> OrderBySex(const std::vector<Entity>& entities) {
    std::vector<int> order;
    order.reserve(entities.size());
    for (Sex sex : {Sex::F, Sex::M, Sex::UNSPECIFIED}) {
        for (size_t i = 0; i < entities.size(); ++i) {
            if (entities[i].sex == sex) order.push_back(static_cast<int>(i));
        }
    }
    return order;
}

int LeastFilledBin(const std::vector<int>& sizes) {
    return static_cast<int>(std::min_element(sizes.begin(), sizes.end()) - sizes.begin());
}

}  // namespace

Assignment BuildGreedyAssignment(
    const std::vector<Entity>& entities,
    const PartitionConfig& config,
    const BinGeometry& geometry
) {
    const int n = static_cast<int>(entities.size());
    const int num_bins = geometry.num_bins;
    Assignment assignment(n, 0);
    std::vector<int> sizes(num_bins, 0);
    std::vector<int> order = OrderBySex(entities);

    if (config.sex_mode == SexMode::SAME) {
        // Fill bins one after another, opening a fresh bin when the sex changes
        const int fill = std::min(geometry.max_size, CeilDiv(n, num_bins));
        int bin = 0;
        Sex current = order.empty() ? Sex::F : entities[order[0]].sex;
        for (int i : order) {
            const bool sex_changed = entities[i].sex != current;
            current = entities[i].sex;
            if ((sex_changed && sizes[bin] > 0) || sizes[bin] >= fill) {
                if (bin + 1 < num_bins) bin++;
            }
            int target = sizes[bin] < geometry.max_size ? bin : LeastFilledBin(sizes);
            assignment[i] = target;
            sizes[target]++;
        }
        return assignment;
    }

    int bin = 0;
    for (int i : order) {
        int target = -1;
        for (int step = 0; step < num_bins; ++step) {
            int candidate = (bin + step) % num_bins;
            if (sizes[candidate] < geometry.max_size) {
                target = candidate;
                break;
            }
        }
        if (target == -1) target = LeastFilledBin(sizes);
        assignment[i] = target;
        sizes[target]++;
        bin = (target + 1) % num_bins;
    }
    return assignment;
}

}  // namespace groupopt
