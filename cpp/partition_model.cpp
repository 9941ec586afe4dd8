#include "partition_model.hpp"

#include "absl/strings/str_cat.h"
#include "ortools/base/logging.h"

namespace groupopt {

bool MixedRuleApplies(const std::vector<Entity>& entities, int num_bins) {
    int num_female = 0;
    int num_male = 0;
    for (const Entity& e : entities) {
        if (e.sex == Sex::F) num_female++;
        if (e.sex == Sex::M) num_male++;
    }
    return num_female >= num_bins && num_male >= num_bins;
}

PartitionModel::PartitionModel(
    const std::vector<Entity>& entities,
    const BinGeometry& geometry,
    sat::CpModelBuilder* model
) : entities(entities), geometry(geometry), model(model),
    assignment(entities.size()), bin_sizes(geometry.num_bins),
    female_counts(geometry.num_bins), male_counts(geometry.num_bins),
    mixed_rule_applied(false)
{
}

void PartitionModel::InitAssignment() {
    const int num_bins = geometry.num_bins;
    for (size_t i = 0; i < entities.size(); ++i) {
        assignment[i].resize(num_bins);
        for (int b = 0; b < num_bins; ++b) {
            assignment[i][b] = model->NewBoolVar().WithName(absl::StrCat("e", i, "_b", b));
        }
    }

    for (int b = 0; b < num_bins; ++b) {
        sat::LinearExpr females, males;
        for (size_t i = 0; i < entities.size(); ++i) {
            if (entities[i].sex == Sex::F) females += assignment[i][b];
            if (entities[i].sex == Sex::M) males += assignment[i][b];
        }
        female_counts[b] = females;
        male_counts[b] = males;
    }
}

void PartitionModel::AddExactlyOne() {
    for (size_t i = 0; i < entities.size(); ++i) {
        model->AddExactlyOne(assignment[i]);
    }
}

void PartitionModel::AddCapacity() {
    const int n = NumEntities();
    for (int b = 0; b < geometry.num_bins; ++b) {
        sat::LinearExpr occupied;
        for (int i = 0; i < n; ++i) {
            occupied += assignment[i][b];
        }
        bin_sizes[b] = model->NewIntVar({geometry.min_size, geometry.max_size})
                           .WithName(absl::StrCat("size_b", b));
        model->AddEquality(bin_sizes[b], occupied);
    }
}

void PartitionModel::AddCompositionBounds(const CompositionBounds& bounds) {
    for (int b = 0; b < geometry.num_bins; ++b) {
        if (bounds.min_female >= 0) model->AddGreaterOrEqual(female_counts[b], bounds.min_female);
        if (bounds.max_female >= 0) model->AddLessOrEqual(female_counts[b], bounds.max_female);
        if (bounds.min_male >= 0) model->AddGreaterOrEqual(male_counts[b], bounds.min_male);
        if (bounds.max_male >= 0) model->AddLessOrEqual(male_counts[b], bounds.max_male);
    }
}

void PartitionModel::AddSameSexRule() {
    female_only.resize(geometry.num_bins);
    for (int b = 0; b < geometry.num_bins; ++b) {
        female_only[b] = model->NewBoolVar().WithName(absl::StrCat("female_only_b", b));
        model->AddEquality(male_counts[b], 0).OnlyEnforceIf(female_only[b]);
        model->AddEquality(female_counts[b], 0).OnlyEnforceIf(female_only[b].Not());
    }
}

bool PartitionModel::AddMixedSexRule() {
    const int num_bins = geometry.num_bins;
    if (!MixedRuleApplies(entities, num_bins)) {
        LOG(WARNING) << "Skipping mixed-sex rule: fewer than " << num_bins
                     << " members of one sex for " << num_bins << " bins";
        mixed_rule_applied = false;
        return false;
    }

    for (int b = 0; b < num_bins; ++b) {
        model->AddGreaterOrEqual(female_counts[b], 1);
        model->AddGreaterOrEqual(male_counts[b], 1);
    }
    mixed_rule_applied = true;
    return true;
}

sat::LinearExpr PartitionModel::CountInBin(int bin, const std::vector<int>& members) const {
    sat::LinearExpr count;
    for (int i : members) {
        count += assignment[i][bin];
    }
    return count;
}

void PartitionModel::AddAssignmentHint(const Assignment& hint) {
    for (size_t i = 0; i < entities.size() && i < hint.size(); ++i) {
        for (int b = 0; b < geometry.num_bins; ++b) {
            model->AddHint(assignment[i][b], hint[i] == b);
        }
    }
}

void PartitionModel::AddHardConstraints(const PartitionConfig& config) {
    InitAssignment();
    AddExactlyOne();
    AddCapacity();
    AddCompositionBounds(config.composition);

    if (config.sex_mode == SexMode::SAME) {
        AddSameSexRule();
    } else if (config.sex_mode == SexMode::MIXED) {
        AddMixedSexRule();
    }
}

}  // namespace groupopt
