#pragma once
#include <vector>

#include "ortools/sat/cp_model.h"

#include "config.hpp"
#include "entity.hpp"

namespace groupopt {

namespace sat = operations_research::sat;

// Both sexes have at least as many members as there are bins. The mixed-sex
// rule is only enforced when this holds.
bool MixedRuleApplies(const std::vector<Entity>& entities, int num_bins);

// Decision variables and hard constraints of one partition request.
// The CpModelBuilder is owned by the caller and must outlive this object.
class PartitionModel {
private:
    const std::vector<Entity>& entities;
    BinGeometry geometry;
    sat::CpModelBuilder* model;

    // assignment[e][b] is true when entity e is placed in bin b
    std::vector<std::vector<sat::BoolVar>> assignment;
    std::vector<sat::IntVar> bin_sizes;
    std::vector<sat::LinearExpr> female_counts;
    std::vector<sat::LinearExpr> male_counts;
    std::vector<sat::BoolVar> female_only;

    bool mixed_rule_applied;

public:
    explicit PartitionModel(
        const std::vector<Entity>& entities,
        const BinGeometry& geometry,
        sat::CpModelBuilder* model
    );

    int NumEntities() const { return static_cast<int>(entities.size()); }
    int NumBins() const { return geometry.num_bins; }
    bool MixedRuleApplied() const { return mixed_rule_applied; }

    const std::vector<Entity>& GetEntities() const { return entities; }
    const BinGeometry& GetGeometry() const { return geometry; }
    sat::CpModelBuilder* GetModel() const { return model; }
    const std::vector<std::vector<sat::BoolVar>>& GetAssignment() const { return assignment; }
    const std::vector<sat::IntVar>& GetBinSizes() const { return bin_sizes; }
    const sat::LinearExpr& GetFemaleCount(int bin) const { return female_counts[bin]; }
    const sat::LinearExpr& GetMaleCount(int bin) const { return male_counts[bin]; }

    // Creates the entity x bin boolean matrix and the per-bin sex count expressions
    void InitAssignment();

    // Each entity lands in exactly one bin
    void AddExactlyOne();

    // Bin sizes within [min_size, max_size]
    void AddCapacity();

    // Per-bin female/male counts within the configured bounds, unset bounds are skipped
    void AddCompositionBounds(const CompositionBounds& bounds);

    // Every bin is female-only or male-only, selected by one indicator per bin
    void AddSameSexRule();

    // Every bin holds at least one F and one M. Only applied when both sexes have
    // at least as many members as there are bins, otherwise skipped entirely.
    bool AddMixedSexRule();

    // Sum of assignment variables of the given entities in one bin
    sat::LinearExpr CountInBin(int bin, const std::vector<int>& members) const;

    // Seeds the search with one bin per entity
    void AddAssignmentHint(const Assignment& hint);

    // Registers every hard constraint the configuration asks for
    void AddHardConstraints(const PartitionConfig& config);
};

}  // namespace groupopt
