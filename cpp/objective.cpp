#include "objective.hpp"

#include <algorithm>
#include <cstdlib>
#include <set>
#include <unordered_map>

#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "ortools/base/logging.h"

namespace groupopt {

namespace {

// Returns nullptr when the attribute is missing or blank
const std::string* AttributeValue(const Entity& entity, const std::string& attribute) {
    auto it = entity.attributes.find(attribute);
    if (it == entity.attributes.end()) return nullptr;
    if (absl::StripAsciiWhitespace(it->second).empty()) return nullptr;
    return &it->second;
}

std::vector<int> Holders(const std::vector<Entity>& entities,
                         const std::string& attribute, const std::string& value) {
    std::vector<int> holders;
    for (size_t i = 0; i < entities.size(); ++i) {
        const std::string* v = AttributeValue(entities[i], attribute);
        if (v != nullptr && *v == value) holders.push_back(static_cast<int>(i));
    }
    return holders;
}

std::string TermName(const AttributeRule& rule, const std::string& value) {
    const char* prefix = rule.kind == AttributeRuleKind::SPREAD ? "spread:" : "cap:";
    return absl::StrCat(prefix, rule.attribute, "=", value);
}

// Class sizes aim at floor(n/k) or ceil(n/k), whichever is nearer; groups aim at group_size
int64_t SizeDeviationValue(const PartitionConfig& config, const BinGeometry& geometry,
                           int num_entities, int64_t size) {
    if (config.variant == Variant::GROUPS) {
        return std::llabs(size - config.group_size);
    }
    const int64_t target_floor = num_entities / geometry.num_bins;
    const int64_t target_ceil = CeilDiv(num_entities, geometry.num_bins);
    return std::min(std::llabs(size - target_floor), std::llabs(size - target_ceil));
}

}  // namespace

std::vector<std::string> DistinctAttributeValues(const std::vector<Entity>& entities,
                                                 const std::string& attribute) {
    std::set<std::string> values;
    for (const Entity& e : entities) {
        const std::string* v = AttributeValue(e, attribute);
        if (v != nullptr) values.insert(*v);
    }
    return std::vector<std::string>(values.begin(), values.end());
}

std::vector<std::pair<int, int>> ResolvePriorPairs(const std::vector<Entity>& entities,
                                                   const std::vector<PriorPair>& pairs) {
    // A repeated name resolves to its last occurrence in the batch
    std::unordered_map<std::string, int> name_to_id;
    for (size_t i = 0; i < entities.size(); ++i) {
        name_to_id[std::string(absl::StripAsciiWhitespace(entities[i].name))] = static_cast<int>(i);
    }

    std::set<std::pair<int, int>> resolved;
    for (const PriorPair& pair : pairs) {
        auto first = name_to_id.find(std::string(absl::StripAsciiWhitespace(pair.first)));
        auto second = name_to_id.find(std::string(absl::StripAsciiWhitespace(pair.second)));
        if (first == name_to_id.end() || second == name_to_id.end()) continue;
        if (first->second == second->second) continue;
        resolved.insert(std::minmax(first->second, second->second));
    }
    return std::vector<std::pair<int, int>>(resolved.begin(), resolved.end());
}

sat::LinearExpr ObjectiveComposer::SizeDeviation(int bin) {
    sat::CpModelBuilder* model = partition->GetModel();
    const BinGeometry& geometry = partition->GetGeometry();
    const int n = partition->NumEntities();
    const int64_t bound = std::max(n, geometry.max_size);
    const sat::IntVar size = partition->GetBinSizes()[bin];

    if (config.variant == Variant::GROUPS) {
        sat::IntVar dev = model->NewIntVar({0, bound}).WithName(absl::StrCat("size_dev_b", bin));
        model->AddAbsEquality(dev, size - config.group_size);
        return dev;
    }

    const int64_t target_floor = n / geometry.num_bins;
    const int64_t target_ceil = CeilDiv(n, geometry.num_bins);
    sat::IntVar dev_floor = model->NewIntVar({0, bound});
    model->AddAbsEquality(dev_floor, size - target_floor);
    if (target_floor == target_ceil) {
        return dev_floor;
    }
    sat::IntVar dev_ceil = model->NewIntVar({0, bound});
    model->AddAbsEquality(dev_ceil, size - target_ceil);
    sat::IntVar dev = model->NewIntVar({0, bound}).WithName(absl::StrCat("size_dev_b", bin));
    model->AddMinEquality(dev, {dev_floor, dev_ceil});
    return dev;
}

void ObjectiveComposer::AddSizeBalanceTerm() {
    sat::LinearExpr total;
    for (int b = 0; b < partition->NumBins(); ++b) {
        total += SizeDeviation(b);
    }
    terms.push_back({"size_balance", config.weights.size_balance, total});
}

void ObjectiveComposer::AddSexBalanceTerm() {
    sat::CpModelBuilder* model = partition->GetModel();
    const int bound = partition->GetGeometry().max_size;

    sat::LinearExpr total;
    for (int b = 0; b < partition->NumBins(); ++b) {
        sat::IntVar imbalance = model->NewIntVar({0, bound}).WithName(absl::StrCat("imbalance_b", b));
        model->AddAbsEquality(imbalance, partition->GetFemaleCount(b) - partition->GetMaleCount(b));
        total += imbalance;
    }
    terms.push_back({"sex_balance", config.weights.sex_balance, total});
}

// (number of bins holding the value) - 1, zero when all holders share a bin
sat::LinearExpr ObjectiveComposer::SpreadTerm(const std::vector<int>& holders) {
    sat::CpModelBuilder* model = partition->GetModel();
    std::vector<sat::BoolVar> has_in_bin;
    for (int b = 0; b < partition->NumBins(); ++b) {
        sat::LinearExpr count = partition->CountInBin(b, holders);
        sat::BoolVar has = model->NewBoolVar();
        model->AddGreaterOrEqual(count, 1).OnlyEnforceIf(has);
        model->AddEquality(count, 0).OnlyEnforceIf(has.Not());
        has_in_bin.push_back(has);
    }
    return sat::LinearExpr::Sum(has_in_bin) - 1;
}

sat::LinearExpr ObjectiveComposer::CapExcessTerm(const std::vector<int>& holders, int max_per_bin) {
    sat::CpModelBuilder* model = partition->GetModel();
    sat::LinearExpr total;
    for (int b = 0; b < partition->NumBins(); ++b) {
        sat::IntVar excess = model->NewIntVar({0, static_cast<int64_t>(holders.size())});
        model->AddGreaterOrEqual(excess, partition->CountInBin(b, holders) - max_per_bin);
        total += excess;
    }
    return total;
}

void ObjectiveComposer::AddAttributeTerms() {
    const std::vector<Entity>& entities = partition->GetEntities();
    for (const AttributeRule& rule : config.attribute_rules) {
        if (rule.weight <= 0) continue;
        for (const std::string& value : DistinctAttributeValues(entities, rule.attribute)) {
            std::vector<int> holders = Holders(entities, rule.attribute, value);
            sat::LinearExpr expr = rule.kind == AttributeRuleKind::SPREAD
                ? SpreadTerm(holders)
                : CapExcessTerm(holders, rule.max_per_bin);
            terms.push_back({TermName(rule, value), rule.weight, expr});
        }
    }
}

int ObjectiveComposer::AddPriorPairingTerm(const std::vector<PriorPair>& pairs) {
    std::vector<std::pair<int, int>> resolved = ResolvePriorPairs(partition->GetEntities(), pairs);
    if (resolved.empty()) return 0;

    sat::CpModelBuilder* model = partition->GetModel();
    const auto& x = partition->GetAssignment();
    sat::LinearExpr total;
    for (const auto& pair : resolved) {
        const int a = pair.first;
        const int c = pair.second;
        for (int b = 0; b < partition->NumBins(); ++b) {
            sat::BoolVar both = model->NewBoolVar().WithName(absl::StrCat("prior_", a, "_", c, "_b", b));
            model->AddBoolAnd({x[a][b], x[c][b]}).OnlyEnforceIf(both);
            model->AddBoolOr({x[a][b].Not(), x[c][b].Not()}).OnlyEnforceIf(both.Not());
            total += both;
        }
    }
    terms.push_back({"prior_pairing", config.weights.prior_pairing, total});
    return static_cast<int>(resolved.size());
}

int ObjectiveComposer::AddAllTerms(const std::vector<PriorPair>& pairs) {
    if (config.weights.size_balance > 0) AddSizeBalanceTerm();
    if (config.sex_mode == SexMode::MIXED && config.weights.sex_balance > 0) AddSexBalanceTerm();
    AddAttributeTerms();

    int resolved = 0;
    if (config.weights.prior_pairing > 0) {
        resolved = AddPriorPairingTerm(pairs);
        if (resolved < static_cast<int>(pairs.size())) {
            VLOG(1) << pairs.size() - resolved << " prior pairs unresolved or duplicated";
        }
    }

    for (const PenaltyTerm& term : terms) {
        VLOG(1) << "Penalty term " << term.name << " weight " << term.weight;
    }
    return resolved;
}

sat::LinearExpr ObjectiveComposer::BuildObjective() const {
    sat::LinearExpr objective;
    for (const PenaltyTerm& term : terms) {
        objective += term.expr * term.weight;
    }
    return objective;
}

ScoreBreakdown ScoreAssignment(
    const std::vector<Entity>& entities,
    const PartitionConfig& config,
    const BinGeometry& geometry,
    const std::vector<PriorPair>& pairs,
    const Assignment& assignment
) {
    const int n = static_cast<int>(entities.size());
    const int num_bins = geometry.num_bins;
    ScoreBreakdown breakdown;

    std::vector<int64_t> sizes(num_bins, 0), females(num_bins, 0), males(num_bins, 0);
    for (int i = 0; i < n; ++i) {
        const int b = assignment[i];
        sizes[b]++;
        if (entities[i].sex == Sex::F) females[b]++;
        if (entities[i].sex == Sex::M) males[b]++;
    }

    if (config.weights.size_balance > 0) {
        int64_t value = 0;
        for (int b = 0; b < num_bins; ++b) {
            value += SizeDeviationValue(config, geometry, n, sizes[b]);
        }
        breakdown.terms.push_back({"size_balance", config.weights.size_balance, value});
    }

    if (config.sex_mode == SexMode::MIXED && config.weights.sex_balance > 0) {
        int64_t value = 0;
        for (int b = 0; b < num_bins; ++b) {
            value += std::llabs(females[b] - males[b]);
        }
        breakdown.terms.push_back({"sex_balance", config.weights.sex_balance, value});
    }

    for (const AttributeRule& rule : config.attribute_rules) {
        if (rule.weight <= 0) continue;
        for (const std::string& value : DistinctAttributeValues(entities, rule.attribute)) {
            std::vector<int64_t> per_bin(num_bins, 0);
            for (int i : Holders(entities, rule.attribute, value)) {
                per_bin[assignment[i]]++;
            }

            int64_t term = 0;
            if (rule.kind == AttributeRuleKind::SPREAD) {
                for (int64_t count : per_bin) {
                    if (count > 0) term++;
                }
                term -= 1;
            } else {
                for (int64_t count : per_bin) {
                    term += std::max<int64_t>(0, count - rule.max_per_bin);
                }
            }
            breakdown.terms.push_back({TermName(rule, value), rule.weight, term});
        }
    }

    if (config.weights.prior_pairing > 0) {
        std::vector<std::pair<int, int>> resolved = ResolvePriorPairs(entities, pairs);
        if (!resolved.empty()) {
            int64_t together = 0;
            for (const auto& pair : resolved) {
                if (assignment[pair.first] == assignment[pair.second]) together++;
            }
            breakdown.terms.push_back({"prior_pairing", config.weights.prior_pairing, together});
        }
    }

    for (const TermScore& term : breakdown.terms) {
        breakdown.total += term.value * term.weight;
    }
    return breakdown;
}

}  // namespace groupopt
