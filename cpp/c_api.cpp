#include "group_optimiser.h"

#include <cstdio>
#include <string>
#include <vector>

#include "config.hpp"
#include "entity.hpp"
#include "partitioner.hpp"

using namespace groupopt;

namespace {

bool ToConfig(const PartitionSettings& settings, const AttributeRuleSpec* rules, int num_rules,
              PartitionConfig* config, std::string* error) {
    if (settings.variant < 0 || settings.variant > 1) {
        *error = "unknown variant";
        return false;
    }
    if (settings.sex_mode < 0 || settings.sex_mode > 2) {
        *error = "unknown sex mode";
        return false;
    }

    config->variant = static_cast<Variant>(settings.variant);
    config->group_size = settings.group_size;
    config->num_bins = settings.num_bins;
    config->min_bin_size = settings.min_bin_size;
    config->max_bin_size = settings.max_bin_size;
    config->sex_mode = static_cast<SexMode>(settings.sex_mode);
    config->composition.min_female = settings.min_female;
    config->composition.max_female = settings.max_female;
    config->composition.min_male = settings.min_male;
    config->composition.max_male = settings.max_male;
    config->weights.size_balance = settings.size_balance_weight;
    config->weights.sex_balance = settings.sex_balance_weight;
    config->weights.prior_pairing = settings.prior_pairing_weight;

    for (int r = 0; r < num_rules; ++r) {
        const AttributeRuleSpec& spec = rules[r];
        if (spec.kind < 0 || spec.kind > 1) {
            *error = "unknown attribute rule kind";
            return false;
        }
        AttributeRule rule;
        rule.attribute = spec.attribute != nullptr ? spec.attribute : "";
        rule.kind = static_cast<AttributeRuleKind>(spec.kind);
        rule.weight = spec.weight;
        rule.max_per_bin = spec.max_per_bin;
        config->attribute_rules.push_back(rule);
    }
    return true;
}

bool ToEntities(const StudentRecord* students, int num_students,
                const char* const* attribute_names, int num_attribute_names,
                std::vector<Entity>* entities, std::string* error) {
    entities->reserve(num_students);
    for (int i = 0; i < num_students; ++i) {
        const StudentRecord& s = students[i];
        if (s.sex < 0 || s.sex > 2) {
            *error = "unknown sex code for student " + std::to_string(i);
            return false;
        }

        Entity e;
        e.id = i;
        e.name = s.name != nullptr ? s.name : "";
        e.sex = static_cast<Sex>(s.sex);
        if (s.attribute_values != nullptr) {
            for (int a = 0; a < num_attribute_names; ++a) {
                if (attribute_names[a] == nullptr || s.attribute_values[a] == nullptr) continue;
                e.attributes[attribute_names[a]] = s.attribute_values[a];
            }
        }
        entities->push_back(e);
    }
    return true;
}

void SetMessage(PartitionSolveResult* result, const std::string& message) {
    std::snprintf(result->message, sizeof(result->message), "%s", message.c_str());
}

PartitionSolveResult InvalidRequest(const std::string& message) {
    PartitionSolveResult result = {false, static_cast<int>(SolveStatus::INVALID_CONFIGURATION),
                                   0, 0.0, 0.0, 0.0, false, 0, {0}};
    SetMessage(&result, message);
    return result;
}

}  // namespace

extern "C" {

__attribute__((visibility("default")))
PartitionSettings DefaultPartitionSettings(void) {
    PartitionConfig config;
    PartitionSettings settings;
    settings.variant = static_cast<int>(config.variant);
    settings.group_size = config.group_size;
    settings.num_bins = config.num_bins;
    settings.min_bin_size = config.min_bin_size;
    settings.max_bin_size = config.max_bin_size;
    settings.sex_mode = static_cast<int>(config.sex_mode);
    settings.min_female = config.composition.min_female;
    settings.max_female = config.composition.max_female;
    settings.min_male = config.composition.min_male;
    settings.max_male = config.composition.max_male;
    settings.size_balance_weight = config.weights.size_balance;
    settings.sex_balance_weight = config.weights.sex_balance;
    settings.prior_pairing_weight = config.weights.prior_pairing;
    return settings;
}

__attribute__((visibility("default")))
int ComputeBinCount(const PartitionSettings* settings, int num_students) {
    if (settings == nullptr || num_students < 0) return -1;
    PartitionConfig config;
    std::string error;
    if (!ToConfig(*settings, nullptr, 0, &config, &error) || !ValidateConfig(config, &error)) {
        return -1;
    }
    return ComputeBinGeometry(config, num_students).num_bins;
}

__attribute__((visibility("default")))
PartitionSolveResult OptimisePartition(
    const StudentRecord* students, int num_students,
    const char* const* attribute_names, int num_attribute_names,
    const PartitionSettings* settings,
    const AttributeRuleSpec* rules, int num_rules,
    const PriorPairing* pairs, int num_pairs,
    const int* initial_assignment,
    int* out_bin_assignment,
    const double* max_runtime_secs,
    const int* random_seed,
    const bool* use_greedy_hint,
    const bool* score_only
) {
    if (settings == nullptr || num_students < 0 || (num_students > 0 && students == nullptr)) {
        return InvalidRequest("missing students or settings");
    }
    if (num_attribute_names < 0 || num_rules < 0 || num_pairs < 0) {
        return InvalidRequest("negative array length");
    }
    if ((num_attribute_names > 0 && attribute_names == nullptr) ||
        (num_rules > 0 && rules == nullptr) ||
        (num_pairs > 0 && pairs == nullptr)) {
        return InvalidRequest("missing attribute names, rules or prior pairs for a non-zero count");
    }

    PartitionConfig config;
    std::vector<Entity> entities;
    std::string error;
    if (!ToConfig(*settings, rules, num_rules, &config, &error) ||
        !ToEntities(students, num_students, attribute_names, num_attribute_names, &entities, &error)) {
        return InvalidRequest(error);
    }

    std::vector<PriorPair> prior_pairs;
    for (int p = 0; p < num_pairs; ++p) {
        if (pairs[p].first == nullptr || pairs[p].second == nullptr) continue;
        prior_pairs.push_back({pairs[p].first, pairs[p].second});
    }

    Assignment hint;
    if (initial_assignment != nullptr) {
        hint.assign(initial_assignment, initial_assignment + num_students);
    }

    PartitionResult partition;
    if (score_only != nullptr && *score_only) {
        if (initial_assignment == nullptr) {
            return InvalidRequest("score_only needs an initial assignment");
        }
        partition = ScorePartition(entities, config, prior_pairs, hint);
    } else {
        SolveOptions options;
        options.time_limit_secs = (max_runtime_secs != nullptr) ? *max_runtime_secs : 30.0;
        options.random_seed = (random_seed != nullptr) ? *random_seed : 42;
        options.use_greedy_hint = (use_greedy_hint != nullptr) ? *use_greedy_hint : false;
        options.initial_assignment = hint;
        partition = Partition(entities, config, prior_pairs, options);
    }

    PartitionSolveResult result = {partition.success, static_cast<int>(partition.status),
                                   partition.num_bins, static_cast<double>(partition.objective),
                                   partition.solver_objective, partition.solve_time_secs,
                                   partition.mixed_rule_applied, partition.resolved_prior_pairs,
                                   {0}};
    SetMessage(&result, partition.message);

    if (out_bin_assignment != nullptr) {
        for (int i = 0; i < num_students; ++i) {
            out_bin_assignment[i] = partition.success ? partition.assignment[i] : -1;
        }
    }
    return result;
}

}  // extern "C"
