#pragma once
#include <cstdint>

// Standard C++ protection for C-compatible headers
#ifdef __cplusplus
extern "C" {
#endif

struct StudentRecord {
    const char* name;
    int sex;                               // 0 = F, 1 = M, 2 = unspecified
    const char* const* attribute_values;   // One per attribute name, entries may be null
};

struct AttributeRuleSpec {
    const char* attribute;
    int kind;          // 0 = spread, 1 = cap
    int weight;
    int max_per_bin;
};

struct PriorPairing {
    const char* first;
    const char* second;
};

struct PartitionSettings {
    int variant;       // 0 = groups, 1 = classes
    int group_size;
    int num_bins;
    int min_bin_size;
    int max_bin_size;
    int sex_mode;      // 0 = none, 1 = same, 2 = mixed
    int min_female;
    int max_female;
    int min_male;
    int max_male;
    int size_balance_weight;
    int sex_balance_weight;
    int prior_pairing_weight;
};

struct PartitionSolveResult {
    bool success;
    int status_code;
    int num_bins;
    double objective;
    double solver_objective;
    double solve_time_secs;
    bool mixed_rule_applied;
    int resolved_prior_pairs;
    char message[256];
};

PartitionSettings DefaultPartitionSettings(void);

// Number of bins the settings produce for num_students, or -1 when the
// settings are invalid. Callers size hint buffers with it.
int ComputeBinCount(const PartitionSettings* settings, int num_students);

// out_bin_assignment receives one bin index per student on success.
// Null optional pointers fall back to defaults: 30s, seed 42, no greedy hint,
// full solve. With score_only set, initial_assignment is scored instead.
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
);

#ifdef __cplusplus
}
#endif
