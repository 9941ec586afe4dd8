#pragma once
#include <map>
#include <string>
#include <vector>

namespace groupopt {

// Study groups derive their count from a maximum size, classes have a fixed count
enum class Variant {
    GROUPS = 0,
    CLASSES = 1
};

enum class SexMode {
    NONE = 0,   // No sex composition rule
    SAME = 1,   // Every bin is single-sex
    MIXED = 2   // Every bin has both sexes when there are enough of each
};

enum class AttributeRuleKind {
    SPREAD = 0,  // Prefer holders of a value concentrated in as few bins as possible
    CAP = 1      // Prefer at most max_per_bin holders of a value per bin
};

// Soft rule over one categorical attribute, instantiated once per distinct value
struct AttributeRule {
    std::string attribute;
    AttributeRuleKind kind = AttributeRuleKind::SPREAD;
    int weight = 5;
    int max_per_bin = 2;  // CAP only
};

struct PenaltyWeights {
    int size_balance = 1;
    int sex_balance = 2;
    int prior_pairing = 10;
};

// Value -1 leaves a bound unset
struct CompositionBounds {
    int min_female = -1;
    int max_female = -1;
    int min_male = -1;
    int max_male = -1;
};

struct PartitionConfig {
    Variant variant = Variant::GROUPS;

    // GROUPS
    int group_size = 4;

    // CLASSES
    int num_bins = 1;
    int min_bin_size = 0;
    int max_bin_size = -1;  // -1 = no upper bound

    SexMode sex_mode = SexMode::NONE;
    CompositionBounds composition;
    std::vector<AttributeRule> attribute_rules;
    PenaltyWeights weights;
};

struct SolveOptions {
    double time_limit_secs = 30.0;
    int random_seed = 42;
    int num_workers = 0;             // 0 keeps the CP-SAT default
    bool use_greedy_hint = false;
    bool log_search_progress = false;
    std::string solver_parameters;   // Extra SatParameters in text proto format
    std::vector<int> initial_assignment;  // Optional warm start, one bin per entity
};

struct BinGeometry {
    int num_bins;
    int min_size;
    int max_size;
};

// Rejects contradictory bounds and negative weights before any model is built
bool ValidateConfig(const PartitionConfig& config, std::string* error);

bool ValidateSolveOptions(const SolveOptions& options, std::string* error);

// Overrides weights by term name: "size_balance", "sex_balance", "prior_pairing",
// "spread:<attribute>" or "cap:<attribute>" for an already configured rule.
bool ApplyWeightOverrides(const std::map<std::string, int>& overrides,
                          PartitionConfig* config, std::string* error);

// Groups: ceil(n / group_size) bins (at least one) of at most group_size members.
// Classes: the configured count and interval, an unset maximum becomes
// max(n, min_bin_size).
BinGeometry ComputeBinGeometry(const PartitionConfig& config, int num_entities);

// ceil(numerator / denominator) for numerator >= 0, denominator > 0, without overflow
int CeilDiv(int numerator, int denominator);

const char* VariantName(Variant variant);
const char* SexModeName(SexMode mode);

}  // namespace groupopt
