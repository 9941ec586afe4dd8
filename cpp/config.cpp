#include "config.hpp"

#include <algorithm>
#include <set>
#include <utility>

#include "absl/strings/str_cat.h"

namespace groupopt {

namespace {

const char kSpreadPrefix[] = "spread:";
const char kCapPrefix[] = "cap:";

bool CheckBoundPair(const char* label, int lo, int hi, std::string* error) {
    if (lo < -1 || hi < -1) {
        *error = absl::StrCat(label, " bounds must be -1 (unset) or non-negative");
        return false;
    }
    if (lo >= 0 && hi >= 0 && lo > hi) {
        *error = absl::StrCat(label, " minimum ", lo, " exceeds maximum ", hi);
        return false;
    }
    return true;
}

bool HasPrefix(const std::string& s, const char* prefix, std::string* rest) {
    const std::string p(prefix);
    if (s.compare(0, p.size(), p) != 0) return false;
    *rest = s.substr(p.size());
    return true;
}

}  // namespace

bool ValidateConfig(const PartitionConfig& config, std::string* error) {
    if (config.variant == Variant::GROUPS) {
        if (config.group_size <= 0) {
            *error = absl::StrCat("group_size must be positive, got ", config.group_size);
            return false;
        }
    } else {
        if (config.num_bins <= 0) {
            *error = absl::StrCat("num_bins must be positive, got ", config.num_bins);
            return false;
        }
        if (config.min_bin_size < 0) {
            *error = absl::StrCat("min_bin_size must be non-negative, got ", config.min_bin_size);
            return false;
        }
        if (config.max_bin_size < -1 || config.max_bin_size == 0) {
            *error = absl::StrCat("max_bin_size must be positive or -1, got ", config.max_bin_size);
            return false;
        }
        if (config.max_bin_size > 0 && config.min_bin_size > config.max_bin_size) {
            *error = absl::StrCat("min_bin_size ", config.min_bin_size,
                                  " exceeds max_bin_size ", config.max_bin_size);
            return false;
        }
    }

    const CompositionBounds& c = config.composition;
    if (!CheckBoundPair("female", c.min_female, c.max_female, error)) return false;
    if (!CheckBoundPair("male", c.min_male, c.max_male, error)) return false;

    const PenaltyWeights& w = config.weights;
    if (w.size_balance < 0 || w.sex_balance < 0 || w.prior_pairing < 0) {
        *error = "penalty weights must be non-negative";
        return false;
    }

    std::set<std::pair<std::string, AttributeRuleKind>> seen;
    for (const AttributeRule& rule : config.attribute_rules) {
        if (rule.attribute.empty()) {
            *error = "attribute rule with an empty attribute name";
            return false;
        }
        if (rule.weight < 0) {
            *error = absl::StrCat("attribute rule '", rule.attribute, "' has negative weight");
            return false;
        }
        if (rule.kind == AttributeRuleKind::CAP && rule.max_per_bin < 0) {
            *error = absl::StrCat("attribute rule '", rule.attribute, "' has negative max_per_bin");
            return false;
        }
        if (!seen.insert({rule.attribute, rule.kind}).second) {
            *error = absl::StrCat("duplicate attribute rule for '", rule.attribute, "'");
            return false;
        }
    }
    return true;
}

bool ValidateSolveOptions(const SolveOptions& options, std::string* error) {
    if (!(options.time_limit_secs > 0.0)) {
        *error = absl::StrCat("time limit must be positive, got ", options.time_limit_secs);
        return false;
    }
    if (options.num_workers < 0) {
        *error = absl::StrCat("num_workers must be non-negative, got ", options.num_workers);
        return false;
    }
    return true;
}

bool ApplyWeightOverrides(const std::map<std::string, int>& overrides,
                          PartitionConfig* config, std::string* error) {
    for (const auto& entry : overrides) {
        const std::string& name = entry.first;
        const int weight = entry.second;
        if (weight < 0) {
            *error = absl::StrCat("weight for '", name, "' must be non-negative");
            return false;
        }

        if (name == "size_balance") {
            config->weights.size_balance = weight;
            continue;
        }
        if (name == "sex_balance") {
            config->weights.sex_balance = weight;
            continue;
        }
        if (name == "prior_pairing") {
            config->weights.prior_pairing = weight;
            continue;
        }

        std::string attribute;
        AttributeRuleKind kind;
        if (HasPrefix(name, kSpreadPrefix, &attribute)) {
            kind = AttributeRuleKind::SPREAD;
        } else if (HasPrefix(name, kCapPrefix, &attribute)) {
            kind = AttributeRuleKind::CAP;
        } else {
            *error = absl::StrCat("unknown penalty term '", name, "'");
            return false;
        }

        bool found = false;
        for (AttributeRule& rule : config->attribute_rules) {
            if (rule.attribute == attribute && rule.kind == kind) {
                rule.weight = weight;
                found = true;
            }
        }
        if (!found) {
            *error = absl::StrCat("no attribute rule configured for '", name, "'");
            return false;
        }
    }
    return true;
}

BinGeometry ComputeBinGeometry(const PartitionConfig& config, int num_entities) {
    BinGeometry geometry;
    if (config.variant == Variant::GROUPS) {
        // Rounding up keeps every group within group_size even for the remainder
        int bins = CeilDiv(num_entities, config.group_size);
        geometry.num_bins = bins > 0 ? bins : 1;
        geometry.min_size = 0;
        geometry.max_size = config.group_size;
    } else {
        geometry.num_bins = config.num_bins;
        geometry.min_size = config.min_bin_size;
        geometry.max_size = config.max_bin_size >= 0
            ? config.max_bin_size : std::max(num_entities, config.min_bin_size);
    }
    return geometry;
}

int CeilDiv(int numerator, int denominator) {
    return numerator / denominator + (numerator % denominator != 0 ? 1 : 0);
}

const char* VariantName(Variant variant) {
    switch (variant) {
        case Variant::GROUPS: return "groups";
        case Variant::CLASSES: return "classes";
    }
    return "unknown";
}

const char* SexModeName(SexMode mode) {
    switch (mode) {
        case SexMode::NONE: return "none";
        case SexMode::SAME: return "same";
        case SexMode::MIXED: return "mixed";
    }
    return "unknown";
}

}  // namespace groupopt
