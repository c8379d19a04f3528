// =================================================================
// src/Parley/ModelSelector.cpp
// =================================================================
// Implementation of the rule-based model/region selector.

#include "Parley/ModelSelector.hpp"
#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace Parley {

ModelSelector::ModelSelector(const ModelRegistry& registry, const ModelSelectorConfig& config)
    : m_registry(registry), m_config(config) {
    buildRules();
}

void ModelSelector::buildRules() {
    m_rules.clear();

    // 1. Hard question with time to think
    m_rules.push_back({
        "deep_reasoning",
        [](const SelectionInputs& in) { return in.score > 0.9 && in.latency_budget_ms > 1000; },
        [this](const SelectionInputs&) -> std::optional<ModelProfile> {
            auto profiles = m_registry.getProfiles();
            std::vector<ModelProfile> reasoning;
            std::copy_if(profiles.begin(), profiles.end(), std::back_inserter(reasoning),
                         [](const ModelProfile& p) { return p.supportsExtendedReasoning(); });
            return mostCapable(reasoning.empty() ? profiles : reasoning);
        },
        true
    });

    // 2. Simple utterance under a tight budget
    m_rules.push_back({
        "fast_simple",
        [](const SelectionInputs& in) { return in.score < 0.3 && in.latency_budget_ms < 150; },
        [this](const SelectionInputs& in) -> std::optional<ModelProfile> {
            auto fast = candidates(ModelTier::FAST);
            return in.cost_sensitive ? cheapest(fast) : mostCapable(fast);
        },
        false
    });

    // 3. Moderate utterance under a tight budget
    m_rules.push_back({
        "fast_tier",
        [](const SelectionInputs& in) { return in.score < 0.6 && in.latency_budget_ms < 200; },
        [this](const SelectionInputs&) { return fastest(candidates(ModelTier::FAST)); },
        false
    });

    // 4. Tool use
    m_rules.push_back({
        "tool_use",
        [](const SelectionInputs& in) { return in.needs_tools; },
        [this](const SelectionInputs&) -> std::optional<ModelProfile> {
            auto with_tools = [](const std::vector<ModelProfile>& profiles) {
                std::vector<ModelProfile> result;
                std::copy_if(profiles.begin(), profiles.end(), std::back_inserter(result),
                             [](const ModelProfile& p) { return p.supportsTools(); });
                return result;
            };
            auto balanced = with_tools(m_registry.getProfilesInTier(ModelTier::BALANCED));
            if (!balanced.empty()) {
                return mostCapable(balanced);
            }
            auto any = with_tools(m_registry.getProfiles());
            if (!any.empty()) {
                return mostCapable(any);
            }
            return mostCapable(candidates(ModelTier::BALANCED));
        },
        false
    });

    // 5. Complex utterance without time for extended reasoning
    m_rules.push_back({
        "capable",
        [](const SelectionInputs& in) { return in.score > 0.7; },
        [this](const SelectionInputs&) -> std::optional<ModelProfile> {
            auto capable = m_registry.getProfilesInTier(ModelTier::CAPABLE);
            if (capable.empty()) {
                capable = candidates(ModelTier::FLAGSHIP);
            }
            return mostCapable(capable);
        },
        false
    });

    // 6. Everything else
    m_rules.push_back({
        "balanced",
        [](const SelectionInputs&) { return true; },
        [this](const SelectionInputs&) { return mostCapable(candidates(ModelTier::BALANCED)); },
        false
    });
}

RoutingDecision ModelSelector::select(double score, int latency_budget_ms, bool cost_sensitive,
                                      bool needs_tools, const std::string& preferred_region) const {
    SelectionInputs inputs;
    inputs.score = score;
    inputs.latency_budget_ms = latency_budget_ms;
    inputs.cost_sensitive = cost_sensitive;
    inputs.needs_tools = needs_tools;
    inputs.preferred_region = preferred_region;
    return select(inputs);
}

RoutingDecision ModelSelector::select(const SelectionInputs& inputs) const {
    RoutingDecision decision;
    decision.complexity = inputs.score;
    decision.region = inputs.preferred_region;

    for (const auto& rule : m_rules) {
        if (!rule.predicate(inputs)) {
            continue;
        }

        decision.rule_name = rule.name;
        auto profile = rule.outcome(inputs);
        if (!profile) {
            // Empty model table; nothing can serve the turn
            decision.degraded = true;
            return decision;
        }

        decision.model_id = profile->id;
        if (rule.grants_reasoning && profile->supportsExtendedReasoning()) {
            decision.reasoning_budget = m_config.reasoning_budget_tokens;
        }
        break;
    }

    resolveRegion(decision, inputs.preferred_region);
    return decision;
}

bool ModelSelector::evaluateRule(const std::string& rule_name, const SelectionInputs& inputs) const {
    for (const auto& rule : m_rules) {
        if (rule.name == rule_name) {
            return rule.predicate(inputs);
        }
    }
    throw std::invalid_argument("Unknown routing rule: " + rule_name);
}

std::vector<ModelProfile> ModelSelector::candidates(ModelTier tier) const {
    auto profiles = m_registry.getProfilesInTier(tier);
    if (profiles.empty()) {
        profiles = m_registry.getProfiles();
    }
    return profiles;
}

// Profiles arrive ordered by id and std::max_element/min_element return the
// first of equal elements, so ties always resolve the same way.

std::optional<ModelProfile> ModelSelector::mostCapable(const std::vector<ModelProfile>& profiles) const {
    if (profiles.empty()) {
        return std::nullopt;
    }
    return *std::max_element(profiles.begin(), profiles.end(),
        [](const ModelProfile& a, const ModelProfile& b) {
            return a.intelligence_rank < b.intelligence_rank;
        });
}

std::optional<ModelProfile> ModelSelector::fastest(const std::vector<ModelProfile>& profiles) const {
    if (profiles.empty()) {
        return std::nullopt;
    }
    return *std::max_element(profiles.begin(), profiles.end(),
        [](const ModelProfile& a, const ModelProfile& b) {
            return a.speed_rank < b.speed_rank;
        });
}

std::optional<ModelProfile> ModelSelector::cheapest(const std::vector<ModelProfile>& profiles) const {
    if (profiles.empty()) {
        return std::nullopt;
    }
    return *std::min_element(profiles.begin(), profiles.end(),
        [](const ModelProfile& a, const ModelProfile& b) {
            if (a.cost_rank != b.cost_rank) {
                return a.cost_rank < b.cost_rank;
            }
            return a.speed_rank > b.speed_rank;
        });
}

void ModelSelector::resolveRegion(RoutingDecision& decision, const std::string& preferred_region) const {
    auto profile = m_registry.findProfile(decision.model_id);
    if (!profile) {
        return;
    }

    // No preference: serve from the model's home region
    if (preferred_region.empty()) {
        decision.region = profile->regions.empty() ? "" : profile->regions.front();
        decision.degraded = profile->regions.empty();
        return;
    }

    if (profile->isAvailableIn(preferred_region)) {
        decision.region = preferred_region;
        return;
    }

    for (const auto& region : m_registry.getFallbackRegions()) {
        if (profile->isAvailableIn(region)) {
            decision.region = region;
            return;
        }
    }

    decision.region = preferred_region;
    decision.degraded = true;
}

} // namespace Parley
