// =================================================================
// include/Parley/ModelSelector.hpp
// =================================================================
// Rule-based model and region selection for a single turn.

#pragma once

#include "Parley/ModelRegistry.hpp"
#include "Parley/ModelCapabilities.hpp"
#include <string>
#include <vector>
#include <functional>
#include <optional>

namespace Parley {

/**
 * @brief Outcome of model/region selection for one turn
 */
struct RoutingDecision {
    std::string model_id;          ///< Selected model identifier
    std::string region;            ///< Selected serving region
    size_t reasoning_budget = 0;   ///< Reasoning tokens granted (0 if unused)
    bool degraded = false;         ///< No configured region serves the model
    std::string rule_name;         ///< Name of the rule that fired
    double complexity = 0.0;       ///< Complexity score the decision was made on
};

/**
 * @brief Inputs to a routing decision
 */
struct SelectionInputs {
    double score = 0.0;                 ///< Complexity score in [0, 1]
    int latency_budget_ms = 0;          ///< Time allowed for the first audio
    bool cost_sensitive = false;        ///< Prefer cheaper models
    bool needs_tools = false;           ///< Turn requires tool use
    std::string preferred_region;       ///< Region the caller should be served from
};

/**
 * @brief One entry of the ordered routing table
 */
struct RoutingRule {
    std::string name;                                            ///< Rule identifier for logs
    std::function<bool(const SelectionInputs&)> predicate;       ///< When the rule applies
    std::function<std::optional<ModelProfile>(const SelectionInputs&)> outcome; ///< Model chosen
    bool grants_reasoning = false;                               ///< Attach the reasoning budget
};

/**
 * @brief Configuration for ModelSelector
 */
struct ModelSelectorConfig {
    size_t reasoning_budget_tokens = 8000;   ///< Budget granted by the deep-reasoning rule
};

/**
 * @brief Maps complexity and turn constraints to a (model, region) pair
 *
 * Rules are evaluated top to bottom and the first matching rule wins.
 * Selection depends only on its inputs and the model table; the selector
 * holds no mutable state.
 */
class ModelSelector {
public:
    /**
     * @brief Constructor
     * @param registry Model table; must outlive the selector
     * @param config Selector configuration
     */
    ModelSelector(const ModelRegistry& registry, const ModelSelectorConfig& config = ModelSelectorConfig());

    virtual ~ModelSelector() = default;

    ModelSelector(const ModelSelector&) = delete;
    ModelSelector& operator=(const ModelSelector&) = delete;

    /**
     * @brief Select a model and region
     * @param score Complexity score
     * @param latency_budget_ms Latency budget in milliseconds
     * @param cost_sensitive Prefer cheaper models where the rule allows
     * @param needs_tools Turn requires a tool-capable model
     * @param preferred_region Region to serve from if available
     * @return Routing decision (degraded if no region serves the model)
     */
    virtual RoutingDecision select(double score, int latency_budget_ms, bool cost_sensitive,
                                   bool needs_tools, const std::string& preferred_region) const;

    virtual RoutingDecision select(const SelectionInputs& inputs) const;

    /**
     * @brief Evaluate a single rule's predicate
     * @return True if the named rule would fire for the inputs
     * @throws std::invalid_argument if no rule has that name
     */
    bool evaluateRule(const std::string& rule_name, const SelectionInputs& inputs) const;

    /**
     * @brief Ordered routing table
     */
    const std::vector<RoutingRule>& getRules() const { return m_rules; }

    const ModelSelectorConfig& getConfig() const { return m_config; }

private:
    const ModelRegistry& m_registry;
    ModelSelectorConfig m_config;
    std::vector<RoutingRule> m_rules;

    void buildRules();

    /**
     * @brief Profiles of a tier, or the whole table if the tier is empty
     */
    std::vector<ModelProfile> candidates(ModelTier tier) const;

    std::optional<ModelProfile> mostCapable(const std::vector<ModelProfile>& profiles) const;
    std::optional<ModelProfile> fastest(const std::vector<ModelProfile>& profiles) const;
    std::optional<ModelProfile> cheapest(const std::vector<ModelProfile>& profiles) const;

    void resolveRegion(RoutingDecision& decision, const std::string& preferred_region) const;
};

} // namespace Parley
