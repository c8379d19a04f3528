// =================================================================
// include/Parley/ModelCapabilities.hpp
// =================================================================
// Static model descriptors and capability flags used for routing.

#pragma once

#include <string>
#include <vector>

namespace Parley {

/**
 * @brief Enumeration of model capability flags
 */
enum class ModelCapability {
    TOOL_USE,           ///< Accepts tool specifications
    EXTENDED_REASONING, ///< Accepts a reasoning budget
    VISION              ///< Accepts image input
};

/**
 * @brief Coarse latency/quality tier of a model
 */
enum class ModelTier {
    FAST,       ///< Lowest latency, used for short confirmations
    BALANCED,   ///< Default conversational tier
    CAPABLE,    ///< Stronger reasoning at higher latency
    FLAGSHIP    ///< Most capable, highest latency
};

/**
 * @brief Immutable descriptor of one generation model
 *
 * Ranks are relative within the configured table: a higher
 * intelligence_rank is more capable, a higher speed_rank is faster and a
 * higher cost_rank is more expensive.
 */
struct ModelProfile {
    std::string id;                         ///< Model identifier sent to the provider
    std::string description;                ///< Human-readable description
    ModelTier tier = ModelTier::BALANCED;   ///< Routing tier
    int intelligence_rank = 0;              ///< Higher is more capable
    int speed_rank = 0;                     ///< Higher is faster
    int cost_rank = 0;                      ///< Higher is more expensive
    size_t max_output_tokens = 4096;        ///< Output token ceiling
    size_t max_reasoning_tokens = 0;        ///< Reasoning budget ceiling (0 = none)
    std::vector<ModelCapability> capabilities; ///< Capability flags
    std::vector<std::string> regions;       ///< Regions where the model is served

    bool supportsTools() const;
    bool supportsExtendedReasoning() const;
    bool supportsVision() const;
    bool isAvailableIn(const std::string& region) const;
};

/**
 * @brief Utility functions for model capabilities and tiers
 */
class ModelCapabilityUtils {
public:
    /**
     * @brief Convert capability enum to string representation
     */
    static std::string capabilityToString(ModelCapability capability);

    /**
     * @brief Convert string to capability enum
     * @return ModelCapability or throws std::invalid_argument if invalid
     */
    static ModelCapability stringToCapability(const std::string& str);

    static std::string tierToString(ModelTier tier);

    /**
     * @brief Convert string (fast, balanced, capable, flagship) to tier
     * @return ModelTier or throws std::invalid_argument if invalid
     */
    static ModelTier stringToTier(const std::string& str);

    static bool hasCapability(const ModelProfile& profile, ModelCapability capability);

    static std::vector<std::string> capabilitiesToStrings(const std::vector<ModelCapability>& capabilities);

    static std::vector<ModelCapability> parseCapabilities(const std::vector<std::string>& capability_strings);
};

} // namespace Parley
