// =================================================================
// src/Parley/ModelCapabilities.cpp
// =================================================================
// Implementation of model profile and capability utilities.

#include "Parley/ModelCapabilities.hpp"
#include <stdexcept>
#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace Parley {

bool ModelProfile::supportsTools() const {
    return ModelCapabilityUtils::hasCapability(*this, ModelCapability::TOOL_USE);
}

bool ModelProfile::supportsExtendedReasoning() const {
    return ModelCapabilityUtils::hasCapability(*this, ModelCapability::EXTENDED_REASONING);
}

bool ModelProfile::supportsVision() const {
    return ModelCapabilityUtils::hasCapability(*this, ModelCapability::VISION);
}

bool ModelProfile::isAvailableIn(const std::string& region) const {
    return std::find(regions.begin(), regions.end(), region) != regions.end();
}

std::string ModelCapabilityUtils::capabilityToString(ModelCapability capability) {
    switch (capability) {
        case ModelCapability::TOOL_USE:
            return "TOOL_USE";
        case ModelCapability::EXTENDED_REASONING:
            return "EXTENDED_REASONING";
        case ModelCapability::VISION:
            return "VISION";
        default:
            throw std::invalid_argument("Unknown ModelCapability value");
    }
}

ModelCapability ModelCapabilityUtils::stringToCapability(const std::string& str) {
    static const std::unordered_map<std::string, ModelCapability> capability_map = {
        {"TOOL_USE", ModelCapability::TOOL_USE},
        {"EXTENDED_REASONING", ModelCapability::EXTENDED_REASONING},
        {"VISION", ModelCapability::VISION}
    };

    auto it = capability_map.find(str);
    if (it != capability_map.end()) {
        return it->second;
    }

    throw std::invalid_argument("Unknown capability string: " + str);
}

std::string ModelCapabilityUtils::tierToString(ModelTier tier) {
    switch (tier) {
        case ModelTier::FAST: return "fast";
        case ModelTier::BALANCED: return "balanced";
        case ModelTier::CAPABLE: return "capable";
        case ModelTier::FLAGSHIP: return "flagship";
        default:
            throw std::invalid_argument("Unknown ModelTier value");
    }
}

ModelTier ModelCapabilityUtils::stringToTier(const std::string& str) {
    std::string normalized = str;
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (normalized == "fast") return ModelTier::FAST;
    if (normalized == "balanced") return ModelTier::BALANCED;
    if (normalized == "capable") return ModelTier::CAPABLE;
    if (normalized == "flagship") return ModelTier::FLAGSHIP;

    throw std::invalid_argument("Unknown tier string: " + str);
}

bool ModelCapabilityUtils::hasCapability(const ModelProfile& profile, ModelCapability capability) {
    return std::find(profile.capabilities.begin(), profile.capabilities.end(), capability)
           != profile.capabilities.end();
}

std::vector<std::string> ModelCapabilityUtils::capabilitiesToStrings(const std::vector<ModelCapability>& capabilities) {
    std::vector<std::string> result;
    result.reserve(capabilities.size());

    for (const auto& capability : capabilities) {
        result.push_back(capabilityToString(capability));
    }

    return result;
}

std::vector<ModelCapability> ModelCapabilityUtils::parseCapabilities(const std::vector<std::string>& capability_strings) {
    std::vector<ModelCapability> result;
    result.reserve(capability_strings.size());

    for (const auto& str : capability_strings) {
        result.push_back(stringToCapability(str));
    }

    return result;
}

} // namespace Parley
