// =================================================================
// src/Parley/ModelRegistry.cpp
// =================================================================
// Implementation of the static model table.

#include "Parley/ModelRegistry.hpp"
#include "Parley/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <sstream>
#include <algorithm>

namespace Parley {

namespace {

std::vector<std::string> readStringList(const YAML::Node& node) {
    std::vector<std::string> values;
    if (node && node.IsSequence()) {
        for (const auto& item : node) {
            values.push_back(item.as<std::string>());
        }
    }
    return values;
}

// Parses one entry of the `models` map. Capability and tier names are
// validated here; unknown names throw std::invalid_argument.
ModelProfile parseProfile(const std::string& id, const YAML::Node& node) {
    ModelProfile profile;
    profile.id = id;

    if (node["description"]) {
        profile.description = node["description"].as<std::string>();
    }
    if (node["tier"]) {
        profile.tier = ModelCapabilityUtils::stringToTier(node["tier"].as<std::string>());
    }
    if (node["intelligence_rank"]) {
        profile.intelligence_rank = node["intelligence_rank"].as<int>();
    }
    if (node["speed_rank"]) {
        profile.speed_rank = node["speed_rank"].as<int>();
    }
    if (node["cost_rank"]) {
        profile.cost_rank = node["cost_rank"].as<int>();
    }
    if (node["max_output_tokens"]) {
        profile.max_output_tokens = node["max_output_tokens"].as<size_t>();
    }
    if (node["max_reasoning_tokens"]) {
        profile.max_reasoning_tokens = node["max_reasoning_tokens"].as<size_t>();
    }

    profile.capabilities = ModelCapabilityUtils::parseCapabilities(readStringList(node["capabilities"]));
    profile.regions = readStringList(node["regions"]);

    return profile;
}

} // namespace

ModelRegistry::ModelRegistry() {
    m_status.last_update = std::chrono::system_clock::now();
}

RegistryStatus ModelRegistry::loadFromConfig(const std::string& config_path) {
    Logger::getInstance().info("ModelRegistry", "Loading models from configuration: " + config_path);
    return loadDocument(config_path, true);
}

RegistryStatus ModelRegistry::loadFromString(const std::string& yaml_text) {
    return loadDocument(yaml_text, false);
}

RegistryStatus ModelRegistry::loadDocument(const std::string& source, bool is_file) {
    RegistryStatus status;
    status.last_update = std::chrono::system_clock::now();

    std::map<std::string, ModelProfile> profiles;
    std::vector<std::string> fallback_regions;
    std::vector<std::string> degradation_chain;

    try {
        YAML::Node root = is_file ? YAML::LoadFile(source) : YAML::Load(source);

        if (!root["models"]) {
            Logger::getInstance().warning("ModelRegistry", "No 'models' section in configuration");
        } else {
            const YAML::Node models = root["models"];
            for (YAML::const_iterator it = models.begin(); it != models.end(); ++it) {
                ModelLoadResult result;
                result.model_id = it->first.as<std::string>();
                status.total_configured++;

                try {
                    ModelProfile profile = parseProfile(result.model_id, it->second);
                    if (validateProfile(profile, result.error_message)) {
                        profiles[profile.id] = profile;
                        result.success = true;
                        status.successfully_loaded++;
                    } else {
                        status.failed_to_load++;
                    }
                } catch (const std::exception& e) {
                    result.error_message = e.what();
                    status.failed_to_load++;
                }

                if (!result.success) {
                    Logger::getInstance().error("ModelRegistry",
                        "Rejected model " + result.model_id + ": " + result.error_message);
                }
                status.load_results.push_back(result);
            }
        }

        if (root["routing"]) {
            fallback_regions = readStringList(root["routing"]["fallback_regions"]);
            degradation_chain = readStringList(root["routing"]["degradation_chain"]);
        }

        status.success = true;

    } catch (const std::exception& e) {
        status.error_message = "Failed to parse configuration: " + std::string(e.what());
        Logger::getInstance().error("ModelRegistry", status.error_message);
        return status;
    }

    for (const auto& model_id : degradation_chain) {
        if (profiles.find(model_id) == profiles.end()) {
            Logger::getInstance().warning("ModelRegistry",
                "Degradation chain references unknown model: " + model_id);
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_registry_mutex);
        m_profiles = std::move(profiles);
        m_fallback_regions = std::move(fallback_regions);
        m_degradation_chain = std::move(degradation_chain);
        m_status = status;
    }

    Logger::getInstance().info("ModelRegistry",
        "Model loading complete. Loaded: " + std::to_string(status.successfully_loaded) +
        "/" + std::to_string(status.total_configured));

    return status;
}

ModelLoadResult ModelRegistry::addProfile(const ModelProfile& profile) {
    ModelLoadResult result;
    result.model_id = profile.id;

    if (!validateProfile(profile, result.error_message)) {
        Logger::getInstance().error("ModelRegistry",
            "Rejected model " + profile.id + ": " + result.error_message);
        return result;
    }

    std::lock_guard<std::mutex> lock(m_registry_mutex);
    m_profiles[profile.id] = profile;
    m_status.successfully_loaded = m_profiles.size();
    m_status.last_update = std::chrono::system_clock::now();
    result.success = true;
    return result;
}

std::optional<ModelProfile> ModelRegistry::findProfile(const std::string& model_id) const {
    std::lock_guard<std::mutex> lock(m_registry_mutex);
    auto it = m_profiles.find(model_id);
    if (it == m_profiles.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<ModelProfile> ModelRegistry::getProfiles() const {
    std::lock_guard<std::mutex> lock(m_registry_mutex);
    std::vector<ModelProfile> profiles;
    profiles.reserve(m_profiles.size());
    for (const auto& [id, profile] : m_profiles) {
        profiles.push_back(profile);
    }
    return profiles;
}

std::vector<ModelProfile> ModelRegistry::getProfilesInTier(ModelTier tier) const {
    std::lock_guard<std::mutex> lock(m_registry_mutex);
    std::vector<ModelProfile> profiles;
    for (const auto& [id, profile] : m_profiles) {
        if (profile.tier == tier) {
            profiles.push_back(profile);
        }
    }
    return profiles;
}

bool ModelRegistry::isAvailable(const std::string& model_id, const std::string& region) const {
    std::lock_guard<std::mutex> lock(m_registry_mutex);
    auto it = m_profiles.find(model_id);
    return it != m_profiles.end() && it->second.isAvailableIn(region);
}

std::vector<std::string> ModelRegistry::getFallbackRegions() const {
    std::lock_guard<std::mutex> lock(m_registry_mutex);
    return m_fallback_regions;
}

void ModelRegistry::setFallbackRegions(const std::vector<std::string>& regions) {
    std::lock_guard<std::mutex> lock(m_registry_mutex);
    m_fallback_regions = regions;
}

std::vector<std::string> ModelRegistry::getDegradationChain() const {
    std::lock_guard<std::mutex> lock(m_registry_mutex);
    return m_degradation_chain;
}

void ModelRegistry::setDegradationChain(const std::vector<std::string>& chain) {
    std::lock_guard<std::mutex> lock(m_registry_mutex);
    m_degradation_chain = chain;
}

bool ModelRegistry::validateProfile(const ModelProfile& profile, std::string& error_message) const {
    if (profile.id.empty()) {
        error_message = "Model profile missing identifier";
        return false;
    }

    if (profile.max_output_tokens == 0) {
        error_message = "max_output_tokens must be greater than zero";
        return false;
    }

    if (profile.supportsExtendedReasoning() && profile.max_reasoning_tokens == 0) {
        error_message = "EXTENDED_REASONING requires max_reasoning_tokens";
        return false;
    }

    if (profile.regions.empty()) {
        error_message = "Model profile lists no regions";
        return false;
    }

    return true;
}

RegistryStatus ModelRegistry::getStatus() const {
    std::lock_guard<std::mutex> lock(m_registry_mutex);
    return m_status;
}

size_t ModelRegistry::size() const {
    std::lock_guard<std::mutex> lock(m_registry_mutex);
    return m_profiles.size();
}

std::string ModelRegistry::getModelInfo(const std::string& model_id) const {
    auto profile = findProfile(model_id);
    if (!profile) {
        return "Model not found: " + model_id;
    }

    std::stringstream ss;
    ss << "Model: " << profile->id << "\n";
    ss << "  Description: " << profile->description << "\n";
    ss << "  Tier: " << ModelCapabilityUtils::tierToString(profile->tier) << "\n";
    ss << "  Ranks: intelligence " << profile->intelligence_rank
       << ", speed " << profile->speed_rank
       << ", cost " << profile->cost_rank << "\n";
    ss << "  Max Output: " << profile->max_output_tokens << " tokens\n";
    ss << "  Max Reasoning: " << profile->max_reasoning_tokens << " tokens\n";
    ss << "  Capabilities: ";

    auto cap_strings = ModelCapabilityUtils::capabilitiesToStrings(profile->capabilities);
    for (size_t i = 0; i < cap_strings.size(); ++i) {
        if (i > 0) ss << ", ";
        ss << cap_strings[i];
    }
    ss << "\n";

    ss << "  Regions: ";
    for (size_t i = 0; i < profile->regions.size(); ++i) {
        if (i > 0) ss << ", ";
        ss << profile->regions[i];
    }
    ss << "\n";

    return ss.str();
}

std::string ModelRegistry::getAllModelsInfo() const {
    std::stringstream ss;

    auto status = getStatus();
    ss << "Model Registry Status\n";
    ss << "=====================\n";
    ss << "Total Configured: " << status.total_configured << "\n";
    ss << "Successfully Loaded: " << status.successfully_loaded << "\n";
    ss << "Failed to Load: " << status.failed_to_load << "\n";

    auto chain = getDegradationChain();
    ss << "Degradation Chain: ";
    for (size_t i = 0; i < chain.size(); ++i) {
        if (i > 0) ss << " -> ";
        ss << chain[i];
    }
    ss << "\n";

    auto profiles = getProfiles();
    if (profiles.empty()) {
        ss << "\nNo models loaded.\n";
    } else {
        ss << "\nLoaded Models:\n";
        ss << "--------------\n";
        for (const auto& profile : profiles) {
            ss << "\n" << getModelInfo(profile.id);
        }
    }

    return ss.str();
}

} // namespace Parley
