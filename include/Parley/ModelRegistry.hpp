// =================================================================
// include/Parley/ModelRegistry.hpp
// =================================================================
// Static model table and region availability loaded at startup.

#pragma once

#include "Parley/ModelCapabilities.hpp"
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <mutex>
#include <chrono>

namespace Parley {

/**
 * @brief Result of loading one model profile
 */
struct ModelLoadResult {
    bool success = false;                  ///< Whether the profile was accepted
    std::string model_id;                  ///< Model identifier
    std::string error_message;             ///< Error message if rejected
};

/**
 * @brief Registry status information
 */
struct RegistryStatus {
    bool success = false;                  ///< Whether the file could be read and parsed
    std::string error_message;             ///< Parse or I/O error
    size_t total_configured = 0;           ///< Profiles found in the file
    size_t successfully_loaded = 0;        ///< Profiles accepted
    size_t failed_to_load = 0;             ///< Profiles rejected by validation
    std::chrono::system_clock::time_point last_update; ///< Last load time
    std::vector<ModelLoadResult> load_results; ///< Individual load results
};

/**
 * @brief Registry of model profiles, fallback regions and the degradation chain
 *
 * Populated once at startup and read concurrently afterwards by every call
 * session. Lookups return copies so callers never hold references into the
 * table.
 */
class ModelRegistry {
public:
    ModelRegistry();
    virtual ~ModelRegistry() = default;

    /**
     * @brief Load the `models` and `routing` sections of a YAML file
     * @param config_path Path to YAML configuration file
     * @return Registry status after loading
     */
    virtual RegistryStatus loadFromConfig(const std::string& config_path);

    /**
     * @brief Load from YAML text instead of a file
     * @param yaml_text YAML document
     * @return Registry status after loading
     */
    virtual RegistryStatus loadFromString(const std::string& yaml_text);

    /**
     * @brief Add or replace a single profile
     * @return Load result (fails if the profile is invalid)
     */
    virtual ModelLoadResult addProfile(const ModelProfile& profile);

    /**
     * @brief Find a model profile by identifier
     * @return Copy of the profile, or std::nullopt if not configured
     */
    virtual std::optional<ModelProfile> findProfile(const std::string& model_id) const;

    /**
     * @brief All profiles ordered by identifier
     */
    virtual std::vector<ModelProfile> getProfiles() const;

    /**
     * @brief Profiles of one tier ordered by identifier
     */
    virtual std::vector<ModelProfile> getProfilesInTier(ModelTier tier) const;

    /**
     * @brief Whether a model is served in a region
     */
    virtual bool isAvailable(const std::string& model_id, const std::string& region) const;

    virtual std::vector<std::string> getFallbackRegions() const;
    virtual void setFallbackRegions(const std::vector<std::string>& regions);

    /**
     * @brief Ordered list of models to degrade through on failure
     *
     * Ordered from most capable to cheapest/fastest.
     */
    virtual std::vector<std::string> getDegradationChain() const;
    virtual void setDegradationChain(const std::vector<std::string>& chain);

    /**
     * @brief Validate a profile
     * @param profile Profile to check
     * @param error_message Receives the reason on failure
     */
    virtual bool validateProfile(const ModelProfile& profile, std::string& error_message) const;

    virtual RegistryStatus getStatus() const;
    virtual size_t size() const;

    /**
     * @brief Get model info as formatted string (for CLI)
     */
    virtual std::string getModelInfo(const std::string& model_id) const;

    /**
     * @brief Get all models info as formatted string (for CLI)
     */
    virtual std::string getAllModelsInfo() const;

private:
    std::map<std::string, ModelProfile> m_profiles;
    std::vector<std::string> m_fallback_regions;
    std::vector<std::string> m_degradation_chain;
    RegistryStatus m_status;
    mutable std::mutex m_registry_mutex;

    RegistryStatus loadDocument(const std::string& source, bool is_file);
};

} // namespace Parley
