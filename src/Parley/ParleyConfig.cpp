// =================================================================
// src/Parley/ParleyConfig.cpp
// =================================================================
// Implementation of YAML configuration loading.

#include "Parley/ParleyConfig.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <functional>

namespace Parley {

namespace {

bool isKnownLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    return lower == "debug" || lower == "info" || lower == "warning" ||
           lower == "error" || lower == "critical";
}

/**
 * @brief Reads typed keys from one section, recording invalid values
 */
class SectionReader {
public:
    SectionReader(const YAML::Node& root, const std::string& section, ConfigLoadResult& result)
        : m_node(root[section]), m_section(section), m_result(result) {
        m_present = m_node && m_node.IsMap();
        if (m_node && !m_present) {
            m_result.warnings.push_back("Section '" + section + "' is not a map, using defaults");
        }
    }

    bool present() const { return m_present; }

    template <typename T>
    void read(const std::string& key, T& target, std::function<bool(const T&)> valid = nullptr) {
        if (!present() || !m_node[key]) {
            return;
        }
        try {
            T parsed = m_node[key].template as<T>();
            if (valid && !valid(parsed)) {
                warn(key, "value out of range");
                return;
            }
            target = parsed;
        } catch (const YAML::Exception& e) {
            warn(key, e.what());
        }
    }

    void readMillis(const std::string& key, std::chrono::milliseconds& target) {
        long long value = target.count();
        read<long long>(key, value, [](const long long& v) { return v >= 0; });
        target = std::chrono::milliseconds(value);
    }

    void readStrings(const std::string& key, std::vector<std::string>& target) {
        if (!present() || !m_node[key]) {
            return;
        }
        try {
            target = m_node[key].template as<std::vector<std::string>>();
        } catch (const YAML::Exception& e) {
            warn(key, e.what());
        }
    }

    void readLevel(const std::string& key, LogLevel& target) {
        std::string name;
        read<std::string>(key, name);
        if (name.empty()) {
            return;
        }
        if (!isKnownLevel(name)) {
            warn(key, "unknown level '" + name + "'");
            return;
        }
        target = Logger::parseLevel(name, target);
    }

    void warn(const std::string& key, const std::string& reason) {
        m_result.warnings.push_back(m_section + "." + key + ": " + reason + ", using default");
    }

private:
    const YAML::Node m_node;
    bool m_present = false;
    std::string m_section;
    ConfigLoadResult& m_result;
};

} // namespace

std::string degradedModeToString(DegradedMode mode) {
    switch (mode) {
        case DegradedMode::ATTEMPT: return "attempt";
        case DegradedMode::REJECT: return "reject";
        default: return "attempt";
    }
}

ParleyConfig::ParleyConfig() {
    generation_endpoint.base_url = "http://localhost:8080";
    generation_endpoint.path = "/v1/messages";
    generation_endpoint.timeout_ms = 10000;

    synthesis_endpoint.base_url = "http://localhost:8081";
    synthesis_endpoint.path = "/v1/speak";
    synthesis_endpoint.timeout_ms = 5000;
}

ConfigLoadResult ParleyConfig::loadFromFile(const std::string& path) {
    Logger::getInstance().info("ParleyConfig", "Loading configuration: " + path);
    return loadDocument(path, true);
}

ConfigLoadResult ParleyConfig::loadFromString(const std::string& yaml_text) {
    return loadDocument(yaml_text, false);
}

ConfigLoadResult ParleyConfig::loadDocument(const std::string& source, bool is_file) {
    ConfigLoadResult result;

    YAML::Node root;
    try {
        root = is_file ? YAML::LoadFile(source) : YAML::Load(source);
    } catch (const YAML::Exception& e) {
        result.error_message = "Failed to parse configuration: " + std::string(e.what());
        Logger::getInstance().error("ParleyConfig", result.error_message);
        return result;
    }

    if (!root.IsNull() && !root.IsMap()) {
        result.error_message = "Configuration root must be a map";
        Logger::getInstance().error("ParleyConfig", result.error_message);
        return result;
    }

    auto positive_size = [](const size_t& v) { return v > 0; };
    auto positive_int = [](const int& v) { return v > 0; };
    auto unit_ratio = [](const double& v) { return v >= 0.0 && v <= 1.0; };

    // routing
    {
        SectionReader routing(root, "routing", result);
        routing.read<size_t>("reasoning_budget_tokens", selector.reasoning_budget_tokens);

        std::string mode;
        routing.read<std::string>("degraded_mode", mode);
        if (mode == "attempt") {
            pipeline.degraded_mode = DegradedMode::ATTEMPT;
        } else if (mode == "reject") {
            pipeline.degraded_mode = DegradedMode::REJECT;
        } else if (!mode.empty()) {
            routing.warn("degraded_mode", "unknown mode '" + mode + "'");
        }
    }

    // scorer
    {
        SectionReader section(root, "scorer", result);
        section.readStrings("patterns", scorer.patterns);
        section.read<size_t>("long_history_turns", scorer.long_history_turns);

        std::string policy;
        section.read<std::string>("context_policy", policy);
        if (!policy.empty()) {
            try {
                scorer.context_policy = ComplexityScorer::stringToContextPolicy(policy);
            } catch (const std::invalid_argument& e) {
                section.warn("context_policy", e.what());
            }
        }
    }

    // generation
    {
        SectionReader section(root, "generation", result);
        section.read<std::string>("base_url", generation_endpoint.base_url);
        section.read<std::string>("path", generation_endpoint.path);
        section.read<int>("timeout_ms", generation_endpoint.timeout_ms, positive_int);
        section.read<int>("connect_timeout_ms", generation_endpoint.connect_timeout_ms, positive_int);
        section.read<double>("temperature", pipeline.temperature, unit_ratio);
        section.read<size_t>("max_tokens", pipeline.max_tokens, positive_size);
        section.read<std::string>("system_prompt", pipeline.system_prompt);
        section.read<size_t>("max_history_turns", pipeline.max_history_turns);
        section.read<size_t>("channel_capacity", pipeline.channel_capacity, positive_size);
    }

    // synthesis
    {
        SectionReader section(root, "synthesis", result);
        section.read<std::string>("base_url", synthesis_endpoint.base_url);
        section.read<std::string>("path", synthesis_endpoint.path);
        section.read<int>("timeout_ms", synthesis_endpoint.timeout_ms, positive_int);
        section.read<std::string>("voice", synthesis.voice);
        section.read<std::string>("encoding", synthesis.encoding);
        section.read<int>("sample_rate", synthesis.sample_rate, positive_int);
        section.read<size_t>("max_concurrent", synthesis.max_concurrent, positive_size);
        section.read<std::string>("fallback_phrase", synthesis.fallback_phrase);
        section.read<std::string>("apology_phrase", pipeline.apology_phrase);
    }

    // resilience
    {
        SectionReader section(root, "resilience", result);
        section.read<size_t>("failure_threshold", breaker.failure_threshold, positive_size);
        section.readMillis("recovery_window_ms", breaker.recovery_window);
        section.read<size_t>("max_attempts", retry.max_attempts, positive_size);
        section.readMillis("base_delay_ms", retry.base_delay);
        section.readMillis("max_delay_ms", retry.max_delay);
        section.read<double>("jitter_ratio", retry.jitter_ratio, unit_ratio);
    }

    // logging
    {
        SectionReader section(root, "logging", result);
        section.read<std::string>("directory", logging.directory);
        section.readLevel("console_level", logging.console_level);
        section.readLevel("file_level", logging.file_level);
        section.read<bool>("console_enabled", logging.console_enabled);
        section.read<size_t>("max_file_size", logging.max_file_size, positive_size);
        section.read<size_t>("max_files", logging.max_files, positive_size);
    }

    for (const auto& warning : result.warnings) {
        Logger::getInstance().warning("ParleyConfig", warning);
    }

    result.success = true;
    return result;
}

void ParleyConfig::applyLoggingSettings() const {
    auto& logger = Logger::getInstance();
    logger.initialize(logging.directory, logging.max_file_size, logging.max_files);
    logger.setConsoleLogLevel(logging.console_level);
    logger.setFileLogLevel(logging.file_level);
    logger.setConsoleLogging(logging.console_enabled);
}

} // namespace Parley
