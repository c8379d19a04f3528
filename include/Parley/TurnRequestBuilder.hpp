// =================================================================
// include/Parley/TurnRequestBuilder.hpp
// =================================================================
// Assembles the outbound generation request for a turn.

#pragma once

#include "Parley/ModelRegistry.hpp"
#include "Parley/ModelSelector.hpp"
#include "Parley/ConversationContext.hpp"
#include "Parley/Errors.hpp"
#include "nlohmann/json.hpp"
#include <string>
#include <vector>

namespace Parley {

/**
 * @brief One message of the generation request
 */
struct ChatMessage {
    std::string role;      ///< "user" or "assistant"
    std::string content;
};

/**
 * @brief Tool made available to the model
 */
struct ToolSpec {
    std::string name;
    std::string description;
    nlohmann::json input_schema = nlohmann::json::object();
};

/**
 * @brief Structured request sent to the generation service
 */
struct GenerationRequest {
    std::string model_id;
    std::string region;
    std::string system_prompt;
    std::vector<ChatMessage> messages;
    size_t max_tokens = 0;
    double temperature = 0.3;
    std::vector<ToolSpec> tools;
    size_t reasoning_budget = 0;     ///< 0 when extended reasoning is off
    bool stream = true;

    /**
     * @brief Serialize to the provider's messages API body
     */
    nlohmann::json toJson() const;
};

/**
 * @brief Per-turn build options
 */
struct BuildOptions {
    size_t requested_max_tokens = 300;    ///< Capped at the model ceiling
    double temperature = 0.3;
    std::string system_prompt;            ///< Agent prompt before voice guidelines
    std::vector<ToolSpec> tools;          ///< Attached only for tool-capable models
    size_t max_history_turns = 20;        ///< Most recent turns kept
};

/**
 * @brief Result of building a request
 */
struct BuildResult {
    bool success = false;
    GenerationRequest request;
    std::string error_message;
    ErrorKind error_kind = ErrorKind::NONE;
};

/**
 * @brief Builds generation requests honoring per-model limits
 */
class TurnRequestBuilder {
public:
    /**
     * @brief Constructor
     * @param registry Model table; must outlive the builder
     */
    explicit TurnRequestBuilder(const ModelRegistry& registry);

    virtual ~TurnRequestBuilder() = default;

    /**
     * @brief Build the request for a turn
     * @param utterance Caller utterance for this turn
     * @param context Conversation so far (the utterance is not yet in it)
     * @param routing Routing decision for the turn
     * @param options Sampling, prompt and tool options
     * @return Failed result with REQUEST_INVALID if the model is not in the table
     */
    virtual BuildResult build(const std::string& utterance,
                              const ConversationContext& context,
                              const RoutingDecision& routing,
                              const BuildOptions& options = BuildOptions()) const;

    /**
     * @brief Fixed guidelines appended to every system prompt
     */
    static std::string getVoiceGuidelines();

    /// Smallest reasoning budget the provider accepts
    static constexpr size_t MIN_REASONING_BUDGET = 1024;

    /// Extended reasoning only runs at the provider's default temperature
    static constexpr double REASONING_TEMPERATURE = 1.0;

private:
    const ModelRegistry& m_registry;

    /**
     * @brief Attach a reasoning budget, growing max_tokens to hold budget plus answer
     *
     * The budget stays strictly below max_tokens. When the model's output
     * ceiling cannot fit the minimum budget, the request goes out without
     * reasoning.
     */
    void attachReasoning(GenerationRequest& request, size_t requested_budget,
                         const ModelProfile& profile) const;

    std::vector<ChatMessage> buildMessages(const std::string& utterance,
                                           const ConversationContext& context,
                                           size_t max_history_turns) const;
};

} // namespace Parley
