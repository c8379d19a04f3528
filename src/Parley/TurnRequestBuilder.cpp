// =================================================================
// src/Parley/TurnRequestBuilder.cpp
// =================================================================
// Implementation of the generation request builder.

#include "Parley/TurnRequestBuilder.hpp"
#include "Parley/Logger.hpp"
#include <algorithm>

namespace Parley {

nlohmann::json GenerationRequest::toJson() const {
    nlohmann::json body = {
        {"model", model_id},
        {"max_tokens", max_tokens},
        {"temperature", temperature},
        {"stream", stream}
    };

    if (!system_prompt.empty()) {
        body["system"] = system_prompt;
    }

    body["messages"] = nlohmann::json::array();
    for (const auto& message : messages) {
        body["messages"].push_back({{"role", message.role}, {"content", message.content}});
    }

    if (!tools.empty()) {
        body["tools"] = nlohmann::json::array();
        for (const auto& tool : tools) {
            body["tools"].push_back({
                {"name", tool.name},
                {"description", tool.description},
                {"input_schema", tool.input_schema}
            });
        }
    }

    if (reasoning_budget > 0) {
        body["thinking"] = {{"type", "enabled"}, {"budget_tokens", reasoning_budget}};
    }

    return body;
}

TurnRequestBuilder::TurnRequestBuilder(const ModelRegistry& registry)
    : m_registry(registry) {
}

std::string TurnRequestBuilder::getVoiceGuidelines() {
    return "You are speaking on a phone call. Keep every response short: one to three "
           "sentences. Use natural contractions and plain spoken language with no lists, "
           "markdown or symbols. End with a clear question when you need something from "
           "the caller.";
}

BuildResult TurnRequestBuilder::build(const std::string& utterance,
                                      const ConversationContext& context,
                                      const RoutingDecision& routing,
                                      const BuildOptions& options) const {
    BuildResult result;

    auto profile = m_registry.findProfile(routing.model_id);
    if (!profile) {
        result.error_kind = ErrorKind::REQUEST_INVALID;
        result.error_message = "Model not found in model table: '" + routing.model_id + "'";
        Logger::getInstance().error("TurnRequestBuilder", result.error_message);
        return result;
    }

    GenerationRequest& request = result.request;
    request.model_id = profile->id;
    request.region = routing.region;
    request.temperature = options.temperature;
    request.max_tokens = std::min(options.requested_max_tokens, profile->max_output_tokens);

    request.system_prompt = options.system_prompt;
    if (!request.system_prompt.empty()) {
        request.system_prompt += "\n\n";
    }
    request.system_prompt += getVoiceGuidelines();

    request.messages = buildMessages(utterance, context, options.max_history_turns);

    if (profile->supportsTools()) {
        request.tools = options.tools;
    }

    if (routing.reasoning_budget > 0 && profile->supportsExtendedReasoning()) {
        attachReasoning(request, routing.reasoning_budget, *profile);
    }

    result.success = true;
    return result;
}

void TurnRequestBuilder::attachReasoning(GenerationRequest& request, size_t requested_budget,
                                         const ModelProfile& profile) const {
    const size_t answer_tokens = request.max_tokens;

    size_t budget = std::min(requested_budget, profile.max_reasoning_tokens);
    budget = std::max(budget, MIN_REASONING_BUDGET);

    // Reasoning tokens count against max_tokens and must leave room for the answer
    const size_t total = std::min(profile.max_output_tokens, budget + answer_tokens);
    if (budget + answer_tokens > total) {
        budget = total > answer_tokens ? total - answer_tokens : 0;
    }

    if (budget < MIN_REASONING_BUDGET || budget > profile.max_reasoning_tokens) {
        Logger::getInstance().warning("TurnRequestBuilder",
            "Output ceiling of '" + profile.id + "' leaves no room for reasoning; sending without it");
        return;
    }

    request.reasoning_budget = budget;
    request.max_tokens = total;
    request.temperature = REASONING_TEMPERATURE;
}

std::vector<ChatMessage> TurnRequestBuilder::buildMessages(const std::string& utterance,
                                                           const ConversationContext& context,
                                                           size_t max_history_turns) const {
    std::vector<ChatMessage> messages;

    // Consecutive turns from the same speaker are merged so roles alternate
    auto append = [&messages](const std::string& role, const std::string& content) {
        if (!messages.empty() && messages.back().role == role) {
            messages.back().content += "\n" + content;
        } else {
            messages.push_back({role, content});
        }
    };

    const size_t total = context.turns.size();
    const size_t first = total > max_history_turns ? total - max_history_turns : 0;
    for (size_t i = first; i < total; ++i) {
        const auto& turn = context.turns[i];
        append(turn.role == SpeakerRole::AGENT ? "assistant" : "user", turn.text);
    }

    // The provider rejects conversations that open with the assistant
    if (!messages.empty() && messages.front().role == "assistant") {
        messages.erase(messages.begin());
    }

    append("user", utterance);
    return messages;
}

} // namespace Parley
