// =================================================================
// include/Parley/ConversationContext.hpp
// =================================================================
// Per-call conversation history and routing hints.

#pragma once

#include <string>
#include <vector>
#include <chrono>

namespace Parley {

/**
 * @brief Who spoke a turn
 */
enum class SpeakerRole {
    CALLER,   ///< The person on the line
    AGENT     ///< The voice agent
};

/**
 * @brief One finalized turn of the conversation
 */
struct ConversationTurn {
    SpeakerRole role = SpeakerRole::CALLER;
    std::string text;
    std::chrono::system_clock::time_point timestamp;
};

/**
 * @brief Conversation state owned by one call session
 *
 * Turns are only ever appended; the history reflects the order in which
 * turns were finalized.
 */
struct ConversationContext {
    std::vector<ConversationTurn> turns;   ///< Prior turns, oldest first
    std::string tenant_id;                 ///< Tenant the call belongs to
    std::string agent_config_ref;          ///< Agent configuration reference
    std::string region_hint;               ///< Preferred serving region
    bool tools_anticipated = false;        ///< Agent expects to call tools this turn
    bool multi_turn = false;               ///< Call flagged as a multi-turn dialogue

    size_t priorTurnCount() const { return turns.size(); }

    /**
     * @brief Append a finalized turn stamped with the current time
     */
    void appendTurn(SpeakerRole role, const std::string& text);
};

std::string speakerRoleToString(SpeakerRole role);

} // namespace Parley
