// =================================================================
// src/Parley/ConversationContext.cpp
// =================================================================

#include "Parley/ConversationContext.hpp"

namespace Parley {

void ConversationContext::appendTurn(SpeakerRole role, const std::string& text) {
    ConversationTurn turn;
    turn.role = role;
    turn.text = text;
    turn.timestamp = std::chrono::system_clock::now();
    turns.push_back(turn);
}

std::string speakerRoleToString(SpeakerRole role) {
    switch (role) {
        case SpeakerRole::CALLER: return "caller";
        case SpeakerRole::AGENT: return "agent";
        default: return "caller";
    }
}

} // namespace Parley
