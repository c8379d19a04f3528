// =================================================================
// src/Parley/CallSession.cpp
// =================================================================
// Implementation of the per-call session.

#include "Parley/CallSession.hpp"
#include "Parley/Logger.hpp"

namespace Parley {

CallSession::CallSession(const std::string& call_id,
                         TurnPipeline& pipeline,
                         const std::string& tenant_id,
                         const std::string& region_hint)
    : m_call_id(call_id),
      m_pipeline(pipeline),
      m_started(std::chrono::steady_clock::now()) {
    m_context.tenant_id = tenant_id;
    m_context.region_hint = region_hint;
    Logger::getInstance().logSessionStart(m_call_id, tenant_id);
}

CallSession::~CallSession() {
    hangup();
    // Wait for a turn still running on another thread
    std::lock_guard<std::mutex> turn_lock(m_turn_mutex);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - m_started);
    Logger::getInstance().logSessionEnd(m_call_id, turnCount(), static_cast<long>(elapsed.count()));
}

TurnResult CallSession::handleUtterance(const std::string& utterance, TurnOptions options) {
    std::lock_guard<std::mutex> turn_lock(m_turn_mutex);

    options.call_id = m_call_id;

    if (!isActive()) {
        TurnResult result;
        result.outcome = TurnOutcome::CANCELLED;
        result.error_kind = ErrorKind::CANCELLED;
        result.error_message = "Call has ended";
        return result;
    }

    ConversationContext snapshot = getContext();
    TurnResult result = m_pipeline.runTurn(utterance, snapshot, options, m_token);

    TerminalFailureHandler handler;
    {
        std::lock_guard<std::mutex> lock(m_context_mutex);
        m_context.appendTurn(SpeakerRole::CALLER, utterance);
        if (!result.response_text.empty()) {
            m_context.appendTurn(SpeakerRole::AGENT, result.response_text);
        } else if (!result.spoken_apology.empty()) {
            m_context.appendTurn(SpeakerRole::AGENT, result.spoken_apology);
        }
        ++m_turns_handled;
        handler = m_on_terminal_failure;
    }

    if (result.outcome == TurnOutcome::FAILED) {
        Logger::getInstance().critical("CallSession", "Turn failed with nothing spoken", m_call_id);
        if (handler) {
            handler(m_call_id, result);
        }
    }

    return result;
}

void CallSession::hangup() {
    if (m_active.exchange(false)) {
        Logger::getInstance().info("CallSession", "Hangup", m_call_id);
    }
    m_token.cancel();
}

ConversationContext CallSession::getContext() const {
    std::lock_guard<std::mutex> lock(m_context_mutex);
    return m_context;
}

void CallSession::setTerminalFailureHandler(TerminalFailureHandler handler) {
    std::lock_guard<std::mutex> lock(m_context_mutex);
    m_on_terminal_failure = std::move(handler);
}

void CallSession::setToolsAnticipated(bool anticipated) {
    std::lock_guard<std::mutex> lock(m_context_mutex);
    m_context.tools_anticipated = anticipated;
}

void CallSession::setMultiTurn(bool multi_turn) {
    std::lock_guard<std::mutex> lock(m_context_mutex);
    m_context.multi_turn = multi_turn;
}

size_t CallSession::turnCount() const {
    std::lock_guard<std::mutex> lock(m_context_mutex);
    return m_turns_handled;
}

} // namespace Parley
