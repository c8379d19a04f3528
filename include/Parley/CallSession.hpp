// =================================================================
// include/Parley/CallSession.hpp
// =================================================================
// State of one live call: conversation history, cancellation and turns.

#pragma once

#include "Parley/CancellationToken.hpp"
#include "Parley/ConversationContext.hpp"
#include "Parley/TurnPipeline.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>

namespace Parley {

/**
 * @brief Called when a turn ends with nothing spoken to the caller
 */
using TerminalFailureHandler = std::function<void(const std::string& call_id, const TurnResult& result)>;

/**
 * @brief One call from answer to hangup
 *
 * Turns of the same call run one at a time and are appended to the history
 * in the order they finish. hangup() cancels only this call's work.
 */
class CallSession {
public:
    /**
     * @brief Constructor
     * @param call_id Call identifier used in logs and metrics
     * @param pipeline Shared turn pipeline; must outlive the session
     * @param tenant_id Tenant the call belongs to
     * @param region_hint Preferred serving region
     */
    CallSession(const std::string& call_id,
                TurnPipeline& pipeline,
                const std::string& tenant_id = "",
                const std::string& region_hint = "");

    ~CallSession();

    CallSession(const CallSession&) = delete;
    CallSession& operator=(const CallSession&) = delete;

    /**
     * @brief Run a turn for a finalized caller utterance
     *
     * Both the caller turn and the agent reply (answer text or apology) are
     * appended to the history once the turn finishes. After hangup the
     * turn is reported as cancelled without being run.
     *
     * @param utterance Caller transcript
     * @param options Routing inputs; call id is filled in by the session
     * @return Turn result
     */
    TurnResult handleUtterance(const std::string& utterance, TurnOptions options = TurnOptions());

    /**
     * @brief Cancel every outstanding task of this call
     */
    void hangup();

    bool isActive() const { return m_active.load(); }

    /**
     * @brief Snapshot of the conversation so far
     */
    ConversationContext getContext() const;

    void setTerminalFailureHandler(TerminalFailureHandler handler);
    void setToolsAnticipated(bool anticipated);
    void setMultiTurn(bool multi_turn);

    const std::string& getCallId() const { return m_call_id; }
    size_t turnCount() const;

private:
    std::string m_call_id;
    TurnPipeline& m_pipeline;
    ConversationContext m_context;
    CancellationToken m_token;
    TerminalFailureHandler m_on_terminal_failure;
    std::atomic<bool> m_active{true};
    size_t m_turns_handled = 0;
    std::chrono::steady_clock::time_point m_started;

    mutable std::mutex m_context_mutex;   ///< Guards context, counters and handler
    std::mutex m_turn_mutex;              ///< Serializes turns of this call
};

} // namespace Parley
