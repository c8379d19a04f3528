// =================================================================
// include/Parley/ComplexityScorer.hpp
// =================================================================
// Scores how much reasoning a caller utterance is likely to need.

#pragma once

#include "Parley/ConversationContext.hpp"
#include <string>
#include <vector>
#include <regex>

namespace Parley {

/**
 * @brief How the conversation-context rules combine
 */
enum class ContextPolicy {
    FIRST_MATCH,   ///< Only the highest-priority applicable rule contributes
    ADDITIVE       ///< Every applicable rule contributes
};

/**
 * @brief Configuration for complexity scoring
 */
struct ScorerConfig {
    double word_weight;                 ///< Weight of the utterance length factor
    double pattern_weight;              ///< Weight of the pattern-match factor
    size_t word_saturation;             ///< Word count at which the length factor saturates
    size_t long_history_turns;          ///< History longer than this counts as long
    double long_history_factor;         ///< Context factor for a long history
    double tool_factor;                 ///< Context factor when tools are anticipated
    double multi_turn_factor;           ///< Context factor for multi-turn calls
    ContextPolicy context_policy;       ///< How context rules combine
    std::vector<std::string> patterns;  ///< Complexity phrases (defaults when empty)

    ScorerConfig()
        : word_weight(0.3), pattern_weight(0.5), word_saturation(50),
          long_history_turns(5), long_history_factor(0.3), tool_factor(0.4),
          multi_turn_factor(0.2), context_policy(ContextPolicy::FIRST_MATCH) {}
};

/**
 * @brief Individual factors behind a complexity score
 */
struct ComplexityBreakdown {
    size_t word_count = 0;
    double word_factor = 0.0;           ///< Unweighted, in [0, 1]
    double pattern_factor = 0.0;        ///< Unweighted, in [0, 1]
    double context_factor = 0.0;        ///< Already weighted
    std::vector<std::string> matched_patterns;
    double score = 0.0;                 ///< Final score in [0, 1]
};

/**
 * @brief Deterministic complexity scorer
 *
 * score = min(word_weight * word_factor + pattern_weight * pattern_factor
 *             + context_factor, 1.0)
 *
 * Scoring has no side effects and never fails; empty or malformed input
 * contributes nothing.
 */
class ComplexityScorer {
public:
    explicit ComplexityScorer(const ScorerConfig& config = ScorerConfig());

    /**
     * @brief Score an utterance in its conversation context
     * @return Score in [0.0, 1.0]
     */
    double score(const std::string& utterance, const ConversationContext& context) const;

    /**
     * @brief Score and return every contributing factor
     */
    ComplexityBreakdown scoreWithBreakdown(const std::string& utterance,
                                           const ConversationContext& context) const;

    const ScorerConfig& getConfig() const { return m_config; }

    static std::vector<std::string> getDefaultPatterns();
    static std::string contextPolicyToString(ContextPolicy policy);

    /**
     * @brief Parse "first_match" or "additive"
     * @throws std::invalid_argument for other names
     */
    static ContextPolicy stringToContextPolicy(const std::string& name);

private:
    ScorerConfig m_config;
    std::vector<std::pair<std::string, std::regex>> m_patterns;

    void compilePatterns();
    size_t countWords(const std::string& text) const;
    double computeContextFactor(const ConversationContext& context) const;
};

} // namespace Parley
