// =================================================================
// src/Parley/ComplexityScorer.cpp
// =================================================================
// Implementation of the complexity scorer.

#include "Parley/ComplexityScorer.hpp"
#include "Parley/Logger.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace Parley {

namespace {

// Builds a case-insensitive, word-bounded expression for a phrase. Runs of
// spaces inside the phrase match any whitespace.
std::string phraseToExpression(const std::string& phrase) {
    static const std::string special = "\\^$.|?*+()[]{}";

    std::string expression = "\\b";
    bool in_space = false;
    for (char c : phrase) {
        if (c == ' ') {
            if (!in_space) {
                expression += "\\s+";
                in_space = true;
            }
            continue;
        }
        in_space = false;
        if (special.find(c) != std::string::npos) {
            expression += '\\';
        }
        expression += c;
    }
    expression += "\\b";
    return expression;
}

} // namespace

ComplexityScorer::ComplexityScorer(const ScorerConfig& config)
    : m_config(config) {
    if (m_config.patterns.empty()) {
        m_config.patterns = getDefaultPatterns();
    }
    compilePatterns();
}

std::vector<std::string> ComplexityScorer::getDefaultPatterns() {
    return {
        "analyze", "troubleshoot", "compare", "step by step", "explain why",
        "evaluate", "diagnose", "calculate", "recommend", "pros and cons"
    };
}

std::string ComplexityScorer::contextPolicyToString(ContextPolicy policy) {
    switch (policy) {
        case ContextPolicy::FIRST_MATCH: return "first_match";
        case ContextPolicy::ADDITIVE: return "additive";
        default: return "first_match";
    }
}

ContextPolicy ComplexityScorer::stringToContextPolicy(const std::string& name) {
    if (name == "first_match") return ContextPolicy::FIRST_MATCH;
    if (name == "additive") return ContextPolicy::ADDITIVE;
    throw std::invalid_argument("Unknown context policy: " + name);
}

void ComplexityScorer::compilePatterns() {
    m_patterns.clear();
    for (const auto& phrase : m_config.patterns) {
        try {
            m_patterns.emplace_back(phrase, std::regex(phraseToExpression(phrase),
                                    std::regex::icase | std::regex::ECMAScript));
        } catch (const std::regex_error& e) {
            Logger::getInstance().warning("ComplexityScorer",
                "Skipping invalid pattern '" + phrase + "'", e.what());
        }
    }
}

double ComplexityScorer::score(const std::string& utterance, const ConversationContext& context) const {
    return scoreWithBreakdown(utterance, context).score;
}

ComplexityBreakdown ComplexityScorer::scoreWithBreakdown(const std::string& utterance,
                                                         const ConversationContext& context) const {
    ComplexityBreakdown breakdown;

    breakdown.word_count = countWords(utterance);
    if (m_config.word_saturation > 0) {
        breakdown.word_factor = std::min(
            static_cast<double>(breakdown.word_count) / static_cast<double>(m_config.word_saturation), 1.0);
    }

    // The denominator is the configured pattern count so the factor stays
    // comparable even if a pattern failed to compile.
    if (!m_config.patterns.empty()) {
        for (const auto& [phrase, expression] : m_patterns) {
            bool matched = false;
            try {
                matched = std::regex_search(utterance, expression);
            } catch (const std::regex_error&) {
                matched = false;
            }
            if (matched) {
                breakdown.matched_patterns.push_back(phrase);
            }
        }
        breakdown.pattern_factor = static_cast<double>(breakdown.matched_patterns.size()) /
                                   static_cast<double>(m_config.patterns.size());
    }

    breakdown.context_factor = computeContextFactor(context);

    double raw = m_config.word_weight * breakdown.word_factor +
                 m_config.pattern_weight * breakdown.pattern_factor +
                 breakdown.context_factor;
    breakdown.score = std::clamp(raw, 0.0, 1.0);

    return breakdown;
}

size_t ComplexityScorer::countWords(const std::string& text) const {
    std::istringstream stream(text);
    std::string word;
    size_t count = 0;
    while (stream >> word) {
        count++;
    }
    return count;
}

double ComplexityScorer::computeContextFactor(const ConversationContext& context) const {
    // Rules in priority order
    const bool long_history = context.priorTurnCount() > m_config.long_history_turns;
    const bool tools = context.tools_anticipated;
    const bool multi_turn = context.multi_turn;

    if (m_config.context_policy == ContextPolicy::ADDITIVE) {
        double factor = 0.0;
        if (long_history) factor += m_config.long_history_factor;
        if (tools) factor += m_config.tool_factor;
        if (multi_turn) factor += m_config.multi_turn_factor;
        return factor;
    }

    if (long_history) return m_config.long_history_factor;
    if (tools) return m_config.tool_factor;
    if (multi_turn) return m_config.multi_turn_factor;
    return 0.0;
}

} // namespace Parley
