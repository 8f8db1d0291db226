/**
 * @file IntentDispatcher.hpp
 * @brief Ordered first-match classification of messages into intents.
 */

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "domain/Clock.hpp"
#include "domain/ConversationStore.hpp"
#include "domain/Intent.hpp"
#include "domain/expression/ExpressionEvaluator.hpp"

namespace logicchat::application {

namespace replies {
inline constexpr const char* kNoHistory = "There is no previous conversation yet.";
inline constexpr const char* kHistoryHeader = "Here is our recent conversation history:";
inline constexpr const char* kSelfDescription =
    "I am a small open-source AI assistant. Unlike large models such as ChatGPT "
    "or Gemini, I run entirely on simple logic without access to external APIs "
    "or massive datasets. I can perform arithmetic, tell the date and time, and "
    "remember our conversation, but I don't pretend to know everything.";
inline constexpr const char* kFallback =
    "I'm sorry, I don't have enough information to answer that. "
    "I'm still learning and rely on simple reasoning rather than vast knowledge.";
} // namespace replies

/**
 * @class IntentDispatcher
 * @brief Walks an explicit priority table of (intent, predicate, handler) rules.
 *
 * Rules are tried top to bottom against the trimmed, lowercased message. The
 * first rule whose predicate matches and whose handler produces a reply wins.
 * A handler may decline (return std::nullopt); the arithmetic handler does so
 * whenever the evaluator fails, and the walk then continues with the next
 * rules as if arithmetic had never matched.
 */
class IntentDispatcher {
public:
    using Predicate = std::function<bool(const std::string& normalized)>;
    using Handler = std::function<std::optional<std::string>(const std::string& normalized)>;

    struct Rule {
        domain::Intent intent;
        Predicate matches;
        Handler respond;
    };

    /** @brief The intent that produced the reply, with the reply text. */
    struct Dispatch {
        domain::Intent intent;
        std::string response;
    };

    /**
     * @param store Log queried by the history rule.
     * @param clock Source of "now" for the date and time rules.
     * @param limits Bounds applied to arithmetic parsing.
     * @param historyLimit Number of turns shown by the history rule.
     */
    IntentDispatcher(std::shared_ptr<domain::ConversationStore> store,
                     domain::Clock clock,
                     domain::expression::ParserLimits limits = {},
                     int historyLimit = 10);

    // Handlers in the rule table capture `this`.
    IntentDispatcher(const IntentDispatcher&) = delete;
    IntentDispatcher& operator=(const IntentDispatcher&) = delete;

    /**
     * @brief Pure classification: the first rule whose predicate matches.
     * Does not run any handler, so "today 3+3" is Arithmetic here even though
     * answering it falls through to the date rule.
     */
    domain::Intent classify(const std::string& text) const;

    /** @brief Classifies and answers, honouring handler fall-through. */
    Dispatch dispatch(const std::string& text) const;

    /** @brief The priority table, in evaluation order. */
    const std::vector<Rule>& rules() const { return m_rules; }

    /** @brief Trims surrounding whitespace and lowercases ASCII letters. */
    static std::string Normalize(const std::string& text);

private:
    std::optional<std::string> answerArithmetic(const std::string& normalized) const;
    std::optional<std::string> answerDate() const;
    std::optional<std::string> answerTime() const;
    std::optional<std::string> answerHistory() const;

    std::shared_ptr<domain::ConversationStore> m_store;
    domain::Clock m_clock;
    domain::expression::ExpressionEvaluator m_evaluator;
    int m_historyLimit;
    std::vector<Rule> m_rules;
};

} // namespace logicchat::application
