/**
 * @file IntentDispatcher.cpp
 * @brief Implementation of IntentDispatcher.
 */

#include "application/IntentDispatcher.hpp"
#include "application/NumberFormatter.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace logicchat::application {

using domain::Intent;

namespace {

const std::vector<std::string> kDateKeywords = {"date", "day", "today", "날짜", "요일"};
const std::vector<std::string> kTimeKeywords = {"time", "현재 시간", "시각", "hour", "minute"};
const std::vector<std::string> kHistoryKeywords = {"history", "memory", "log", "대화", "내역", "지난", "remember"};
const std::vector<std::string> kIdentityKeywords = {"who are you", "what are you", "이름", "정체", "your difference"};

constexpr const char* kArithmeticOperators = "+-*/%";

bool ContainsAny(const std::string& text, const std::vector<std::string>& keywords) {
    return std::any_of(keywords.begin(), keywords.end(), [&text](const std::string& keyword) {
        return text.find(keyword) != std::string::npos;
    });
}

bool LooksLikeArithmetic(const std::string& text) {
    bool hasDigit = std::any_of(text.begin(), text.end(), [](char c) {
        return c >= '0' && c <= '9';
    });
    return hasDigit && text.find_first_of(kArithmeticOperators) != std::string::npos;
}

std::string FormatLocal(std::chrono::system_clock::time_point instant, const char* pattern) {
    std::time_t t = std::chrono::system_clock::to_time_t(instant);
    std::tm local{};
#if defined(_WIN32)
    localtime_s(&local, &t);
#else
    localtime_r(&t, &local);
#endif
    std::ostringstream ss;
    ss << std::put_time(&local, pattern);
    return ss.str();
}

} // namespace

IntentDispatcher::IntentDispatcher(std::shared_ptr<domain::ConversationStore> store,
                                   domain::Clock clock,
                                   domain::expression::ParserLimits limits,
                                   int historyLimit)
    : m_store(std::move(store)),
      m_clock(clock ? std::move(clock) : domain::SystemClock()),
      m_evaluator(limits),
      m_historyLimit(historyLimit) {
    // Order is the classification policy. Do not sort.
    m_rules = {
        {Intent::Arithmetic, LooksLikeArithmetic,
         [this](const std::string& msg) { return answerArithmetic(msg); }},
        {Intent::DateQuery, [](const std::string& msg) { return ContainsAny(msg, kDateKeywords); },
         [this](const std::string&) { return answerDate(); }},
        {Intent::TimeQuery, [](const std::string& msg) { return ContainsAny(msg, kTimeKeywords); },
         [this](const std::string&) { return answerTime(); }},
        {Intent::HistoryRecall, [](const std::string& msg) { return ContainsAny(msg, kHistoryKeywords); },
         [this](const std::string&) { return answerHistory(); }},
        {Intent::SelfIdentify, [](const std::string& msg) { return ContainsAny(msg, kIdentityKeywords); },
         [](const std::string&) { return std::optional<std::string>(replies::kSelfDescription); }},
        {Intent::Fallback, [](const std::string&) { return true; },
         [](const std::string&) { return std::optional<std::string>(replies::kFallback); }},
    };
}

std::string IntentDispatcher::Normalize(const std::string& text) {
    const char* blanks = " \t\n\r\f\v";
    auto first = text.find_first_not_of(blanks);
    if (first == std::string::npos) return "";
    auto last = text.find_last_not_of(blanks);

    std::string result = text.substr(first, last - first + 1);
    std::transform(result.begin(), result.end(), result.begin(), [](char c) {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    });
    return result;
}

Intent IntentDispatcher::classify(const std::string& text) const {
    const std::string msg = Normalize(text);
    for (const auto& rule : m_rules) {
        if (rule.matches(msg)) {
            return rule.intent;
        }
    }
    return Intent::Fallback;
}

IntentDispatcher::Dispatch IntentDispatcher::dispatch(const std::string& text) const {
    const std::string msg = Normalize(text);
    for (const auto& rule : m_rules) {
        if (!rule.matches(msg)) continue;
        if (auto reply = rule.respond(msg)) {
            return {rule.intent, *reply};
        }
    }
    return {Intent::Fallback, replies::kFallback};
}

std::optional<std::string> IntentDispatcher::answerArithmetic(const std::string& normalized) const {
    auto result = m_evaluator.evaluate(normalized);
    if (!result) {
        return std::nullopt;
    }
    return "The result is " + FormatNumber(result.value()) + ".";
}

std::optional<std::string> IntentDispatcher::answerDate() const {
    return "Today's date is " + FormatLocal(m_clock(), "%Y-%m-%d") + " (local time).";
}

std::optional<std::string> IntentDispatcher::answerTime() const {
    return "The current time is " + FormatLocal(m_clock(), "%H:%M:%S") + " (local time).";
}

std::optional<std::string> IntentDispatcher::answerHistory() const {
    if (!m_store) {
        return std::string(replies::kNoHistory);
    }

    std::vector<domain::Turn> history;
    try {
        history = m_store->fetchRecent(m_historyLimit);
    } catch (const std::exception& e) {
        std::cerr << "[IntentDispatcher] Could not read conversation log: " << e.what() << std::endl;
        return std::nullopt;
    }

    if (history.empty()) {
        return std::string(replies::kNoHistory);
    }

    std::ostringstream out;
    out << replies::kHistoryHeader;
    int index = 1;
    for (const auto& turn : history) {
        out << "\n" << index++ << ". You said: '" << turn.userText
            << "' | I responded: '" << turn.aiText << "'";
    }
    return out.str();
}

} // namespace logicchat::application
