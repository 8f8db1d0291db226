#include <cassert>
#include <chrono>
#include <ctime>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "application/IntentDispatcher.hpp"
#include "application/ResponseEngine.hpp"
#include "infrastructure/InMemoryConversationStore.hpp"

using namespace logicchat;
using domain::Intent;
using application::IntentDispatcher;

namespace {

// 2024-03-15 09:05:07 local time.
std::chrono::system_clock::time_point LocalInstant() {
    std::tm tm{};
    tm.tm_year = 2024 - 1900;
    tm.tm_mon = 2;
    tm.tm_mday = 15;
    tm.tm_hour = 9;
    tm.tm_min = 5;
    tm.tm_sec = 7;
    tm.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

class UnreadableStore : public domain::ConversationStore {
public:
    domain::Turn append(const std::string&, const std::string&) override {
        throw std::runtime_error("disk full");
    }
    std::vector<domain::Turn> fetchRecent(int) const override {
        throw std::runtime_error("log unreadable");
    }
    void close() override {}
    bool isOpen() const override { return true; }
};

void TestRuleOrder(const IntentDispatcher& dispatcher) {
    const std::vector<Intent> expected = {
        Intent::Arithmetic, Intent::DateQuery, Intent::TimeQuery,
        Intent::HistoryRecall, Intent::SelfIdentify, Intent::Fallback};
    assert(dispatcher.rules().size() == expected.size());
    for (std::size_t i = 0; i < expected.size(); ++i) {
        assert(dispatcher.rules()[i].intent == expected[i]);
    }
    std::cout << "[PASS] Rule table order." << std::endl;
}

void TestClassification(const IntentDispatcher& d) {
    assert(d.classify("2+2") == Intent::Arithmetic);
    assert(d.classify("today 3+3") == Intent::Arithmetic);
    assert(d.classify("room 2-b") == Intent::Arithmetic);
    assert(d.classify("what is the date") == Intent::DateQuery);
    assert(d.classify("What DAY is it?") == Intent::DateQuery);
    assert(d.classify("date and time please") == Intent::DateQuery);
    assert(d.classify("what time is it") == Intent::TimeQuery);
    assert(d.classify("remember the time?") == Intent::TimeQuery);
    assert(d.classify("show me the HISTORY") == Intent::HistoryRecall);
    assert(d.classify("do you remember me") == Intent::HistoryRecall);
    assert(d.classify("Who are you?") == Intent::SelfIdentify);
    assert(d.classify("what are you exactly") == Intent::SelfIdentify);
    assert(d.classify("hello there") == Intent::Fallback);
    assert(d.classify("") == Intent::Fallback);
    assert(d.classify("42") == Intent::Fallback);
    assert(d.classify("+-*/") == Intent::Fallback);

    assert(d.classify("오늘 날짜 알려줘") == Intent::DateQuery);
    assert(d.classify("무슨 요일이야") == Intent::DateQuery);
    assert(d.classify("현재 시간") == Intent::TimeQuery);
    assert(d.classify("지난 대화 보여줘") == Intent::HistoryRecall);
    assert(d.classify("너의 이름은") == Intent::SelfIdentify);
    std::cout << "[PASS] Classification by ordered first match." << std::endl;
}

void TestDispatch(const IntentDispatcher& d) {
    auto sum = d.dispatch("2+2");
    assert(sum.intent == Intent::Arithmetic);
    assert(sum.response == "The result is 4.");

    assert(d.dispatch("  7 / 2 ").response == "The result is 3.5.");
    assert(d.dispatch("-7//2").response == "The result is -4.");
    assert(d.dispatch("2**10").response == "The result is 1024.");
    assert(d.dispatch("2**0.5").response == "The result is 1.4142135623730951.");
    assert(d.dispatch("1E3 + 1").response == "The result is 1001.");

    auto date = d.dispatch("what is the date?");
    assert(date.intent == Intent::DateQuery);
    assert(date.response == "Today's date is 2024-03-15 (local time).");

    auto time = d.dispatch("What time is it?");
    assert(time.intent == Intent::TimeQuery);
    assert(time.response == "The current time is 09:05:07 (local time).");

    auto who = d.dispatch("who are you?");
    assert(who.intent == Intent::SelfIdentify);
    assert(who.response == application::replies::kSelfDescription);

    auto other = d.dispatch("tell me a joke");
    assert(other.intent == Intent::Fallback);
    assert(other.response == application::replies::kFallback);
    std::cout << "[PASS] Handlers produce the fixed templates." << std::endl;
}

void TestFallThrough(const IntentDispatcher& d) {
    // Pre-filter matches, evaluation fails, later rules answer.
    assert(d.classify("5%0") == Intent::Arithmetic);
    auto byZero = d.dispatch("5%0");
    assert(byZero.intent == Intent::Fallback);
    assert(byZero.response == application::replies::kFallback);

    auto dated = d.dispatch("today 3+3");
    assert(dated.intent == Intent::DateQuery);
    assert(dated.response == "Today's date is 2024-03-15 (local time).");

    auto timed = d.dispatch("time 1/0");
    assert(timed.intent == Intent::TimeQuery);

    auto recalled = d.dispatch("log 2-");
    assert(recalled.intent == Intent::HistoryRecall);

    auto named = d.dispatch("who are you 1+x");
    assert(named.intent == Intent::SelfIdentify);

    assert(d.dispatch("what is 2+2?").intent == Intent::Fallback);
    assert(d.dispatch("2023-10-05").intent == Intent::Fallback);
    assert(d.dispatch("(-8)**0.5").intent == Intent::Fallback);
    assert(d.dispatch("1e400 - 1").intent == Intent::Fallback);
    assert(d.dispatch("1e400 - 1").response == application::replies::kFallback);
    assert(d.dispatch(std::string(300, '(') + "1" + std::string(300, ')') + "+1").intent == Intent::Fallback);
    std::cout << "[PASS] Evaluator failures fall through to later rules." << std::endl;
}

void TestHistory() {
    auto store = std::make_shared<infrastructure::InMemoryConversationStore>();
    IntentDispatcher d(store, domain::FixedClock(LocalInstant()));

    auto empty = d.dispatch("show history");
    assert(empty.intent == Intent::HistoryRecall);
    assert(empty.response == "There is no previous conversation yet.");

    store->append("2+2", "The result is 4.");
    store->append("hello", "Hi.");
    auto two = d.dispatch("show history");
    assert(two.response ==
           "Here is our recent conversation history:\n"
           "1. You said: '2+2' | I responded: 'The result is 4.'\n"
           "2. You said: 'hello' | I responded: 'Hi.'");

    for (int i = 3; i <= 12; ++i) {
        store->append("m" + std::to_string(i), "r" + std::to_string(i));
    }
    auto ten = d.dispatch("what do you remember").response;
    std::size_t lines = 0;
    for (char c : ten) if (c == '\n') ++lines;
    assert(lines == 10);
    assert(ten.find("\n1. You said: 'm3' | I responded: 'r3'") != std::string::npos);
    assert(ten.find("\n10. You said: 'm12' | I responded: 'r12'") != std::string::npos);
    assert(ten.find("'hello'") == std::string::npos);

    IntentDispatcher shortRecall(store, domain::FixedClock(LocalInstant()), {}, 2);
    auto last2 = shortRecall.dispatch("history").response;
    assert(last2 ==
           "Here is our recent conversation history:\n"
           "1. You said: 'm11' | I responded: 'r11'\n"
           "2. You said: 'm12' | I responded: 'r12'");
    std::cout << "[PASS] History recall renders recent turns oldest first." << std::endl;
}

void TestDeterminism() {
    auto store = std::make_shared<infrastructure::InMemoryConversationStore>();
    store->append("a", "b");
    auto dispatcher = std::make_shared<IntentDispatcher>(store, domain::SystemClock());
    application::ResponseEngine engine(dispatcher);

    const std::vector<std::string> inputs = {"2+2", "3 % 0", "history", "who are you", "anything", ""};
    for (const auto& input : inputs) {
        assert(engine.generateResponse(input) == engine.generateResponse(input));
    }
    assert(engine.generateResponse("2+2") == "The result is 4.");
    std::cout << "[PASS] Non-clock replies are deterministic." << std::endl;
}

void TestUnreadableStore() {
    auto dispatcher = std::make_shared<IntentDispatcher>(
        std::make_shared<UnreadableStore>(), domain::FixedClock(LocalInstant()));
    auto result = dispatcher->dispatch("history");
    assert(result.intent == Intent::Fallback);

    application::ResponseEngine engine(dispatcher);
    assert(engine.generateResponse("history") == application::replies::kFallback);
    std::cout << "[PASS] Unreadable log degrades to later rules." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting IntentDispatcher Test..." << std::endl;

    auto store = std::make_shared<infrastructure::InMemoryConversationStore>();
    IntentDispatcher dispatcher(store, domain::FixedClock(LocalInstant()));

    TestRuleOrder(dispatcher);
    TestClassification(dispatcher);
    TestDispatch(dispatcher);
    TestFallThrough(dispatcher);
    TestHistory();
    TestDeterminism();
    TestUnreadableStore();

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
