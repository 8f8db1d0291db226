#include <cassert>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

#include "infrastructure/FileConversationStore.hpp"
#include "infrastructure/InMemoryConversationStore.hpp"
#include "infrastructure/TimeUtils.hpp"

using namespace logicchat;
using infrastructure::FileConversationStore;
using infrastructure::InMemoryConversationStore;

namespace {

namespace fs = std::filesystem;

std::chrono::system_clock::time_point EpochPlus(long long millis) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(millis));
}

// Shared contract checks, run against every implementation.
void CheckAppendOnlyContract(domain::ConversationStore& store) {
    assert(store.isOpen());
    assert(store.fetchRecent(5).empty());

    auto a = store.append("A", "ra");
    auto b = store.append("B", "rb");
    auto c = store.append("C", "rc");
    auto d = store.append("D", "rd");
    assert(a.id < b.id && b.id < c.id && c.id < d.id);

    auto recent = store.fetchRecent(3);
    assert(recent.size() == 3);
    assert(recent[0] == b);
    assert(recent[1] == c);
    assert(recent[2] == d);

    assert(store.fetchRecent(0).empty());
    assert(store.fetchRecent(-4).empty());
    assert(store.fetchRecent(100).size() == 4);
    assert(store.fetchRecent(100).front() == a);

    // Read-your-writes.
    auto e = store.append("E", "re");
    assert(store.fetchRecent(1).size() == 1);
    assert(store.fetchRecent(1)[0] == e);

    store.close();
    assert(!store.isOpen());
    bool threw = false;
    try {
        store.append("F", "rf");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    assert(store.fetchRecent(10).size() == 5);
}

void TestTimestamps() {
    assert(infrastructure::TimeUtils::ToIso8601Utc(EpochPlus(1500)) == "1970-01-01T00:00:01.500000Z");
    assert(infrastructure::TimeUtils::ToIso8601Utc(EpochPlus(1700000000123LL)) == "2023-11-14T22:13:20.123000Z");

    InMemoryConversationStore store(domain::FixedClock(EpochPlus(86400000LL)));
    auto turn = store.append("hi", "hello");
    assert(turn.id == 1);
    assert(turn.timestamp == "1970-01-02T00:00:00.000000Z");
    std::cout << "[PASS] ISO-8601 UTC timestamps." << std::endl;
}

void TestInMemory() {
    InMemoryConversationStore store;
    CheckAppendOnlyContract(store);
    std::cout << "[PASS] InMemoryConversationStore contract." << std::endl;
}

void TestFileContractAndReplay(const fs::path& root) {
    fs::path logPath = root / "nested" / "conversation.ndjson";
    {
        FileConversationStore store(logPath.string(), domain::FixedClock(EpochPlus(1500)));
        CheckAppendOnlyContract(store);
    }
    assert(fs::exists(logPath));

    // Every line is a complete four-field record.
    std::ifstream in(logPath);
    std::string line;
    int lines = 0;
    while (std::getline(in, line)) {
        auto j = nlohmann::json::parse(line);
        assert(j.at("id").get<long long>() == lines + 1);
        assert(j.at("timestamp").get<std::string>() == "1970-01-01T00:00:01.500000Z");
        assert(j.contains("user_msg") && j.contains("ai_msg"));
        ++lines;
    }
    assert(lines == 5);

    FileConversationStore reopened(logPath.string());
    auto turns = reopened.fetchRecent(10);
    assert(turns.size() == 5);
    assert(turns.front().userText == "A");
    assert(turns.back().userText == "E");
    assert(reopened.skippedRecords() == 0);

    auto next = reopened.append("안녕하세요 \"quoted\"\nline", "네");
    assert(next.id == 6);
    reopened.close();

    FileConversationStore again(logPath.string());
    auto last = again.fetchRecent(1);
    assert(last.size() == 1);
    assert(last[0].id == 6);
    assert(last[0].userText == "안녕하세요 \"quoted\"\nline");
    assert(last[0].aiText == "네");
    std::cout << "[PASS] FileConversationStore contract and replay." << std::endl;
}

void TestFileRecovery(const fs::path& root) {
    fs::path logPath = root / "damaged.ndjson";
    {
        std::ofstream out(logPath, std::ios::binary);
        out << R"({"id": 1, "timestamp": "t1", "user_msg": "u1", "ai_msg": "a1"})" << "\n";
        out << "this is not json\n";
        out << "\n";
        out << R"({"id": 2, "timestamp": "t2", "user_msg": "u2", "ai_msg": "a2"})" << "\n";
        out << R"({"id": 2, "timestamp": "dup", "user_msg": "u", "ai_msg": "a"})" << "\n";
        out << R"({"id": 3, "timest)";
    }

    {
        FileConversationStore store(logPath.string());
        auto turns = store.fetchRecent(10);
        assert(turns.size() == 2);
        assert(turns[0].id == 1 && turns[1].id == 2);
        assert(store.skippedRecords() == 3);

        auto appended = store.append("u3", "a3");
        assert(appended.id == 3);
    }

    FileConversationStore reopened(logPath.string());
    auto turns = reopened.fetchRecent(10);
    assert(turns.size() == 3);
    assert(turns[2].id == 3);
    assert(turns[2].userText == "u3");
    std::cout << "[PASS] Malformed and torn records are skipped." << std::endl;
}

void TestRecallWindow(const fs::path& root) {
    fs::path logPath = root / "windowed.ndjson";
    {
        FileConversationStore store(logPath.string(), domain::SystemClock(), 3);
        for (int i = 1; i <= 10; ++i) {
            store.append("u" + std::to_string(i), "a" + std::to_string(i));
            assert(store.cachedTurns() <= 3);
        }
        assert(store.cachedTurns() == 3);
        assert(store.turnCount() == 10);

        auto shallow = store.fetchRecent(2);
        assert(shallow.size() == 2);
        assert(shallow[0].id == 9 && shallow[1].id == 10);

        // Reads past the window come from the file, still oldest first.
        auto deep = store.fetchRecent(7);
        assert(deep.size() == 7);
        for (std::size_t i = 0; i < deep.size(); ++i) {
            assert(deep[i].id == static_cast<std::int64_t>(i + 4));
        }
        assert(deep[0].userText == "u4");
        assert(store.fetchRecent(100).size() == 10);
        assert(store.cachedTurns() == 3);
    }

    FileConversationStore reopened(logPath.string(), domain::SystemClock(), 3);
    assert(reopened.cachedTurns() == 3);
    assert(reopened.turnCount() == 10);
    auto all = reopened.fetchRecent(10);
    assert(all.size() == 10);
    assert(all.front().id == 1 && all.back().id == 10);

    auto next = reopened.append("u11", "a11");
    assert(next.id == 11);
    assert(reopened.cachedTurns() == 3);
    assert(reopened.fetchRecent(1)[0] == next);

    bool threw = false;
    try {
        FileConversationStore zeroWindow((root / "zero.ndjson").string(), domain::SystemClock(), 0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Memory holds only the recall window; deeper reads use the file." << std::endl;
}

void TestSingleOwner(const fs::path& root) {
    fs::path logPath = root / "owned.ndjson";
    FileConversationStore owner(logPath.string());
    owner.append("first", "one");

    bool threw = false;
    try {
        FileConversationStore intruder(logPath.string());
    } catch (const std::runtime_error& e) {
        threw = true;
        std::cout << "[Test] Expected failure: " << e.what() << std::endl;
    }
    assert(threw);

    owner.close();
    FileConversationStore successor(logPath.string());
    auto turn = successor.append("second", "two");
    assert(turn.id == 2);
    std::cout << "[PASS] A log is held by one store at a time." << std::endl;
}

void TestInvalidUtf8(const fs::path& root) {
    fs::path logPath = root / "bytes.ndjson";
    const std::string raw = "bad \xff byte";
    const std::string replaced = "bad \xEF\xBF\xBD byte";

    domain::Turn written;
    {
        FileConversationStore store(logPath.string());
        written = store.append(raw, "ok");
        assert(written.userText == replaced);
        assert(store.fetchRecent(1)[0] == written);
    }

    FileConversationStore reopened(logPath.string());
    assert(reopened.skippedRecords() == 0);
    assert(reopened.fetchRecent(1)[0] == written);
    std::cout << "[PASS] Turns read back the same before and after a restart." << std::endl;
}

void TestUnopenableFile(const fs::path& root) {
    fs::path dirAsFile = root / "a_directory";
    fs::create_directories(dirAsFile);
    bool threw = false;
    try {
        FileConversationStore store(dirAsFile.string());
    } catch (const std::runtime_error& e) {
        threw = true;
        std::cout << "[Test] Expected failure: " << e.what() << std::endl;
    }
    assert(threw);
    std::cout << "[PASS] Unopenable log reports an error." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ConversationStore Test..." << std::endl;

    fs::path testRoot = "test_conversation_store_root";
    fs::remove_all(testRoot);
    fs::create_directories(testRoot);

    TestTimestamps();
    TestInMemory();
    TestFileContractAndReplay(testRoot);
    TestFileRecovery(testRoot);
    TestRecallWindow(testRoot);
    TestSingleOwner(testRoot);
    TestInvalidUtf8(testRoot);
    TestUnopenableFile(testRoot);

    fs::remove_all(testRoot);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
