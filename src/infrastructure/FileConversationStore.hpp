/**
 * @file FileConversationStore.hpp
 * @brief File-system based append-only conversation log (NDJSON).
 */

#pragma once

#include <cstddef>
#include <deque>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>
#include "domain/Clock.hpp"
#include "domain/ConversationStore.hpp"

namespace logicchat::infrastructure {

/**
 * @class FileConversationStore
 * @brief Persists each turn as one JSON object per line and keeps the most
 * recent turns in memory for reads.
 *
 * Record layout: {"id":1,"timestamp":"...Z","user_msg":"...","ai_msg":"..."}.
 * Opening replays the file to rebuild the next id and the recent-turn window.
 * A turn is published to readers only after its line has been written and
 * flushed. Reads deeper than the window are served from the file.
 *
 * The log belongs to one process at a time: the store holds an exclusive
 * advisory lock on the file from construction until close().
 */
class FileConversationStore : public domain::ConversationStore {
public:
    static constexpr std::size_t kDefaultRecallWindow = 256;

    /**
     * @brief Opens (creating if needed) the log at the given path.
     * @param recallWindow Number of recent turns kept in memory; must be positive.
     * @throws std::runtime_error if the file cannot be opened or is locked by
     * another store.
     * @throws std::invalid_argument if recallWindow is zero.
     */
    explicit FileConversationStore(std::string filePath,
                                   domain::Clock clock = domain::SystemClock(),
                                   std::size_t recallWindow = kDefaultRecallWindow);
    ~FileConversationStore() override;

    FileConversationStore(const FileConversationStore&) = delete;
    FileConversationStore& operator=(const FileConversationStore&) = delete;

    domain::Turn append(const std::string& userText, const std::string& aiText) override;
    std::vector<domain::Turn> fetchRecent(int limit) const override;
    void close() override;
    bool isOpen() const override;

    const std::string& filePath() const { return m_filePath; }

    /** @brief Number of records skipped as malformed while replaying the file. */
    std::size_t skippedRecords() const { return m_skippedRecords; }

    /** @brief Turns currently held in memory. Never exceeds recallWindow(). */
    std::size_t cachedTurns() const;
    std::size_t recallWindow() const { return m_recallWindow; }

    /** @brief Total number of valid turns in the log. */
    std::size_t turnCount() const;

private:
    struct ScanResult {
        std::deque<domain::Turn> tail;
        std::size_t total = 0;
        std::size_t skipped = 0;
        std::size_t lines = 0;
        bool lastLineTerminated = true;
    };

    /** Reads the whole log, keeping the last `keep` valid turns. */
    ScanResult scan(std::size_t keep, bool reportSkips) const;
    void replay();
    void acquireLock();
    void releaseLock();

    std::string m_filePath;
    domain::Clock m_clock;
    std::size_t m_recallWindow;
    std::ofstream m_out;
    int m_lockFd = -1;
    std::deque<domain::Turn> m_recent;
    std::size_t m_turnCount = 0;
    std::int64_t m_nextId = 1;
    std::size_t m_skippedRecords = 0;
    bool m_needsNewline = false;
    mutable std::mutex m_mutex;
};

} // namespace logicchat::infrastructure
