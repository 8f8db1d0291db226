/**
 * @file FileConversationStore.cpp
 * @brief Implementation of FileConversationStore.
 */

#include "infrastructure/FileConversationStore.hpp"
#include "infrastructure/TimeUtils.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#include <nlohmann/json.hpp>

namespace logicchat::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

domain::Turn TurnFromRecord(const json& j) {
    domain::Turn turn;
    turn.id = j.at("id").get<std::int64_t>();
    turn.timestamp = j.at("timestamp").get<std::string>();
    turn.userText = j.at("user_msg").get<std::string>();
    turn.aiText = j.at("ai_msg").get<std::string>();
    return turn;
}

} // namespace

FileConversationStore::FileConversationStore(std::string filePath, domain::Clock clock, std::size_t recallWindow)
    : m_filePath(std::move(filePath)),
      m_clock(clock ? std::move(clock) : domain::SystemClock()),
      m_recallWindow(recallWindow) {
    if (m_recallWindow == 0) {
        throw std::invalid_argument("FileConversationStore: recall window must be positive.");
    }

    fs::path path(m_filePath);
    try {
        if (path.has_parent_path() && !fs::exists(path.parent_path())) {
            fs::create_directories(path.parent_path());
        }
    } catch (const fs::filesystem_error& e) {
        throw std::runtime_error("FileConversationStore: cannot create directory for " + m_filePath + ": " + e.what());
    }

    acquireLock();
    try {
        replay();
        m_out.open(path, std::ios::out | std::ios::app | std::ios::binary);
        if (!m_out.is_open()) {
            throw std::runtime_error("FileConversationStore: cannot open " + m_filePath + " for appending.");
        }
    } catch (const std::exception&) {
        releaseLock();
        throw;
    }
}

FileConversationStore::~FileConversationStore() {
    close();
}

// flock() rather than fcntl() record locks: the latter are dropped as soon as
// any descriptor for the file is closed, which the replay reader does.
void FileConversationStore::acquireLock() {
    m_lockFd = ::open(m_filePath.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (m_lockFd < 0) {
        throw std::runtime_error("FileConversationStore: cannot open " + m_filePath + ": " + std::strerror(errno));
    }
    if (::flock(m_lockFd, LOCK_EX | LOCK_NB) != 0) {
        const int err = errno;
        ::close(m_lockFd);
        m_lockFd = -1;
        if (err == EWOULDBLOCK) {
            throw std::runtime_error("FileConversationStore: " + m_filePath + " is in use by another process.");
        }
        throw std::runtime_error("FileConversationStore: cannot lock " + m_filePath + ": " + std::strerror(err));
    }
}

void FileConversationStore::releaseLock() {
    if (m_lockFd >= 0) {
        ::flock(m_lockFd, LOCK_UN);
        ::close(m_lockFd);
        m_lockFd = -1;
    }
}

FileConversationStore::ScanResult FileConversationStore::scan(std::size_t keep, bool reportSkips) const {
    ScanResult result;
    std::ifstream in(m_filePath, std::ios::binary);
    if (!in) return result;

    std::int64_t lastId = 0;
    std::string line;
    while (std::getline(in, line)) {
        ++result.lines;
        result.lastLineTerminated = !in.eof();
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        try {
            auto turn = TurnFromRecord(json::parse(line));
            if (result.total > 0 && turn.id <= lastId) {
                if (reportSkips) {
                    std::cerr << "[FileConversationStore] Skipping out-of-order record at line "
                              << result.lines << " (id " << turn.id << ")" << std::endl;
                }
                ++result.skipped;
                continue;
            }
            lastId = turn.id;
            ++result.total;
            result.tail.push_back(std::move(turn));
            if (result.tail.size() > keep) result.tail.pop_front();
        } catch (const json::exception& e) {
            if (reportSkips) {
                std::cerr << "[FileConversationStore] Skipping malformed record at line "
                          << result.lines << ": " << e.what() << std::endl;
            }
            ++result.skipped;
        }
    }
    return result;
}

void FileConversationStore::replay() {
    ScanResult result = scan(m_recallWindow, true);

    m_recent = std::move(result.tail);
    m_turnCount = result.total;
    m_skippedRecords = result.skipped;
    if (!m_recent.empty()) {
        m_nextId = m_recent.back().id + 1;
    }
    // A torn final write leaves no trailing newline; start the next record on a fresh line.
    m_needsNewline = result.lines > 0 && !result.lastLineTerminated;
}

domain::Turn FileConversationStore::append(const std::string& userText, const std::string& aiText) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_out.is_open()) {
        throw std::runtime_error("FileConversationStore: store is closed.");
    }

    json j = {
        {"id", m_nextId},
        {"timestamp", TimeUtils::ToIso8601Utc(m_clock())},
        {"user_msg", userText},
        {"ai_msg", aiText}
    };
    const std::string record = j.dump(-1, ' ', false, json::error_handler_t::replace);
    // Publish what a replay will read back, including any replaced bytes.
    domain::Turn turn = TurnFromRecord(json::parse(record));

    if (m_needsNewline) {
        m_out << '\n';
    }
    m_out << record << '\n';
    m_out.flush();
    if (!m_out) {
        m_out.clear();
        m_needsNewline = true;
        throw std::runtime_error("FileConversationStore: write failed for " + m_filePath);
    }
    m_needsNewline = false;

    ++m_nextId;
    ++m_turnCount;
    m_recent.push_back(turn);
    if (m_recent.size() > m_recallWindow) m_recent.pop_front();
    return turn;
}

std::vector<domain::Turn> FileConversationStore::fetchRecent(int limit) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (limit <= 0 || m_turnCount == 0) return {};

    const auto wanted = static_cast<std::size_t>(limit);
    if (wanted <= m_recent.size() || m_recent.size() == m_turnCount) {
        const std::size_t count = std::min(wanted, m_recent.size());
        return std::vector<domain::Turn>(m_recent.end() - static_cast<std::ptrdiff_t>(count), m_recent.end());
    }

    // Deeper than the window: every published record has been flushed, so the file has it.
    ScanResult result = scan(wanted, false);
    return std::vector<domain::Turn>(result.tail.begin(), result.tail.end());
}

void FileConversationStore::close() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_out.is_open()) {
        m_out.flush();
        m_out.close();
    }
    releaseLock();
}

bool FileConversationStore::isOpen() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_out.is_open();
}

std::size_t FileConversationStore::cachedTurns() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_recent.size();
}

std::size_t FileConversationStore::turnCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_turnCount;
}

} // namespace logicchat::infrastructure
