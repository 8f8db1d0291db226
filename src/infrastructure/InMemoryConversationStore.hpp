/**
 * @file InMemoryConversationStore.hpp
 * @brief Volatile ConversationStore for tests and throwaway sessions.
 */

#pragma once

#include <mutex>
#include <vector>
#include "domain/Clock.hpp"
#include "domain/ConversationStore.hpp"

namespace logicchat::infrastructure {

class InMemoryConversationStore : public domain::ConversationStore {
public:
    explicit InMemoryConversationStore(domain::Clock clock = domain::SystemClock());

    domain::Turn append(const std::string& userText, const std::string& aiText) override;
    std::vector<domain::Turn> fetchRecent(int limit) const override;
    void close() override;
    bool isOpen() const override;

private:
    domain::Clock m_clock;
    std::vector<domain::Turn> m_turns;
    std::int64_t m_nextId = 1;
    bool m_open = true;
    mutable std::mutex m_mutex;
};

/** @brief Copies the last `limit` turns of an id-ordered log, oldest first. */
std::vector<domain::Turn> TailOf(const std::vector<domain::Turn>& turns, int limit);

} // namespace logicchat::infrastructure
