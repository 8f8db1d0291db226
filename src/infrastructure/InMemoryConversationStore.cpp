#include "infrastructure/InMemoryConversationStore.hpp"
#include "infrastructure/TimeUtils.hpp"
#include <algorithm>
#include <stdexcept>

namespace logicchat::infrastructure {

std::vector<domain::Turn> TailOf(const std::vector<domain::Turn>& turns, int limit) {
    if (limit <= 0 || turns.empty()) return {};
    std::size_t count = std::min(turns.size(), static_cast<std::size_t>(limit));
    return std::vector<domain::Turn>(turns.end() - static_cast<std::ptrdiff_t>(count), turns.end());
}

InMemoryConversationStore::InMemoryConversationStore(domain::Clock clock)
    : m_clock(clock ? std::move(clock) : domain::SystemClock()) {}

domain::Turn InMemoryConversationStore::append(const std::string& userText, const std::string& aiText) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_open) {
        throw std::runtime_error("InMemoryConversationStore: store is closed.");
    }
    domain::Turn turn{m_nextId++, TimeUtils::ToIso8601Utc(m_clock()), userText, aiText};
    m_turns.push_back(turn);
    return turn;
}

std::vector<domain::Turn> InMemoryConversationStore::fetchRecent(int limit) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return TailOf(m_turns, limit);
}

void InMemoryConversationStore::close() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_open = false;
}

bool InMemoryConversationStore::isOpen() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_open;
}

} // namespace logicchat::infrastructure
