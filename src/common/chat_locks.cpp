#include "common/chat_locks.hpp"

namespace streakguard {

std::shared_ptr<std::mutex> ChatLocks::forChat(ChatId chatId)
{
    std::lock_guard<std::mutex> lock(m_mapMutex);
    auto &slot = m_locks[chatId];
    if (!slot) {
        slot = std::make_shared<std::mutex>();
    }
    return slot;
}

} // namespace streakguard
