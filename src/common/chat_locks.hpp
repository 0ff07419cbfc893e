#pragma once

#include <memory>
#include <mutex>
#include <unordered_map>

#include "common/models.hpp"

namespace streakguard {

// ChatLocks hands out one mutex per chat id. Every mutating operation on a chat
// (event append, undo, rule changes) holds that chat's mutex, so writes of one
// chat apply in a single order while different chats never wait on each other.
class ChatLocks {
public:
    std::shared_ptr<std::mutex> forChat(ChatId chatId);

private:
    std::mutex m_mapMutex;
    std::unordered_map<ChatId, std::shared_ptr<std::mutex>> m_locks;
};

} // namespace streakguard
