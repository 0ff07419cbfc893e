#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "common/chat_locks.hpp"
#include "common/config.hpp"
#include "common/models.hpp"
#include "detect/lemma_normalizer.hpp"
#include "detect/pattern_compiler.hpp"
#include "store/streak_store.hpp"

namespace streakguard {

// TriggerRegistry owns the per-chat trigger vocabulary. Readers get an
// immutable ActiveRules snapshot from a per-chat {rules, expiry} cache entry;
// every mutation persists under the chat's lock, bumps the chat's generation
// and then swaps in a freshly loaded snapshot. A snapshot loaded under an older
// generation never replaces a newer one.
//
// Until a chat's vocabulary is first changed, the configured default lemmas are
// part of every read without being stored. The first mutation installs them
// (system actor) before applying itself, so a chat is seeded exactly once and
// reads never write.
class TriggerRegistry {
public:
    using Clock = std::function<TimePoint()>;

    TriggerRegistry(StreakStore &store,
                    ChatLocks &locks,
                    PatternCompiler &compiler,
                    const LemmaNormalizer &normalizer,
                    const StreakConfig &config);

    void setClock(Clock clock);

    // Throws ValidationError on an invalid or duplicate word.
    TriggerRule addLemma(ChatId chatId, const std::string &word, const Actor &actor);

    // Lemma rule plus every generated pattern rule, inserted atomically.
    std::vector<TriggerRule> addWord(ChatId chatId, const std::string &word, const Actor &actor);

    // Deletes the lemma and all rules derived from it. Returns the number of
    // rules removed; an unknown word is a ValidationError.
    int removeWord(ChatId chatId, const std::string &word, const Actor &actor);

    // ruleName is a lemma value or a generated pattern rule name.
    void enable(ChatId chatId, const std::string &ruleName, const Actor &actor);
    void disable(ChatId chatId, const std::string &ruleName, const Actor &actor);

    std::shared_ptr<const ActiveRules> activeRules(ChatId chatId);

    // Every rule including disabled ones, in insertion order.
    std::vector<TriggerRule> allRules(ChatId chatId);

    // True once the default lemmas have been written for chatId.
    bool isSeeded(ChatId chatId);

    static Actor systemActor();

private:
    struct CacheEntry {
        std::shared_ptr<const ActiveRules> rules;
        TimePoint expiry;
        std::uint64_t generation = 0;
    };

    StreakStore &m_store;
    ChatLocks &m_locks;
    PatternCompiler &m_compiler;
    const LemmaNormalizer &m_normalizer;
    std::vector<std::string> m_defaultLemmas;
    std::chrono::seconds m_ttl;
    Clock m_clock;

    std::mutex m_cacheMutex;
    std::unordered_map<ChatId, CacheEntry> m_cache;
    std::unordered_map<ChatId, std::uint64_t> m_generations;
    std::unordered_set<ChatId> m_seeded;

    std::string lemmaFor(const std::string &word) const;
    std::vector<TriggerRule> buildRules(ChatId chatId,
                                        const std::string &lemma,
                                        const Actor &actor,
                                        bool withPatterns) const;
    void precompile(const std::vector<TriggerRule> &rules);
    bool hasLemmaLocked(ChatId chatId, const std::string &lemma) const;
    void insertWordLocked(ChatId chatId, const std::vector<TriggerRule> &rules);
    // Default words not yet present in existing; invalid defaults are skipped.
    std::vector<std::vector<TriggerRule>> pendingDefaults(
        ChatId chatId, const std::vector<TriggerRule> &existing) const;
    std::vector<TriggerRule> visibleRules(ChatId chatId);
    void seedLocked(ChatId chatId);
    void bumpGenerationLocked(ChatId chatId);
    std::shared_ptr<const ActiveRules> reload(ChatId chatId);
    void setEnabled(ChatId chatId, const std::string &ruleName, bool enabled, const Actor &actor);
};

} // namespace streakguard
