#include "detect/trigger_registry.hpp"

#include <QString>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "detect/text_utils.hpp"

namespace streakguard {

namespace {

std::string seededKey(ChatId chatId)
{
    return "seeded_chat:" + std::to_string(chatId);
}

nlohmann::json ruleNames(const std::vector<TriggerRule> &rules)
{
    nlohmann::json names = nlohmann::json::array();
    for (const auto &rule : rules) {
        names.push_back(rule.value);
    }
    return names;
}

} // namespace

TriggerRegistry::TriggerRegistry(StreakStore &store,
                                 ChatLocks &locks,
                                 PatternCompiler &compiler,
                                 const LemmaNormalizer &normalizer,
                                 const StreakConfig &config)
    : m_store(store)
    , m_locks(locks)
    , m_compiler(compiler)
    , m_normalizer(normalizer)
    , m_defaultLemmas(config.defaultLemmas)
    , m_ttl(config.ruleCacheTtl)
    , m_clock([] { return std::chrono::system_clock::now(); })
{
}

void TriggerRegistry::setClock(Clock clock)
{
    m_clock = std::move(clock);
}

Actor TriggerRegistry::systemActor()
{
    return Actor{0, "system"};
}

std::string TriggerRegistry::lemmaFor(const std::string &word) const
{
    return canonicalWord(m_normalizer.normalize(canonicalWord(word), std::string()));
}

std::vector<TriggerRule> TriggerRegistry::buildRules(ChatId chatId,
                                                     const std::string &lemma,
                                                     const Actor &actor,
                                                     bool withPatterns) const
{
    const TimePoint createdAt = truncateToMillis(m_clock());

    TriggerRule lemmaRule;
    lemmaRule.chatId = chatId;
    lemmaRule.kind = RuleKind::Lemma;
    lemmaRule.value = lemma;
    lemmaRule.sourceWord = lemma;
    lemmaRule.createdBy = actor;
    lemmaRule.createdAt = createdAt;

    std::vector<TriggerRule> rules{lemmaRule};
    if (!withPatterns) {
        return rules;
    }

    for (const auto &variant : m_compiler.generateVariants(lemma)) {
        TriggerRule rule;
        rule.chatId = chatId;
        rule.kind = RuleKind::Pattern;
        rule.value = variant.ruleName;
        rule.sourceWord = lemma;
        rule.variant = variant.kind;
        rule.patternSource = variant.patternSource;
        rule.createdBy = actor;
        rule.createdAt = createdAt;
        rules.push_back(std::move(rule));
    }
    return rules;
}

void TriggerRegistry::precompile(const std::vector<TriggerRule> &rules)
{
    for (const auto &rule : rules) {
        if (rule.kind == RuleKind::Pattern) {
            m_compiler.compile(rule.patternSource);
        }
    }
}

bool TriggerRegistry::hasLemmaLocked(ChatId chatId, const std::string &lemma) const
{
    for (const auto &rule : m_store.listTriggerRules(chatId)) {
        if (rule.kind == RuleKind::Lemma && rule.value == lemma) {
            return true;
        }
    }
    return false;
}

void TriggerRegistry::insertWordLocked(ChatId chatId, const std::vector<TriggerRule> &rules)
{
    seedLocked(chatId);
    if (hasLemmaLocked(chatId, rules.front().value)) {
        throw ValidationError("trigger already exists: " + rules.front().value);
    }
    m_store.insertTriggerRules(rules);
    bumpGenerationLocked(chatId);
}

void TriggerRegistry::bumpGenerationLocked(ChatId chatId)
{
    std::lock_guard<std::mutex> lock(m_cacheMutex);
    ++m_generations[chatId];
}

TriggerRule TriggerRegistry::addLemma(ChatId chatId, const std::string &word, const Actor &actor)
{
    const std::string lemma = lemmaFor(word);
    const auto rules = buildRules(chatId, lemma, actor, false);

    {
        auto chatMutex = m_locks.forChat(chatId);
        std::lock_guard<std::mutex> lock(*chatMutex);
        insertWordLocked(chatId, rules);
    }
    reload(chatId);

    SGLOG_INFO(QStringLiteral("TriggerRegistry"),
               QStringLiteral("addLemma"),
               QStringLiteral("lemma_added"),
               QStringLiteral("vocabulary_change"),
               QStringLiteral("sqlite_insert"),
               logging::actorWho(actor),
               QString(),
               nlohmann::json{{"chatId", chatId}, {"word", word}, {"lemma", lemma}});
    return rules.front();
}

std::vector<TriggerRule> TriggerRegistry::addWord(ChatId chatId,
                                                  const std::string &word,
                                                  const Actor &actor)
{
    const std::string lemma = lemmaFor(word);
    const auto rules = buildRules(chatId, lemma, actor, true);
    precompile(rules);

    {
        auto chatMutex = m_locks.forChat(chatId);
        std::lock_guard<std::mutex> lock(*chatMutex);
        insertWordLocked(chatId, rules);
    }
    reload(chatId);

    SGLOG_INFO(QStringLiteral("TriggerRegistry"),
               QStringLiteral("addWord"),
               QStringLiteral("word_added"),
               QStringLiteral("vocabulary_change"),
               QStringLiteral("sqlite_transaction"),
               logging::actorWho(actor),
               QString(),
               nlohmann::json{{"chatId", chatId}, {"lemma", lemma}, {"rules", ruleNames(rules)}});
    return rules;
}

int TriggerRegistry::removeWord(ChatId chatId, const std::string &word, const Actor &actor)
{
    const std::string canonical = canonicalWord(word);
    const std::string lemma = lemmaFor(word);

    int removed = 0;
    {
        auto chatMutex = m_locks.forChat(chatId);
        std::lock_guard<std::mutex> lock(*chatMutex);
        seedLocked(chatId);
        removed = m_store.deleteTriggerRulesForWord(chatId, lemma);
        if (removed == 0 && canonical != lemma) {
            removed = m_store.deleteTriggerRulesForWord(chatId, canonical);
        }
        bumpGenerationLocked(chatId);
    }
    reload(chatId);
    if (removed == 0) {
        throw ValidationError("unknown trigger word: " + word);
    }

    SGLOG_INFO(QStringLiteral("TriggerRegistry"),
               QStringLiteral("removeWord"),
               QStringLiteral("word_removed"),
               QStringLiteral("vocabulary_change"),
               QStringLiteral("cascade_delete"),
               logging::actorWho(actor),
               QString(),
               nlohmann::json{{"chatId", chatId}, {"lemma", lemma}, {"removed", removed}});
    return removed;
}

void TriggerRegistry::enable(ChatId chatId, const std::string &ruleName, const Actor &actor)
{
    setEnabled(chatId, ruleName, true, actor);
}

void TriggerRegistry::disable(ChatId chatId, const std::string &ruleName, const Actor &actor)
{
    setEnabled(chatId, ruleName, false, actor);
}

void TriggerRegistry::setEnabled(ChatId chatId,
                                 const std::string &ruleName,
                                 bool enabled,
                                 const Actor &actor)
{
    const std::string name = foldCase(ruleName);
    bool found = false;
    {
        auto chatMutex = m_locks.forChat(chatId);
        std::lock_guard<std::mutex> lock(*chatMutex);
        seedLocked(chatId);
        found = m_store.setTriggerRuleEnabled(chatId, name, enabled);
        bumpGenerationLocked(chatId);
    }
    reload(chatId);
    if (!found) {
        throw ValidationError("unknown rule: " + ruleName);
    }

    SGLOG_INFO(QStringLiteral("TriggerRegistry"),
               QStringLiteral("setEnabled"),
               enabled ? QStringLiteral("rule_enabled") : QStringLiteral("rule_disabled"),
               QStringLiteral("vocabulary_change"),
               QStringLiteral("sqlite_update"),
               logging::actorWho(actor),
               QString(),
               nlohmann::json{{"chatId", chatId}, {"rule", name}});
}

bool TriggerRegistry::isSeeded(ChatId chatId)
{
    {
        std::lock_guard<std::mutex> lock(m_cacheMutex);
        if (m_seeded.count(chatId) > 0) {
            return true;
        }
    }
    if (!m_store.getMeta(seededKey(chatId)).has_value()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(m_cacheMutex);
    m_seeded.insert(chatId);
    return true;
}

std::vector<std::vector<TriggerRule>> TriggerRegistry::pendingDefaults(
    ChatId chatId, const std::vector<TriggerRule> &existing) const
{
    std::unordered_set<std::string> present;
    for (const auto &rule : existing) {
        if (rule.kind == RuleKind::Lemma) {
            present.insert(rule.value);
        }
    }

    std::vector<std::vector<TriggerRule>> words;
    for (const auto &word : m_defaultLemmas) {
        std::string lemma;
        try {
            lemma = lemmaFor(word);
        } catch (const ValidationError &) {
            // Reported once, when the chat is seeded.
            continue;
        }
        if (!present.insert(lemma).second) {
            continue;
        }
        words.push_back(buildRules(chatId, lemma, systemActor(), true));
    }
    return words;
}

std::vector<TriggerRule> TriggerRegistry::visibleRules(ChatId chatId)
{
    std::vector<TriggerRule> rules = m_store.listTriggerRules(chatId);
    if (isSeeded(chatId)) {
        return rules;
    }
    for (auto &word : pendingDefaults(chatId, rules)) {
        for (auto &rule : word) {
            rules.push_back(std::move(rule));
        }
    }
    return rules;
}

void TriggerRegistry::seedLocked(ChatId chatId)
{
    if (isSeeded(chatId)) {
        return;
    }

    for (const auto &word : m_defaultLemmas) {
        try {
            lemmaFor(word);
        } catch (const ValidationError &ex) {
            SGLOG_WARN(QStringLiteral("TriggerRegistry"),
                       QStringLiteral("seedLocked"),
                       QStringLiteral("default_lemma_skipped"),
                       QStringLiteral("invalid_word"),
                       QStringLiteral("validation"),
                       logging::defaultWho(),
                       QString(),
                       nlohmann::json{{"word", word}, {"error", ex.what()}});
        }
    }

    nlohmann::json seeded = nlohmann::json::array();
    for (const auto &word : pendingDefaults(chatId, m_store.listTriggerRules(chatId))) {
        m_store.insertTriggerRules(word);
        seeded.push_back(word.front().value);
    }
    m_store.setMeta(seededKey(chatId), "1");
    bumpGenerationLocked(chatId);

    SGLOG_INFO(QStringLiteral("TriggerRegistry"),
               QStringLiteral("seedLocked"),
               QStringLiteral("default_vocabulary_seeded"),
               QStringLiteral("first_mutation"),
               QStringLiteral("sqlite_insert"),
               logging::defaultWho(),
               QString(),
               nlohmann::json{{"chatId", chatId}, {"lemmas", seeded}});

    std::lock_guard<std::mutex> lock(m_cacheMutex);
    m_seeded.insert(chatId);
}

std::shared_ptr<const ActiveRules> TriggerRegistry::reload(ChatId chatId)
{
    std::uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(m_cacheMutex);
        generation = m_generations[chatId];
    }

    auto rules = std::make_shared<ActiveRules>();
    for (auto &rule : visibleRules(chatId)) {
        if (!rule.enabled) {
            continue;
        }
        if (rule.kind == RuleKind::Lemma) {
            rules->lemmas.push_back(std::move(rule));
        } else {
            rules->patterns.push_back(std::move(rule));
        }
    }

    std::shared_ptr<const ActiveRules> snapshot = std::move(rules);
    const TimePoint expiry = m_clock() + m_ttl;
    std::shared_ptr<const ActiveRules> newer;
    {
        std::lock_guard<std::mutex> lock(m_cacheMutex);
        auto it = m_cache.find(chatId);
        if (it != m_cache.end() && it->second.generation > generation) {
            newer = it->second.rules;
        } else {
            m_cache[chatId] = CacheEntry{snapshot, expiry, generation};
        }
    }

    if (newer) {
        SGLOG_DEBUG(QStringLiteral("TriggerRegistry"),
                    QStringLiteral("reload"),
                    QStringLiteral("stale_snapshot_discarded"),
                    QStringLiteral("mutation_during_reload"),
                    QStringLiteral("generation_check"),
                    logging::defaultWho(),
                    QString(),
                    nlohmann::json{{"chatId", chatId}, {"generation", generation}});
        return newer;
    }

    SGLOG_DEBUG(QStringLiteral("TriggerRegistry"),
                QStringLiteral("reload"),
                QStringLiteral("rules_cache_reload"),
                QStringLiteral("expired_or_mutated"),
                QStringLiteral("sqlite_query"),
                logging::defaultWho(),
                QString(),
                nlohmann::json{{"chatId", chatId},
                               {"generation", generation},
                               {"lemmas", snapshot->lemmas.size()},
                               {"patterns", snapshot->patterns.size()}});
    return snapshot;
}

std::shared_ptr<const ActiveRules> TriggerRegistry::activeRules(ChatId chatId)
{
    const TimePoint now = m_clock();
    {
        std::lock_guard<std::mutex> lock(m_cacheMutex);
        auto it = m_cache.find(chatId);
        if (it != m_cache.end() && now < it->second.expiry) {
            return it->second.rules;
        }
    }
    return reload(chatId);
}

std::vector<TriggerRule> TriggerRegistry::allRules(ChatId chatId)
{
    return visibleRules(chatId);
}

} // namespace streakguard
