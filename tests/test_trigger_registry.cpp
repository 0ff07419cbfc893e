#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <algorithm>
#include <filesystem>
#include <memory>

#include "common/chat_locks.hpp"
#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "detect/lemma_normalizer.hpp"
#include "detect/pattern_compiler.hpp"
#include "detect/trigger_registry.hpp"
#include "store/streak_store.hpp"

namespace {

constexpr streakguard::ChatId kChat = -100200300;

const streakguard::Actor kAdmin{7, "admin"};

bool hasRule(const std::vector<streakguard::TriggerRule> &rules, const std::string &value)
{
    return std::any_of(rules.begin(), rules.end(), [&value](const streakguard::TriggerRule &rule) {
        return rule.value == value;
    });
}

} // namespace

class TriggerRegistryTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void cleanup();
    void testDefaultsSeededOnce();
    void testAddWordCreatesPatternRules();
    void testRemoveWordCascades();
    void testDuplicateWordRejected();
    void testUnknownNamesRejected();
    void testDisableAndEnable();
    void testCacheExpiresAfterTtl();
    void testMutationDuringReloadIsKept();
    void testDecomposedWordIsComposed();
    void testShortWordGetsLemmaOnly();
    void testAddLemmaUsesNormalizer();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
    streakguard::StreakConfig m_config;
    streakguard::TimePoint m_now;
    std::unique_ptr<streakguard::StreakStore> m_store;
    std::unique_ptr<streakguard::ChatLocks> m_locks;
    std::unique_ptr<streakguard::PatternCompiler> m_compiler;
    std::unique_ptr<streakguard::DictionaryNormalizer> m_normalizer;
    std::unique_ptr<streakguard::TriggerRegistry> m_registry;

    std::string dbPath() const;
    void openRegistry();
};

void TriggerRegistryTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void TriggerRegistryTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

std::string TriggerRegistryTests::dbPath() const
{
    return m_tempDir.path().toStdString() + "/rules.db";
}

void TriggerRegistryTests::init()
{
    cleanup();
    std::error_code error;
    std::filesystem::remove(dbPath(), error);
    std::filesystem::remove(dbPath() + "-wal", error);
    std::filesystem::remove(dbPath() + "-shm", error);

    m_config = streakguard::defaultConfig();
    m_config.defaultLemmas.clear();
    m_config.lemmaForms = {{"testing", "test"}};
    m_now = streakguard::fromEpochMillis(1700000000000);
    m_store = std::make_unique<streakguard::StreakStore>(dbPath());
    m_locks = std::make_unique<streakguard::ChatLocks>();
    openRegistry();
}

void TriggerRegistryTests::cleanup()
{
    m_registry.reset();
    m_normalizer.reset();
    m_compiler.reset();
    m_locks.reset();
    m_store.reset();
}

void TriggerRegistryTests::openRegistry()
{
    m_registry.reset();
    m_compiler = std::make_unique<streakguard::PatternCompiler>(m_config);
    m_normalizer = std::make_unique<streakguard::DictionaryNormalizer>(m_config.lemmaForms);
    m_registry = std::make_unique<streakguard::TriggerRegistry>(*m_store, *m_locks, *m_compiler,
                                                                *m_normalizer, m_config);
    m_registry->setClock([this] { return m_now; });
}

void TriggerRegistryTests::testDefaultsSeededOnce()
{
    m_config.defaultLemmas = {"Test", "not a word", "ok"};
    openRegistry();

    const auto rules = m_registry->activeRules(kChat);
    QCOMPARE(rules->lemmas.size(), static_cast<std::size_t>(2));
    QCOMPARE(rules->lemmas.front().value, std::string("test"));
    QCOMPARE(rules->lemmas.front().createdBy, streakguard::TriggerRegistry::systemActor());
    QCOMPARE(rules->patterns.size(), static_cast<std::size_t>(6));
    QCOMPARE(m_registry->allRules(kChat).size(), static_cast<std::size_t>(8));

    // Reads never write: defaults are only installed by the first mutation.
    QVERIFY(m_store->listTriggerRules(kChat).empty());
    QVERIFY(!m_store->getMeta("seeded_chat:" + std::to_string(kChat)).has_value());
    QVERIFY(!m_registry->isSeeded(kChat));

    // Removing a default must not bring it back, not even for a new process.
    QCOMPARE(m_registry->removeWord(kChat, "test", kAdmin), 7);
    QVERIFY(m_registry->isSeeded(kChat));
    QCOMPARE(m_store->listTriggerRules(kChat).size(), static_cast<std::size_t>(1));
    openRegistry();
    const auto after = m_registry->allRules(kChat);
    QVERIFY(!hasRule(after, "test"));
    QVERIFY(hasRule(after, "ok"));
    QCOMPARE(after.front().createdBy, streakguard::TriggerRegistry::systemActor());

    // Seeding is per chat.
    QVERIFY(hasRule(m_registry->allRules(kChat + 1), "test"));
    QVERIFY(m_store->listTriggerRules(kChat + 1).empty());
}

void TriggerRegistryTests::testAddWordCreatesPatternRules()
{
    QVERIFY(m_registry->activeRules(kChat)->lemmas.empty());

    const auto added = m_registry->addWord(kChat, "  Test ", kAdmin);
    QVERIFY(added.size() >= 6);
    QCOMPARE(added.front().kind, streakguard::RuleKind::Lemma);
    QCOMPARE(added.front().value, std::string("test"));
    for (std::size_t i = 1; i < added.size(); ++i) {
        QCOMPARE(added[i].kind, streakguard::RuleKind::Pattern);
        QCOMPARE(added[i].sourceWord, std::string("test"));
        QVERIFY(added[i].variant.has_value());
    }

    const auto rules = m_registry->activeRules(kChat);
    QCOMPARE(rules->lemmas.size(), static_cast<std::size_t>(1));
    QCOMPARE(rules->patterns.size(), added.size() - 1);
    QCOMPARE(rules->patterns.front().value, added[1].value);
    // Generated sources were compiled before the rules became visible.
    QVERIFY(m_compiler->cacheSize() >= added.size() - 1);
}

void TriggerRegistryTests::testRemoveWordCascades()
{
    m_registry->addWord(kChat, "test", kAdmin);
    m_registry->addWord(kChat, "other", kAdmin);
    const auto before = m_registry->activeRules(kChat);

    const int removed = m_registry->removeWord(kChat, "TEST", kAdmin);
    QCOMPARE(removed, 7);

    const auto rules = m_registry->activeRules(kChat);
    QCOMPARE(rules->lemmas.size(), static_cast<std::size_t>(1));
    QCOMPARE(rules->lemmas.front().value, std::string("other"));
    for (const auto &rule : rules->patterns) {
        QCOMPARE(rule.sourceWord, std::string("other"));
    }
    // Earlier snapshots are immutable.
    QCOMPARE(before->lemmas.size(), static_cast<std::size_t>(2));

    // A word form resolves to its lemma.
    m_registry->addWord(kChat, "test", kAdmin);
    QCOMPARE(m_registry->removeWord(kChat, "testing", kAdmin), 7);
    QVERIFY_EXCEPTION_THROWN(m_registry->removeWord(kChat, "test", kAdmin),
                             streakguard::ValidationError);
}

void TriggerRegistryTests::testDuplicateWordRejected()
{
    m_registry->addWord(kChat, "test", kAdmin);
    QVERIFY_EXCEPTION_THROWN(m_registry->addWord(kChat, "TEST", kAdmin),
                             streakguard::ValidationError);
    QVERIFY_EXCEPTION_THROWN(m_registry->addLemma(kChat, "testing", kAdmin),
                             streakguard::ValidationError);
    QVERIFY_EXCEPTION_THROWN(m_registry->addWord(kChat, "two words", kAdmin),
                             streakguard::ValidationError);
    QCOMPARE(m_registry->allRules(kChat).size(), static_cast<std::size_t>(7));
}

void TriggerRegistryTests::testUnknownNamesRejected()
{
    QVERIFY_EXCEPTION_THROWN(m_registry->enable(kChat, "nothing", kAdmin),
                             streakguard::ValidationError);
    QVERIFY_EXCEPTION_THROWN(m_registry->disable(kChat, "nothing_spaced", kAdmin),
                             streakguard::ValidationError);
    QVERIFY_EXCEPTION_THROWN(m_registry->removeWord(kChat, "nothing", kAdmin),
                             streakguard::ValidationError);
}

void TriggerRegistryTests::testDisableAndEnable()
{
    m_registry->addWord(kChat, "test", kAdmin);

    m_registry->disable(kChat, "TEST_Spaced", kAdmin);
    auto rules = m_registry->activeRules(kChat);
    QVERIFY(!hasRule(rules->patterns, "test_spaced"));
    QCOMPARE(rules->patterns.size(), static_cast<std::size_t>(5));

    // Disabled rules are still listed.
    const auto all = m_registry->allRules(kChat);
    auto it = std::find_if(all.begin(), all.end(), [](const streakguard::TriggerRule &rule) {
        return rule.value == "test_spaced";
    });
    QVERIFY(it != all.end());
    QVERIFY(!it->enabled);

    m_registry->disable(kChat, "test", kAdmin);
    QVERIFY(m_registry->activeRules(kChat)->lemmas.empty());

    m_registry->enable(kChat, "test_spaced", kAdmin);
    m_registry->enable(kChat, "test", kAdmin);
    rules = m_registry->activeRules(kChat);
    QCOMPARE(rules->lemmas.size(), static_cast<std::size_t>(1));
    // Re-enabling keeps the original insertion position.
    QCOMPARE(rules->patterns.size(), static_cast<std::size_t>(6));
    QCOMPARE(rules->patterns[2].value, std::string("test_spaced"));
}

void TriggerRegistryTests::testCacheExpiresAfterTtl()
{
    m_registry->addWord(kChat, "test", kAdmin);
    const auto cached = m_registry->activeRules(kChat);

    // A change made behind the registry's back is invisible until expiry.
    QVERIFY(m_store->setTriggerRuleEnabled(kChat, "test", false));
    QVERIFY(m_registry->activeRules(kChat) == cached);

    m_now += m_config.ruleCacheTtl - std::chrono::seconds(1);
    QVERIFY(m_registry->activeRules(kChat) == cached);

    m_now += std::chrono::seconds(1);
    const auto refreshed = m_registry->activeRules(kChat);
    QVERIFY(refreshed != cached);
    QVERIFY(refreshed->lemmas.empty());
}

void TriggerRegistryTests::testMutationDuringReloadIsKept()
{
    m_registry->addWord(kChat, "test", kAdmin);
    m_registry->addWord(kChat, "other", kAdmin);
    m_now += m_config.ruleCacheTtl;

    // The clock is read once for the expiry check and once more after the
    // expired reader has loaded its rows. Remove a word exactly there.
    int clockCalls = 0;
    bool armed = true;
    m_registry->setClock([this, &clockCalls, &armed] {
        if (armed && ++clockCalls == 2) {
            armed = false;
            m_registry->removeWord(kChat, "test", kAdmin);
        }
        return m_now;
    });

    m_registry->activeRules(kChat);
    QVERIFY(!armed);

    const auto rules = m_registry->activeRules(kChat);
    QCOMPARE(rules->lemmas.size(), static_cast<std::size_t>(1));
    QCOMPARE(rules->lemmas.front().value, std::string("other"));
    for (const auto &rule : rules->patterns) {
        QCOMPARE(rule.sourceWord, std::string("other"));
    }
}

void TriggerRegistryTests::testDecomposedWordIsComposed()
{
    const auto rule = m_registry->addLemma(kChat, "Cafe\xCC\x81", kAdmin);
    QCOMPARE(rule.value, std::string("caf\xC3\xA9"));
    QVERIFY_EXCEPTION_THROWN(m_registry->addLemma(kChat, "caf\xC3\xA9", kAdmin),
                             streakguard::ValidationError);
    QCOMPARE(m_registry->removeWord(kChat, "cafe\xCC\x81", kAdmin), 1);
}

void TriggerRegistryTests::testShortWordGetsLemmaOnly()
{
    const auto added = m_registry->addWord(kChat, "ok", kAdmin);
    QCOMPARE(added.size(), static_cast<std::size_t>(1));
    QCOMPARE(added.front().kind, streakguard::RuleKind::Lemma);
    QVERIFY(m_registry->activeRules(kChat)->patterns.empty());
}

void TriggerRegistryTests::testAddLemmaUsesNormalizer()
{
    const auto rule = m_registry->addLemma(kChat, "Testing", kAdmin);
    QCOMPARE(rule.value, std::string("test"));
    QCOMPARE(rule.createdBy, kAdmin);
    QVERIFY(rule.createdAt == m_now);

    const auto rules = m_registry->activeRules(kChat);
    QCOMPARE(rules->lemmas.size(), static_cast<std::size_t>(1));
    QVERIFY(rules->patterns.empty());
    QCOMPARE(m_registry->removeWord(kChat, "test", kAdmin), 1);
}

QTEST_MAIN(TriggerRegistryTests)
#include "test_trigger_registry.moc"
