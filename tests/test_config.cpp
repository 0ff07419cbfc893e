#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include "common/config.hpp"
#include "common/errors.hpp"

class ConfigTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void testDefaults();
    void testFileOverlaysDefaults();
    void testWrongTypeRejected();
    void testMissingFileRejected();
    void testOutOfRangeRejected();
    void testResolveFromEnvironment();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    QString writeConfig(const QString &name, const QByteArray &content) const;
};

void ConfigTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
    qunsetenv("STREAKGUARD_CONFIG");
}

void ConfigTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

QString ConfigTests::writeConfig(const QString &name, const QByteArray &content) const
{
    const QString path = m_tempDir.path() + "/" + name;
    QFile file(path);
    if (file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        file.write(content);
    }
    return path;
}

void ConfigTests::testDefaults()
{
    const auto config = streakguard::defaultConfig();
    QCOMPARE(config.defaultLemmas.size(), static_cast<std::size_t>(1));
    QCOMPARE(QString::fromStdString(config.defaultLemmas.front()), QStringLiteral("test"));
    QCOMPARE(config.maxUndo, 10);
    QCOMPARE(static_cast<long long>(config.ruleCacheTtl.count()), 300LL);
    QCOMPARE(config.patternCacheCapacity, static_cast<std::size_t>(256));
    QCOMPARE(config.variants.spacedMaxGap, 2);
    QCOMPARE(config.variants.minWordLength, 3);
    QVERIFY(!config.verifyProjectionOnRead);
    QCOMPARE(config.commandPrefixes.size(), static_cast<std::size_t>(1));
    QVERIFY(config.confusables.count("t") == 1);
    QVERIFY(config.transliteration.count("т") == 1);
    QCOMPARE(QString::fromStdString(config.databasePath),
             m_tempDir.path() + "/.local/share/streakguard/streakguard.db");
}

void ConfigTests::testFileOverlaysDefaults()
{
    const QString path = writeConfig(QStringLiteral("overlay.json"), R"({
        "defaultLemmas": ["alpha", "beta"],
        "maxUndo": 5,
        "ruleCacheTtlSeconds": 60,
        "variants": {"spacedMaxGap": 3},
        "lemmaForms": {"alphas": "alpha"},
        "logging": {"directory": "/var/log/sg", "keepRotated": 5},
        "unknownKey": true
    })");

    const auto config = streakguard::loadConfigFile(path);
    QCOMPARE(config.defaultLemmas.size(), static_cast<std::size_t>(2));
    QCOMPARE(config.maxUndo, 5);
    QCOMPARE(static_cast<long long>(config.ruleCacheTtl.count()), 60LL);
    QCOMPARE(config.variants.spacedMaxGap, 3);
    QCOMPARE(config.variants.minWordLength, 3);
    QCOMPARE(QString::fromStdString(config.lemmaForms.at("alphas")), QStringLiteral("alpha"));
    QCOMPARE(config.patternCacheCapacity, static_cast<std::size_t>(256));
    QVERIFY(!config.confusables.empty());
    QCOMPARE(config.logging.directory, QStringLiteral("/var/log/sg"));
    QCOMPARE(config.logging.keepRotated, 5);
    QCOMPARE(config.logging.maxFileBytes, static_cast<qint64>(5 * 1024 * 1024));
    QVERIFY(!config.logging.trace);
}

void ConfigTests::testWrongTypeRejected()
{
    const QString path = writeConfig(QStringLiteral("wrong.json"), R"({"maxUndo": "ten"})");
    QVERIFY_EXCEPTION_THROWN(streakguard::loadConfigFile(path), streakguard::ValidationError);

    const QString notJson = writeConfig(QStringLiteral("broken.json"), "{not json");
    QVERIFY_EXCEPTION_THROWN(streakguard::loadConfigFile(notJson), streakguard::ValidationError);
}

void ConfigTests::testMissingFileRejected()
{
    QVERIFY_EXCEPTION_THROWN(streakguard::loadConfigFile(m_tempDir.path() + "/absent.json"),
                             streakguard::ValidationError);
}

void ConfigTests::testOutOfRangeRejected()
{
    const QString path = writeConfig(QStringLiteral("range.json"), R"({"maxUndo": 0})");
    QVERIFY_EXCEPTION_THROWN(streakguard::loadConfigFile(path), streakguard::ValidationError);

    const QString above = writeConfig(QStringLiteral("above.json"), R"({"maxUndo": 11})");
    QVERIFY_EXCEPTION_THROWN(streakguard::loadConfigFile(above), streakguard::ValidationError);

    const QString ceiling = writeConfig(QStringLiteral("ceiling.json"), R"({"maxUndo": 10})");
    QCOMPARE(streakguard::loadConfigFile(ceiling).maxUndo, 10);

    const QString logging = writeConfig(QStringLiteral("logging.json"),
                                        R"({"logging": {"maxFileBytes": 0}})");
    QVERIFY_EXCEPTION_THROWN(streakguard::loadConfigFile(logging), streakguard::ValidationError);
}

void ConfigTests::testResolveFromEnvironment()
{
    QCOMPARE(streakguard::resolveConfig(QString()).maxUndo, 10);

    const QString path = writeConfig(QStringLiteral("env.json"), R"({"maxUndo": 3})");
    qputenv("STREAKGUARD_CONFIG", path.toUtf8());
    QCOMPARE(streakguard::resolveConfig(QString()).maxUndo, 3);

    const QString explicitPath = writeConfig(QStringLiteral("explicit.json"), R"({"maxUndo": 7})");
    QCOMPARE(streakguard::resolveConfig(explicitPath).maxUndo, 7);
    qunsetenv("STREAKGUARD_CONFIG");
}

QTEST_MAIN(ConfigTests)
#include "test_config.moc"
