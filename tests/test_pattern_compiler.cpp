#include <QtTest/QtTest>

#include <algorithm>

#include "common/config.hpp"
#include "common/errors.hpp"
#include "detect/pattern_compiler.hpp"
#include "detect/text_utils.hpp"

namespace {

const streakguard::PatternVariant *findVariant(const std::vector<streakguard::PatternVariant> &variants,
                                               streakguard::VariantKind kind)
{
    auto it = std::find_if(variants.begin(), variants.end(),
                           [kind](const streakguard::PatternVariant &variant) {
                               return variant.kind == kind;
                           });
    return it == variants.end() ? nullptr : &*it;
}

bool matches(streakguard::PatternCompiler &compiler,
             const streakguard::PatternVariant *variant,
             const QString &text)
{
    if (!variant) {
        return false;
    }
    const auto matcher = compiler.compile(variant->patternSource);
    return matcher->match(streakguard::decompose(text).text).hasMatch();
}

} // namespace

class PatternCompilerTests : public QObject
{
    Q_OBJECT
private slots:
    void testGeneratesNamedVariants();
    void testGenerationIsDeterministic();
    void testShortAndInvalidWords();
    void testSpacedVariant();
    void testZeroWidthVariant();
    void testDiacriticVariant();
    void testLookalikeVariant();
    void testTransliterationVariant();
    void testSpacedSkippedWithoutGap();
    void testTableEntriesAreEscaped();
    void testCacheEvictsLeastRecentlyUsed();
    void testInvalidSourceThrows();
};

void PatternCompilerTests::testGeneratesNamedVariants()
{
    streakguard::PatternCompiler compiler(streakguard::defaultConfig());
    const auto variants = compiler.generateVariants("test");

    QCOMPARE(variants.size(), static_cast<std::size_t>(6));
    const std::vector<std::string> expectedNames{
        "test_transliteration", "test_lookalike", "test_spaced",
        "test_zero_width",      "test_diacritic", "test_multimodal",
    };
    for (std::size_t i = 0; i < variants.size(); ++i) {
        QCOMPARE(variants[i].ruleName, expectedNames[i]);
        QCOMPARE(streakguard::PatternCompiler::ruleName("test", variants[i].kind),
                 expectedNames[i]);
        // Every generated source must be usable.
        QVERIFY(compiler.compile(variants[i].patternSource)->isValid());
    }
}

void PatternCompilerTests::testGenerationIsDeterministic()
{
    streakguard::PatternCompiler compiler(streakguard::defaultConfig());
    const auto first = compiler.generateVariants("test");
    QVERIFY(first == compiler.generateVariants("test"));
    QVERIFY(first == compiler.generateVariants("  TEST "));

    streakguard::PatternCompiler other(streakguard::defaultConfig());
    QVERIFY(first == other.generateVariants("test"));
}

void PatternCompilerTests::testShortAndInvalidWords()
{
    streakguard::PatternCompiler compiler(streakguard::defaultConfig());
    QVERIFY(compiler.generateVariants("ab").empty());
    QVERIFY_EXCEPTION_THROWN(compiler.generateVariants("te st"), streakguard::ValidationError);
    QVERIFY_EXCEPTION_THROWN(compiler.generateVariants("t3st"), streakguard::ValidationError);
    QVERIFY_EXCEPTION_THROWN(compiler.generateVariants("   "), streakguard::ValidationError);
}

void PatternCompilerTests::testSpacedVariant()
{
    streakguard::PatternCompiler compiler(streakguard::defaultConfig());
    const auto variants = compiler.generateVariants("test");
    const auto *spaced = findVariant(variants, streakguard::VariantKind::Spaced);

    QVERIFY(matches(compiler, spaced, QStringLiteral("this is a t e s t today")));
    QVERIFY(matches(compiler, spaced, QStringLiteral("t.e.s.t")));
    QVERIFY(matches(compiler, spaced, QStringLiteral("TEST")));
    QVERIFY(!matches(compiler, spaced, QStringLiteral("t   e s t")));
    QVERIFY(!matches(compiler, spaced, QStringLiteral("latest")));
    QVERIFY(!matches(compiler, spaced, QStringLiteral("testament")));
    QVERIFY(!matches(compiler, spaced, QStringLiteral("teast")));
}

void PatternCompilerTests::testZeroWidthVariant()
{
    streakguard::PatternCompiler compiler(streakguard::defaultConfig());
    const auto variants = compiler.generateVariants("test");
    const auto *zeroWidth = findVariant(variants, streakguard::VariantKind::ZeroWidth);

    const QString hidden = QStringLiteral("te") + QChar(0x200B) + QStringLiteral("s")
        + QChar(0x00AD) + QStringLiteral("t");
    QVERIFY(matches(compiler, zeroWidth, hidden));
    QVERIFY(!matches(compiler, zeroWidth, QStringLiteral("te st")));
}

void PatternCompilerTests::testDiacriticVariant()
{
    streakguard::PatternCompiler compiler(streakguard::defaultConfig());
    const auto variants = compiler.generateVariants("test");
    const auto *diacritic = findVariant(variants, streakguard::VariantKind::Diacritic);

    QVERIFY(matches(compiler, diacritic, QString::fromUtf8("t\xC3\xA9st")));
    QVERIFY(matches(compiler, diacritic, QString::fromUtf8("t\xC3\xA9s\xC5\xA3")));
    QVERIFY(!matches(compiler, diacritic, QString::fromUtf8("t\xC3\xA9stament")));
}

void PatternCompilerTests::testLookalikeVariant()
{
    streakguard::PatternCompiler compiler(streakguard::defaultConfig());
    const auto variants = compiler.generateVariants("test");
    const auto *lookalike = findVariant(variants, streakguard::VariantKind::Lookalike);

    QVERIFY(matches(compiler, lookalike, QStringLiteral("7e$7")));
    QVERIFY(matches(compiler, lookalike, QStringLiteral("t3st")));
    QVERIFY(!matches(compiler, lookalike, QStringLiteral("7e$7s")));
}

void PatternCompilerTests::testTransliterationVariant()
{
    streakguard::PatternCompiler compiler(streakguard::defaultConfig());
    const auto latin = compiler.generateVariants("test");
    QVERIFY(matches(compiler,
                    findVariant(latin, streakguard::VariantKind::Transliteration),
                    QString::fromUtf8("\xD1\x82\xD0\xB5\xD1\x81\xD1\x82")));

    // The same tables work in the other direction.
    const auto cyrillic = compiler.generateVariants("\xD1\x82\xD0\xB5\xD1\x81\xD1\x82");
    QCOMPARE(cyrillic.front().ruleName, std::string("\xD1\x82\xD0\xB5\xD1\x81\xD1\x82_transliteration"));
    QVERIFY(matches(compiler,
                    findVariant(cyrillic, streakguard::VariantKind::Transliteration),
                    QStringLiteral("test")));
}

void PatternCompilerTests::testSpacedSkippedWithoutGap()
{
    auto config = streakguard::defaultConfig();
    config.variants.spacedMaxGap = 0;
    config.transliteration.clear();
    config.confusables.clear();
    streakguard::PatternCompiler compiler(config);

    const auto variants = compiler.generateVariants("test");
    QCOMPARE(variants.size(), static_cast<std::size_t>(3));
    QVERIFY(!findVariant(variants, streakguard::VariantKind::Spaced));
    QVERIFY(!findVariant(variants, streakguard::VariantKind::Lookalike));
    QVERIFY(!findVariant(variants, streakguard::VariantKind::Transliteration));
    QVERIFY(matches(compiler,
                    findVariant(variants, streakguard::VariantKind::Multimodal),
                    QStringLiteral("test")));
}

void PatternCompilerTests::testTableEntriesAreEscaped()
{
    auto config = streakguard::defaultConfig();
    config.confusables = {{"a", "]\\^-(["}};
    config.transliteration = {{"a", {"(?", "|"}}};
    streakguard::PatternCompiler compiler(config);

    const auto variants = compiler.generateVariants("aaa");
    QCOMPARE(variants.size(), static_cast<std::size_t>(6));
    for (const auto &variant : variants) {
        QVERIFY(compiler.compile(variant.patternSource)->isValid());
    }
    QVERIFY(matches(compiler,
                    findVariant(variants, streakguard::VariantKind::Lookalike),
                    QStringLiteral("a-(")));
    QVERIFY(matches(compiler,
                    findVariant(variants, streakguard::VariantKind::Transliteration),
                    QStringLiteral("a(?|")));
    QVERIFY(!matches(compiler,
                     findVariant(variants, streakguard::VariantKind::Lookalike),
                     QStringLiteral("abc")));
}

void PatternCompilerTests::testCacheEvictsLeastRecentlyUsed()
{
    auto config = streakguard::defaultConfig();
    config.patternCacheCapacity = 2;
    streakguard::PatternCompiler compiler(config);
    QCOMPARE(compiler.cacheCapacity(), static_cast<std::size_t>(2));

    const auto first = compiler.compile("alpha");
    compiler.compile("beta");
    QVERIFY(compiler.compile("alpha") == first);
    QCOMPARE(compiler.compileCount(), static_cast<std::uint64_t>(2));

    compiler.compile("gamma");
    QCOMPARE(compiler.cacheSize(), static_cast<std::size_t>(2));
    QVERIFY(compiler.compile("alpha") == first);
    QCOMPARE(compiler.compileCount(), static_cast<std::uint64_t>(3));

    // beta was the least recently used entry.
    compiler.compile("beta");
    QCOMPARE(compiler.compileCount(), static_cast<std::uint64_t>(4));
    QCOMPARE(compiler.cacheSize(), static_cast<std::size_t>(2));

    // Evicted matchers stay valid for holders.
    QVERIFY(first->match(QStringLiteral("ALPHA")).hasMatch());
}

void PatternCompilerTests::testInvalidSourceThrows()
{
    streakguard::PatternCompiler compiler(streakguard::defaultConfig());
    QVERIFY_EXCEPTION_THROWN(compiler.compile("("), streakguard::PatternError);
    QCOMPARE(compiler.cacheSize(), static_cast<std::size_t>(0));
    QCOMPARE(compiler.compileCount(), static_cast<std::uint64_t>(0));
}

QTEST_MAIN(PatternCompilerTests)
#include "test_pattern_compiler.moc"
