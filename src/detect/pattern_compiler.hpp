#pragma once

#include <cstddef>
#include <cstdint>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <QRegularExpression>

#include "common/config.hpp"
#include "common/models.hpp"

namespace streakguard {

// PatternCompiler turns a canonical word into named evasion patterns and owns
// the process-wide cache of compiled matchers. Generated sources expect the
// subject in NFD form (see decompose()).
class PatternCompiler {
public:
    explicit PatternCompiler(const StreakConfig &config);

    // Deterministic for a given configuration. Words shorter than
    // variants.minWordLength yield no variants. Throws ValidationError when the
    // word is not a valid trigger word.
    std::vector<PatternVariant> generateVariants(const std::string &word) const;

    // Case-insensitive, Unicode-aware matcher for source, cached by source with
    // LRU eviction. Throws PatternError if the source does not compile.
    std::shared_ptr<const QRegularExpression> compile(const std::string &source);

    std::size_t cacheSize() const;
    std::size_t cacheCapacity() const;
    // Number of sources actually compiled since construction (cache misses).
    std::uint64_t compileCount() const;

    static std::string ruleName(const std::string &word, VariantKind kind);

private:
    struct CacheEntry {
        std::shared_ptr<const QRegularExpression> matcher;
        std::list<std::string>::iterator order;
    };

    std::map<uint, QString> m_confusables;
    std::map<uint, std::vector<QString>> m_transliteration;
    VariantSettings m_variants;
    std::size_t m_capacity = 256;

    mutable std::mutex m_cacheMutex;
    std::list<std::string> m_lru;
    std::unordered_map<std::string, CacheEntry> m_cache;
    std::uint64_t m_compileCount = 0;

    QString lookalikeClass(uint letter) const;
    QString transliterationGroup(uint letter) const;
    QString spacedSeparator() const;
};

} // namespace streakguard
