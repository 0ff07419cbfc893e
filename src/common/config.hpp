#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include <QString>

#include "common/logging.hpp"

namespace streakguard {

struct VariantSettings {
    // Upper bound of separator characters allowed between letters.
    int spacedMaxGap = 2;
    // Shorter words get a lemma rule only.
    int minWordLength = 3;
};

// Static configuration supplied at startup. Every later vocabulary change goes
// through TriggerRegistry.
struct StreakConfig {
    std::string databasePath;
    std::vector<std::string> defaultLemmas;
    // Lower-case letter -> string of characters that can stand in for it.
    std::map<std::string, std::string> confusables;
    // Lower-case letter -> alternative spellings in another script.
    std::map<std::string, std::vector<std::string>> transliteration;
    // Word form -> lemma, consumed by DictionaryNormalizer.
    std::map<std::string, std::string> lemmaForms;
    VariantSettings variants;
    std::chrono::seconds ruleCacheTtl{300};
    std::size_t patternCacheCapacity = 256;
    int maxUndo = 10;
    std::vector<std::string> commandPrefixes{"/"};
    bool verifyProjectionOnRead = false;
    logging::LogOptions logging;
};

StreakConfig defaultConfig();

// Overlays the keys present in the JSON file onto the defaults. Throws
// ValidationError when the file is unreadable, not JSON, or a key has the
// wrong type.
StreakConfig loadConfigFile(const QString &path);

// --config path, then STREAKGUARD_CONFIG, then built-in defaults.
StreakConfig resolveConfig(const QString &explicitPath);

std::string defaultDatabasePath();

} // namespace streakguard
