#include "common/config.hpp"

#include <QFile>

#include <cstdlib>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/logging.hpp"

namespace streakguard {

namespace {

constexpr int kMaxUndoLimit = 10;

std::map<std::string, std::string> defaultConfusables()
{
    return {
        {"a", "a@4аα"},
        {"b", "b6вß"},
        {"c", "c(сϲ¢"},
        {"e", "e3её€ε"},
        {"g", "g9"},
        {"h", "hн"},
        {"i", "i1!|lіı"},
        {"k", "kк"},
        {"l", "l1|i"},
        {"m", "mм"},
        {"o", "o0оοσ"},
        {"p", "pрρ"},
        {"s", "s5$ѕ"},
        {"t", "t7+т"},
        {"u", "uυμ"},
        {"x", "xх×"},
        {"y", "yу"},
        {"z", "z2"},
        {"а", "аa@4"},
        {"б", "б6b"},
        {"в", "вbв8"},
        {"г", "гr"},
        {"е", "еeё3"},
        {"ё", "ёеe"},
        {"з", "з3"},
        {"и", "иuі"},
        {"к", "кk"},
        {"м", "мm"},
        {"н", "нh"},
        {"о", "оo0"},
        {"п", "пn"},
        {"р", "рp"},
        {"с", "сc$"},
        {"т", "тt7"},
        {"у", "уy"},
        {"х", "хx"},
        {"ч", "ч4"},
        {"ш", "шw"},
    };
}

std::map<std::string, std::vector<std::string>> defaultTransliteration()
{
    return {
        // Cyrillic -> Latin
        {"а", {"a"}},
        {"б", {"b"}},
        {"в", {"v", "w"}},
        {"г", {"g"}},
        {"д", {"d"}},
        {"е", {"e", "ye"}},
        {"ё", {"yo", "e"}},
        {"ж", {"zh", "j"}},
        {"з", {"z"}},
        {"и", {"i"}},
        {"й", {"y", "i", "j"}},
        {"к", {"k"}},
        {"л", {"l"}},
        {"м", {"m"}},
        {"н", {"n"}},
        {"о", {"o"}},
        {"п", {"p"}},
        {"р", {"r"}},
        {"с", {"s"}},
        {"т", {"t"}},
        {"у", {"u"}},
        {"ф", {"f"}},
        {"х", {"h", "kh", "x"}},
        {"ц", {"ts", "c"}},
        {"ч", {"ch"}},
        {"ш", {"sh"}},
        {"щ", {"sch", "shch"}},
        {"ъ", {""}},
        {"ы", {"y"}},
        {"ь", {""}},
        {"э", {"e"}},
        {"ю", {"yu", "ju"}},
        {"я", {"ya", "ja"}},
        // Latin -> Cyrillic
        {"a", {"а"}},
        {"b", {"б"}},
        {"c", {"к", "с", "ц"}},
        {"d", {"д"}},
        {"e", {"е", "э"}},
        {"f", {"ф"}},
        {"g", {"г"}},
        {"h", {"х"}},
        {"i", {"и", "ай"}},
        {"j", {"дж", "й"}},
        {"k", {"к"}},
        {"l", {"л"}},
        {"m", {"м"}},
        {"n", {"н"}},
        {"o", {"о"}},
        {"p", {"п"}},
        {"q", {"к"}},
        {"r", {"р"}},
        {"s", {"с"}},
        {"t", {"т"}},
        {"u", {"у", "ю"}},
        {"v", {"в"}},
        {"w", {"в"}},
        {"x", {"кс", "х"}},
        {"y", {"й", "ы", "и"}},
        {"z", {"з"}},
    };
}

nlohmann::json readJsonFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        throw ValidationError("cannot open config file: " + path.toStdString());
    }
    const QByteArray data = file.readAll();
    try {
        return nlohmann::json::parse(data.toStdString());
    } catch (const nlohmann::json::parse_error &ex) {
        throw ValidationError("config file is not valid JSON: " + std::string(ex.what()));
    }
}

template <typename T>
T requireValue(const nlohmann::json &j, const std::string &key)
{
    try {
        return j.at(key).get<T>();
    } catch (const nlohmann::json::exception &) {
        throw ValidationError("config key '" + key + "' has the wrong type");
    }
}

} // namespace

std::string defaultDatabasePath()
{
    const char *home = std::getenv("HOME");
    std::filesystem::path basePath = home ? home : ".";
    basePath /= ".local/share/streakguard";
    return (basePath / "streakguard.db").string();
}

StreakConfig defaultConfig()
{
    StreakConfig config;
    config.databasePath = defaultDatabasePath();
    config.defaultLemmas = {"test"};
    config.confusables = defaultConfusables();
    config.transliteration = defaultTransliteration();
    return config;
}

StreakConfig loadConfigFile(const QString &path)
{
    const nlohmann::json j = readJsonFile(path);
    if (!j.is_object()) {
        throw ValidationError("config root must be a JSON object");
    }

    StreakConfig config = defaultConfig();
    if (j.contains("databasePath")) {
        config.databasePath = requireValue<std::string>(j, "databasePath");
    }
    if (j.contains("defaultLemmas")) {
        config.defaultLemmas = requireValue<std::vector<std::string>>(j, "defaultLemmas");
    }
    if (j.contains("confusables")) {
        config.confusables =
            requireValue<std::map<std::string, std::string>>(j, "confusables");
    }
    if (j.contains("transliteration")) {
        config.transliteration =
            requireValue<std::map<std::string, std::vector<std::string>>>(j, "transliteration");
    }
    if (j.contains("lemmaForms")) {
        config.lemmaForms = requireValue<std::map<std::string, std::string>>(j, "lemmaForms");
    }
    if (j.contains("variants")) {
        const auto variants = requireValue<nlohmann::json>(j, "variants");
        if (!variants.is_object()) {
            throw ValidationError("config key 'variants' has the wrong type");
        }
        if (variants.contains("spacedMaxGap")) {
            config.variants.spacedMaxGap = requireValue<int>(variants, "spacedMaxGap");
        }
        if (variants.contains("minWordLength")) {
            config.variants.minWordLength = requireValue<int>(variants, "minWordLength");
        }
    }
    if (j.contains("ruleCacheTtlSeconds")) {
        config.ruleCacheTtl = std::chrono::seconds(requireValue<int>(j, "ruleCacheTtlSeconds"));
    }
    if (j.contains("patternCacheCapacity")) {
        config.patternCacheCapacity = requireValue<std::size_t>(j, "patternCacheCapacity");
    }
    if (j.contains("maxUndo")) {
        config.maxUndo = requireValue<int>(j, "maxUndo");
    }
    if (j.contains("commandPrefixes")) {
        config.commandPrefixes = requireValue<std::vector<std::string>>(j, "commandPrefixes");
    }
    if (j.contains("verifyProjectionOnRead")) {
        config.verifyProjectionOnRead = requireValue<bool>(j, "verifyProjectionOnRead");
    }

    if (j.contains("logging")) {
        const auto section = requireValue<nlohmann::json>(j, "logging");
        if (!section.is_object()) {
            throw ValidationError("config key 'logging' has the wrong type");
        }
        if (section.contains("directory")) {
            config.logging.directory =
                QString::fromStdString(requireValue<std::string>(section, "directory"));
        }
        if (section.contains("trace")) {
            config.logging.trace = requireValue<bool>(section, "trace");
        }
        if (section.contains("maxFileBytes")) {
            config.logging.maxFileBytes = requireValue<qint64>(section, "maxFileBytes");
        }
        if (section.contains("keepRotated")) {
            config.logging.keepRotated = requireValue<int>(section, "keepRotated");
        }
        if (config.logging.maxFileBytes < 1 || config.logging.keepRotated < 0) {
            throw ValidationError("config 'logging' values out of range");
        }
    }

    if (config.variants.spacedMaxGap < 0 || config.variants.minWordLength < 1) {
        throw ValidationError("config 'variants' values out of range");
    }
    if (config.maxUndo < 1 || config.maxUndo > kMaxUndoLimit) {
        throw ValidationError("config 'maxUndo' must be between 1 and "
                              + std::to_string(kMaxUndoLimit));
    }
    if (config.patternCacheCapacity == 0) {
        throw ValidationError("config 'patternCacheCapacity' must be positive");
    }
    return config;
}

StreakConfig resolveConfig(const QString &explicitPath)
{
    QString path = explicitPath;
    if (path.isEmpty()) {
        path = qEnvironmentVariable("STREAKGUARD_CONFIG");
    }
    if (path.isEmpty()) {
        return defaultConfig();
    }

    StreakConfig config = loadConfigFile(path);
    SGLOG_INFO(QStringLiteral("Config"),
               QStringLiteral("resolveConfig"),
               QStringLiteral("config_loaded"),
               QStringLiteral("startup"),
               QStringLiteral("json_file"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"path", path.toStdString()},
                               {"defaultLemmas", config.defaultLemmas.size()}}));
    return config;
}

} // namespace streakguard
