#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTextStream>

#include <cstdio>
#include <memory>

#include <nlohmann/json.hpp>

#include "common/chat_locks.hpp"
#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"
#include "daemon/command_handler.hpp"
#include "detect/detection_engine.hpp"
#include "detect/exclusion_filter.hpp"
#include "detect/lemma_normalizer.hpp"
#include "detect/pattern_compiler.hpp"
#include "detect/trigger_registry.hpp"
#include "service/streak_service.hpp"
#include "store/event_log.hpp"
#include "store/streak_store.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("streakguard-daemon"));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Reads one JSON request per line on stdin and answers on stdout."));
    parser.addHelpOption();
    QCommandLineOption configOption(QStringList() << "config",
                                    "JSON configuration file.",
                                    "path");
    QCommandLineOption databaseOption(QStringList() << "database",
                                      "SQLite database path (overrides the config).",
                                      "path");
    QCommandLineOption traceOption(QStringList() << "trace",
                                   "Enable verbose trace logging.");
    parser.addOption(configOption);
    parser.addOption(databaseOption);
    parser.addOption(traceOption);
    parser.process(app);

    const bool trace = parser.isSet(traceOption)
        || qEnvironmentVariableIntValue("STREAKGUARD_TRACE") == 1;
    streakguard::logging::LogOptions startupLog;
    startupLog.trace = trace;
    streakguard::logging::initLogging(QStringLiteral("streakguard-daemon"), startupLog);

    streakguard::StreakConfig config;
    try {
        config = streakguard::resolveConfig(parser.value(configOption));
    } catch (const streakguard::ValidationError &ex) {
        SGLOG_ERROR(QStringLiteral("main"),
                    QStringLiteral("main"),
                    QStringLiteral("config_invalid"),
                    QStringLiteral("startup"),
                    QStringLiteral("json_file"),
                    streakguard::logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"what", ex.what()}}));
        std::fprintf(stderr, "streakguard-daemon: %s\n", ex.what());
        return 2;
    }
    config.logging.trace = config.logging.trace || trace;
    streakguard::logging::initLogging(QStringLiteral("streakguard-daemon"), config.logging);

    if (parser.isSet(databaseOption)) {
        config.databasePath = parser.value(databaseOption).toStdString();
    }

    std::unique_ptr<streakguard::StreakStore> store;
    try {
        store = std::make_unique<streakguard::StreakStore>(config.databasePath);
    } catch (const streakguard::StoreError &ex) {
        SGLOG_ERROR(QStringLiteral("main"),
                    QStringLiteral("main"),
                    QStringLiteral("database_open_failed"),
                    QStringLiteral("startup"),
                    QStringLiteral("sqlite_open"),
                    streakguard::logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"path", config.databasePath}, {"what", ex.what()}}));
        std::fprintf(stderr, "streakguard-daemon: %s\n", ex.what());
        return 1;
    }

    std::string integrityMessage;
    const bool intact = store->integrityCheck(&integrityMessage);
    SGLOG_INFO(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("daemon_start"),
               QStringLiteral("user_start"),
               QStringLiteral("stdin_json_lines"),
               streakguard::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"database", store->path()},
                               {"integrity", integrityMessage}}));
    if (!intact) {
        SGLOG_ERROR(QStringLiteral("main"),
                    QStringLiteral("main"),
                    QStringLiteral("integrity_check_failed"),
                    QStringLiteral("startup"),
                    QStringLiteral("sqlite_pragma"),
                    streakguard::logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"result", integrityMessage}}));
    }

    streakguard::ChatLocks locks;
    streakguard::DictionaryNormalizer normalizer(config.lemmaForms);
    streakguard::PatternCompiler compiler(config);
    streakguard::ExclusionFilter exclusions(config.commandPrefixes);
    streakguard::TriggerRegistry registry(*store, locks, compiler, normalizer, config);
    streakguard::DetectionEngine detector(registry, compiler, normalizer, exclusions);
    streakguard::EventLog eventLog(*store, locks, config);
    streakguard::StreakService service(eventLog, registry, detector, *store);
    streakguard::CommandHandler handler(service);
    handler.setReadOnly(!intact);

    QTextStream in(stdin);
    QTextStream out(stdout);
    QString line;
    while (in.readLineInto(&line)) {
        if (line.trimmed().isEmpty()) {
            continue;
        }
        out << QString::fromUtf8(handler.handleRequestPayload(line.toUtf8())) << '\n';
        out.flush();
    }

    SGLOG_INFO(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("daemon_stop"),
               QStringLiteral("stdin_closed"),
               QStringLiteral("stdin_json_lines"),
               streakguard::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"consistencyFaults", eventLog.consistencyFaults()}}));
    return 0;
}
