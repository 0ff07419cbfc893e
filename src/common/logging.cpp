#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThread>

#include <unistd.h>

#include <cstdio>
#include <map>
#include <memory>
#include <mutex>

namespace streakguard::logging {

namespace {

struct LogState {
    QString processName;
    LogOptions options;
    // Open sinks by path. Closed on re-init and on rotation.
    std::map<QString, std::unique_ptr<QFile>> files;
};

std::mutex g_logMutex;
LogState g_state;

thread_local QString t_corrId;

const char *levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

QString resolvedDir(const LogOptions &options)
{
    return options.directory.isEmpty() ? logsDirPath() : options.directory;
}

// <path>.N is dropped, then every generation shifts up by one.
void rotate(const QString &path, int keep)
{
    if (keep < 1) {
        QFile::remove(path);
        return;
    }
    QFile::remove(path + QStringLiteral(".%1").arg(keep));
    for (int generation = keep - 1; generation >= 1; --generation) {
        const QString from = path + QStringLiteral(".%1").arg(generation);
        if (QFile::exists(from)) {
            QFile::rename(from, path + QStringLiteral(".%1").arg(generation + 1));
        }
    }
    QFile::rename(path, path + QStringLiteral(".1"));
}

QFile *sinkFor(const QString &path)
{
    auto it = g_state.files.find(path);
    if (it != g_state.files.end()) {
        if (it->second->size() < g_state.options.maxFileBytes && QFile::exists(path)) {
            return it->second.get();
        }
        it->second->close();
        g_state.files.erase(it);
        if (QFileInfo(path).size() >= g_state.options.maxFileBytes) {
            rotate(path, g_state.options.keepRotated);
        }
    } else if (QFileInfo(path).size() >= g_state.options.maxFileBytes) {
        rotate(path, g_state.options.keepRotated);
    }

    QDir().mkpath(QFileInfo(path).absolutePath());
    auto file = std::make_unique<QFile>(path);
    if (!file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        return nullptr;
    }
    QFile *raw = file.get();
    g_state.files.emplace(path, std::move(file));
    return raw;
}

void writeLine(const QString &path, const QByteArray &line)
{
    QFile *file = sinkFor(path);
    if (!file) {
        std::fprintf(stderr, "%s\n", line.constData());
        return;
    }
    file->write(line);
    file->write("\n");
    file->flush();
}

QString threadIdString()
{
    return QStringLiteral("0x%1")
        .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16);
}

} // namespace

void initLogging(const QString &processName, const LogOptions &options)
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_state.files.clear();
    g_state.processName = processName;
    g_state.options = options;
}

bool isTraceEnabled()
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    return g_state.options.trace;
}

QString currentCorrelationId()
{
    return t_corrId;
}

CorrelationScope::CorrelationScope(const QString &corrId)
    : m_prev(t_corrId)
{
    t_corrId = corrId;
}

CorrelationScope::~CorrelationScope()
{
    t_corrId = m_prev;
}

QString logsDirPath()
{
    const QString overrideDir = qEnvironmentVariable("STREAKGUARD_LOG_DIR");
    if (!overrideDir.isEmpty()) {
        return overrideDir;
    }
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".local/share/streakguard/logs");
    }
    return home + QStringLiteral("/.local/share/streakguard/logs");
}

QString defaultProcessName()
{
    {
        std::lock_guard<std::mutex> lock(g_logMutex);
        if (!g_state.processName.isEmpty()) {
            return g_state.processName;
        }
    }
    if (QCoreApplication::instance() && !QCoreApplication::applicationName().isEmpty()) {
        return QCoreApplication::applicationName();
    }
    return QStringLiteral("streakguard");
}

QString defaultWho()
{
    return QStringLiteral("pid:%1,uid:%2")
        .arg(static_cast<qint64>(getpid()))
        .arg(static_cast<qint64>(getuid()));
}

QString actorWho(const Actor &actor)
{
    QString who = QStringLiteral("user:%1").arg(actor.userId);
    if (!actor.displayName.empty()) {
        who += QStringLiteral(",name:") + QString::fromStdString(actor.displayName);
    }
    return who;
}

void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context)
{
    const QString corr = correlationId.isEmpty() ? currentCorrelationId() : correlationId;
    nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelName(level)},
        {"process", processName.toStdString()},
        {"thread", threadIdString().toStdString()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", who.toStdString()},
        {"corr", corr.toStdString()},
        {"context", context}
    };
    if (context.is_object() && context.contains("chatId")) {
        payload["chat"] = context["chatId"];
    }

    const QByteArray line = QByteArray::fromStdString(
        payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));

    const QString process = processName.isEmpty() ? defaultProcessName() : processName;
    std::lock_guard<std::mutex> lock(g_logMutex);
    const QString base = resolvedDir(g_state.options) + QDir::separator() + process;

    if (level != LogLevel::Debug || g_state.options.trace) {
        writeLine(base + QStringLiteral(".log"), line);
    }
    if (g_state.options.trace) {
        writeLine(base + QStringLiteral("-trace.log"), line);
    }
}

} // namespace streakguard::logging
