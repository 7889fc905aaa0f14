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

namespace foldermind::logging {

namespace {

// Appends lines to one log file, rotating it into a .1 .. .N chain.
class LogSink {
public:
    LogSink(QString path, qint64 rotateBytes, int keepRotated)
        : m_path(std::move(path))
        , m_rotateBytes(rotateBytes)
        , m_keepRotated(keepRotated)
        , m_file(m_path)
    {
    }

    bool append(const QByteArray &line)
    {
        if (!ensureOpen()) {
            return false;
        }
        if (m_rotateBytes > 0 && m_file.size() + line.size() + 1 > m_rotateBytes) {
            rotate();
            if (!ensureOpen()) {
                return false;
            }
        }
        m_file.write(line);
        m_file.write("\n", 1);
        m_file.flush();
        return true;
    }

private:
    bool ensureOpen()
    {
        if (m_file.isOpen()) {
            return true;
        }
        QDir().mkpath(QFileInfo(m_path).absolutePath());
        return m_file.open(QIODevice::WriteOnly | QIODevice::Append);
    }

    void rotate()
    {
        m_file.close();
        if (m_keepRotated <= 0) {
            QFile::remove(m_path);
            return;
        }
        QFile::remove(rotatedName(m_keepRotated));
        for (int i = m_keepRotated - 1; i >= 1; --i) {
            QFile::rename(rotatedName(i), rotatedName(i + 1));
        }
        QFile::rename(m_path, rotatedName(1));
    }

    QString rotatedName(int index) const
    {
        return m_path + QLatin1Char('.') + QString::number(index);
    }

    QString m_path;
    qint64 m_rotateBytes;
    int m_keepRotated;
    QFile m_file;
};

struct LoggerState {
    std::mutex mutex;
    QString processName;
    bool trace = false;
    LogOptions options;
    std::map<QString, std::unique_ptr<LogSink>> sinks;
};

LoggerState &state()
{
    static LoggerState instance;
    return instance;
}

thread_local QString t_corrId;

QString defaultLogsDir()
{
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".local/share/foldermind/logs");
    }
    return home + QStringLiteral("/.local/share/foldermind/logs");
}

QString logsDirLocked(const LoggerState &s)
{
    return s.options.directory.isEmpty() ? defaultLogsDir() : s.options.directory;
}

// Caller holds the state mutex.
void writeLocked(LoggerState &s, const QString &file, const QByteArray &line)
{
    const QString path = logsDirLocked(s) + QLatin1Char('/') + file;
    auto it = s.sinks.find(path);
    if (it == s.sinks.end()) {
        it = s.sinks.emplace(path, std::make_unique<LogSink>(
                                       path, s.options.rotateBytes, s.options.keepRotated))
                 .first;
    }
    if (!it->second->append(line)) {
        std::fprintf(stderr, "%s\n", line.constData());
    }
}

QString threadIdString()
{
    return QStringLiteral("0x%1")
        .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16);
}

} // namespace

void initLogging(const QString &processName, bool traceEnabled)
{
    initLogging(processName, traceEnabled, LogOptions());
}

void initLogging(const QString &processName, bool traceEnabled, const LogOptions &options)
{
    LoggerState &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.processName = processName;
    s.trace = traceEnabled;
    s.options = options;
    if (traceEnabled) {
        s.options.minimumLevel = LogLevel::Debug;
    }
    // Options may have moved the directory or changed rotation.
    s.sinks.clear();
}

bool isTraceEnabled()
{
    LoggerState &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.trace;
}

QString logsDirPath()
{
    LoggerState &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return logsDirLocked(s);
}

std::optional<LogLevel> parseLogLevel(const QString &text)
{
    const QString value = text.trimmed().toLower();
    if (value == QLatin1String("debug")) {
        return LogLevel::Debug;
    }
    if (value == QLatin1String("info")) {
        return LogLevel::Info;
    }
    if (value == QLatin1String("warn") || value == QLatin1String("warning")) {
        return LogLevel::Warn;
    }
    if (value == QLatin1String("error")) {
        return LogLevel::Error;
    }
    return std::nullopt;
}

QString logLevelName(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return QStringLiteral("DEBUG");
    case LogLevel::Info:
        return QStringLiteral("INFO");
    case LogLevel::Warn:
        return QStringLiteral("WARN");
    case LogLevel::Error:
        return QStringLiteral("ERROR");
    }
    return QStringLiteral("INFO");
}

void setCorrelationId(const QString &corrId)
{
    t_corrId = corrId;
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

QString defaultProcessName()
{
    {
        LoggerState &s = state();
        std::lock_guard<std::mutex> lock(s.mutex);
        if (!s.processName.isEmpty()) {
            return s.processName;
        }
    }
    if (QCoreApplication::instance() && !QCoreApplication::applicationName().isEmpty()) {
        return QCoreApplication::applicationName();
    }
    return QStringLiteral("foldermind");
}

QString defaultWho()
{
    static const QString who = []() {
        char hostname[256] = {};
        if (gethostname(hostname, sizeof(hostname) - 1) != 0) {
            hostname[0] = '\0';
        }
        return QStringLiteral("host:%1,uid:%2,pid:%3")
            .arg(QString::fromUtf8(hostname))
            .arg(static_cast<int>(getuid()))
            .arg(static_cast<int>(getpid()));
    }();
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
    LoggerState &s = state();
    {
        std::lock_guard<std::mutex> lock(s.mutex);
        if (level < s.options.minimumLevel && !s.trace) {
            return;
        }
    }

    const QString process = processName.isEmpty() ? defaultProcessName() : processName;
    const nlohmann::json event = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", logLevelName(level).toStdString()},
        {"process", process.toStdString()},
        {"thread", threadIdString().toStdString()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", who.toStdString()},
        {"corr", (correlationId.isEmpty() ? currentCorrelationId() : correlationId).toStdString()},
        {"context", context}
    };
    const QByteArray line = QByteArray::fromStdString(
        event.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));

    std::lock_guard<std::mutex> lock(s.mutex);
    if (level >= s.options.minimumLevel) {
        writeLocked(s, process + QStringLiteral(".log"), line);
    }
    if (s.trace) {
        writeLocked(s, process + QStringLiteral("-trace.log"), line);
    }
    if (s.options.mirrorToStderr && level >= LogLevel::Warn) {
        std::fprintf(stderr, "%s\n", line.constData());
    }
}

} // namespace foldermind::logging
