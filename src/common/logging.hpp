#pragma once

#include <optional>

#include <QString>

#include <nlohmann/json.hpp>

namespace foldermind::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

struct LogOptions {
    // Empty: ~/.local/share/foldermind/logs.
    QString directory;
    LogLevel minimumLevel = LogLevel::Info;
    qint64 rotateBytes = 5 * 1024 * 1024;
    int keepRotated = 3;
    // Warnings and errors are copied to stderr. Never stdout: the MCP
    // bridge owns it.
    bool mirrorToStderr = false;
};

// Call early in main(). Trace mode lowers the minimum level to Debug and
// writes every event to <process>-trace.log as well.
void initLogging(const QString &processName, bool traceEnabled);
void initLogging(const QString &processName, bool traceEnabled, const LogOptions &options);

bool isTraceEnabled();
QString logsDirPath();

// "debug", "info", "warn"/"warning", "error"; case-insensitive.
std::optional<LogLevel> parseLogLevel(const QString &text);
QString logLevelName(LogLevel level);

void setCorrelationId(const QString &corrId);
QString currentCorrelationId();

// Restores the previous correlation id on destruction.
class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

    CorrelationScope(const CorrelationScope &) = delete;
    CorrelationScope &operator=(const CorrelationScope &) = delete;

private:
    QString m_prev;
};

// One JSON line per event. Empty strings are fine for unknown fields; an
// empty correlationId falls back to the thread's current one.
void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context = nlohmann::json::object());

QString defaultProcessName();
QString defaultWho();

} // namespace foldermind::logging

#define FMLOG_EVENT_(level, component, where, what, why, how, who, corr, ctxJson) \
    ::foldermind::logging::logEvent((level), \
                                    ::foldermind::logging::defaultProcessName(), \
                                    (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define FMLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    FMLOG_EVENT_(::foldermind::logging::LogLevel::Debug, component, where, what, why, how, who, corr, ctxJson)
#define FMLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    FMLOG_EVENT_(::foldermind::logging::LogLevel::Info, component, where, what, why, how, who, corr, ctxJson)
#define FMLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    FMLOG_EVENT_(::foldermind::logging::LogLevel::Warn, component, where, what, why, how, who, corr, ctxJson)
#define FMLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    FMLOG_EVENT_(::foldermind::logging::LogLevel::Error, component, where, what, why, how, who, corr, ctxJson)
