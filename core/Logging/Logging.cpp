#include "Logging.h"
#include "Logger.h"
#include "FileLogWriter.h"
#include "ConsoleLogWriter.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <memory>

namespace FRLGRender {

static std::unique_ptr<Logger> globalLogger;
static std::shared_ptr<ConsoleLogWriter> consoleWriter;
static std::atomic<bool> loggingEnabled{true};

const char* LogLevelName(LogLevel level) {
    switch (level) {
        case INTERNAL: return "INTERNAL";
        case FATAL: return "FATAL";
        case ERROR: return "ERROR";
        case WARNING: return "WARNING";
        case MESSAGE: return "MESSAGE";
        case DEBUG: return "DEBUG";
        default: return "UNKNOWN";
    }
}

LogLevel ParseLogLevel(const std::string& name, LogLevel fallback) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);

    for (LogLevel level : {FATAL, ERROR, WARNING, MESSAGE, DEBUG, INTERNAL}) {
        if (upper == LogLevelName(level)) {
            return level;
        }
    }
    return fallback;
}

void ToggleLogging(bool enabled) {
    loggingEnabled = enabled;
}

bool IsLoggingEnabled() {
    return loggingEnabled && globalLogger != nullptr;
}

void AddLogWriter(std::shared_ptr<LogWriter> writer) {
    if (globalLogger) {
        globalLogger->AddLogWriter(std::move(writer));
    }
}

void SetConsoleWindowLogLevel(LogLevel level) {
    if (consoleWriter) {
        consoleWriter->level = level;
    }
}

void LogMsg(LogLevel level, const char* owner, const char* message) {
    if (!loggingEnabled || !globalLogger) {
        return;
    }

    globalLogger->LogMsg(level, owner, message);
}

void FlushLogs() {
    if (globalLogger) {
        globalLogger->Flush();
    }
}

void InitializeLogging(LogLevel consoleLevel, const std::string& logFile) {
    if (globalLogger) {
        return;
    }

    std::deque<Logger::WriterPtr> writers;
    consoleWriter = std::make_shared<ConsoleLogWriter>(consoleLevel);
    writers.push_back(consoleWriter);

    if (!logFile.empty()) {
        writers.push_back(std::make_shared<FileLogWriter>(logFile, DEBUG));
    }

    globalLogger = std::make_unique<Logger>(std::move(writers));
}

void ShutdownLogging() {
    if (globalLogger) {
        FlushLogs();
        globalLogger.reset();
    }
    consoleWriter.reset();
}

} // namespace FRLGRender
