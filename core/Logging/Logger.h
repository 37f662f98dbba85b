#pragma once

#include "Logging.h"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace FRLGRender {

class LogWriter {
public:
    std::atomic<LogLevel> level;

    explicit LogWriter(LogLevel level)
        : level(level) {}
    virtual ~LogWriter() noexcept = default;

    bool accepts(LogLevel msgLevel) const { return msgLevel <= level.load(); }

    virtual void WriteLogMessage(const LogMessage& msg) = 0;
    virtual void Flush() {}
};

// Queues messages from any thread and hands them to the writers on a worker thread.
class Logger {
public:
    using WriterPtr = std::shared_ptr<LogWriter>;

    explicit Logger(std::deque<WriterPtr> initialWriters);
    ~Logger();

    void AddLogWriter(WriterPtr writer);
    void LogMsg(LogLevel level, const char* owner, const char* message);
    void LogMsg(LogMessage&& msg);
    void Flush();

private:
    using QueueType = std::deque<LogMessage>;
    QueueType messageQueue;
    std::deque<WriterPtr> writers;

    bool running = true;
    std::condition_variable cv;
    std::mutex queueLock;
    std::mutex writerLock;
    std::thread loggingThread;

    void threadLoop();
    void ProcessMessages(const QueueType& queue);
};

} // namespace FRLGRender
