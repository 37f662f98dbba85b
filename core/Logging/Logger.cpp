#include "Logger.h"

namespace FRLGRender {

Logger::Logger(std::deque<WriterPtr> initialWriters)
    : writers(std::move(initialWriters))
{
    loggingThread = std::thread(&Logger::threadLoop, this);
}

Logger::~Logger() {
    {
        std::lock_guard<std::mutex> lock(queueLock);
        running = false;
    }
    cv.notify_all();

    if (loggingThread.joinable()) {
        loggingThread.join();
    }

    // Anything queued after the worker left
    Flush();
}

void Logger::AddLogWriter(WriterPtr writer) {
    std::lock_guard<std::mutex> lock(writerLock);
    writers.push_back(std::move(writer));
}

void Logger::LogMsg(LogLevel level, const char* owner, const char* message) {
    LogMsg(LogMessage(level, owner, message));
}

void Logger::LogMsg(LogMessage&& msg) {
    {
        std::lock_guard<std::mutex> lock(queueLock);
        messageQueue.push_back(std::move(msg));
    }
    cv.notify_one();
}

void Logger::Flush() {
    // Held across swap and write: batches reach the writers in queue order.
    std::lock_guard<std::mutex> writeGuard(writerLock);
    QueueType queue;
    {
        std::lock_guard<std::mutex> lock(queueLock);
        queue.swap(messageQueue);
    }

    ProcessMessages(queue);
    for (const auto& writer : writers) {
        writer->Flush();
    }
}

void Logger::threadLoop() {
    for (;;) {
        {
            std::unique_lock<std::mutex> lock(queueLock);
            cv.wait(lock, [this] { return !messageQueue.empty() || !running; });

            if (!running && messageQueue.empty()) {
                return;
            }
        }

        // Lock order is writerLock, then queueLock, as in Flush()
        std::lock_guard<std::mutex> writeGuard(writerLock);
        QueueType queue;
        {
            std::lock_guard<std::mutex> lock(queueLock);
            queue.swap(messageQueue);
        }
        ProcessMessages(queue);
    }
}

// Caller holds writerLock.
void Logger::ProcessMessages(const QueueType& queue) {
    for (const auto& msg : queue) {
        for (const auto& writer : writers) {
            if (writer->accepts(msg.level)) {
                writer->WriteLogMessage(msg);
            }
        }
    }
}

} // namespace FRLGRender
