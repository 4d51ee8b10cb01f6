#pragma once

#include "Logging.h"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace XcurScale {

class LogWriter {
public:
    std::atomic<LogLevel> level;

    explicit LogWriter(LogLevel level)
        : level(level) {}
    virtual ~LogWriter() noexcept = default;

    bool Accepts(LogLevel msgLevel) const { return msgLevel <= level.load(); }

    virtual void WriteLogMessage(const LogMessage& msg) = 0;
    virtual void Flush() {}
};

/**
 * Queues messages from any thread and hands them to the writers on a
 * single background thread, so writers see messages in submission order.
 * Flush() blocks until everything queued before the call has been written.
 */
class Logger {
public:
    using WriterPtr = std::shared_ptr<LogWriter>;

private:
    using QueueType = std::deque<LogMessage>;
    QueueType messageQueue;
    std::deque<WriterPtr> writers;

    bool running = true;
    bool writing = false;
    std::condition_variable queued;
    std::condition_variable drained;
    std::mutex queueLock;
    std::mutex writerLock;
    std::thread loggingThread;

    void threadLoop();
    void ProcessMessages(const QueueType& queue);

public:
    explicit Logger(std::deque<WriterPtr> initialWriters);
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void AddLogWriter(WriterPtr writer);
    void LogMsg(LogMessage&& msg);
    void Flush();
};

} // namespace XcurScale
