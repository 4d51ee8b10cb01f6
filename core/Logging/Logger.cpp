#include "Logger.h"

namespace XcurScale {

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
    queued.notify_all();

    // The thread drains whatever is still queued before it exits
    if (loggingThread.joinable()) {
        loggingThread.join();
    }

    std::lock_guard<std::mutex> lock(writerLock);
    for (const auto& writer : writers) {
        writer->Flush();
    }
}

void Logger::AddLogWriter(WriterPtr writer) {
    std::lock_guard<std::mutex> lock(writerLock);
    writers.push_back(std::move(writer));
}

void Logger::LogMsg(LogMessage&& msg) {
    {
        std::lock_guard<std::mutex> lock(queueLock);
        messageQueue.push_back(std::move(msg));
    }
    queued.notify_one();
}

void Logger::Flush() {
    {
        std::unique_lock<std::mutex> lock(queueLock);
        drained.wait(lock, [this] { return messageQueue.empty() && !writing; });
    }

    std::lock_guard<std::mutex> lock(writerLock);
    for (const auto& writer : writers) {
        writer->Flush();
    }
}

void Logger::threadLoop() {
    std::unique_lock<std::mutex> lock(queueLock);
    while (true) {
        queued.wait(lock, [this] { return !messageQueue.empty() || !running; });
        if (messageQueue.empty()) {
            break; // stopped and nothing left
        }

        QueueType batch = std::move(messageQueue);
        messageQueue.clear();
        writing = true;
        lock.unlock();

        ProcessMessages(batch);

        lock.lock();
        writing = false;
        drained.notify_all();
    }
    drained.notify_all();
}

void Logger::ProcessMessages(const QueueType& queue) {
    std::lock_guard<std::mutex> lock(writerLock);

    for (const auto& msg : queue) {
        for (const auto& writer : writers) {
            if (writer->Accepts(msg.level)) {
                writer->WriteLogMessage(msg);
            }
        }
    }
}

} // namespace XcurScale
