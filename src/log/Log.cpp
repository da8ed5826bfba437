#include "plugctl/log/Log.hpp"

#include <iostream>
#include <mutex>

namespace plugctl::log {

namespace {

// Both default sinks write to stderr: stdout carries command output only.
LogHandler makeStderrSink() {
    return [](std::string_view message) {
        std::cerr << message;
        std::cerr.flush();
    };
}

std::mutex handlerMutex;
LogHandler infoHandler = makeStderrSink();
LogHandler errorHandler = makeStderrSink();

LogHandler currentHandler(const LogHandler& slot) {
    std::lock_guard lock(handlerMutex);
    return slot;
}

} // namespace

LogHandler discardingHandler() {
    return [](std::string_view) {};
}

void setInfoLogHandler(LogHandler handler) {
    std::lock_guard lock(handlerMutex);
    infoHandler = handler ? std::move(handler) : makeStderrSink();
}

void setErrorLogHandler(LogHandler handler) {
    std::lock_guard lock(handlerMutex);
    errorHandler = handler ? std::move(handler) : makeStderrSink();
}

void setLogHandlers(LogHandler newInfo, LogHandler newError) {
    std::lock_guard lock(handlerMutex);
    infoHandler = newInfo ? std::move(newInfo) : makeStderrSink();
    errorHandler = newError ? std::move(newError) : makeStderrSink();
}

void resetLogHandlers() {
    std::lock_guard lock(handlerMutex);
    infoHandler = makeStderrSink();
    errorHandler = makeStderrSink();
}

void logInfo(std::string_view message) {
    if (auto handler = currentHandler(infoHandler)) {
        handler(message);
    }
}

void logError(std::string_view message) {
    if (auto handler = currentHandler(errorHandler)) {
        handler(message);
    }
}

} // namespace plugctl::log
