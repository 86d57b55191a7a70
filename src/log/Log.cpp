#include "pixelair/log/Log.hpp"

#include <array>
#include <cstddef>
#include <iostream>
#include <mutex>

namespace pixelair::log {

namespace {

constexpr std::size_t LEVEL_COUNT = 3;

std::size_t indexOf(Level level) {
    return static_cast<std::size_t>(level);
}

LogHandler makeDefaultSink(Level level) {
    if (level == Level::Info) {
        return [](std::string_view message) {
            std::cout << message;
            std::cout.flush();
        };
    }
    return [level](std::string_view message) {
        if (level == Level::Warning) {
            std::cerr << "warning: ";
        }
        std::cerr << message;
        std::cerr.flush();
    };
}

std::mutex sinkMutex;
std::array<LogHandler, LEVEL_COUNT> handlers{
    makeDefaultSink(Level::Info),
    makeDefaultSink(Level::Warning),
    makeDefaultSink(Level::Error)
};

void dispatch(Level level, std::string_view message) {
    LogHandler handler;
    {
        std::lock_guard lock(sinkMutex);
        handler = handlers[indexOf(level)];
    }
    if (handler) {
        handler(message);
    }
}

} // namespace

void setLogHandler(Level level, LogHandler handler) {
    std::lock_guard lock(sinkMutex);
    handlers[indexOf(level)] = handler ? std::move(handler) : makeDefaultSink(level);
}

void setLogHandlers(LogHandler infoHandler, LogHandler errorHandler) {
    std::lock_guard lock(sinkMutex);
    handlers[indexOf(Level::Info)] =
        infoHandler ? std::move(infoHandler) : makeDefaultSink(Level::Info);
    // Warnings follow the error sink unless set separately.
    handlers[indexOf(Level::Warning)] =
        errorHandler ? errorHandler : makeDefaultSink(Level::Warning);
    handlers[indexOf(Level::Error)] =
        errorHandler ? std::move(errorHandler) : makeDefaultSink(Level::Error);
}

void resetLogHandlers() {
    std::lock_guard lock(sinkMutex);
    for (auto level : {Level::Info, Level::Warning, Level::Error}) {
        handlers[indexOf(level)] = makeDefaultSink(level);
    }
}

void logInfo(std::string_view message) {
    dispatch(Level::Info, message);
}

void logWarning(std::string_view message) {
    dispatch(Level::Warning, message);
}

void logError(std::string_view message) {
    dispatch(Level::Error, message);
}

} // namespace pixelair::log
