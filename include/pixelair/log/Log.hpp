#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <sstream>
#include <type_traits>
#include <utility>

namespace pixelair::log {

enum class Level {
    Info,
    Warning,
    Error
};

using LogHandler = std::function<void(std::string_view)>;

/// Replace the sink for one level. An empty handler restores the default
/// (stdout for Info, stderr for Warning and Error).
void setLogHandler(Level level, LogHandler handler);
void setLogHandlers(LogHandler infoHandler, LogHandler errorHandler);
void resetLogHandlers();

void logInfo(std::string_view message);
void logWarning(std::string_view message);
void logError(std::string_view message);

namespace detail {

template<typename... Args>
inline std::string buildLogMessage(Args&&... args) {
    std::ostringstream oss;
    (oss << ... << std::forward<Args>(args));
    return oss.str();
}

template<typename T>
using IsStringViewConvertible = std::is_convertible<T, std::string_view>;

} // namespace detail

template<typename First, typename... Rest,
         typename = std::enable_if_t<(sizeof...(Rest) > 0) ||
             !detail::IsStringViewConvertible<std::decay_t<First>>::value>>
void logInfo(First&& first, Rest&&... rest) {
    logInfo(std::string_view{detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...)});
}

template<typename First, typename... Rest,
         typename = std::enable_if_t<(sizeof...(Rest) > 0) ||
             !detail::IsStringViewConvertible<std::decay_t<First>>::value>>
void logWarning(First&& first, Rest&&... rest) {
    logWarning(std::string_view{detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...)});
}

template<typename First, typename... Rest,
         typename = std::enable_if_t<(sizeof...(Rest) > 0) ||
             !detail::IsStringViewConvertible<std::decay_t<First>>::value>>
void logError(First&& first, Rest&&... rest) {
    logError(std::string_view{detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...)});
}

} // namespace pixelair::log

namespace pixelair {
using log::LogHandler;
using log::setLogHandler;
using log::setLogHandlers;
using log::resetLogHandlers;
using log::logInfo;
using log::logWarning;
using log::logError;
} // namespace pixelair
