#pragma once

#include <stdexcept>
#include <string>
#include <utility>

#include "spdlog/spdlog.h"
#include "fmt/format.h"

namespace infraget
{

/**
 * Obtain global logger, which is initialized from
 * the following environment variables:
 *  - INFRAGET_LOG_LEVEL
 *  - INFRAGET_LOG_FILE
 *  - INFRAGET_LOG_FILE_MAXSIZE
 */
spdlog::logger& log();

/**
 * Set the level of the log instance to corresponding string.
 * If the string is empty, set to info.
 * @param logLevel String representation of the log level.
 * @param logInstance spdlog logger instance.
 */
void setLogLevel(std::string logLevel, spdlog::logger& logInstance);

/**
 * Log an exception and throw it.
 */
template<typename ExceptionType=std::runtime_error, typename... Args>
[[noreturn]] void raise(Args&&... args)
{
    ExceptionType exceptionInstance(std::forward<Args>(args)...);
    if constexpr (requires {exceptionInstance.what();})
        log().error(exceptionInstance.what());
    throw exceptionInstance;
}

/**
 * Format a message, log it and throw it as ExceptionType.
 */
template<typename ExceptionType=std::runtime_error, typename... Args>
[[noreturn]] void raiseFmt(fmt::format_string<Args...> formatString, Args&&... args)
{
    raise<ExceptionType>(fmt::format(formatString, std::forward<Args>(args)...));
}

}
