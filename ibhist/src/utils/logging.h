#ifndef IBHIST_LOGGING_H
#define IBHIST_LOGGING_H

#include <string>

#include <spdlog/spdlog.h>

namespace logging {
    /**
     * Maps "none", "error", "warning", "information" or "debug" to a spdlog
     * level.
     *
     * @throws std::invalid_argument for any other name.
     */
    spdlog::level::level_enum parseLevel(const std::string &levelName);

    /**
     * Sets the level of the default logger and, if `logFile` is not empty,
     * replaces the console logger with one writing to that file.
     */
    void configure(const std::string &levelName, const std::string &logFile);
}

#endif //IBHIST_LOGGING_H
