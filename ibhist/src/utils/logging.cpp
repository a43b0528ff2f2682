#include "logging.h"

#include <map>
#include <stdexcept>

#include <boost/filesystem.hpp>
#include <spdlog/sinks/basic_file_sink.h>

namespace logging {
    spdlog::level::level_enum parseLevel(const std::string &levelName) {
        static const std::map<std::string, spdlog::level::level_enum> levels{
                {"none",        spdlog::level::off},
                {"error",       spdlog::level::err},
                {"warning",     spdlog::level::warn},
                {"information", spdlog::level::info},
                {"debug",       spdlog::level::debug}
        };

        auto level = levels.find(levelName);
        if (level == levels.end()) {
            throw std::invalid_argument(
                    "log-level: " + levelName + " must be 1 of 'none',"
                    " 'error', 'warning', 'information', 'debug'."
            );
        }
        return level->second;
    }

    void configure(const std::string &levelName, const std::string &logFile) {
        spdlog::level::level_enum level = parseLevel(levelName);

        if (!logFile.empty()) {
            boost::filesystem::path logPath(logFile);
            std::string loggerName = logPath.filename().string();

            // keep an existing logger, the tests configure logging repeatedly
            std::shared_ptr<spdlog::logger> logger = spdlog::get(loggerName);
            if (!logger) {
                if (logPath.has_parent_path()
                    && !boost::filesystem::exists(logPath.parent_path())) {
                    boost::filesystem::create_directories(logPath.parent_path());
                }
                logger = spdlog::basic_logger_mt(loggerName, logFile);
            }
            spdlog::set_default_logger(logger);
        }

        spdlog::set_level(level);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%^%l%$] %v");
    }
}
