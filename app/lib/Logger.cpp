#include "Logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdio>
#include <system_error>

namespace {
constexpr std::size_t kMaxLogFileSize = 5 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;
constexpr const char* kLogFileName = "docvault.log";
constexpr const char* kLogPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";
}

std::shared_ptr<spdlog::logger> Logger::make_logger(const std::string& name,
                                                    const std::vector<spdlog::sink_ptr>& sinks,
                                                    spdlog::level::level_enum level)
{
    if (spdlog::get(name)) {
        spdlog::drop(name);
    }
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->set_pattern(kLogPattern);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    return logger;
}

void Logger::setup_loggers(const std::optional<std::filesystem::path>& log_dir, bool verbose)
{
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (log_dir) {
        std::error_code ec;
        std::filesystem::create_directories(*log_dir, ec);
        if (ec) {
            std::fprintf(stderr, "Cannot create log directory %s: %s\n",
                         log_dir->string().c_str(), ec.message().c_str());
        } else {
            try {
                const auto file_path = (*log_dir / kLogFileName).string();
                sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    file_path, kMaxLogFileSize, kMaxLogFiles));
            } catch (const spdlog::spdlog_ex& ex) {
                std::fprintf(stderr, "File logging disabled: %s\n", ex.what());
            }
        }
    }

    const auto level = verbose ? spdlog::level::debug : spdlog::level::info;
    for (const char* name : {kCoreLogger, kDbLogger, kLLMLogger}) {
        make_logger(name, sinks, level);
    }
}

std::shared_ptr<spdlog::logger> Logger::get_logger(const std::string& name)
{
    return spdlog::get(name);
}

void Logger::shutdown()
{
    spdlog::shutdown();
}
