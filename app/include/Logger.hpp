#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <memory>
#include <optional>
#include <string>
#include <filesystem>
#include <vector>

#include <spdlog/spdlog.h>

class Logger {
public:
    static constexpr const char* kCoreLogger = "core_logger";
    static constexpr const char* kDbLogger = "db_logger";
    static constexpr const char* kLLMLogger = "llm_logger";

    /**
     * @brief Registers the named loggers with a colored stderr sink and, when a
     * directory is given, a rotating file sink inside it.
     */
    static void setup_loggers(const std::optional<std::filesystem::path>& log_dir, bool verbose);

    static std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

    static void shutdown();

private:
    static std::shared_ptr<spdlog::logger> make_logger(const std::string& name,
                                                       const std::vector<spdlog::sink_ptr>& sinks,
                                                       spdlog::level::level_enum level);
};

#endif
