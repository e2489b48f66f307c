#include "Logging.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <vector>

namespace {
    constexpr const char* LOGGER_NAME = "reelcast";
    constexpr const char* LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [t%t] %v";
}

namespace Logging {

void init(const std::string& level, const std::string& log_file) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    std::string file_error;
    if (!log_file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
        } catch (const spdlog::spdlog_ex& e) {
            file_error = e.what();
        }
    }

    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    logger->set_pattern(LOG_PATTERN);

    auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        parsed = spdlog::level::info;
    }
    logger->set_level(parsed);
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger);

    if (!file_error.empty()) {
        spdlog::warn("Logging: cannot open {}: {}", log_file, file_error);
    }
}

void quietConsole() {
    auto logger = spdlog::default_logger();
    if (!logger || logger->sinks().empty()) {
        return;
    }
    logger->sinks().front()->set_level(spdlog::level::warn);
}

} // namespace Logging
