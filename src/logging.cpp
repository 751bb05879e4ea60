#include "toolbridge/logging.hpp"

#include <spdlog/common.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <mutex>
#include <system_error>
#include <vector>

#include "toolbridge/error.hpp"

namespace toolbridge {

    namespace {

        std::mutex logger_mu;

        spdlog::level::level_enum parse_level(const std::string& name) {
            auto lvl = spdlog::level::from_str(name);
            // from_str() maps anything unknown to "off"
            if (lvl == spdlog::level::off && name != "off") {
                throw ConfigurationError("Unknown log level: '" + name + "'");
            }
            return lvl;
        }

        constexpr const char* kPattern =
            "%Y-%m-%d %H:%M:%S.%e | %^%-8l%$ | %n - %v";

    }  // namespace

    void configure_logging(const LoggingConfiguration& cfg) {
        const auto console_level = parse_level(cfg.level);
        const auto file_level = parse_level(cfg.file_level);

        std::vector<spdlog::sink_ptr> sinks;

        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console->set_level(console_level);
        console->set_pattern(kPattern);
        sinks.push_back(console);

        auto logger_level = console_level;

        if (!cfg.directory.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(cfg.directory, ec);
            if (ec) {
                throw ConfigurationError("Cannot create log directory '" +
                                         cfg.directory + "': " + ec.message());
            }

            auto path =
                (std::filesystem::path(cfg.directory) / "toolbridge.log")
                    .string();
            auto file = std::make_shared<spdlog::sinks::daily_file_sink_mt>(
                path, 12, 0, false, 7);
            file->set_level(file_level);
            file->set_pattern(kPattern);
            sinks.push_back(file);

            logger_level = std::min(console_level, file_level);
        }

        auto lg = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(),
                                                   sinks.end());
        lg->set_level(logger_level);
        lg->flush_on(spdlog::level::warn);

        std::lock_guard<std::mutex> lk(logger_mu);
        spdlog::drop(kLoggerName);
        spdlog::register_logger(lg);
    }

    std::shared_ptr<spdlog::logger> logger() {
        std::lock_guard<std::mutex> lk(logger_mu);
        if (auto lg = spdlog::get(kLoggerName)) return lg;

        auto lg = spdlog::stderr_color_mt(kLoggerName);
        lg->set_pattern(kPattern);
        return lg;
    }

}  // namespace toolbridge
