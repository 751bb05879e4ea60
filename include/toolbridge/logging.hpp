#pragma once

#include <memory>
#include <spdlog/logger.h>

#include "toolbridge/config.hpp"

namespace toolbridge {

    /// @brief Name under which the bridge logger is registered with spdlog.
    inline constexpr const char* kLoggerName = "toolbridge";

    /**
     * @brief Install the bridge logger.
     *
     * Colored stderr sink at cfg.level, plus a daily rotating file sink
     * (rotates at 12:00, keeps 7 files) at cfg.file_level when
     * cfg.directory is non-empty. Replaces any previously installed logger.
     * @throws ConfigurationError on an unknown level name or an unusable
     * log directory.
     */
    void configure_logging(const LoggingConfiguration& cfg);

    /// @brief The bridge logger; a stderr-only default is created on first
    /// use if configure_logging() was never called.
    std::shared_ptr<spdlog::logger> logger();

}  // namespace toolbridge
