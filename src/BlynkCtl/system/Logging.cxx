// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "system/Logging.hxx"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace blynkCtl::logging
{
    static constexpr char TAG[] = "Logging";
    static constexpr char LOG_PATTERN[] = "[%^%l%$] %n: %v";

    static spdlog::sink_ptr sharedSink() {
        static spdlog::sink_ptr sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        return sink;
    }

    void init() {
        spdlog::set_pattern(LOG_PATTERN);
        setLevel(spdlog::level::warn);

        const char* env_level = std::getenv(LOG_LEVEL_ENV);
        if (!env_level || *env_level == '\0') {
            return;
        }
        if (const auto level = parseLevel(env_level)) {
            setLevel(*level);
        } else {
            get(TAG)->warn("Ignoring unknown {} value '{}'", LOG_LEVEL_ENV, env_level);
        }
    }

    void setLevel(const spdlog::level::level_enum level) {
        spdlog::set_level(level);
    }

    std::optional<spdlog::level::level_enum> parseLevel(const std::string_view name) {
        if (name == "trace") return spdlog::level::trace;
        if (name == "debug") return spdlog::level::debug;
        if (name == "info") return spdlog::level::info;
        if (name == "warn" || name == "warning") return spdlog::level::warn;
        if (name == "error") return spdlog::level::err;
        if (name == "critical") return spdlog::level::critical;
        if (name == "off") return spdlog::level::off;
        return std::nullopt;
    }

    std::shared_ptr<spdlog::logger> get(const char* tag) {
        if (auto existing = spdlog::get(tag)) {
            return existing;
        }
        auto logger = std::make_shared<spdlog::logger>(tag, sharedSink());
        // picks up the registry level and pattern
        spdlog::initialize_logger(logger);
        return logger;
    }
}
