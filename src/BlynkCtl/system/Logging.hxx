// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef BLYNKCTL_LOGGING_HXX
#define BLYNKCTL_LOGGING_HXX

namespace blynkCtl::logging
{
    static constexpr char LOG_LEVEL_ENV[] = "BLYNKCTL_LOG_LEVEL";

    /**
     * @brief Route every component logger to stderr and apply the level
     * named by BLYNKCTL_LOG_LEVEL (default: warn).
     * stdout stays reserved for command output.
     */
    void init();

    void setLevel(spdlog::level::level_enum level);

    /** Parses trace|debug|info|warn|error|critical|off. */
    [[nodiscard]] std::optional<spdlog::level::level_enum> parseLevel(std::string_view name);

    /** Logger for a component tag, created on first use. */
    [[nodiscard]] std::shared_ptr<spdlog::logger> get(const char* tag);

} // namespace blynkCtl::logging

#endif //BLYNKCTL_LOGGING_HXX
