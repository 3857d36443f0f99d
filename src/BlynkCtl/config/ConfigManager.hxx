// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef BLYNKCTL_CONFIGMANAGER_HXX
#define BLYNKCTL_CONFIGMANAGER_HXX

#include "config/AppConfig.hxx"
#include "system/BlynkErr.hxx"

namespace blynkCtl
{
    static constexpr char CONFIG_PATH_ENV[] = "BLYNKCTL_CONFIG";
    static constexpr char SERVER_ENV[] = "BLYNKCTL_SERVER";

    class ConfigManager {
        public:
            ConfigManager() = default;
            ConfigManager(const ConfigManager&) = delete;
            ConfigManager& operator=(const ConfigManager&) = delete;

            /** Built-in device table, used when no configuration file exists. */
            [[nodiscard]] static AppConfig defaultConfig();

            /**
             * @brief Load the device table.
             * Looks at $BLYNKCTL_CONFIG, then $XDG_CONFIG_HOME and $HOME/.config,
             * and keeps the built-in table when none of them holds a file.
             * $BLYNKCTL_SERVER overrides the base URL afterwards.
             */
            BlynkErr load();

            BlynkErr loadFromFile(const std::string& path);

            BlynkErr loadFromJson(const char* json_str);

            [[nodiscard]] const AppConfig& getConfig() const;

            /** "built-in" or the path the table was read from. */
            [[nodiscard]] const std::string& getSource() const;

            /** Checks that every switchable device has a 0/1 default state. */
            [[nodiscard]] static BlynkErr validate(const AppConfig& cfg);

        private:
            static std::optional<std::string> defaultConfigPath();
            static BlynkErr parseRoot(const cJSON* root, AppConfig& cfg);
            static BlynkErr parseDevice(const cJSON* item, Device& out);
            static BlynkErr parseStringArray(const cJSON* array, const char* key, std::vector<std::string>& out);
            static std::string normalizeServer(std::string server);

            AppConfig config_cache{defaultConfig()};
            std::string source{"built-in"};
    };
}

#endif //BLYNKCTL_CONFIGMANAGER_HXX
