// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "config/ConfigManager.hxx"
#include "system/Logging.hxx"

#include <utils/FileHandle.hxx>

#include <cerrno>
#include <sys/stat.h>

namespace blynkCtl
{
    static constexpr char TAG[] = "Config";
    static constexpr char BUILTIN_SOURCE[] = "built-in";

    static bool fileExists(const std::string& path) {
        struct stat st{};
        return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
    }

    AppConfig ConfigManager::defaultConfig() {
        AppConfig cfg;
        cfg.server = BLYNKCTL_DEFAULT_SERVER;
        // kitchen_light switches an active-low relay
        cfg.devices = {
            {"bedroom_light", "V3", "<auth_token>", 0, "bedroom"},
            {"kitchen_light", "d2", "<auth_token>", 1, "kitchen"},
            {"temperature",   "V6", "<auth_token>", std::nullopt, std::nullopt},
            {"humidity",      "V5", "<auth_token>", std::nullopt, std::nullopt},
        };
        cfg.exclude = {"temperature", "humidity"};
        cfg.groups = {"bedroom", "kitchen"};
        return cfg;
    }

    std::optional<std::string> ConfigManager::defaultConfigPath() {
        if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
            return std::string(xdg) + "/" + BLYNKCTL_CONFIG_FILE_NAME;
        }
        if (const char* home = std::getenv("HOME"); home && *home) {
            return std::string(home) + "/.config/" + BLYNKCTL_CONFIG_FILE_NAME;
        }
        return std::nullopt;
    }

    std::string ConfigManager::normalizeServer(std::string server) {
        while (!server.empty() && server.back() == '/') {
            server.pop_back();
        }
        return server;
    }

    BlynkErr ConfigManager::load() {
        const auto log = logging::get(TAG);
        BlynkErr err = BlynkErr::Ok;

        if (const char* explicit_path = std::getenv(CONFIG_PATH_ENV); explicit_path && *explicit_path) {
            err = loadFromFile(explicit_path);
        } else if (const auto path = defaultConfigPath(); path && fileExists(*path)) {
            err = loadFromFile(*path);
        } else {
            log->debug("No configuration file found, using built-in device table.");
            config_cache = defaultConfig();
            source = BUILTIN_SOURCE;
        }
        if (err != BlynkErr::Ok) {
            return err;
        }

        if (const char* server = std::getenv(SERVER_ENV); server && *server) {
            log->debug("Server overridden by {}: {}", SERVER_ENV, server);
            config_cache.server = normalizeServer(server);
        }

        log->info("Loaded {} devices from {} (server {}).", config_cache.devices.size(), source, config_cache.server);
        return BlynkErr::Ok;
    }

    BlynkErr ConfigManager::loadFromFile(const std::string& path) {
        const auto log = logging::get(TAG);

        const utils::FileHandle file(path.c_str(), "rb");
        if (!file) {
            log->error("Cannot open configuration file '{}': {}", path, std::strerror(errno));
            return BlynkErr::InvalidConfig;
        }
        std::string contents;
        if (!file.readAll(contents)) {
            log->error("Failed to read configuration file '{}'", path);
            return BlynkErr::InvalidConfig;
        }

        const BlynkErr err = loadFromJson(contents.c_str());
        if (err == BlynkErr::Ok) {
            source = path;
        } else {
            log->error("Configuration file '{}' rejected: {}", path, errToName(err));
        }
        return err;
    }

    BlynkErr ConfigManager::parseStringArray(const cJSON* array, const char* key, std::vector<std::string>& out) {
        out.clear();
        if (!cJSON_IsArray(array)) {
            logging::get(TAG)->error("'{}' must be an array of strings", key);
            return BlynkErr::InvalidConfig;
        }
        const cJSON* item = nullptr;
        cJSON_ArrayForEach(item, array) {
            if (!cJSON_IsString(item)) {
                logging::get(TAG)->error("'{}' must contain only strings", key);
                return BlynkErr::InvalidConfig;
            }
            out.emplace_back(item->valuestring);
        }
        return BlynkErr::Ok;
    }

    BlynkErr ConfigManager::parseDevice(const cJSON* item, Device& out) {
        const auto log = logging::get(TAG);
        out = Device{};
        out.name = item->string ? item->string : "";

        if (!cJSON_IsObject(item)) {
            log->error("Device '{}' must be an object", out.name);
            return BlynkErr::InvalidConfig;
        }

        const cJSON* pin_item = cJSON_GetObjectItemCaseSensitive(item, "pin");
        const cJSON* auth_item = cJSON_GetObjectItemCaseSensitive(item, "auth");
        if (!cJSON_IsString(pin_item) || !cJSON_IsString(auth_item)) {
            log->error("Device '{}' needs string fields 'pin' and 'auth'", out.name);
            return BlynkErr::InvalidConfig;
        }
        out.pin = pin_item->valuestring;
        out.auth = auth_item->valuestring;

        if (const cJSON* default_item = cJSON_GetObjectItemCaseSensitive(item, "default")) {
            if (!cJSON_IsNumber(default_item) ||
                (default_item->valuedouble != 0.0 && default_item->valuedouble != 1.0)) {
                log->error("Device '{}': 'default' must be 0 or 1", out.name);
                return BlynkErr::InvalidConfig;
            }
            out.default_state = static_cast<uint8_t>(default_item->valuedouble);
        }

        if (const cJSON* group_item = cJSON_GetObjectItemCaseSensitive(item, "group");
            group_item && !cJSON_IsNull(group_item)) {
            if (!cJSON_IsString(group_item)) {
                log->error("Device '{}': 'group' must be a string", out.name);
                return BlynkErr::InvalidConfig;
            }
            out.group = group_item->valuestring;
        }
        return BlynkErr::Ok;
    }

    BlynkErr ConfigManager::parseRoot(const cJSON* root, AppConfig& cfg) {
        const auto log = logging::get(TAG);

        if (const cJSON* server_item = cJSON_GetObjectItemCaseSensitive(root, "server")) {
            if (!cJSON_IsString(server_item)) {
                log->error("'server' must be a string");
                return BlynkErr::InvalidConfig;
            }
            cfg.server = server_item->valuestring;
        }

        const cJSON* devices_item = cJSON_GetObjectItemCaseSensitive(root, "devices");
        if (!cJSON_IsObject(devices_item)) {
            log->error("'devices' must be an object keyed by device name");
            return BlynkErr::InvalidConfig;
        }
        const cJSON* device_item = nullptr;
        cJSON_ArrayForEach(device_item, devices_item) {
            Device device;
            if (const BlynkErr err = parseDevice(device_item, device); err != BlynkErr::Ok) {
                return err;
            }
            if (cfg.findDevice(device.name)) {
                log->error("Device '{}' is defined twice", device.name);
                return BlynkErr::InvalidConfig;
            }
            cfg.devices.push_back(std::move(device));
        }

        if (const cJSON* exclude_item = cJSON_GetObjectItemCaseSensitive(root, "exclude")) {
            std::vector<std::string> names;
            if (const BlynkErr err = parseStringArray(exclude_item, "exclude", names); err != BlynkErr::Ok) {
                return err;
            }
            cfg.exclude.insert(names.begin(), names.end());
        }

        if (const cJSON* groups_item = cJSON_GetObjectItemCaseSensitive(root, "groups")) {
            if (const BlynkErr err = parseStringArray(groups_item, "groups", cfg.groups); err != BlynkErr::Ok) {
                return err;
            }
        } else {
            // No explicit list: every group tag used by a device is selectable.
            for (const auto& device : cfg.devices) {
                if (device.group && !cfg.isGroup(*device.group)) {
                    cfg.groups.push_back(*device.group);
                }
            }
        }
        return BlynkErr::Ok;
    }

    BlynkErr ConfigManager::loadFromJson(const char* json_str) {
        const auto log = logging::get(TAG);

        cJSON* root = cJSON_Parse(json_str);
        if (!cJSON_IsObject(root)) {
            log->error("Configuration is not a JSON object");
            cJSON_Delete(root);
            return BlynkErr::InvalidConfig;
        }

        AppConfig cfg;
        cfg.server = BLYNKCTL_DEFAULT_SERVER;
        BlynkErr err = parseRoot(root, cfg);
        cJSON_Delete(root);

        if (err == BlynkErr::Ok) {
            err = validate(cfg);
        }
        if (err != BlynkErr::Ok) {
            return err;
        }

        cfg.server = normalizeServer(std::move(cfg.server));
        config_cache = std::move(cfg);
        source = "inline JSON";
        log->debug("Parsed {} devices, {} excluded, {} groups.",
                   config_cache.devices.size(), config_cache.exclude.size(), config_cache.groups.size());
        return BlynkErr::Ok;
    }

    BlynkErr ConfigManager::validate(const AppConfig& cfg) {
        const auto log = logging::get(TAG);
        if (cfg.server.empty()) {
            log->error("Server URL is empty");
            return BlynkErr::InvalidConfig;
        }
        for (const auto& device : cfg.devices) {
            if (cfg.isExcluded(device.name)) continue;
            if (!device.default_state || *device.default_state > 1) {
                log->error("Device '{}' is switchable but has no 0/1 'default'; add it or list it in 'exclude'",
                           device.name);
                return BlynkErr::InvalidConfig;
            }
        }
        return BlynkErr::Ok;
    }

    const AppConfig& ConfigManager::getConfig() const {
        return config_cache;
    }

    const std::string& ConfigManager::getSource() const {
        return source;
    }
}
