// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef BLYNKCTL_APPCONFIG_HXX
#define BLYNKCTL_APPCONFIG_HXX

namespace blynkCtl
{
    struct Device {
        std::string name;                       // Unique key, CLI selector
        std::string pin;                        // Blynk pin, e.g. "V3" or "d2"
        std::string auth;                       // Blynk auth token
        std::optional<uint8_t> default_state{}; // 1 = active-low wiring; absent for sensors
        std::optional<std::string> group{};     // Room / group tag
    };

    struct AppConfig {
        std::string server;                 // Base URL, no trailing slash
        std::vector<Device> devices;        // Enumeration order = table order
        std::set<std::string> exclude;      // Never switched on/off
        std::vector<std::string> groups;    // Names accepted as group selectors

        [[nodiscard]] const Device* findDevice(std::string_view name) const {
            const auto it = std::ranges::find_if(devices, [name](const Device& d) { return d.name == name; });
            return it != devices.end() ? &*it : nullptr;
        }

        [[nodiscard]] bool isExcluded(const std::string& name) const {
            return exclude.contains(name);
        }

        [[nodiscard]] bool isGroup(std::string_view name) const {
            return std::ranges::any_of(groups, [name](const std::string& g) { return g == name; });
        }
    };

} // namespace blynkCtl

#endif //BLYNKCTL_APPCONFIG_HXX
