// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "cli/DeviceResolver.hxx"

namespace blynkCtl
{
    DeviceResolver::DeviceResolver(const AppConfig& config) : m_config(config) {}

    std::vector<std::string> DeviceResolver::selectDevices(const Action& action,
                                                           const std::function<bool(const Device&)>& predicate) const {
        std::vector<std::string> result;
        for (const auto& device : m_config.devices) {
            if (!predicate(device)) continue;
            if (m_config.isExcluded(device.name) && !action.isRead()) continue;
            result.push_back(device.name);
        }
        return result;
    }

    std::vector<std::string> DeviceResolver::resolve(const std::vector<std::string>& selectors,
                                                     const Action& action) const {
        if (selectors.empty()) return {};

        const std::string& first = selectors.front();
        if (first == "all" || first == "a") {
            return selectDevices(action, [](const Device&) { return true; });
        }
        if (m_config.isGroup(first)) {
            return selectDevices(action, [&first](const Device& device) {
                return device.group && *device.group == first;
            });
        }
        return selectors;
    }
}
