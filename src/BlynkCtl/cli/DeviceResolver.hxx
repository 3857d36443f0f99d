// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef BLYNKCTL_DEVICERESOLVER_HXX
#define BLYNKCTL_DEVICERESOLVER_HXX

#include "cli/Action.hxx"
#include "config/AppConfig.hxx"

namespace blynkCtl
{
    class DeviceResolver {
    public:
        explicit DeviceResolver(const AppConfig& config);

        /**
         * @brief Expand selector tokens into device names.
         * Only the first token picks the mode:
         *  - "all" / "a": every device in table order
         *  - a group name: every device of that group in table order
         *  - anything else: the tokens themselves, unchecked and in order
         * The first two modes drop excluded devices unless the action reads.
         */
        [[nodiscard]] std::vector<std::string> resolve(const std::vector<std::string>& selectors,
                                                       const Action& action) const;

    private:
        [[nodiscard]] std::vector<std::string> selectDevices(const Action& action,
                                                             const std::function<bool(const Device&)>& predicate) const;

        const AppConfig& m_config;
    };

} // namespace blynkCtl

#endif //BLYNKCTL_DEVICERESOLVER_HXX
