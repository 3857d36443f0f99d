// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef BLYNKCTL_ACTIONDISPATCHER_HXX
#define BLYNKCTL_ACTIONDISPATCHER_HXX

#include "blynk/BlynkClient.hxx"
#include "cli/Action.hxx"
#include "cli/Presentation.hxx"
#include "config/AppConfig.hxx"
#include "system/BlynkErr.hxx"

namespace blynkCtl
{
    class ActionDispatcher {
    public:
        /**
         * @param out receives print/status output
         */
        ActionDispatcher(const AppConfig& config, BlynkClient& client, std::ostream& out);

        /**
         * @brief Apply an action to resolved devices, strictly in order.
         * The first failing device aborts the remaining ones.
         */
        BlynkErr dispatch(const Action& action, const std::vector<std::string>& devices);

        /** Reads every device; one entry per distinct name. */
        BlynkErr collectStatus(const std::vector<std::string>& devices, StatusEntries& out);

        /** Single value for exactly one device, the mapping otherwise. */
        BlynkErr status(const std::vector<std::string>& devices, StatusReport& out);

    private:
        BlynkErr writeAll(const std::vector<std::string>& devices, PinValue value);
        BlynkErr flip(const std::string& device);
        BlynkErr just(const std::vector<std::string>& devices);

        const AppConfig& m_config;
        BlynkClient& m_client;
        std::ostream& m_out;
    };

} // namespace blynkCtl

#endif //BLYNKCTL_ACTIONDISPATCHER_HXX
