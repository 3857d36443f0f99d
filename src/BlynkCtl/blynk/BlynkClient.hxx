// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef BLYNKCTL_BLYNKCLIENT_HXX
#define BLYNKCTL_BLYNKCLIENT_HXX

#include "config/AppConfig.hxx"
#include "device/PinValue.hxx"
#include "http/HttpClient.hxx"
#include "system/BlynkErr.hxx"

namespace blynkCtl
{
    /**
     * Reads and writes single device pins through the Blynk HTTP API:
     *   GET {server}/{auth}/update/{pin}?value={v}
     *   GET {server}/{auth}/get/{pin}  ->  ["<value>"]
     * One blocking request per call, no retries.
     */
    class BlynkClient {
    public:
        BlynkClient(const AppConfig& config, HttpTransport& transport);

        /**
         * @brief Set a device to a logical value.
         * Whole values are inverted for active-low devices before sending.
         */
        BlynkErr write(const std::string& device, PinValue value);

        /**
         * @brief Read a device's logical value.
         * Only 0/1 readings of switchable devices are inverted; sensor
         * readings and other values are returned as received.
         */
        BlynkErr read(const std::string& device, PinValue& out_value);

        [[nodiscard]] std::string updateUrl(const Device& device, PinValue raw) const;
        [[nodiscard]] std::string getUrl(const Device& device) const;

        /** First element of a JSON array, as number or numeric string. */
        [[nodiscard]] static BlynkErr parseFirstValue(const std::string& body, PinValue& out_value);

    private:
        [[nodiscard]] const Device* lookup(const std::string& name) const;
        BlynkErr request(const std::string& url, HttpResponse& out);

        const AppConfig& m_config;
        HttpTransport& m_transport;
    };

} // namespace blynkCtl

#endif //BLYNKCTL_BLYNKCLIENT_HXX
