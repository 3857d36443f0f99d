// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "blynk/BlynkClient.hxx"
#include "system/Logging.hxx"

#include <utils/StringUtils.hxx>

namespace blynkCtl
{
    static constexpr char TAG[] = "BlynkClient";

    BlynkClient::BlynkClient(const AppConfig& config, HttpTransport& transport)
        : m_config(config), m_transport(transport) {}

    const Device* BlynkClient::lookup(const std::string& name) const {
        const Device* device = m_config.findDevice(name);
        if (!device) {
            logging::get(TAG)->error("Unknown device '{}'", name);
        }
        return device;
    }

    std::string BlynkClient::updateUrl(const Device& device, const PinValue raw) const {
        return utils::stringFormat("%s/%s/update/%s?value=%s", m_config.server.c_str(),
                                   device.auth.c_str(), device.pin.c_str(), formatPinValue(raw).c_str());
    }

    std::string BlynkClient::getUrl(const Device& device) const {
        return utils::stringFormat("%s/%s/get/%s", m_config.server.c_str(), device.auth.c_str(), device.pin.c_str());
    }

    BlynkErr BlynkClient::request(const std::string& url, HttpResponse& out) {
        if (const BlynkErr err = m_transport.get(url, out); err != BlynkErr::Ok) {
            return err;
        }
        if (out.status < 200 || out.status > 299) {
            logging::get(TAG)->error("Server answered HTTP {}: {}", out.status, out.body);
            return BlynkErr::HttpStatus;
        }
        return BlynkErr::Ok;
    }

    BlynkErr BlynkClient::write(const std::string& device, const PinValue value) {
        const auto log = logging::get(TAG);
        const Device* dev = lookup(device);
        if (!dev) return BlynkErr::NotFound;

        if (!dev->default_state) {
            log->error("Device '{}' has no default state and can only be read", device);
            return BlynkErr::InvalidState;
        }

        const PinValue raw = processPin(value, *dev->default_state);
        log->info("{} <- {} (raw {})", device, formatPinValue(value), formatPinValue(raw));

        HttpResponse response;
        return request(updateUrl(*dev, raw), response);
    }

    BlynkErr BlynkClient::read(const std::string& device, PinValue& out_value) {
        const auto log = logging::get(TAG);
        const Device* dev = lookup(device);
        if (!dev) return BlynkErr::NotFound;

        HttpResponse response;
        if (const BlynkErr err = request(getUrl(*dev), response); err != BlynkErr::Ok) {
            return err;
        }

        PinValue raw = 0;
        if (const BlynkErr err = parseFirstValue(response.body, raw); err != BlynkErr::Ok) {
            log->error("Unexpected payload for '{}': {}", device, response.body);
            return err;
        }

        const PinValue state = processPin(raw);
        if ((state != 0 && state != 1) || m_config.isExcluded(device)) {
            out_value = state;
        } else if (!dev->default_state) {
            log->error("Device '{}' has no default state; add it to the exclude list", device);
            return BlynkErr::InvalidState;
        } else {
            out_value = processPin(state, *dev->default_state);
        }

        log->info("{} -> {} (raw {})", device, formatPinValue(out_value), formatPinValue(raw));
        return BlynkErr::Ok;
    }

    BlynkErr BlynkClient::parseFirstValue(const std::string& body, PinValue& out_value) {
        cJSON* root = cJSON_Parse(body.c_str());
        const cJSON* first = cJSON_IsArray(root) ? cJSON_GetArrayItem(root, 0) : nullptr;

        BlynkErr err = BlynkErr::InvalidResponse;
        if (cJSON_IsNumber(first)) {
            out_value = first->valuedouble;
            err = BlynkErr::Ok;
        } else if (cJSON_IsString(first)) {
            if (const auto parsed = parsePinValue(first->valuestring)) {
                out_value = *parsed;
                err = BlynkErr::Ok;
            }
        }

        cJSON_Delete(root);
        return err;
    }
}
