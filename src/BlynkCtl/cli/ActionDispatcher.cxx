// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "cli/ActionDispatcher.hxx"
#include "system/Logging.hxx"

namespace blynkCtl
{
    static constexpr char TAG[] = "Dispatcher";

    ActionDispatcher::ActionDispatcher(const AppConfig& config, BlynkClient& client, std::ostream& out)
        : m_config(config), m_client(client), m_out(out) {}

    BlynkErr ActionDispatcher::writeAll(const std::vector<std::string>& devices, const PinValue value) {
        for (const auto& device : devices) {
            if (const BlynkErr err = m_client.write(device, value); err != BlynkErr::Ok) {
                return err;
            }
        }
        return BlynkErr::Ok;
    }

    BlynkErr ActionDispatcher::flip(const std::string& device) {
        PinValue current = 0;
        if (const BlynkErr err = m_client.read(device, current); err != BlynkErr::Ok) {
            return err;
        }
        if (!isWholeNumber(current)) {
            logging::get(TAG)->error("Cannot flip '{}': current value {} is not a switch state",
                                     device, formatPinValue(current));
            return BlynkErr::InvalidState;
        }
        return m_client.write(device, processPin(current, 1));
    }

    BlynkErr ActionDispatcher::just(const std::vector<std::string>& devices) {
        if (const BlynkErr err = writeAll(devices, 1); err != BlynkErr::Ok) {
            return err;
        }

        std::set<std::string> groups;
        for (const auto& name : devices) {
            if (const Device* device = m_config.findDevice(name); device && device->group) {
                groups.insert(*device->group);
            }
        }

        std::vector<std::string> turn_off;
        for (const auto& device : m_config.devices) {
            if (m_config.isExcluded(device.name)) continue;
            if (!device.group || !groups.contains(*device.group)) continue;
            if (std::ranges::find(devices, device.name) != devices.end()) continue;
            turn_off.push_back(device.name);
        }
        logging::get(TAG)->debug("just: {} device(s) on, {} other group member(s) off", devices.size(), turn_off.size());
        return writeAll(turn_off, 0);
    }

    BlynkErr ActionDispatcher::collectStatus(const std::vector<std::string>& devices, StatusEntries& out) {
        out.clear();
        for (const auto& device : devices) {
            PinValue value = 0;
            if (const BlynkErr err = m_client.read(device, value); err != BlynkErr::Ok) {
                return err;
            }
            upsertStatus(out, device, value);
        }
        return BlynkErr::Ok;
    }

    BlynkErr ActionDispatcher::status(const std::vector<std::string>& devices, StatusReport& out) {
        if (devices.size() == 1) {
            PinValue value = 0;
            const BlynkErr err = m_client.read(devices.front(), value);
            if (err == BlynkErr::Ok) {
                out = value;
            }
            return err;
        }

        StatusEntries entries;
        const BlynkErr err = collectStatus(devices, entries);
        if (err == BlynkErr::Ok) {
            out = std::move(entries);
        }
        return err;
    }

    BlynkErr ActionDispatcher::dispatch(const Action& action, const std::vector<std::string>& devices) {
        logging::get(TAG)->debug("{} on {} device(s)", actionName(action.kind), devices.size());

        switch (action.kind) {
            case ActionKind::Flip:
                for (const auto& device : devices) {
                    if (const BlynkErr err = flip(device); err != BlynkErr::Ok) {
                        return err;
                    }
                }
                return BlynkErr::Ok;
            case ActionKind::Off:
                return writeAll(devices, 0);
            case ActionKind::On:
                return writeAll(devices, 1);
            case ActionKind::Just:
                return just(devices);
            case ActionKind::Print: {
                StatusEntries entries;
                const BlynkErr err = collectStatus(devices, entries);
                if (err == BlynkErr::Ok) {
                    m_out << renderTable(entries) << '\n';
                }
                return err;
            }
            case ActionKind::Status: {
                StatusReport report;
                const BlynkErr err = status(devices, report);
                if (err == BlynkErr::Ok) {
                    m_out << renderStatus(report) << '\n';
                }
                return err;
            }
            case ActionKind::SetValue:
                return writeAll(devices, action.value);
        }
        return BlynkErr::InvalidArg;
    }
}
