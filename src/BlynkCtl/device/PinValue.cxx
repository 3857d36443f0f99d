// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "device/PinValue.hxx"

#include <fmt/format.h>

namespace blynkCtl
{
    // 2^63, exact in a double
    static constexpr double INT64_LIMIT = 9223372036854775808.0;

    bool isWholeNumber(const PinValue value) {
        return std::isfinite(value) && std::trunc(value) == value &&
               value >= -INT64_LIMIT && value < INT64_LIMIT;
    }

    PinValue processPin(const PinValue raw, const uint8_t default_state) {
        if (!isWholeNumber(raw)) {
            return raw;
        }
        return static_cast<PinValue>(static_cast<int64_t>(raw) ^ static_cast<int64_t>(default_state));
    }

    std::string formatPinValue(const PinValue value) {
        if (isWholeNumber(value)) {
            return std::to_string(static_cast<int64_t>(value));
        }
        // shortest representation that reads back to the same double
        return fmt::format("{}", value);
    }

    std::optional<PinValue> parsePinValue(std::string_view text) {
        constexpr std::string_view blanks = " \t\r\n";
        const auto first = text.find_first_not_of(blanks);
        if (first == std::string_view::npos) {
            return std::nullopt;
        }
        text = text.substr(first, text.find_last_not_of(blanks) - first + 1);
        if (text.starts_with('+')) {
            text.remove_prefix(1);
            if (text.starts_with('-') || text.starts_with('+')) return std::nullopt;
        }

        PinValue value = 0;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc() || ptr != text.data() + text.size()) {
            return std::nullopt;
        }
        return value;
    }
}
