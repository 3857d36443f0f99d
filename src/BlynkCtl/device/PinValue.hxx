// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef BLYNKCTL_PINVALUE_HXX
#define BLYNKCTL_PINVALUE_HXX

namespace blynkCtl
{
    // Raw or logical pin value. Whole numbers are switch states, anything
    // else is an analog value (dimmer level, sensor reading).
    using PinValue = double;

    /** Finite whole number inside the signed 64-bit range. */
    [[nodiscard]] bool isWholeNumber(PinValue value);

    /**
     * @brief Translate between raw and logical pin values.
     * Whole numbers are XOR-ed with default_state, other values pass through
     * unchanged. Applying it twice with the same default_state is a no-op.
     * @param raw value read from or destined for the service
     * @param default_state 1 for active-low wiring, 0 otherwise
     */
    [[nodiscard]] PinValue processPin(PinValue raw, uint8_t default_state = 0);

    /** Wire / display form: "1", "-3", "0.5", "1e-05". */
    [[nodiscard]] std::string formatPinValue(PinValue value);

    /** Parses a complete floating-point literal, surrounding blanks allowed. */
    [[nodiscard]] std::optional<PinValue> parsePinValue(std::string_view text);

} // namespace blynkCtl

#endif //BLYNKCTL_PINVALUE_HXX
