// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef BLYNKCTL_PRESENTATION_HXX
#define BLYNKCTL_PRESENTATION_HXX

#include "device/PinValue.hxx"

namespace blynkCtl
{
    // Device name -> state, in first-seen order
    using StatusEntries = std::vector<std::pair<std::string, PinValue>>;

    // Bare value when a single device was asked for, the whole mapping otherwise
    using StatusReport = std::variant<PinValue, StatusEntries>;

    /** Repeated names keep their first position and take the latest value. */
    void upsertStatus(StatusEntries& entries, const std::string& name, PinValue value);

    /**
     * @brief Aligned "name : value" table.
     * Names are left-aligned to the longest name + 1, values to width 3,
     * each row ends with a blank; rows are joined by '\n' without a trailing newline.
     */
    [[nodiscard]] std::string renderTable(const StatusEntries& entries);

    /** Bare value, or a JSON object such as {"lamp":1,"temperature":21.5}. */
    [[nodiscard]] std::string renderStatus(const StatusReport& report);

} // namespace blynkCtl

#endif //BLYNKCTL_PRESENTATION_HXX
