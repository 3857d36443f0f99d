// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "cli/Presentation.hxx"

#include <utils/StringUtils.hxx>

namespace blynkCtl
{
    static constexpr size_t VALUE_COLUMN_WIDTH = 3;

    void upsertStatus(StatusEntries& entries, const std::string& name, const PinValue value) {
        const auto it = std::ranges::find_if(entries, [&name](const auto& entry) { return entry.first == name; });
        if (it != entries.end()) {
            it->second = value;
        } else {
            entries.emplace_back(name, value);
        }
    }

    std::string renderTable(const StatusEntries& entries) {
        size_t name_width = 0;
        for (const auto& name : entries | std::views::keys) {
            name_width = std::max(name_width, name.size());
        }
        name_width += 1;

        std::string table;
        for (const auto& [name, value] : entries) {
            if (!table.empty()) table += '\n';
            table += utils::padRight(name, name_width);
            table += ": ";
            table += utils::padRight(formatPinValue(value), VALUE_COLUMN_WIDTH);
            table += ' ';
        }
        return table;
    }

    std::string renderStatus(const StatusReport& report) {
        if (const auto* single = std::get_if<PinValue>(&report)) {
            return formatPinValue(*single);
        }

        const auto& entries = std::get<StatusEntries>(report);
        cJSON* root = cJSON_CreateObject();
        if (!root) return {};
        for (const auto& [name, value] : entries) {
            cJSON_AddItemToObject(root, name.c_str(), cJSON_CreateNumber(value));
        }

        char* json_string = cJSON_PrintUnformatted(root);
        cJSON_Delete(root);
        if (!json_string) return {};

        std::string result(json_string);
        cJSON_free(json_string);
        return result;
    }
}
