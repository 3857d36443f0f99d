// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "cli/Action.hxx"

namespace blynkCtl
{
    std::optional<Action> parseAction(const std::string_view token) {
        if (token.starts_with('f')) return Action{ActionKind::Flip};
        if (token.starts_with("of")) return Action{ActionKind::Off};
        if (token == "on") return Action{ActionKind::On};
        if (token.starts_with('j')) return Action{ActionKind::Just};
        if (token.starts_with('p')) return Action{ActionKind::Print};
        if (token.starts_with('s')) return Action{ActionKind::Status};

        if (const auto value = parsePinValue(token)) {
            return Action{ActionKind::SetValue, *value};
        }
        return std::nullopt;
    }

    const char* actionName(const ActionKind kind) {
        switch (kind) {
            case ActionKind::Flip:     return "flip";
            case ActionKind::Off:      return "off";
            case ActionKind::On:       return "on";
            case ActionKind::Just:     return "just";
            case ActionKind::Print:    return "print";
            case ActionKind::Status:   return "status";
            case ActionKind::SetValue: return "set";
        }
        return "unknown";
    }
}
