// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef BLYNKCTL_ACTION_HXX
#define BLYNKCTL_ACTION_HXX

#include "device/PinValue.hxx"

namespace blynkCtl
{
    enum class ActionKind {
        Flip,       // f(lip)
        Off,        // of(f)
        On,         // on
        Just,       // j(ust)
        Print,      // p(rint)
        Status,     // s(tatus)
        SetValue    // any int/float literal
    };

    struct Action {
        ActionKind kind{ActionKind::SetValue};
        PinValue value{0};  // SetValue only

        /** print/status: excluded devices stay selectable. */
        [[nodiscard]] bool isRead() const {
            return kind == ActionKind::Print || kind == ActionKind::Status;
        }
    };

    /**
     * @brief Parse the trailing CLI token.
     * Prefixes are tried in a fixed order: f, of, exact "on", j, p, s;
     * anything else must be a number.
     * @return nullopt when the token is neither an action nor a number
     */
    [[nodiscard]] std::optional<Action> parseAction(std::string_view token);

    [[nodiscard]] const char* actionName(ActionKind kind);

} // namespace blynkCtl

#endif //BLYNKCTL_ACTION_HXX
