// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "system/BlynkErr.hxx"

namespace blynkCtl
{
    const char* errToName(const BlynkErr err) {
        switch (err) {
            case BlynkErr::Ok:              return "OK";
            case BlynkErr::NotFound:        return "ERR_NOT_FOUND";
            case BlynkErr::InvalidArg:      return "ERR_INVALID_ARG";
            case BlynkErr::InvalidState:    return "ERR_INVALID_STATE";
            case BlynkErr::InvalidResponse: return "ERR_INVALID_RESPONSE";
            case BlynkErr::Transport:       return "ERR_TRANSPORT";
            case BlynkErr::HttpStatus:      return "ERR_HTTP_STATUS";
            case BlynkErr::InvalidConfig:   return "ERR_INVALID_CONFIG";
        }
        return "ERR_UNKNOWN";
    }
}
