// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef BLYNKCTL_BLYNKERR_HXX
#define BLYNKCTL_BLYNKERR_HXX

namespace blynkCtl
{
    // Result of every fallible operation. The failing layer logs the details,
    // callers only propagate the code.
    enum class BlynkErr {
        Ok,
        NotFound,         // unknown device name
        InvalidArg,       // action token is neither a known action nor a number
        InvalidState,     // device cannot take the requested value
        InvalidResponse,  // payload is not a JSON array starting with a number
        Transport,        // resolve / connect / socket I/O failure
        HttpStatus,       // non-2xx status from the service
        InvalidConfig     // configuration file or device table is invalid
    };

    [[nodiscard]] const char* errToName(BlynkErr err);

} // namespace blynkCtl

#endif //BLYNKCTL_BLYNKERR_HXX
