// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef BLYNKCTL_STRINGUTILS_HXX
#define BLYNKCTL_STRINGUTILS_HXX

namespace blynkCtl::utils {
    inline std::string stringFormat(const char* fmt, ...) {
        va_list args;
        va_start(args, fmt);

        va_list args_copy;
        va_copy(args_copy, args);
        const int len = vsnprintf(nullptr, 0, fmt, args_copy);
        va_end(args_copy);

        if (len < 0) {
            va_end(args);
            return {};
        }

        std::vector<char> buf(len + 1);
        vsnprintf(buf.data(), len + 1, fmt, args);
        va_end(args);

        return {buf.data(), static_cast<size_t>(len)};
    }

    /** Left-aligns text in a field of the given width. */
    inline std::string padRight(const std::string_view text, const size_t width) {
        std::string result(text);
        if (result.size() < width) {
            result.append(width - result.size(), ' ');
        }
        return result;
    }
}

#endif //BLYNKCTL_STRINGUTILS_HXX
