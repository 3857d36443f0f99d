// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef BLYNKCTL_FILEHANDLE_HXX
#define BLYNKCTL_FILEHANDLE_HXX
#include <cstdio>
#include <string>

namespace blynkCtl::utils {
    // RAII wrapper for FILE handle
    class FileHandle {
    public:
        explicit FileHandle(const char* path, const char* mode) {
            m_file = fopen(path, mode);
        }

        ~FileHandle() {
            if (m_file) {
                fclose(m_file);
            }
        }

        [[nodiscard]] FILE* get() const { return m_file; }
        explicit operator bool() const { return m_file != nullptr; }

        /** Reads the remaining contents. Returns false on a read error. */
        bool readAll(std::string& out) const {
            out.clear();
            if (!m_file) return false;
            char buffer[4096];
            size_t n = 0;
            while ((n = fread(buffer, 1, sizeof(buffer), m_file)) > 0) {
                out.append(buffer, n);
            }
            return ferror(m_file) == 0;
        }

        FileHandle(const FileHandle&) = delete;
        FileHandle& operator=(const FileHandle&) = delete;
    private:
        FILE* m_file{nullptr};
    };
}
#endif //BLYNKCTL_FILEHANDLE_HXX
