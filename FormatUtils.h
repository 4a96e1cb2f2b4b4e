// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef REMOTEFS_FORMATUTILS_H
#define REMOTEFS_FORMATUTILS_H

#include <QString>
#include <cstdint>
#include <optional>
#include <string>

namespace FormatUtils {
    /**
     * Formats a byte count using 1024-based units.
     *
     * Values are rounded to two decimals with trailing zeros removed,
     * e.g. 0 -> "0 Bytes", 2560 -> "2.5 KB", 1048576 -> "1 MB".
     *
     * @param bytes The size in bytes.
     * @return A QString such as "2.5 KB".
     */
    [[nodiscard]] QString formatSize(quint64 bytes);

    /**
     * Converts a timestamp in milliseconds since the Unix epoch to a formatted
     * date and time string in the local time zone ("YYYY-MM-DD HH:MM:SS").
     *
     * Unset timestamps are shown as "N/A". If the value does not fit into
     * std::time_t, "out-of-range" is returned; "invalid-time" or "format-error"
     * report conversion failures.
     *
     * @param msSinceEpoch Milliseconds since January 1, 1970 (UTC), or std::nullopt.
     * @return A std::string with the formatted local time or an error indicator.
     */
    [[nodiscard]] std::string formatTimestamp(std::optional<qint64> msSinceEpoch);
}

#endif //REMOTEFS_FORMATUTILS_H
