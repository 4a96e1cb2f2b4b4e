// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "FormatUtils.h"
#include <algorithm>
#include <array>
#include <cmath>
#include <ctime>
#include <limits>

namespace FormatUtils {

    QString formatSize(const quint64 bytes) {
        if (bytes == 0) {
            return QStringLiteral("0 Bytes");
        }

        static constexpr std::array<const char*, 5> kUnits{"Bytes", "KB", "MB", "GB", "TB"};

        const double value = static_cast<double>(bytes);
        const int exponent = std::min(static_cast<int>(std::floor(std::log(value) / std::log(1024.0))),
                                      static_cast<int>(kUnits.size()) - 1);
        const double scaled = value / std::pow(1024.0, exponent);

        // 'g' with enough precision drops trailing zeros after rounding to two decimals.
        const double rounded = std::round(scaled * 100.0) / 100.0;
        return QString::number(rounded, 'g', 15) + u' ' + QString::fromLatin1(kUnits[static_cast<size_t>(exponent)]);
    }

    std::string formatTimestamp(const std::optional<qint64> msSinceEpoch) {
        if (!msSinceEpoch) {
            return "N/A";
        }

        const std::int64_t secs = *msSinceEpoch / 1000;

        using time_limits = std::numeric_limits<std::time_t>;
        const auto min_tt = static_cast<std::int64_t>(time_limits::min());
        const auto max_tt = static_cast<std::int64_t>(time_limits::max());

        if (secs < min_tt || secs > max_tt) {
            return "out-of-range";
        }

        const std::time_t tt = static_cast<std::time_t>(secs);

        std::tm tm{};
        if (::localtime_r(&tt, &tm) == nullptr) {
            return "invalid-time";
        }

        std::array<char, 20> buf{}; // "YYYY-MM-DD HH:MM:SS" + '\0'
        if (std::strftime(buf.data(), buf.size(), "%Y-%m-%d %H:%M:%S", &tm) == 0) {
            return "format-error";
        }
        return std::string{buf.data()};
    }
}
