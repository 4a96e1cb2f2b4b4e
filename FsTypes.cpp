// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "FsTypes.h"

QString jobKindName(JobKind kind) {
    switch (kind) {
        case JobKind::Upload: return QStringLiteral("upload");
        case JobKind::Archive: return QStringLiteral("archive");
        case JobKind::Extract: return QStringLiteral("extract");
        case JobKind::UrlUpload: return QStringLiteral("upload-url");
    }
    return QStringLiteral("unknown");
}
