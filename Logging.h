// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef REMOTEFS_LOGGING_H
#define REMOTEFS_LOGGING_H

#include <QLoggingCategory>

// Enable with e.g. QT_LOGGING_RULES="remotefs.*.debug=true"
Q_DECLARE_LOGGING_CATEGORY(lcTransport)
Q_DECLARE_LOGGING_CATEGORY(lcListing)
Q_DECLARE_LOGGING_CATEGORY(lcJobs)
Q_DECLARE_LOGGING_CATEGORY(lcOps)

#endif //REMOTEFS_LOGGING_H
