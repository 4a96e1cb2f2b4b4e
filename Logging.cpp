// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "Logging.h"

Q_LOGGING_CATEGORY(lcTransport, "remotefs.transport", QtInfoMsg)
Q_LOGGING_CATEGORY(lcListing, "remotefs.listing", QtInfoMsg)
Q_LOGGING_CATEGORY(lcJobs, "remotefs.jobs", QtInfoMsg)
Q_LOGGING_CATEGORY(lcOps, "remotefs.ops", QtInfoMsg)
