// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef REMOTEFS_EVENTSTREAMPARSER_H
#define REMOTEFS_EVENTSTREAMPARSER_H

#include <QByteArray>
#include <QByteArrayView>
#include <QList>
#include "Transport.h"

/**
 * Incremental text/event-stream decoder.
 *
 * Bytes arrive in arbitrary chunks; complete lines are consumed as they show up
 * and an event is dispatched on every blank line. Partial lines stay buffered
 * until the next feed().
 */
class EventStreamParser final {
public:
    QList<ChannelEvent> feed(const QByteArray& chunk);

    // Drops buffered bytes and any half-built event.
    void reset();

private:
    void consumeLine(QByteArrayView line, QList<ChannelEvent>& out);
    void dispatch(QList<ChannelEvent>& out);

    QByteArray m_buffer;
    bool m_skipLeadingLf = false; // previous chunk ended on '\r'

    QByteArray m_eventName;
    QByteArray m_data;
    bool m_hasData = false;
    QByteArray m_lastEventId;
};

#endif //REMOTEFS_EVENTSTREAMPARSER_H
