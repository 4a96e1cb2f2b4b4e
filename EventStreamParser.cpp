// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "EventStreamParser.h"

QList<ChannelEvent> EventStreamParser::feed(const QByteArray& chunk) {
    QList<ChannelEvent> out;
    m_buffer += chunk;

    // Lines end in "\n", "\r" or "\r\n". A lone '\r' at the end of the buffer may be
    // followed by '\n' in the next chunk, so remember to swallow it.
    qsizetype start = 0;
    if (m_skipLeadingLf && !m_buffer.isEmpty()) {
        if (m_buffer.at(0) == '\n') start = 1;
        m_skipLeadingLf = false;
    }

    while (true) {
        qsizetype eol = -1;
        for (qsizetype i = start; i < m_buffer.size(); ++i) {
            const char c = m_buffer.at(i);
            if (c == '\n' || c == '\r') {
                eol = i;
                break;
            }
        }
        if (eol < 0) break;

        consumeLine(QByteArrayView(m_buffer.constData() + start, eol - start), out);

        qsizetype next = eol + 1;
        if (m_buffer.at(eol) == '\r') {
            if (next < m_buffer.size()) {
                if (m_buffer.at(next) == '\n') ++next;
            } else {
                m_skipLeadingLf = true;
            }
        }
        start = next;
    }

    m_buffer.remove(0, start);
    return out;
}

void EventStreamParser::reset() {
    m_buffer.clear();
    m_skipLeadingLf = false;
    m_eventName.clear();
    m_data.clear();
    m_hasData = false;
}

void EventStreamParser::consumeLine(QByteArrayView line, QList<ChannelEvent>& out) {
    if (line.isEmpty()) {
        dispatch(out);
        return;
    }

    // Comment / keep-alive
    if (line.startsWith(':')) return;

    QByteArrayView field = line;
    QByteArrayView value;

    const qsizetype colon = line.indexOf(':');
    if (colon >= 0) {
        field = line.first(colon);
        value = line.sliced(colon + 1);
        if (value.startsWith(' ')) value = value.sliced(1);
    }

    if (field == "event") {
        m_eventName = value.toByteArray();
    } else if (field == "data") {
        if (m_hasData) m_data += '\n';
        m_data += value.toByteArray();
        m_hasData = true;
    } else if (field == "id") {
        if (!value.contains('\0')) m_lastEventId = value.toByteArray();
    }
    // "retry" and unknown fields are ignored; reconnecting is the job's decision.
}

void EventStreamParser::dispatch(QList<ChannelEvent>& out) {
    if (!m_hasData) {
        m_eventName.clear();
        return;
    }

    ChannelEvent ev;
    if (!m_eventName.isEmpty()) ev.name = QString::fromUtf8(m_eventName);
    ev.data = m_data;
    ev.id = QString::fromUtf8(m_lastEventId);
    out.push_back(ev);

    m_eventName.clear();
    m_data.clear();
    m_hasData = false;
}
