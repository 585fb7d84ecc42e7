/*
* ========================================================================== *
*                                                                            *
*    This file is part of the USB Monitor QT version                         *
*                                                                            *
*    Copyright (C) 2024   USB Monitor contributors                           *
*                                                                            *
*    This program is free software: you can redistribute it and/or modify    *
*    it under the terms of the GNU General Public License as published by    *
*    the Free Software Foundation version 3.                                 *
*                                                                            *
*    This program is distributed in the hope that it will be useful, but     *
*    WITHOUT ANY WARRANTY; without even the implied warranty of              *
*    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU        *
*    General Public License for more details.                                *
*                                                                            *
*    You should have received a copy of the GNU General Public License       *
*    along with this program. If not, see <http://www.gnu.org/licenses/>.    *
*                                                                            *
* ========================================================================== *
*/

#include "DebugConsole.h"

#include <QDateTime>
#include <QMutexLocker>

DebugConsole::DebugConsole(int maxMessages, QObject *parent)
    : QObject(parent)
    , m_maxMessages(maxMessages > 0 ? maxMessages : 1000)
{
}

void DebugConsole::addMessage(const QString &message, const QString &level)
{
    QString timestamp = QDateTime::currentDateTime().toString("HH:mm:ss.zzz");
    addLine(QString("[%1] %2: %3").arg(timestamp, level, message));
}

void DebugConsole::addLine(const QString &line)
{
    QList<Sink> sinks;
    {
        QMutexLocker locker(&m_mutex);
        m_messages.append(line);
        while (m_messages.size() > m_maxMessages) {
            m_messages.removeFirst();
        }
        sinks = m_sinks.values();
    }

    for (const Sink &sink : sinks) {
        sink(line);
    }
    emit messageAdded(line);
}

QStringList DebugConsole::messages() const
{
    QMutexLocker locker(&m_mutex);
    return m_messages;
}

void DebugConsole::clear()
{
    {
        QMutexLocker locker(&m_mutex);
        m_messages.clear();
    }
    emit cleared();
}

void DebugConsole::registerSink(const QString &name, Sink sink)
{
    if (!sink) {
        return;
    }

    QStringList backlog;
    {
        QMutexLocker locker(&m_mutex);
        if (m_sinks.contains(name)) {
            m_sinks.insert(name, sink);
            return;
        }
        m_sinks.insert(name, sink);
        backlog = m_messages;
    }

    for (const QString &line : backlog) {
        sink(line);
    }
}

void DebugConsole::unregisterSink(const QString &name)
{
    QMutexLocker locker(&m_mutex);
    m_sinks.remove(name);
}

int DebugConsole::sinkCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_sinks.size();
}
