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

#ifndef DEBUGCONSOLE_H
#define DEBUGCONSOLE_H

#include <QObject>
#include <QMap>
#include <QMutex>
#include <QStringList>
#include <functional>

/**
 * @brief In-memory debug message buffer shared by the log handler and any viewer.
 *
 * Owned by the application and passed to whoever produces or displays debug output.
 * Sinks registered after messages were recorded receive the backlog first.
 */
class DebugConsole : public QObject
{
    Q_OBJECT
public:
    using Sink = std::function<void(const QString&)>;

    explicit DebugConsole(int maxMessages = 1000, QObject *parent = nullptr);

    // Formats as "[HH:mm:ss.zzz] LEVEL: message"
    void addMessage(const QString &message, const QString &level = "INFO");
    void addLine(const QString &line);

    QStringList messages() const;
    int maxMessages() const { return m_maxMessages; }
    void clear();

    void registerSink(const QString &name, Sink sink);
    void unregisterSink(const QString &name);
    int sinkCount() const;

signals:
    void messageAdded(const QString &line);
    void cleared();

private:
    int m_maxMessages;
    QStringList m_messages;
    QMap<QString, Sink> m_sinks;
    mutable QMutex m_mutex;
};

#endif // DEBUGCONSOLE_H
