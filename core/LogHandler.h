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

#ifndef LOGHANDLER_H
#define LOGHANDLER_H

#include <QObject>
#include <QMutex>
#include <QString>
#include <QtGlobal>
#include <QLoggingCategory>

class MonitorSettings;
class DebugConsole;

/**
 * @brief Routes Qt log output to stderr, the optional log file and the debug console.
 *
 * Qt keeps a single process-wide message handler, so only one LogHandler can be
 * installed at a time; installing a second one replaces the first. The previous
 * handler is restored on uninstall().
 */
class LogHandler : public QObject
{
    Q_OBJECT

public:
    explicit LogHandler(MonitorSettings *settings, DebugConsole *console = nullptr, QObject *parent = nullptr);
    ~LogHandler();

    void install();
    void uninstall();
    bool isInstalled() const { return m_installed; }

    // Enables debug output for every usbmon category regardless of settings
    void setVerbose(bool verbose);

    static QString formatMessage(QtMsgType type, const QMessageLogContext &context, const QString &msg);

private:
    static void messageHandler(QtMsgType type, const QMessageLogContext &context, const QString &msg);
    void handleMessage(QtMsgType type, const QMessageLogContext &context, const QString &msg);
    void writeToFile(const QString &line);

    MonitorSettings *m_settings;
    DebugConsole *m_console;
    QtMessageHandler m_previousHandler;
    bool m_installed;
    bool m_storeLog;
    QString m_logFilePath;
    QMutex m_fileMutex;
};

#endif // LOGHANDLER_H
