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

#include "LogHandler.h"
#include "MonitorSettings.h"
#include "DebugConsole.h"

#include <QAtomicPointer>
#include <QDateTime>
#include <QFile>
#include <QMutexLocker>
#include <QTextStream>
#include <QThread>
#include <iostream>

namespace {
QAtomicPointer<LogHandler> s_activeHandler;
}

LogHandler::LogHandler(MonitorSettings *settings, DebugConsole *console, QObject *parent)
    : QObject(parent)
    , m_settings(settings)
    , m_console(console)
    , m_previousHandler(nullptr)
    , m_installed(false)
    , m_storeLog(false)
{
}

LogHandler::~LogHandler()
{
    uninstall();
}

void LogHandler::install()
{
    if (m_settings) {
        QLoggingCategory::setFilterRules(m_settings->logFilterRules());
        QMutexLocker locker(&m_fileMutex);
        m_storeLog = m_settings->storeLog() && !m_settings->logFilePath().isEmpty();
        m_logFilePath = m_settings->logFilePath();
    }

    if (m_installed) {
        return;
    }

    s_activeHandler.storeRelease(this);
    m_previousHandler = qInstallMessageHandler(messageHandler);
    m_installed = true;

    if (m_storeLog) {
        qInfo() << "Storing log to" << m_logFilePath;
    }
}

void LogHandler::uninstall()
{
    if (!m_installed) {
        return;
    }

    // Only restore when nobody replaced us in the meantime
    if (s_activeHandler.testAndSetOrdered(this, nullptr)) {
        qInstallMessageHandler(m_previousHandler);
    }
    m_previousHandler = nullptr;
    m_installed = false;
}

void LogHandler::setVerbose(bool verbose)
{
    if (verbose) {
        QLoggingCategory::setFilterRules("usbmon.*.debug=true");
    } else if (m_settings) {
        QLoggingCategory::setFilterRules(m_settings->logFilterRules());
    }
}

QString LogHandler::formatMessage(QtMsgType type, const QMessageLogContext &context, const QString &msg)
{
    const char *categoryName = context.category;
    QString category = categoryName ? QString(categoryName) : "usbmon.default.msg";
    QString timestamp = QDateTime::currentDateTime().toString("yyyy-MM-dd HH:mm:ss.zzz");
    QThread *currentThread = QThread::currentThread();
    QString threadName = currentThread->objectName().isEmpty()
        ? QString::number(reinterpret_cast<quintptr>(QThread::currentThreadId()))
        : currentThread->objectName();
    QString txt = QString("[%1][%2] ").arg(timestamp, threadName);

    switch (type) {
        case QtDebugMsg:
            txt += QString("[D][%1]: %2").arg(category, msg);
            break;
        case QtWarningMsg:
            txt += QString("[W][%1]: %2").arg(category, msg);
            break;
        case QtCriticalMsg:
            txt += QString("[C][%1]: %2").arg(category, msg);
            break;
        case QtFatalMsg:
            txt += QString("[F][%1]: %2").arg(category, msg);
            break;
        case QtInfoMsg:
            txt += QString("[I][%1]: %2").arg(category, msg);
            break;
    }
    return txt;
}

void LogHandler::messageHandler(QtMsgType type, const QMessageLogContext &context, const QString &msg)
{
    LogHandler *handler = s_activeHandler.loadAcquire();
    if (handler) {
        handler->handleMessage(type, context, msg);
    } else {
        std::cerr << formatMessage(type, context, msg).toStdString() << std::endl;
    }
}

void LogHandler::handleMessage(QtMsgType type, const QMessageLogContext &context, const QString &msg)
{
    QString txt = formatMessage(type, context, msg);

    std::cerr << txt.toStdString() << std::endl;

    writeToFile(QString("%1 (%2:%3, %4)")
                    .arg(txt, QString(context.file))
                    .arg(context.line)
                    .arg(QString(context.function)));

    if (m_console) {
        m_console->addLine(txt);
    }
}

void LogHandler::writeToFile(const QString &line)
{
    // install() may change the store settings from another thread
    QMutexLocker locker(&m_fileMutex);
    if (!m_storeLog) {
        return;
    }

    QFile outFile(m_logFilePath);
    if (!outFile.open(QIODevice::WriteOnly | QIODevice::Append)) {
        // Logging through Qt here would recurse into this handler
        std::cerr << "Cannot open log file " << m_logFilePath.toStdString() << ": "
                  << outFile.errorString().toStdString() << std::endl;
        return;
    }

    QTextStream ts(&outFile);
    ts << line << "\n";
    ts.flush();
}
