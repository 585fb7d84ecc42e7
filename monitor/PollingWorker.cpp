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

#include "PollingWorker.h"

#include <QDeadlineTimer>
#include <QMutexLocker>
#include <exception>

Q_LOGGING_CATEGORY(log_monitor_poller, "usbmon.monitor.poller")

PollingWorker::PollingWorker(const QString& name, Tick tick, int intervalMs, QObject* parent)
    : QThread(parent)
    , m_tick(std::move(tick))
    , m_running(false)
    , m_intervalMs(intervalMs > 0 ? intervalMs : 1000)
    , m_tickCount(0)
{
    setObjectName(name);
}

PollingWorker::~PollingWorker()
{
    if (!stopPolling()) {
        // The thread object must outlive the thread; wait for the tick to finish
        qCWarning(log_monitor_poller) << objectName() << "still busy at destruction, waiting for the current tick";
        wait();
    }
}

void PollingWorker::startPolling()
{
    if (isPolling()) {
        qCDebug(log_monitor_poller) << objectName() << "already polling";
        return;
    }

    // A previous run that outlived its stop timeout must finish first
    if (isRunning() && currentThread() != this) {
        wait();
    }

    {
        QMutexLocker locker(&m_mutex);
        if (m_running) {
            return;
        }
        m_running = true;
    }

    qCDebug(log_monitor_poller) << objectName() << "starting with interval" << intervalMs() << "ms";
    start();
}

bool PollingWorker::stopPolling(int timeoutMs)
{
    {
        QMutexLocker locker(&m_mutex);
        m_running = false;
        m_wakeUp.wakeAll();
    }

    if (!isRunning() || currentThread() == this) {
        return true;
    }

    if (!wait(QDeadlineTimer(timeoutMs))) {
        qCWarning(log_monitor_poller) << objectName() << "did not stop within" << timeoutMs << "ms";
        return false;
    }

    qCDebug(log_monitor_poller) << objectName() << "stopped after" << tickCount() << "ticks";
    return true;
}

bool PollingWorker::isPolling() const
{
    QMutexLocker locker(&m_mutex);
    return m_running;
}

int PollingWorker::intervalMs() const
{
    QMutexLocker locker(&m_mutex);
    return m_intervalMs;
}

void PollingWorker::setIntervalMs(int intervalMs)
{
    if (intervalMs <= 0) {
        qCWarning(log_monitor_poller) << "Invalid interval:" << intervalMs << "ms, ignoring";
        return;
    }

    QMutexLocker locker(&m_mutex);
    m_intervalMs = intervalMs;
}

int PollingWorker::tickCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_tickCount;
}

void PollingWorker::run()
{
    qCDebug(log_monitor_poller) << objectName() << "thread started";

    while (isPolling()) {
        try {
            m_tick();
        } catch (const std::exception& e) {
            qCWarning(log_monitor_poller) << objectName() << "tick failed:" << e.what();
        } catch (...) {
            qCWarning(log_monitor_poller) << objectName() << "tick failed with an unknown exception";
        }

        QMutexLocker locker(&m_mutex);
        ++m_tickCount;
        if (!m_running) {
            break;
        }
        m_wakeUp.wait(&m_mutex, QDeadlineTimer(m_intervalMs));
    }

    qCDebug(log_monitor_poller) << objectName() << "thread finished";
}
