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

#ifndef POLLINGWORKER_H
#define POLLINGWORKER_H

#include <QThread>
#include <QMutex>
#include <QWaitCondition>
#include <QLoggingCategory>
#include <functional>

Q_DECLARE_LOGGING_CATEGORY(log_monitor_poller)

/**
 * @brief Runs a tick function on a dedicated thread at a fixed interval.
 *
 * The first tick runs immediately after start(). Exceptions thrown by a tick are
 * logged and the loop continues. stop() is cooperative: a tick in progress runs
 * to completion, and the caller waits at most the given timeout for the thread
 * to leave its loop.
 */
class PollingWorker : public QThread
{
    Q_OBJECT

public:
    using Tick = std::function<void()>;

    static constexpr int DEFAULT_STOP_TIMEOUT_MS = 2000;

    PollingWorker(const QString& name, Tick tick, int intervalMs, QObject* parent = nullptr);
    ~PollingWorker();

    // No-op when already polling
    void startPolling();

    // Returns false when the thread did not exit within timeoutMs
    bool stopPolling(int timeoutMs = DEFAULT_STOP_TIMEOUT_MS);

    bool isPolling() const;

    int intervalMs() const;
    void setIntervalMs(int intervalMs);

    int tickCount() const;

protected:
    void run() override;

private:
    Tick m_tick;
    mutable QMutex m_mutex;
    QWaitCondition m_wakeUp;
    bool m_running;
    int m_intervalMs;
    int m_tickCount;
};

#endif // POLLINGWORKER_H
