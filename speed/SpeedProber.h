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

#ifndef SPEEDPROBER_H
#define SPEEDPROBER_H

#include <QObject>
#include <QAtomicInt>
#include <QByteArray>
#include <QMutex>
#include <QLoggingCategory>
#include <functional>
#include <memory>

#include "SpeedTestResult.h"

Q_DECLARE_LOGGING_CATEGORY(log_speed_prober)

class QThread;
class QElapsedTimer;

/**
 * @brief Measures write and read throughput of a storage path.
 *
 * One probe runs at a time on its own thread. A probe writes the payload to
 * "probe.tmp" inside the target directory, syncs it to the device, reads it back
 * and removes it. Every probe ends with exactly one completion callback, including
 * failed and cancelled probes.
 *
 * Callbacks and signals fire on the probe thread.
 */
class SpeedProber : public QObject
{
    Q_OBJECT

public:
    using StartedCallback = std::function<void(const QString& label)>;
    using ProgressCallback = std::function<void(const QString& label, double percent)>;
    using CompletedCallback = std::function<void(const SpeedTestResult& result)>;

    static constexpr qint64 BLOCK_SIZE = 1024 * 1024;
    static constexpr int STOP_TIMEOUT_MS = 2000;

    explicit SpeedProber(QObject* parent = nullptr);
    ~SpeedProber();

    void setOnStarted(StartedCallback callback);
    void setOnProgress(ProgressCallback callback);
    void setOnCompleted(CompletedCallback callback);

    // Ignored with a warning while a probe is running
    void startProbe(const QString& path, const QString& label, double sizeMb);

    // Cooperative; checked between the write and read phases
    void stopProbe();
    bool isProbing() const;

    static QString probeFilePath(const QString& path);
    static qint64 payloadBytes(double sizeMb);
    static QByteArray generateBlock();

signals:
    void probeStarted(const QString& label);
    void probeProgress(const QString& label, double percent);
    void probeCompleted(const SpeedTestResult& result);

private:
    SpeedTestResult runProbe(const QString& path, const QString& label, double sizeMb,
                             const QElapsedTimer& totalTimer);
    void reportStarted(const QString& label);
    void reportProgress(const QString& label, double percent);
    void reportCompleted(const SpeedTestResult& result);
    bool stopRequested() const;

    std::unique_ptr<QThread> m_thread;
    QAtomicInt m_probing;
    QAtomicInt m_stopRequested;

    mutable QMutex m_callbackMutex;
    StartedCallback m_onStarted;
    ProgressCallback m_onProgress;
    CompletedCallback m_onCompleted;
};

#endif // SPEEDPROBER_H
