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

#include "SpeedProber.h"

#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QMutexLocker>
#include <QRandomGenerator>
#include <QThread>
#include <exception>

#ifdef Q_OS_WIN
#include <io.h>
#else
#include <unistd.h>
#endif

Q_LOGGING_CATEGORY(log_speed_prober, "usbmon.speed.prober")

namespace {

class ProbeThread : public QThread
{
public:
    explicit ProbeThread(std::function<void()> body)
        : m_body(std::move(body))
    {
        setObjectName("SpeedProber");
    }

protected:
    void run() override { m_body(); }

private:
    std::function<void()> m_body;
};

// Pushes the written data to the device so the timing excludes the page cache
bool syncToDevice(QFile& file)
{
#ifdef Q_OS_WIN
    return _commit(file.handle()) == 0;
#else
    return ::fsync(file.handle()) == 0;
#endif
}

double seconds(const QElapsedTimer& timer)
{
    return timer.nsecsElapsed() / 1e9;
}

} // namespace

SpeedProber::SpeedProber(QObject* parent)
    : QObject(parent)
    , m_probing(0)
    , m_stopRequested(0)
{
    qRegisterMetaType<SpeedTestResult>("SpeedTestResult");
}

SpeedProber::~SpeedProber()
{
    m_stopRequested.storeRelease(1);
    if (m_thread) {
        // The probe thread calls back into this object
        m_thread->wait();
    }
}

void SpeedProber::setOnStarted(StartedCallback callback)
{
    QMutexLocker locker(&m_callbackMutex);
    m_onStarted = std::move(callback);
}

void SpeedProber::setOnProgress(ProgressCallback callback)
{
    QMutexLocker locker(&m_callbackMutex);
    m_onProgress = std::move(callback);
}

void SpeedProber::setOnCompleted(CompletedCallback callback)
{
    QMutexLocker locker(&m_callbackMutex);
    m_onCompleted = std::move(callback);
}

void SpeedProber::startProbe(const QString& path, const QString& label, double sizeMb)
{
    if (!m_probing.testAndSetOrdered(0, 1)) {
        qCWarning(log_speed_prober) << "A speed test is already running, ignoring request for" << label;
        return;
    }

    // The previous thread has already delivered its result, it only needs joining
    if (m_thread) {
        m_thread->wait();
        m_thread.reset();
    }

    m_stopRequested.storeRelease(0);

    qCInfo(log_speed_prober) << "Starting speed test of" << label << "at" << path << "with" << sizeMb << "MB";

    m_thread = std::make_unique<ProbeThread>([this, path, label, sizeMb]() {
        QElapsedTimer totalTimer;
        totalTimer.start();

        reportStarted(label);

        SpeedTestResult result;
        try {
            result = runProbe(path, label, sizeMb, totalTimer);
        } catch (const std::exception& e) {
            result = SpeedTestResult::failure(path, label, sizeMb, seconds(totalTimer),
                                              QString("Speed test failed: %1").arg(e.what()));
        } catch (...) {
            result = SpeedTestResult::failure(path, label, sizeMb, seconds(totalTimer),
                                              QString("Speed test failed: unknown error"));
        }

        if (result.success) {
            reportProgress(label, 100.0);
        } else {
            qCWarning(log_speed_prober) << "Speed test of" << label << "failed:" << result.errorMessage;
        }
        reportCompleted(result);

        m_probing.storeRelease(0);
    });
    m_thread->start();
}

void SpeedProber::stopProbe()
{
    if (!isProbing()) {
        return;
    }

    qCInfo(log_speed_prober) << "Stopping speed test";
    m_stopRequested.storeRelease(1);

    if (m_thread && QThread::currentThread() != m_thread.get()) {
        if (!m_thread->wait(STOP_TIMEOUT_MS)) {
            qCWarning(log_speed_prober) << "Speed test did not finish within" << STOP_TIMEOUT_MS << "ms";
        }
    }
}

bool SpeedProber::isProbing() const
{
    return m_probing.loadAcquire() != 0;
}

bool SpeedProber::stopRequested() const
{
    return m_stopRequested.loadAcquire() != 0;
}

QString SpeedProber::probeFilePath(const QString& path)
{
    return QDir(path).filePath("probe.tmp");
}

qint64 SpeedProber::payloadBytes(double sizeMb)
{
    if (sizeMb <= 0) {
        return 0;
    }
    return static_cast<qint64>(sizeMb * BLOCK_SIZE);
}

QByteArray SpeedProber::generateBlock()
{
    QByteArray block(BLOCK_SIZE, Qt::Uninitialized);
    QRandomGenerator::global()->fillRange(reinterpret_cast<quint32*>(block.data()),
                                          BLOCK_SIZE / sizeof(quint32));
    return block;
}

SpeedTestResult SpeedProber::runProbe(const QString& path, const QString& label, double sizeMb,
                                      const QElapsedTimer& totalTimer)
{
    const QString filePath = probeFilePath(path);
    const qint64 totalBytes = payloadBytes(sizeMb);

    auto failure = [&](const QString& message) {
        return SpeedTestResult::failure(path, label, sizeMb, seconds(totalTimer), message);
    };
    auto discardProbeFile = [&]() {
        if (QFile::exists(filePath) && !QFile::remove(filePath)) {
            qCWarning(log_speed_prober) << "Could not remove test file" << filePath;
        }
    };

    if (totalBytes <= 0) {
        return failure(QString("Invalid test size: %1 MB").arg(sizeMb));
    }
    if (!QFileInfo(path).isDir()) {
        return failure(QString("Not a directory: %1").arg(path));
    }

    const QByteArray block = generateBlock();

    // Write phase
    reportProgress(label, 25.0);
    QElapsedTimer phaseTimer;
    phaseTimer.start();

    QFile writeFile(filePath);
    if (!writeFile.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return failure(QString("Cannot create test file %1: %2").arg(filePath, writeFile.errorString()));
    }

    qint64 remaining = totalBytes;
    while (remaining > 0) {
        const qint64 chunk = qMin(remaining, BLOCK_SIZE);
        if (writeFile.write(block.constData(), chunk) != chunk) {
            QString error = writeFile.errorString();
            writeFile.close();
            discardProbeFile();
            return failure(QString("Write to %1 failed: %2").arg(filePath, error));
        }
        remaining -= chunk;
    }

    if (!writeFile.flush() || !syncToDevice(writeFile)) {
        QString error = writeFile.error() != QFileDevice::NoError ? writeFile.errorString() : qt_error_string();
        writeFile.close();
        discardProbeFile();
        return failure(QString("Sync of %1 failed: %2").arg(filePath, error));
    }
    writeFile.close();
    const double writeSeconds = seconds(phaseTimer);
    qCDebug(log_speed_prober) << "Wrote" << totalBytes << "bytes in" << writeSeconds << "s";

    if (stopRequested()) {
        discardProbeFile();
        return failure("Speed test cancelled");
    }

    // Read phase
    reportProgress(label, 75.0);
    phaseTimer.restart();

    QFile readFile(filePath);
    if (!readFile.open(QIODevice::ReadOnly)) {
        QString error = readFile.errorString();
        discardProbeFile();
        return failure(QString("Cannot open test file %1 for reading: %2").arg(filePath, error));
    }

    QByteArray buffer(BLOCK_SIZE, Qt::Uninitialized);
    qint64 readBytes = 0;
    while (true) {
        const qint64 count = readFile.read(buffer.data(), BLOCK_SIZE);
        if (count < 0) {
            QString error = readFile.errorString();
            readFile.close();
            discardProbeFile();
            return failure(QString("Read from %1 failed: %2").arg(filePath, error));
        }
        if (count == 0) {
            break;
        }
        readBytes += count;
    }
    readFile.close();
    const double readSeconds = seconds(phaseTimer);
    qCDebug(log_speed_prober) << "Read" << readBytes << "bytes in" << readSeconds << "s";

    discardProbeFile();

    if (readBytes != totalBytes) {
        return failure(QString("Short read from %1: %2 of %3 bytes").arg(filePath).arg(readBytes).arg(totalBytes));
    }

    if (stopRequested()) {
        return failure("Speed test cancelled");
    }

    SpeedTestResult result = SpeedTestResult::fromTimings(path, label, sizeMb, writeSeconds, readSeconds,
                                                          seconds(totalTimer));
    qCInfo(log_speed_prober) << "Speed test of" << label << "finished: write" << result.writeSpeedMbps
                             << "MB/s, read" << result.readSpeedMbps << "MB/s";
    return result;
}

void SpeedProber::reportStarted(const QString& label)
{
    StartedCallback callback;
    {
        QMutexLocker locker(&m_callbackMutex);
        callback = m_onStarted;
    }

    if (callback) {
        try {
            callback(label);
        } catch (const std::exception& e) {
            qCWarning(log_speed_prober) << "Exception in started callback:" << e.what();
        } catch (...) {
            qCWarning(log_speed_prober) << "Unknown exception in started callback";
        }
    }
    emit probeStarted(label);
}

void SpeedProber::reportProgress(const QString& label, double percent)
{
    ProgressCallback callback;
    {
        QMutexLocker locker(&m_callbackMutex);
        callback = m_onProgress;
    }

    if (callback) {
        try {
            callback(label, percent);
        } catch (const std::exception& e) {
            qCWarning(log_speed_prober) << "Exception in progress callback:" << e.what();
        } catch (...) {
            qCWarning(log_speed_prober) << "Unknown exception in progress callback";
        }
    }
    emit probeProgress(label, percent);
}

void SpeedProber::reportCompleted(const SpeedTestResult& result)
{
    CompletedCallback callback;
    {
        QMutexLocker locker(&m_callbackMutex);
        callback = m_onCompleted;
    }

    if (callback) {
        try {
            callback(result);
        } catch (const std::exception& e) {
            qCWarning(log_speed_prober) << "Exception in completed callback:" << e.what();
        } catch (...) {
            qCWarning(log_speed_prober) << "Unknown exception in completed callback";
        }
    }
    emit probeCompleted(result);
}
