#include <gtest/gtest.h>

#include "speed/SpeedProber.h"

#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QMutexLocker>
#include <QTemporaryDir>
#include <QThread>
#include <atomic>
#include <chrono>
#include <future>

namespace {

// Records every callback of one prober
struct ProbeRecorder
{
    explicit ProbeRecorder(SpeedProber& prober)
    {
        completion = completed.get_future();
        prober.setOnStarted([this](const QString& label) {
            QMutexLocker locker(&mutex);
            started << label;
        });
        prober.setOnProgress([this](const QString&, double percent) {
            QMutexLocker locker(&mutex);
            progress << percent;
        });
        prober.setOnCompleted([this](const SpeedTestResult& result) {
            if (++completions == 1) {
                completed.set_value(result);
            }
        });
    }

    bool waitForResult(SpeedTestResult& result, int timeoutMs = 30000)
    {
        if (completion.wait_for(std::chrono::milliseconds(timeoutMs)) != std::future_status::ready) {
            return false;
        }
        result = completion.get();
        return true;
    }

    QStringList startedLabels()
    {
        QMutexLocker locker(&mutex);
        return started;
    }

    QList<double> progressValues()
    {
        QMutexLocker locker(&mutex);
        return progress;
    }

    QMutex mutex;
    QStringList started;
    QList<double> progress;
    std::atomic<int> completions{0};
    std::promise<SpeedTestResult> completed;
    std::future<SpeedTestResult> completion;
};

bool waitUntilIdle(const SpeedProber& prober, int timeoutMs = 5000)
{
    QElapsedTimer timer;
    timer.start();
    while (prober.isProbing() && timer.elapsed() < timeoutMs) {
        QThread::msleep(5);
    }
    return !prober.isProbing();
}

} // namespace

TEST(SpeedTestResultTest, SpeedsComeFromPhaseTimings)
{
    SpeedTestResult result = SpeedTestResult::fromTimings("/media/usb", "Stick", 100.0, 2.0, 4.0, 6.5);

    EXPECT_TRUE(result.success);
    EXPECT_DOUBLE_EQ(result.writeSpeedMbps, 50.0);
    EXPECT_DOUBLE_EQ(result.readSpeedMbps, 25.0);
    EXPECT_DOUBLE_EQ(result.averageSpeedMbps, 37.5);
    EXPECT_DOUBLE_EQ(result.testDurationSeconds, 6.5);
    EXPECT_TRUE(result.errorMessage.isEmpty());
}

TEST(SpeedTestResultTest, UnmeasurablePhaseYieldsZeroSpeed)
{
    SpeedTestResult result = SpeedTestResult::fromTimings("/media/usb", "Stick", 10.0, 0.0, 5.0, 5.0);

    EXPECT_DOUBLE_EQ(result.writeSpeedMbps, 0.0);
    EXPECT_DOUBLE_EQ(result.readSpeedMbps, 2.0);
    EXPECT_DOUBLE_EQ(result.averageSpeedMbps, 1.0);
}

TEST(SpeedTestResultTest, FailureKeepsElapsedTime)
{
    SpeedTestResult result = SpeedTestResult::failure("/media/usb", "Stick", 100.0, 1.25, "disk full");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorMessage, "disk full");
    EXPECT_DOUBLE_EQ(result.testDurationSeconds, 1.25);
    EXPECT_DOUBLE_EQ(result.averageSpeedMbps, 0.0);

    QJsonObject json = result.toJson();
    EXPECT_FALSE(json.value("success").toBool());
    EXPECT_EQ(json.value("error_message").toString(), "disk full");
    EXPECT_EQ(json.value("device_path").toString(), "/media/usb");
}

TEST(SpeedProberTest, PayloadIsTiledFromOneBlock)
{
    EXPECT_EQ(SpeedProber::payloadBytes(100.0), 100 * SpeedProber::BLOCK_SIZE);
    EXPECT_EQ(SpeedProber::payloadBytes(0.5), SpeedProber::BLOCK_SIZE / 2);
    EXPECT_EQ(SpeedProber::payloadBytes(0.0), 0);
    EXPECT_EQ(SpeedProber::payloadBytes(-3.0), 0);

    QByteArray block = SpeedProber::generateBlock();
    EXPECT_EQ(block.size(), SpeedProber::BLOCK_SIZE);
    EXPECT_NE(block, QByteArray(SpeedProber::BLOCK_SIZE, '\0'));

    EXPECT_EQ(SpeedProber::probeFilePath("/media/usb"), "/media/usb/probe.tmp");
}

TEST(SpeedProberTest, SuccessfulProbeReportsAndCleansUp)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    SpeedProber prober;
    ProbeRecorder recorder(prober);

    prober.startProbe(dir.path(), "Temp", 2.0);

    SpeedTestResult result;
    ASSERT_TRUE(recorder.waitForResult(result));
    ASSERT_TRUE(waitUntilIdle(prober));

    EXPECT_TRUE(result.success) << result.errorMessage.toStdString();
    EXPECT_EQ(result.deviceName, "Temp");
    EXPECT_EQ(result.devicePath, dir.path());
    EXPECT_DOUBLE_EQ(result.testFileSizeMb, 2.0);
    EXPECT_GE(result.writeSpeedMbps, 0.0);
    EXPECT_GE(result.readSpeedMbps, 0.0);
    EXPECT_DOUBLE_EQ(result.averageSpeedMbps, (result.writeSpeedMbps + result.readSpeedMbps) / 2.0);
    EXPECT_GT(result.testDurationSeconds, 0.0);

    EXPECT_EQ(recorder.startedLabels(), QStringList({"Temp"}));
    EXPECT_EQ(recorder.progressValues(), QList<double>({25.0, 75.0, 100.0}));
    EXPECT_EQ(recorder.completions.load(), 1);
    EXPECT_FALSE(QFile::exists(SpeedProber::probeFilePath(dir.path())));
}

TEST(SpeedProberTest, MissingDirectoryFailsWithMessage)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    QString missing = dir.filePath("not-mounted");

    SpeedProber prober;
    ProbeRecorder recorder(prober);

    prober.startProbe(missing, "Ghost", 1.0);

    SpeedTestResult result;
    ASSERT_TRUE(recorder.waitForResult(result));
    ASSERT_TRUE(waitUntilIdle(prober));

    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.errorMessage.isEmpty());
    EXPECT_EQ(recorder.completions.load(), 1);
    EXPECT_EQ(recorder.startedLabels().size(), 1);
    EXPECT_FALSE(recorder.progressValues().contains(100.0));
}

TEST(SpeedProberTest, UncreatableTestFileFailsAfterStart)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    // A directory in the way of the test file makes the write phase fail
    ASSERT_TRUE(QDir(dir.path()).mkdir("probe.tmp"));

    SpeedProber prober;
    ProbeRecorder recorder(prober);

    prober.startProbe(dir.path(), "Blocked", 1.0);

    SpeedTestResult result;
    ASSERT_TRUE(recorder.waitForResult(result));
    ASSERT_TRUE(waitUntilIdle(prober));

    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.errorMessage.contains("probe.tmp")) << result.errorMessage.toStdString();
    EXPECT_GT(result.testDurationSeconds, 0.0);
    EXPECT_DOUBLE_EQ(result.writeSpeedMbps, 0.0);
    EXPECT_DOUBLE_EQ(result.readSpeedMbps, 0.0);
    EXPECT_EQ(recorder.completions.load(), 1);
    EXPECT_EQ(recorder.progressValues(), QList<double>({25.0}));
    EXPECT_FALSE(prober.isProbing());
    EXPECT_TRUE(QFileInfo(SpeedProber::probeFilePath(dir.path())).isDir());
}

TEST(SpeedProberTest, NonStandardExceptionFromCallbackIsContained)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    SpeedProber prober;
    ProbeRecorder recorder(prober);
    prober.setOnStarted([](const QString&) { throw 42; });
    prober.setOnProgress([](const QString&, double) { throw QString("progress failure"); });

    prober.startProbe(dir.path(), "Noisy", 1.0);

    SpeedTestResult result;
    ASSERT_TRUE(recorder.waitForResult(result));
    ASSERT_TRUE(waitUntilIdle(prober));

    EXPECT_TRUE(result.success) << result.errorMessage.toStdString();
    EXPECT_EQ(recorder.completions.load(), 1);
}

TEST(SpeedProberTest, InvalidSizeFails)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    SpeedProber prober;
    ProbeRecorder recorder(prober);

    prober.startProbe(dir.path(), "Empty", 0.0);

    SpeedTestResult result;
    ASSERT_TRUE(recorder.waitForResult(result));
    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.errorMessage.contains("size"));
}

TEST(SpeedProberTest, SecondStartWhileProbingIsIgnored)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    SpeedProber prober;
    ProbeRecorder recorder(prober);

    std::promise<void> gate;
    std::shared_future<void> gateOpen = gate.get_future().share();
    std::atomic<int> starts{0};
    prober.setOnStarted([&starts, gateOpen](const QString&) {
        ++starts;
        gateOpen.wait();
    });

    prober.startProbe(dir.path(), "First", 1.0);

    QElapsedTimer timer;
    timer.start();
    while (starts.load() == 0 && timer.elapsed() < 5000) {
        QThread::msleep(5);
    }
    ASSERT_EQ(starts.load(), 1);
    EXPECT_TRUE(prober.isProbing());

    prober.startProbe(dir.path(), "Second", 1.0);
    EXPECT_TRUE(prober.isProbing());

    gate.set_value();

    SpeedTestResult result;
    ASSERT_TRUE(recorder.waitForResult(result));
    ASSERT_TRUE(waitUntilIdle(prober));

    EXPECT_EQ(starts.load(), 1);
    EXPECT_EQ(result.deviceName, "First");
    EXPECT_EQ(recorder.completions.load(), 1);
}

TEST(SpeedProberTest, StopRequestCancelsProbe)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    SpeedProber prober;
    ProbeRecorder recorder(prober);

    // Runs on the probe thread, so the stop request is seen before the read phase
    prober.setOnStarted([&prober](const QString&) { prober.stopProbe(); });

    prober.startProbe(dir.path(), "Cancelled", 1.0);

    SpeedTestResult result;
    ASSERT_TRUE(recorder.waitForResult(result));
    ASSERT_TRUE(waitUntilIdle(prober));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorMessage, "Speed test cancelled");
    EXPECT_FALSE(QFile::exists(SpeedProber::probeFilePath(dir.path())));
}

TEST(SpeedProberTest, ProberIsReusableAfterCompletion)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    SpeedProber prober;
    std::atomic<int> completions{0};
    prober.setOnCompleted([&completions](const SpeedTestResult&) { ++completions; });

    prober.startProbe(dir.path(), "Run 1", 1.0);
    ASSERT_TRUE(waitUntilIdle(prober, 30000));
    prober.startProbe(dir.path(), "Run 2", 1.0);
    ASSERT_TRUE(waitUntilIdle(prober, 30000));

    EXPECT_EQ(completions.load(), 2);
}
