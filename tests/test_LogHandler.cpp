#include <gtest/gtest.h>

#include "core/LogHandler.h"
#include "core/DebugConsole.h"
#include "core/MonitorSettings.h"

#include <QFile>
#include <QTemporaryDir>
#include <atomic>
#include <thread>

Q_LOGGING_CATEGORY(log_core_logtest, "usbmon.core.logtest")

TEST(LogHandlerTest, FormatCarriesLevelAndCategory)
{
    QMessageLogContext context("DeviceMonitor.cpp", 42, "refreshDevices", "usbmon.device.monitor");

    QString line = LogHandler::formatMessage(QtWarningMsg, context, "source failed");

    EXPECT_TRUE(line.startsWith("["));
    EXPECT_TRUE(line.endsWith("[W][usbmon.device.monitor]: source failed")) << line.toStdString();
}

TEST(LogHandlerTest, MissingCategoryUsesDefault)
{
    QMessageLogContext context(nullptr, 0, nullptr, nullptr);

    QString line = LogHandler::formatMessage(QtInfoMsg, context, "hello");

    EXPECT_TRUE(line.endsWith("[I][usbmon.default.msg]: hello"));
}

TEST(LogHandlerTest, InstalledHandlerFeedsConsoleAndFile)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    QString logPath = dir.filePath("usbmon.log");

    MonitorSettings settings(dir.filePath("usbmon.ini"));
    settings.setLogStoreSettings(true, logPath);
    DebugConsole console;

    {
        LogHandler handler(&settings, &console);
        handler.install();
        EXPECT_TRUE(handler.isInstalled());

        qCWarning(log_core_logtest) << "disk almost full";

        handler.uninstall();
        EXPECT_FALSE(handler.isInstalled());
    }

    QStringList lines = console.messages();
    ASSERT_FALSE(lines.isEmpty());
    EXPECT_TRUE(lines.last().contains("[W][usbmon.core.logtest]: disk almost full")) << lines.last().toStdString();

    QFile logFile(logPath);
    ASSERT_TRUE(logFile.open(QIODevice::ReadOnly));
    EXPECT_TRUE(QString::fromUtf8(logFile.readAll()).contains("disk almost full"));

    // Uninstalled: nothing reaches the console any more
    int before = console.messages().size();
    qCWarning(log_core_logtest) << "after uninstall";
    EXPECT_EQ(console.messages().size(), before);
}

TEST(LogHandlerTest, VerboseEnablesDebugCategories)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    MonitorSettings settings(dir.filePath("usbmon.ini"));
    DebugConsole console;
    LogHandler handler(&settings, &console);
    handler.install();

    qCDebug(log_core_logtest) << "hidden";
    handler.setVerbose(true);
    qCDebug(log_core_logtest) << "visible";
    handler.setVerbose(false);
    handler.uninstall();

    QString all = console.messages().join("\n");
    EXPECT_FALSE(all.contains("hidden"));
    EXPECT_TRUE(all.contains("[D][usbmon.core.logtest]: visible"));
}

TEST(LogHandlerTest, ReinstallWhileLoggingSwitchesFileStore)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    QString firstLog = dir.filePath("first.log");
    QString secondLog = dir.filePath("second.log");

    MonitorSettings settings(dir.filePath("usbmon.ini"));
    settings.setLogStoreSettings(true, firstLog);
    DebugConsole console;
    LogHandler handler(&settings, &console);
    handler.install();

    std::atomic<bool> running{true};
    std::thread writer([&running]() {
        while (running.load()) {
            qCWarning(log_core_logtest) << "background line";
        }
    });

    for (int i = 0; i < 50; ++i) {
        settings.setLogStoreSettings(i % 2 == 0, i % 3 == 0 ? firstLog : secondLog);
        handler.install();
    }
    settings.setLogStoreSettings(true, secondLog);
    handler.install();
    qCWarning(log_core_logtest) << "final line";

    running.store(false);
    writer.join();
    handler.uninstall();

    QFile logFile(secondLog);
    ASSERT_TRUE(logFile.open(QIODevice::ReadOnly));
    EXPECT_TRUE(QString::fromUtf8(logFile.readAll()).contains("final line"));
}
