#include "SpeedTestResult.h"

SpeedTestResult::SpeedTestResult()
    : testFileSizeMb(0.0)
    , writeSpeedMbps(0.0)
    , readSpeedMbps(0.0)
    , averageSpeedMbps(0.0)
    , testDurationSeconds(0.0)
    , success(false)
{
}

SpeedTestResult SpeedTestResult::fromTimings(const QString& devicePath, const QString& deviceName,
                                             double sizeMb, double writeSeconds, double readSeconds,
                                             double totalSeconds)
{
    SpeedTestResult result;
    result.devicePath = devicePath;
    result.deviceName = deviceName;
    result.testFileSizeMb = sizeMb;
    result.writeSpeedMbps = writeSeconds > 0 ? sizeMb / writeSeconds : 0.0;
    result.readSpeedMbps = readSeconds > 0 ? sizeMb / readSeconds : 0.0;
    result.averageSpeedMbps = (result.writeSpeedMbps + result.readSpeedMbps) / 2.0;
    result.testDurationSeconds = totalSeconds;
    result.success = true;
    return result;
}

SpeedTestResult SpeedTestResult::failure(const QString& devicePath, const QString& deviceName,
                                         double sizeMb, double elapsedSeconds, const QString& errorMessage)
{
    SpeedTestResult result;
    result.devicePath = devicePath;
    result.deviceName = deviceName;
    result.testFileSizeMb = sizeMb;
    result.testDurationSeconds = elapsedSeconds;
    result.success = false;
    result.errorMessage = errorMessage;
    return result;
}

QJsonObject SpeedTestResult::toJson() const
{
    QJsonObject object;
    object["device_path"] = devicePath;
    object["device_name"] = deviceName;
    object["test_file_size_mb"] = testFileSizeMb;
    object["write_speed_mbps"] = writeSpeedMbps;
    object["read_speed_mbps"] = readSpeedMbps;
    object["average_speed_mbps"] = averageSpeedMbps;
    object["test_duration_seconds"] = testDurationSeconds;
    object["success"] = success;
    object["error_message"] = errorMessage;
    return object;
}
