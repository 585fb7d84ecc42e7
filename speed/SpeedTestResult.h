#ifndef SPEEDTESTRESULT_H
#define SPEEDTESTRESULT_H

#include <QString>
#include <QJsonObject>
#include <QMetaType>

// Outcome of one throughput probe. Speeds are in MB/s.
class SpeedTestResult
{
public:
    SpeedTestResult();

    QString devicePath;
    QString deviceName;
    double testFileSizeMb;
    double writeSpeedMbps;
    double readSpeedMbps;
    double averageSpeedMbps;
    double testDurationSeconds;
    bool success;
    QString errorMessage;

    // Successful result; a phase that took no measurable time yields speed 0
    static SpeedTestResult fromTimings(const QString& devicePath, const QString& deviceName,
                                       double sizeMb, double writeSeconds, double readSeconds,
                                       double totalSeconds);
    static SpeedTestResult failure(const QString& devicePath, const QString& deviceName,
                                   double sizeMb, double elapsedSeconds, const QString& errorMessage);

    QJsonObject toJson() const;
};

Q_DECLARE_METATYPE(SpeedTestResult)

#endif // SPEEDTESTRESULT_H
