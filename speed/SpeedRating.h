#ifndef SPEEDRATING_H
#define SPEEDRATING_H

#include <QString>

class SpeedRating
{
public:
    // Qualitative bucket for a measured average in MB/s
    static QString forSpeed(double averageSpeedMbps);

    // Nominal MB/s for a bus speed label such as "480 Mb/s"; 0 when unrecognised
    static double theoreticalSpeedMbps(const QString& speedLabel);

    // Compares the measured average against the nominal throughput of the link
    static QString cableQuality(const QString& theoreticalSpeedLabel, double actualSpeedMbps);

private:
    SpeedRating() = delete;
};

#endif // SPEEDRATING_H
