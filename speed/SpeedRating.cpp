#include "SpeedRating.h"

QString SpeedRating::forSpeed(double averageSpeedMbps)
{
    if (averageSpeedMbps >= 400) {
        return "Excellent (USB3.0+)";
    } else if (averageSpeedMbps >= 200) {
        return "Very Good (USB3.0)";
    } else if (averageSpeedMbps >= 60) {
        return "Good (USB2.0 High-Speed)";
    } else if (averageSpeedMbps >= 10) {
        return "Moderate (USB2.0)";
    } else if (averageSpeedMbps >= 1) {
        return "Slow (USB1.1)";
    }
    return "Very Slow";
}

double SpeedRating::theoreticalSpeedMbps(const QString& speedLabel)
{
    if (speedLabel.contains("480 Mb/s")) {
        return 60.0;
    } else if (speedLabel.contains("10 Gb/s")) {
        return 1250.0;
    } else if (speedLabel.contains("5 Gb/s")) {
        return 625.0;
    }
    return 0.0;
}

QString SpeedRating::cableQuality(const QString& theoreticalSpeedLabel, double actualSpeedMbps)
{
    double theoretical = theoreticalSpeedMbps(theoreticalSpeedLabel);
    if (theoretical <= 0) {
        return "Unknown";
    }

    double efficiency = actualSpeedMbps / theoretical * 100.0;
    if (efficiency >= 80) {
        return "Excellent Cable (>80% efficiency)";
    } else if (efficiency >= 60) {
        return "Good Cable (60-80% efficiency)";
    } else if (efficiency >= 40) {
        return "Moderate Cable (40-60% efficiency)";
    } else if (efficiency >= 20) {
        return "Poor Cable (20-40% efficiency)";
    }
    return "Bad Cable (<20% efficiency)";
}
