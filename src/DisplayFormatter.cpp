#include "DisplayFormatter.hpp"
#include <math.h>
#include <stdio.h>

namespace DisplayFormatter {

std::string formatSpeed(uint16_t speedHundredths) {
    char buf[12];
    snprintf(buf, sizeof(buf), "%02u.%02u",
             (unsigned)(speedHundredths / 100), (unsigned)(speedHundredths % 100));
    return std::string(buf);
}

std::string formatDuration(uint32_t elapsedSeconds) {
    unsigned long h = elapsedSeconds / 3600;
    unsigned long m = (elapsedSeconds % 3600) / 60;
    unsigned long s = elapsedSeconds % 60;
    char buf[16];
    snprintf(buf, sizeof(buf), "%lu:%02lu:%02lu", h, m, s); // 分・秒はゼロ埋め2桁
    return std::string(buf);
}

unsigned long estimateSteps(uint32_t distanceMeters, const DisplaySettings& settings) {
    double strideM = (settings.userHeightCm / 100.0) * settings.strideFactor;
    if (strideM <= 0.0) return 0;
    return (unsigned long)floor(distanceMeters / strideM);
}

DerivedDisplay derive(const TelemetrySnapshot& snapshot, const DisplaySettings& settings) {
    DerivedDisplay d;
    char buf[16];

    d.speedText = formatSpeed(snapshot.speedHundredths);

    snprintf(buf, sizeof(buf), "%0*lu", DISTANCE_TEXT_WIDTH, (unsigned long)snapshot.distanceMeters);
    d.distanceText = buf;

    snprintf(buf, sizeof(buf), "%0*u", CALORIES_TEXT_WIDTH, (unsigned)snapshot.caloriesKcal);
    d.caloriesText = buf;

    d.durationText = formatDuration(snapshot.elapsedSeconds);

    d.stepsEstimate = estimateSteps(snapshot.distanceMeters, settings);
    snprintf(buf, sizeof(buf), "%lu", d.stepsEstimate);
    d.stepsText = buf;

    return d;
}

}  // namespace DisplayFormatter
