#ifndef TELEMETRY_SNAPSHOT_HPP
#define TELEMETRY_SNAPSHOT_HPP

#include <stdint.h>

// トレッドミルからの通知1回分のデータ (生成後は変更しない)
struct TelemetrySnapshot {
    uint16_t speedHundredths = 0;  // 速度 (0.01 km/h 単位, 520 = 5.20 km/h)
    uint32_t distanceMeters = 0;   // 総距離 (m)
    uint16_t caloriesKcal = 0;     // 総消費カロリー (kcal)
    uint32_t elapsedSeconds = 0;   // 経過時間 (秒)
};

inline bool operator==(const TelemetrySnapshot& a, const TelemetrySnapshot& b) {
    return a.speedHundredths == b.speedHundredths &&
           a.distanceMeters == b.distanceMeters &&
           a.caloriesKcal == b.caloriesKcal &&
           a.elapsedSeconds == b.elapsedSeconds;
}

inline bool operator!=(const TelemetrySnapshot& a, const TelemetrySnapshot& b) {
    return !(a == b);
}

#endif // TELEMETRY_SNAPSHOT_HPP
