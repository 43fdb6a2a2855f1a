#ifndef DISPLAY_FORMATTER_HPP
#define DISPLAY_FORMATTER_HPP

#include <stdint.h>
#include <string>
#include "config.hpp"
#include "TelemetrySnapshot.hpp"

// 表示計算用の設定 (起動後は読み取り専用)
struct DisplaySettings {
    unsigned int userHeightCm = DEFAULT_USER_HEIGHT_CM;
    double strideFactor = DEFAULT_STRIDE_FACTOR;
};

// 画面に出す文字列一式 (スナップショットから都度生成)
struct DerivedDisplay {
    std::string speedText;     // "05.20"
    std::string distanceText;  // "0120"
    std::string caloriesText;  // "0045"
    std::string durationText;  // "1:02:05"
    std::string stepsText;     // "165"
    unsigned long stepsEstimate = 0;
};

namespace DisplayFormatter {

// スナップショットと設定だけから決まる (内部状態なし)
DerivedDisplay derive(const TelemetrySnapshot& snapshot, const DisplaySettings& settings);

// 秒を H:MM:SS に (時間は桁埋めしない)
std::string formatDuration(uint32_t elapsedSeconds);

// 0.01 km/h 単位の速度を "05.20" 形式に
std::string formatSpeed(uint16_t speedHundredths);

// 歩数 = floor(距離 / (身長m x 係数))。設定が不正なら 0
unsigned long estimateSteps(uint32_t distanceMeters, const DisplaySettings& settings);

}

#endif // DISPLAY_FORMATTER_HPP
