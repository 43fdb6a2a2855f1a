#ifndef FTMS_CODEC_HPP
#define FTMS_CODEC_HPP

#include <stddef.h>
#include <stdint.h>
#include <vector>
#include "TelemetrySnapshot.hpp"

// Bluetooth Fitness Machine Service (FTMS) のトレッドミル部分
namespace Ftms {

// --- UUID (16bit短縮形) ---
extern const char* SERVICE_UUID;         // 0x1826 Fitness Machine
extern const char* TREADMILL_DATA_UUID;  // 0x2ACD Treadmill Data (notify)
extern const char* CONTROL_POINT_UUID;   // 0x2AD9 Fitness Machine Control Point (write/indicate)

// --- Control Point オペコード ---
const uint8_t OP_REQUEST_CONTROL = 0x00;
const uint8_t OP_SET_TARGET_SPEED = 0x02;
const uint8_t OP_START_OR_RESUME = 0x07;
const uint8_t OP_STOP_OR_PAUSE = 0x08;
const uint8_t OP_RESPONSE_CODE = 0x80;

const uint8_t STOP_PARAM_STOP = 0x01;
const uint8_t STOP_PARAM_PAUSE = 0x02;

const uint8_t RESULT_SUCCESS = 0x01;
const uint8_t RESULT_NOT_SUPPORTED = 0x02;
const uint8_t RESULT_INVALID_PARAMETER = 0x03;
const uint8_t RESULT_FAILED = 0x04;
const uint8_t RESULT_NOT_PERMITTED = 0x05;

// --- Treadmill Data フラグ ---
const uint16_t FLAG_MORE_DATA = 0x0001;        // 1 のとき瞬間速度フィールドなし
const uint16_t FLAG_AVERAGE_SPEED = 0x0002;
const uint16_t FLAG_TOTAL_DISTANCE = 0x0004;
const uint16_t FLAG_INCLINATION = 0x0008;
const uint16_t FLAG_ELEVATION_GAIN = 0x0010;
const uint16_t FLAG_INSTANT_PACE = 0x0020;
const uint16_t FLAG_AVERAGE_PACE = 0x0040;
const uint16_t FLAG_EXPENDED_ENERGY = 0x0080;
const uint16_t FLAG_HEART_RATE = 0x0100;
const uint16_t FLAG_METABOLIC_EQUIVALENT = 0x0200;
const uint16_t FLAG_ELAPSED_TIME = 0x0400;
const uint16_t FLAG_REMAINING_TIME = 0x0800;
const uint16_t FLAG_FORCE_AND_POWER = 0x1000;

const uint16_t ENERGY_NOT_AVAILABLE = 0xFFFF;

// --- Control Point コマンド生成 ---
std::vector<uint8_t> encodeRequestControl();
std::vector<uint8_t> encodeStart();
std::vector<uint8_t> encodeStop();
std::vector<uint8_t> encodeSetTargetSpeed(uint16_t speedHundredths);

// Indication (0x80, 要求オペコード, 結果) を解析
bool parseControlResponse(const uint8_t* data, size_t length, uint8_t& requestOp, uint8_t& result);
const char* resultName(uint8_t result);

// 現在速度に step x SPEED_STEP_UNIT_X100 を足し、許容範囲に収める
uint16_t computeTargetSpeed(uint16_t currentHundredths, int step);

}  // namespace Ftms

// Treadmill Data 通知のデコーダ。
// 1回の通知に含まれないフィールドは前回値を引き継ぐ (分割送信対策)。
class FtmsDecoder {
public:
    FtmsDecoder();
    void reset(); // 新しい購読の開始時に呼ぶ
    // 途中で切れた/不正なフレームは false (前回値も変更しない)
    bool decode(const uint8_t* data, size_t length, TelemetrySnapshot& out);

private:
    TelemetrySnapshot last;
};

#endif // FTMS_CODEC_HPP
