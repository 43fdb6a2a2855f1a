#include "FtmsCodec.hpp"
#include "config.hpp"

namespace Ftms {

const char* SERVICE_UUID = "1826";
const char* TREADMILL_DATA_UUID = "2ACD";
const char* CONTROL_POINT_UUID = "2AD9";

std::vector<uint8_t> encodeRequestControl() {
    return std::vector<uint8_t>(1, OP_REQUEST_CONTROL);
}

std::vector<uint8_t> encodeStart() {
    return std::vector<uint8_t>(1, OP_START_OR_RESUME);
}

std::vector<uint8_t> encodeStop() {
    std::vector<uint8_t> cmd;
    cmd.push_back(OP_STOP_OR_PAUSE);
    cmd.push_back(STOP_PARAM_STOP);
    return cmd;
}

std::vector<uint8_t> encodeSetTargetSpeed(uint16_t speedHundredths) {
    std::vector<uint8_t> cmd;
    cmd.push_back(OP_SET_TARGET_SPEED);
    cmd.push_back((uint8_t)(speedHundredths & 0xFF)); // リトルエンディアン
    cmd.push_back((uint8_t)(speedHundredths >> 8));
    return cmd;
}

bool parseControlResponse(const uint8_t* data, size_t length, uint8_t& requestOp, uint8_t& result) {
    if (data == nullptr || length < 3 || data[0] != OP_RESPONSE_CODE) {
        return false;
    }
    requestOp = data[1];
    result = data[2];
    return true;
}

const char* resultName(uint8_t result) {
    switch (result) {
        case RESULT_SUCCESS:           return "Success";
        case RESULT_NOT_SUPPORTED:     return "Op Code not supported";
        case RESULT_INVALID_PARAMETER: return "Invalid Parameter";
        case RESULT_FAILED:            return "Operation Failed";
        case RESULT_NOT_PERMITTED:     return "Control Not Permitted";
        default:                       return "Unknown";
    }
}

uint16_t computeTargetSpeed(uint16_t currentHundredths, int step) {
    long target = (long)currentHundredths + (long)step * SPEED_STEP_UNIT_X100;
    if (target < MIN_TARGET_SPEED_X100) target = MIN_TARGET_SPEED_X100;
    if (target > MAX_TARGET_SPEED_X100) target = MAX_TARGET_SPEED_X100;
    return (uint16_t)target;
}

}  // namespace Ftms


namespace {

// フレーム読み出し用 (範囲外アクセスは ok=false にして以降すべて失敗)
struct FrameReader {
    const uint8_t* data;
    size_t length;
    size_t offset;
    bool ok;

    FrameReader(const uint8_t* d, size_t len) : data(d), length(len), offset(0), ok(true) {}

    bool has(size_t n) const { return ok && offset + n <= length; }

    uint8_t u8() {
        if (!has(1)) { ok = false; return 0; }
        return data[offset++];
    }
    uint16_t u16() {
        if (!has(2)) { ok = false; return 0; }
        uint16_t v = (uint16_t)(data[offset] | (data[offset + 1] << 8));
        offset += 2;
        return v;
    }
    uint32_t u24() {
        if (!has(3)) { ok = false; return 0; }
        uint32_t v = (uint32_t)data[offset] | ((uint32_t)data[offset + 1] << 8) | ((uint32_t)data[offset + 2] << 16);
        offset += 3;
        return v;
    }
    void skip(size_t n) {
        if (!has(n)) { ok = false; return; }
        offset += n;
    }
};

}  // namespace


FtmsDecoder::FtmsDecoder() {}

void FtmsDecoder::reset() {
    last = TelemetrySnapshot();
}

bool FtmsDecoder::decode(const uint8_t* data, size_t length, TelemetrySnapshot& out) {
    if (data == nullptr || length < 2) return false;

    FrameReader r(data, length);
    const uint16_t flags = r.u16();
    TelemetrySnapshot next = last; // 含まれないフィールドは前回値

    // フィールドはフラグのビット順に並ぶ
    if (!(flags & Ftms::FLAG_MORE_DATA))          next.speedHundredths = r.u16();
    if (flags & Ftms::FLAG_AVERAGE_SPEED)         r.skip(2);
    if (flags & Ftms::FLAG_TOTAL_DISTANCE)        next.distanceMeters = r.u24();
    if (flags & Ftms::FLAG_INCLINATION)           r.skip(4); // 傾斜 + ランプ角
    if (flags & Ftms::FLAG_ELEVATION_GAIN)        r.skip(4); // 正/負の標高差
    if (flags & Ftms::FLAG_INSTANT_PACE)          r.skip(1);
    if (flags & Ftms::FLAG_AVERAGE_PACE)          r.skip(1);
    if (flags & Ftms::FLAG_EXPENDED_ENERGY) {
        uint16_t totalEnergy = r.u16();
        r.skip(3); // 時間あたり(2) + 分あたり(1)
        if (totalEnergy != Ftms::ENERGY_NOT_AVAILABLE) next.caloriesKcal = totalEnergy;
    }
    if (flags & Ftms::FLAG_HEART_RATE)            r.skip(1);
    if (flags & Ftms::FLAG_METABOLIC_EQUIVALENT)  r.skip(1);
    if (flags & Ftms::FLAG_ELAPSED_TIME)          next.elapsedSeconds = r.u16();
    if (flags & Ftms::FLAG_REMAINING_TIME)        r.skip(2);
    if (flags & Ftms::FLAG_FORCE_AND_POWER)       r.skip(4);

    if (!r.ok) return false; // 途中で切れている

    last = next;
    out = next;
    return true;
}
