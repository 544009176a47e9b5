#pragma once
// 伝送路の抽象（実機シリアル／テスト用スクリプト）
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace obf {

// ───────────────────────────────────
// 区切り文字までの読み取り結果
// delimiter_found=false はタイムアウト（bytes は空または途中まで）
// error_message が空でなければ回線切断・I/Oエラー（再読み取りしても回復しない）
// ───────────────────────────────────
struct ReadResult {
    std::vector<uint8_t> bytes;   // 区切り文字を含む受信バイト
    bool delimiter_found = false;
    std::string error_message;
};

class Transport {
public:
    virtual ~Transport() = default;

    virtual bool write(const std::vector<uint8_t>& data) = 0;
    virtual bool flush() = 0;

    // 区切り文字を受信するか、timeout() が経過するまでブロック
    virtual ReadResult read_until(uint8_t delimiter) = 0;

    virtual void reset_input_buffer() = 0;
    virtual void reset_output_buffer() = 0;

    virtual void set_timeout(std::chrono::milliseconds timeout) = 0;
    virtual std::chrono::milliseconds timeout() const = 0;

    virtual std::string name() const = 0;
};

} // namespace obf
