#pragma once
// 波長可変光バンドパスフィルタ 通信プロトコル上位層
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "obf_error.hpp"
#include "transport.hpp"

namespace obf {

// ───────────────────────────────────
// 定数
// ───────────────────────────────────
constexpr uint32_t BAUD_RATE       = 9600;

constexpr int    WAVELENGTH_MIN    = 1510;   // [nm]
constexpr int    WAVELENGTH_MAX    = 1589;   // [nm]
constexpr int    STAY_TENTHS_MIN   = 1;      // 0.1s
constexpr int    STAY_TENTHS_MAX   = 300;    // 30.0s
constexpr int    SPAN_MIN          = 1;
constexpr int    SPAN_MAX          = 30;
constexpr int    FIELD_MAX         = 9999;   // 4桁ゼロ埋め

constexpr double FINE_STEP_NM        = 0.2;
constexpr double PRECISION_TOLERANCE = 1e-6;

constexpr char   REQUEST_TERMINATOR = ',';
constexpr char   RESPONSE_DELIMITER = ' ';

// ───────────────────────────────────
// 応答フレーム "<Letter>[<payload>]<delimiter>"
// ───────────────────────────────────
struct ResponseFrame {
    char        letter = '\0';
    std::string payload;
    bool        has_payload = false;   // false: エコー直後に区切り文字
};

// ───────────────────────────────────
// 設定
// ───────────────────────────────────
struct DiscoveryOptions {
    std::chrono::milliseconds probe_timeout{100};     // 識別問い合わせ
    std::chrono::milliseconds connect_timeout{1000};  // 接続後の通常通信
    uint32_t baud = BAUD_RATE;
    bool suppress_output = false;
};

// スキャン応答ループの上限（0=無制限）
struct SweepOptions {
    unsigned max_frames = 0;
    std::chrono::milliseconds deadline{0};
};

// ───────────────────────────────────
// スキャン
// ───────────────────────────────────
struct ScanParameters {
    int    start = WAVELENGTH_MIN;   // 開始波長 [nm]
    int    end   = WAVELENGTH_MAX;   // 終了波長 [nm]
    double stay  = 1.0;              // 滞在時間 [s]（0.1s単位に丸めて送信）
    int    span  = 1;                // そのまま送信（意味は機器仕様に依存）
};

// 設定前に機器が保持していた値（応答にデータなし = -1）
struct PreviousScanSettings {
    int    start = -1;
    int    end   = -1;
    double stay  = -1.0;   // [s]
};

// スキャン中の1フレームの分類
struct SweepFrame {
    enum class Kind { Progress, Heartbeat, Completed, Violation };
    Kind        kind = Kind::Violation;
    std::string wavelength;   // Progress のみ
    std::string raw;          // 受信文字列
};

// ───────────────────────────────────
// 波長設定（整数部 + 0.2nm 刻みの微調整）
// ───────────────────────────────────
struct ChannelSetting {
    int    coarse     = 0;
    int    fine_steps = 0;    // 負: D コマンド, 正: I コマンド
    double achieved   = 0.0;  // coarse + fine_steps * 0.2
};

// ───────────────────────────────────
// ログ（送受信フレームのトレース。既定は無効）
// ───────────────────────────────────
void set_trace(bool enabled);
bool trace_enabled();

// ───────────────────────────────────
// フレーム生成/解析
// ───────────────────────────────────
std::string pad_field(int value);
std::vector<uint8_t> make_frame(char letter, const std::string& field,
                                char terminator = REQUEST_TERMINATOR);

// UTF-8 として不正なら DecodeError
std::string decode_text(const std::vector<uint8_t>& bytes);

ResponseFrame parse_response(const std::string& text, char letter,
                             char delimiter = RESPONSE_DELIMITER);
int decode_int(const std::string& payload);

// ───────────────────────────────────
// 1往復の送受信
// exchange    : データ部を整数として取得。データなしなら false
// exchange_ack: エコーのみ確認し、データ部は破棄
// ───────────────────────────────────
bool exchange(Transport& dev, const std::string& field, char letter, int& value,
              char delimiter = RESPONSE_DELIMITER, char terminator = REQUEST_TERMINATOR);
void exchange_ack(Transport& dev, const std::string& field, char letter,
                  char delimiter = RESPONSE_DELIMITER, char terminator = REQUEST_TERMINATOR);

// ───────────────────────────────────
// デバイス検出
// opener が nullptr を返したポートはスキップ
// ───────────────────────────────────
using PortOpener = std::function<std::unique_ptr<Transport>(const std::string& port,
                                                            const DiscoveryOptions& options)>;

std::unique_ptr<Transport> open_serial(const std::string& port, const DiscoveryOptions& options);

std::unique_ptr<Transport> discover(const std::vector<std::string>& ports,
                                    const DiscoveryOptions& options,
                                    const PortOpener& opener);
std::unique_ptr<Transport> discover(const DiscoveryOptions& options = DiscoveryOptions());

// ───────────────────────────────────
// スキャン（範囲外: RangeError, 応答異常: ProtocolViolation を送出）
// ───────────────────────────────────
int validate_scan_parameters(const ScanParameters& params);   // 戻り値: 滞在時間 [0.1s]
SweepFrame classify_sweep_frame(const std::string& text, char delimiter = RESPONSE_DELIMITER);

PreviousScanSettings scan(Transport& dev, const ScanParameters& params,
                          bool suppress_output = false,
                          const SweepOptions& options = SweepOptions());
PreviousScanSettings scan(Transport& dev, int start, int end, double stay, int span,
                          bool suppress_output = false,
                          const SweepOptions& options = SweepOptions());

// ───────────────────────────────────
// 波長設定
// 戻り値: 0=成功, -1=失敗（例外は送出しない）
// ───────────────────────────────────
ChannelSetting encode_wavelength(double wavelength);
int set_channel(Transport& dev, double wavelength, bool suppress_output = false);

} // namespace obf
