// 光バンドパスフィルタ: フレーム生成／応答解析／検出・スキャン・波長設定 実装
#include <cstdio>
#include <cstdint>
#include <cstdlib>
#include <cmath>
#include <ctime>
#include <vector>
#include <string>
#include <sstream>
#include <iomanip>
#include <chrono>
#include <cctype>
#include <utility>

#include "../include/obf_protocol.hpp"
#include "../include/serial_port.hpp"

using namespace std::chrono;

//===============================
// 定数
//===============================
static constexpr char CMD_IDENTITY  = 'V';  // 識別問い合わせ "V,"
static constexpr char CMD_START     = 'L';  // 開始波長
static constexpr char CMD_END       = 'H';  // 終了波長
static constexpr char CMD_STAY      = 'T';  // 滞在時間 [0.1s]
static constexpr char CMD_SWEEP     = 'S';  // スキャン開始（以後 S<波長> を連続受信）
static constexpr char CMD_COARSE    = 'C';  // 波長 整数部
static constexpr char CMD_FINE_DOWN = 'D';  // 0.2nm 減
static constexpr char CMD_FINE_UP   = 'I';  // 0.2nm 増

static constexpr char SWEEP_DONE    = 'o';  // スキャン終了時に機器が返す先頭文字

static const char* const DEVICE_CLASS = "V2";

static bool g_trace = false;

//===============================
// ログユーティリティ
//===============================
static std::string now_timestamp() {
    const auto tp = system_clock::now();
    const auto ms = duration_cast<milliseconds>(tp.time_since_epoch()) % 1000;
    const std::time_t t = system_clock::to_time_t(tp);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%m/%d %H:%M:%S") << "." << std::setw(3) << std::setfill('0') << ms.count();
    return oss.str();
}
// warn / err は stderr、それ以外は stdout
static void log_line(const char* tag, const std::string& payload) {
    const std::string tg = tag;
    std::FILE* out = (tg == "warn" || tg == "err") ? stderr : stdout;
    std::fprintf(out, "%s  [%s]  %s\n", now_timestamp().c_str(), tag, payload.c_str());
    std::fflush(out);
}
static std::string to_hex_string(const std::vector<uint8_t>& buf) {
    std::ostringstream oss;
    for (size_t i = 0; i < buf.size(); ++i) {
        if (i) oss << ' ';
        oss << std::uppercase << std::hex
            << std::setw(2) << std::setfill('0') << static_cast<int>(buf[i]);
    }
    return oss.str();
}
// "L1510," のように表示（制御文字は <0D> 形式）
static std::string to_printable(const std::vector<uint8_t>& buf) {
    std::ostringstream oss;
    oss << '"';
    for (uint8_t b : buf) {
        if (b >= 0x20 && b < 0x7F) oss << static_cast<char>(b);
        else oss << '<' << std::uppercase << std::hex << std::setw(2) << std::setfill('0')
                 << static_cast<int>(b) << std::dec << '>';
    }
    oss << '"';
    return oss.str();
}
static void trace(const char* tag, const std::vector<uint8_t>& frame) {
    if (g_trace) log_line(tag, to_printable(frame));
}

void obf::set_trace(bool enabled) { g_trace = enabled; }
bool obf::trace_enabled() { return g_trace; }

//===============================
// 入出力バッファを必ず空にして戻る
//===============================
namespace {
struct BufferReset {
    explicit BufferReset(obf::Transport& d) : dev(d) {}
    ~BufferReset() { dev.reset_input_buffer(); dev.reset_output_buffer(); }
    obf::Transport& dev;
};
} // namespace

//===============================
// フレーム生成/解析
//===============================
std::string obf::pad_field(int value) {
    if (value < 0 || value > FIELD_MAX) {
        std::ostringstream oss;
        oss << "数値フィールド(field)は 0〜" << FIELD_MAX << " で指定してください: " << value;
        throw RangeError("field", 0, FIELD_MAX, value, oss.str());
    }
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%04d", value);
    return buf;
}

std::vector<uint8_t> obf::make_frame(char letter, const std::string& field, char terminator) {
    std::vector<uint8_t> f;
    f.reserve(field.size() + 2);
    f.push_back(static_cast<uint8_t>(letter));
    f.insert(f.end(), field.begin(), field.end());
    f.push_back(static_cast<uint8_t>(terminator));
    return f;
}

std::string obf::decode_text(const std::vector<uint8_t>& bytes) {
    size_t i = 0;
    while (i < bytes.size()) {
        const uint8_t c = bytes[i];
        size_t  len = 0;
        uint8_t lo = 0x80, hi = 0xBF;   // 2バイト目の許容範囲
        if      (c < 0x80)                 len = 1;
        else if (c >= 0xC2 && c <= 0xDF)   len = 2;                     // C0/C1 は冗長表現
        else if (c >= 0xE0 && c <= 0xEF) {
            len = 3;
            if      (c == 0xE0) lo = 0xA0;                              // 冗長表現
            else if (c == 0xED) hi = 0x9F;                              // サロゲート
        }
        else if (c >= 0xF0 && c <= 0xF4) {
            len = 4;
            if      (c == 0xF0) lo = 0x90;                              // 冗長表現
            else if (c == 0xF4) hi = 0x8F;                              // U+10FFFF 超
        }
        bool ok = (len != 0 && i + len <= bytes.size());
        if (ok && len > 1) ok = (bytes[i + 1] >= lo && bytes[i + 1] <= hi);
        for (size_t k = 2; ok && k < len; ++k) ok = ((bytes[i + k] & 0xC0) == 0x80);
        if (!ok) throw DecodeError("UTF-8 として解釈できない応答です: " + to_hex_string(bytes),
                                   to_hex_string(bytes));
        i += len;
    }
    return std::string(bytes.begin(), bytes.end());
}

obf::ResponseFrame obf::parse_response(const std::string& text, char letter, char delimiter) {
    if (text.empty() || text[0] != letter) {
        throw ProtocolViolation(std::string("想定外の応答です（期待: '") + letter + "'）: \"" + text + "\"",
                                text);
    }
    const size_t end = text.find(delimiter, 1);
    if (end == std::string::npos) {
        throw ProtocolViolation("応答が区切り文字の前で途切れました: \"" + text + "\"", text);
    }

    ResponseFrame r;
    r.letter      = letter;
    r.payload     = text.substr(1, end - 1);
    r.has_payload = (end > 1);
    return r;
}

int obf::decode_int(const std::string& payload) {
    size_t pos = 0;
    int v = 0;
    try {
        v = std::stoi(payload, &pos, 10);
    } catch (const std::invalid_argument&) {
        throw DecodeError("整数として解釈できません: \"" + payload + "\"", payload);
    } catch (const std::out_of_range&) {
        throw DecodeError("整数の範囲外です: \"" + payload + "\"", payload);
    }
    // 末尾の空白以外が残っていれば不正
    while (pos < payload.size() && std::isspace(static_cast<unsigned char>(payload[pos]))) ++pos;
    if (pos != payload.size()) throw DecodeError("整数として解釈できません: \"" + payload + "\"", payload);
    return v;
}

//===============================
// 送受信（1往復）
//===============================
static obf::ResponseFrame transact(obf::Transport& dev, const std::string& field, char letter,
                                   char delimiter, char terminator)
{
    dev.reset_input_buffer();
    dev.reset_output_buffer();

    const auto tx = obf::make_frame(letter, field, terminator);
    trace("send", tx);
    if (!dev.write(tx)) throw obf::TransportError("送信エラー: " + to_printable(tx));
    if (!dev.flush())   throw obf::TransportError("送信バッファの吐き出しに失敗: " + to_printable(tx));

    const obf::ReadResult rx = dev.read_until(static_cast<uint8_t>(delimiter));
    if (!rx.error_message.empty())
        throw obf::TransportError("受信エラー: " + rx.error_message);
    if (!rx.delimiter_found && g_trace)
        log_line("cmt", "タイムアウト: レスポンスが一定時間内に受信されませんでした。");
    trace("recv", rx.bytes);

    return obf::parse_response(obf::decode_text(rx.bytes), letter, delimiter);
}

bool obf::exchange(Transport& dev, const std::string& field, char letter, int& value,
                   char delimiter, char terminator)
{
    const ResponseFrame r = transact(dev, field, letter, delimiter, terminator);
    if (!r.has_payload) return false;
    value = decode_int(r.payload);
    return true;
}

void obf::exchange_ack(Transport& dev, const std::string& field, char letter,
                       char delimiter, char terminator)
{
    transact(dev, field, letter, delimiter, terminator);
}

//===============================
// デバイス検出
//===============================
std::unique_ptr<obf::Transport> obf::open_serial(const std::string& port, const DiscoveryOptions& options) {
    auto sp = std::make_unique<SerialPort>(port, options.baud, options.probe_timeout);
    if (!sp->open()) {
        if (!options.suppress_output) log_line("cmt", port + " : オープン失敗 (" + sp->last_error() + ")");
        return nullptr;
    }
    return std::unique_ptr<Transport>(std::move(sp));
}

std::unique_ptr<obf::Transport> obf::discover(const std::vector<std::string>& ports,
                                              const DiscoveryOptions& options,
                                              const PortOpener& opener)
{
    const auto query = make_frame(CMD_IDENTITY, "");

    for (const auto& port : ports) {
        if (!options.suppress_output) log_line("cmt", "探索中 : " + port);

        std::unique_ptr<Transport> dev = opener(port, options);
        if (!dev) continue;

        dev->set_timeout(options.probe_timeout);
        dev->reset_input_buffer();
        dev->reset_output_buffer();
        trace("send", query);
        if (!dev->write(query) || !dev->flush()) continue;   // dev の破棄でクローズ

        const ReadResult rx = dev->read_until(static_cast<uint8_t>(RESPONSE_DELIMITER));
        trace("recv", rx.bytes);
        if (!rx.error_message.empty()) {
            if (!options.suppress_output) log_line("cmt", port + " : " + rx.error_message);
            continue;
        }

        std::string id;
        try {
            id = decode_text(rx.bytes);
        } catch (const DecodeError& e) {
            if (!options.suppress_output) log_line("cmt", port + " : " + e.what());
            continue;
        }
        if (id.compare(0, 2, DEVICE_CLASS) == 0) {
            dev->set_timeout(options.connect_timeout);
            if (!options.suppress_output) log_line("cmt", "光フィルタを検出しました : " + port);
            return dev;
        }
    }
    log_line("warn", "光フィルタが見つかりませんでした。");
    return nullptr;
}

std::unique_ptr<obf::Transport> obf::discover(const DiscoveryOptions& options) {
    return discover(list_serial_ports(), options, open_serial);
}

//===============================
// スキャン
//===============================
int obf::validate_scan_parameters(const ScanParameters& p) {
    const double tenths = std::nearbyint(p.stay * 10.0);
    std::ostringstream oss;

    if (p.start < WAVELENGTH_MIN || p.start > WAVELENGTH_MAX) {
        oss << "開始波長(start)は " << WAVELENGTH_MIN << "〜" << WAVELENGTH_MAX << " で指定してください: " << p.start;
        throw RangeError("start", WAVELENGTH_MIN, WAVELENGTH_MAX, p.start, oss.str());
    }
    if (p.end < WAVELENGTH_MIN || p.end > WAVELENGTH_MAX) {
        oss << "終了波長(end)は " << WAVELENGTH_MIN << "〜" << WAVELENGTH_MAX << " で指定してください: " << p.end;
        throw RangeError("end", WAVELENGTH_MIN, WAVELENGTH_MAX, p.end, oss.str());
    }
    if (!(tenths >= STAY_TENTHS_MIN && tenths <= STAY_TENTHS_MAX)) {   // NaN も範囲外
        oss << "滞在時間(stay)は 0.1〜30.0 秒で指定してください: " << p.stay;
        throw RangeError("stay", STAY_TENTHS_MIN / 10.0, STAY_TENTHS_MAX / 10.0, p.stay, oss.str());
    }
    if (p.span < SPAN_MIN || p.span > SPAN_MAX) {
        oss << "スパン(span)は " << SPAN_MIN << "〜" << SPAN_MAX << " で指定してください: " << p.span;
        throw RangeError("span", SPAN_MIN, SPAN_MAX, p.span, oss.str());
    }
    return static_cast<int>(tenths);
}

obf::SweepFrame obf::classify_sweep_frame(const std::string& text, char delimiter) {
    SweepFrame f;
    f.raw = text;
    if (text.empty()) return f;   // Violation

    if (text[0] == CMD_SWEEP) {
        const size_t end = text.find(delimiter, 1);
        const std::string wl = text.substr(1, (end == std::string::npos ? text.size() : end) - 1);
        if (wl.empty()) {
            f.kind = SweepFrame::Kind::Heartbeat;
        } else {
            f.kind = SweepFrame::Kind::Progress;
            f.wavelength = wl;
        }
    } else if (text[0] == SWEEP_DONE) {
        f.kind = SweepFrame::Kind::Completed;
    }
    return f;
}

// S<span> 送信後、終了フレーム('o')まで受信し続ける
static void run_sweep(obf::Transport& dev, int span, bool suppress_output, const obf::SweepOptions& options) {
    const auto tx = obf::make_frame(CMD_SWEEP, obf::pad_field(span));
    trace("send", tx);
    if (!dev.write(tx)) throw obf::TransportError("送信エラー: " + to_printable(tx));
    if (!dev.flush())   throw obf::TransportError("送信バッファの吐き出しに失敗: " + to_printable(tx));

    const auto started  = steady_clock::now();
    unsigned   frames   = 0;
    bool       progress = false;   // 進捗行を表示中
    std::vector<uint8_t> pending;

    while (true) {
        if (options.deadline.count() > 0 && steady_clock::now() - started >= options.deadline) {
            if (progress) std::printf("\n");
            throw obf::SweepTimeout("スキャンが制限時間内に終了しませんでした");
        }

        const obf::ReadResult rx = dev.read_until(static_cast<uint8_t>(obf::RESPONSE_DELIMITER));
        if (!rx.error_message.empty()) {
            if (progress) std::printf("\n");
            throw obf::TransportError("スキャン中の受信エラー: " + rx.error_message);
        }
        pending.insert(pending.end(), rx.bytes.begin(), rx.bytes.end());
        if (!rx.delimiter_found) continue;   // 空/途中まで: 読み直し

        trace("recv", pending);
        const std::string text = obf::decode_text(pending);
        pending.clear();
        ++frames;

        const obf::SweepFrame f = obf::classify_sweep_frame(text);
        switch (f.kind) {
            case obf::SweepFrame::Kind::Heartbeat:
                break;
            case obf::SweepFrame::Kind::Progress:
                if (!suppress_output) {
                    std::printf("\rスキャン中の波長 : %s nm   ", f.wavelength.c_str());
                    std::fflush(stdout);
                    progress = true;
                }
                break;
            case obf::SweepFrame::Kind::Completed:
                if (progress) std::printf("\n");
                return;
            case obf::SweepFrame::Kind::Violation:
                if (progress) std::printf("\n");
                throw obf::ProtocolViolation("スキャン中に想定外の応答を受信しました: \"" + f.raw + "\"", f.raw);
        }

        if (options.max_frames > 0 && frames >= options.max_frames) {
            if (progress) std::printf("\n");
            throw obf::SweepTimeout("スキャンの受信フレーム数が上限に達しました");
        }
    }
}

obf::PreviousScanSettings obf::scan(Transport& dev, const ScanParameters& params,
                                    bool suppress_output, const SweepOptions& options)
{
    const int stay_tenths = validate_scan_parameters(params);

    BufferReset guard(dev);
    if (!suppress_output) log_line("cmt", "/* スキャン設定 */");

    PreviousScanSettings prev;
    int v = 0;
    if (exchange(dev, pad_field(params.start), CMD_START, v)) prev.start = v;
    if (exchange(dev, pad_field(params.end),   CMD_END,   v)) prev.end   = v;
    if (exchange(dev, pad_field(stay_tenths),  CMD_STAY,  v)) prev.stay  = v / 10.0;

    if (!suppress_output) log_line("cmt", "/* スキャン開始 */");
    run_sweep(dev, params.span, suppress_output, options);
    if (!suppress_output) log_line("cmt", "スキャン完了");
    return prev;
}

obf::PreviousScanSettings obf::scan(Transport& dev, int start, int end, double stay, int span,
                                    bool suppress_output, const SweepOptions& options)
{
    ScanParameters p;
    p.start = start;
    p.end   = end;
    p.stay  = stay;
    p.span  = span;
    return scan(dev, p, suppress_output, options);
}

//===============================
// 波長設定
//===============================
obf::ChannelSetting obf::encode_wavelength(double wavelength) {
    ChannelSetting c;
    c.coarse     = static_cast<int>(std::nearbyint(wavelength));
    c.fine_steps = static_cast<int>(std::nearbyint((wavelength - c.coarse) / FINE_STEP_NM));
    c.achieved   = c.coarse + c.fine_steps * FINE_STEP_NM;
    return c;
}

int obf::set_channel(Transport& dev, double wavelength, bool suppress_output) {
    try {
        const double coarse = std::nearbyint(wavelength);
        if (!(coarse >= WAVELENGTH_MIN && coarse <= WAVELENGTH_MAX)) {   // NaN も範囲外
            std::ostringstream oss;
            oss << "波長(wavelength)は " << WAVELENGTH_MIN << "〜" << WAVELENGTH_MAX << " で指定してください: " << wavelength;
            throw RangeError("wavelength", WAVELENGTH_MIN, WAVELENGTH_MAX, wavelength, oss.str());
        }
        const ChannelSetting c = encode_wavelength(wavelength);

        BufferReset guard(dev);
        exchange_ack(dev, pad_field(c.coarse), CMD_COARSE);

        if (!suppress_output && std::fabs(wavelength - c.achieved) > PRECISION_TOLERANCE) {
            std::ostringstream oss;
            oss << wavelength << " nm は設定できません。最も近い " << c.achieved << " nm に設定します";
            log_line("warn", oss.str());
        }
        if (c.fine_steps == 0) return 0;

        const char cmd = (c.fine_steps < 0) ? CMD_FINE_DOWN : CMD_FINE_UP;
        exchange_ack(dev, pad_field(std::abs(c.fine_steps)), cmd);
        return 0;
    } catch (const Error& e) {
        log_line("err", e.what());
        return -1;
    }
}
