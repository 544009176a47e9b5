// プラットフォーム共通部：区切り文字までの読み取り
#include "../include/serial_port.hpp"

using namespace std::chrono;

namespace obf {

ReadResult SerialPort::read_until(uint8_t delimiter) {
    ReadResult r;
    if (!is_open()) { last_error_ = "ポート未オープン"; r.error_message = last_error_; return r; }

    const auto deadline = steady_clock::now() + timeout_;
    while (true) {
        const auto left = duration_cast<milliseconds>(deadline - steady_clock::now());
        if (left.count() <= 0) break;

        uint8_t b = 0;
        if (!read_byte(b, left)) {
            if (read_failed_) { r.error_message = last_error_; break; }
            continue;
        }
        r.bytes.push_back(b);
        if (b == delimiter) { r.delimiter_found = true; break; }
    }
    return r;
}

} // namespace obf
