#pragma once
// 簡易シリアルポートラッパ（Windows: COM API / POSIX: termios）
#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#ifdef _WIN32
#include <windows.h>
#endif

#include "transport.hpp"

namespace obf {

class SerialPort : public Transport {
public:
    SerialPort(std::string port_name, uint32_t baud,
               std::chrono::milliseconds timeout = std::chrono::milliseconds(1000))
        : port_name_(std::move(port_name)), baud_(baud), timeout_(timeout) {}
    ~SerialPort() override { close(); }

    SerialPort(const SerialPort&) = delete;
    SerialPort& operator=(const SerialPort&) = delete;

    bool open();
    void close();
    bool is_open() const;

    bool write(const std::vector<uint8_t>& data) override;
    bool flush() override;
    ReadResult read_until(uint8_t delimiter) override;
    void reset_input_buffer() override;
    void reset_output_buffer() override;

    void set_timeout(std::chrono::milliseconds timeout) override { timeout_ = timeout; }
    std::chrono::milliseconds timeout() const override { return timeout_; }
    std::string name() const override { return port_name_; }

    // 1バイト読み取り（個別タイムアウト）
    // false かつ read_failed()=true なら回線異常、false のみならタイムアウト
    bool read_byte(uint8_t& out, std::chrono::milliseconds per_byte_timeout);

    bool read_failed() const { return read_failed_; }
    std::string last_error() const { return last_error_; }

private:
    std::string port_name_;
    uint32_t    baud_;
    std::chrono::milliseconds timeout_;
#ifdef _WIN32
    HANDLE      h_ = INVALID_HANDLE_VALUE;
#else
    int         fd_ = -1;
#endif
    std::string last_error_;
    bool        read_failed_ = false;
};

// 利用可能なシリアルポート名（COMx / /dev/ttyUSBx など）
std::vector<std::string> list_serial_ports();

} // namespace obf
