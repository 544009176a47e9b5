// POSIX（Linux / macOS）実装：termios + poll
#include "../include/serial_port.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <dirent.h>
#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

namespace obf {

static speed_t to_speed(uint32_t baud) {
    switch (baud) {
        case 9600:   return B9600;
        case 19200:  return B19200;
        case 38400:  return B38400;
        case 57600:  return B57600;
        case 115200: return B115200;
        default:     return B9600;
    }
}

bool SerialPort::open() {
    close();
    fd_ = ::open(port_name_.c_str(), O_RDWR | O_NOCTTY);
    if (fd_ < 0) { last_error_ = std::string("open 失敗: ") + std::strerror(errno); return false; }

    termios tio{};
    if (tcgetattr(fd_, &tio) != 0) {
        last_error_ = std::string("tcgetattr 失敗: ") + std::strerror(errno); close(); return false;
    }
    // 8N1・rawモード
    cfmakeraw(&tio);
    tio.c_cflag |= (CLOCAL | CREAD);
    tio.c_cflag &= ~(PARENB | CSTOPB | CSIZE);
    tio.c_cflag |= CS8;
    tio.c_cc[VMIN]  = 0;
    tio.c_cc[VTIME] = 0;
    cfsetispeed(&tio, to_speed(baud_));
    cfsetospeed(&tio, to_speed(baud_));
    if (tcsetattr(fd_, TCSANOW, &tio) != 0) {
        last_error_ = std::string("tcsetattr 失敗: ") + std::strerror(errno); close(); return false;
    }

    tcflush(fd_, TCIOFLUSH);
    return true;
}

void SerialPort::close() {
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
}

bool SerialPort::is_open() const { return fd_ >= 0; }

bool SerialPort::write(const std::vector<uint8_t>& data) {
    if (fd_ < 0) { last_error_ = "ポート未オープン"; return false; }
    size_t done = 0;
    while (done < data.size()) {
        const ssize_t w = ::write(fd_, data.data() + done, data.size() - done);
        if (w < 0) {
            if (errno == EINTR) continue;
            last_error_ = std::string("write 失敗: ") + std::strerror(errno);
            return false;
        }
        done += static_cast<size_t>(w);
    }
    return true;
}

bool SerialPort::flush() {
    if (fd_ < 0) return false;
    return tcdrain(fd_) == 0;
}

void SerialPort::reset_input_buffer() {
    if (fd_ >= 0) tcflush(fd_, TCIFLUSH);
}

void SerialPort::reset_output_buffer() {
    if (fd_ >= 0) tcflush(fd_, TCOFLUSH);
}

bool SerialPort::read_byte(uint8_t& out, std::chrono::milliseconds per_byte_timeout) {
    read_failed_ = false;
    if (fd_ < 0) { read_failed_ = true; last_error_ = "ポート未オープン"; return false; }

    pollfd p{};
    p.fd     = fd_;
    p.events = POLLIN;
    const int rc = ::poll(&p, 1, static_cast<int>(per_byte_timeout.count()));
    if (rc == 0) return false;  // タイムアウト
    if (rc < 0) {
        if (errno == EINTR) return false;
        read_failed_ = true;
        last_error_ = std::string("poll 失敗: ") + std::strerror(errno);
        return false;
    }
    // 受信データが残っていれば先に読む（切断はその後の read で検出）
    if (!(p.revents & POLLIN) && (p.revents & (POLLERR | POLLHUP | POLLNVAL))) {
        read_failed_ = true;
        last_error_ = "回線切断（POLLHUP/POLLERR）";
        return false;
    }

    const ssize_t r = ::read(fd_, &out, 1);
    if (r == 1) return true;
    if (r < 0 && (errno == EINTR || errno == EAGAIN)) return false;
    read_failed_ = true;
    last_error_ = (r == 0) ? std::string("回線切断（EOF）")
                           : std::string("read 失敗: ") + std::strerror(errno);
    return false;
}

std::vector<std::string> list_serial_ports() {
    static const char* const prefixes[] = { "ttyUSB", "ttyACM", "ttyS", "cu." };

    std::vector<std::string> ports;
    DIR* dir = ::opendir("/dev");
    if (!dir) return ports;
    while (dirent* e = ::readdir(dir)) {
        const std::string name = e->d_name;
        for (const char* p : prefixes) {
            if (name.compare(0, std::strlen(p), p) == 0) { ports.push_back("/dev/" + name); break; }
        }
    }
    ::closedir(dir);
    std::sort(ports.begin(), ports.end());
    return ports;
}

} // namespace obf
