#include "posix_serial_port.hpp"

#include <cerrno>
#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

static bool to_speed(std::uint32_t baud, speed_t& out) {
    switch (baud) {
        case 9600:   out = B9600;   return true;
        case 19200:  out = B19200;  return true;
        case 38400:  out = B38400;  return true;
        case 57600:  out = B57600;  return true;
        case 115200: out = B115200; return true;
        case 230400: out = B230400; return true;
        case 460800: out = B460800; return true;
        case 921600: out = B921600; return true;
        default:     return false;
    }
}

bool PosixSerialPort::open(const std::string& target, std::uint32_t baud) {
    close();

    speed_t speed;
    if (!to_speed(baud, speed)) return false;

    const int fd = ::open(target.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd < 0) return false;

    termios tio{};
    if (tcgetattr(fd, &tio) != 0) {
        ::close(fd);
        return false;
    }

    cfmakeraw(&tio);
    tio.c_cflag |= (CLOCAL | CREAD);
    tio.c_cflag &= ~CSTOPB;      // 8N1
    tio.c_cflag &= ~CRTSCTS;
    tio.c_cc[VMIN]  = 0;
    tio.c_cc[VTIME] = 0;

    if (cfsetispeed(&tio, speed) != 0 || cfsetospeed(&tio, speed) != 0 ||
        tcsetattr(fd, TCSANOW, &tio) != 0) {
        ::close(fd);
        return false;
    }

    // 열기 전에 쌓여있던 쓰레기 바이트 버림
    tcflush(fd, TCIOFLUSH);

    fd_ = fd;
    return true;
}

bool PosixSerialPort::write(const std::uint8_t* data, std::size_t len, int timeout_ms) {
    if (fd_ < 0) return false;

    std::size_t done = 0;
    while (done < len) {
        const ssize_t n = ::write(fd_, data + done, len - done);
        if (n > 0) {
            done += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK) return false;

        // 출력 버퍼 가득 참 -> timeout 까지만 대기
        pollfd pfd{fd_, POLLOUT, 0};
        const int r = ::poll(&pfd, 1, timeout_ms);
        if (r <= 0) return false;
        if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) return false;
    }
    return true;
}

long PosixSerialPort::read_available(std::uint8_t* buf, std::size_t cap) {
    if (fd_ < 0) return -1;

    const ssize_t n = ::read(fd_, buf, cap);
    if (n >= 0) return static_cast<long>(n);
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return 0;
    return -1;
}

void PosixSerialPort::close() {
    if (fd_ < 0) return;
    ::close(fd_);
    fd_ = -1;
}
