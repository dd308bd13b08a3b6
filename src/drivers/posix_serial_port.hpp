#pragma once
#include "serial_port.hpp"

// termios raw 모드 시리얼 포트 (/dev/ttyUSB0, /dev/ttyACM0 ...)
class PosixSerialPort final : public ISerialPort {
public:
    PosixSerialPort() = default;
    ~PosixSerialPort() override { close(); }

    PosixSerialPort(const PosixSerialPort&) = delete;
    PosixSerialPort& operator=(const PosixSerialPort&) = delete;

    bool open(const std::string& target, std::uint32_t baud) override;
    bool write(const std::uint8_t* data, std::size_t len, int timeout_ms) override;
    long read_available(std::uint8_t* buf, std::size_t cap) override;
    void close() override;
    bool is_open() const override { return fd_ >= 0; }

private:
    int fd_ = -1;
};
