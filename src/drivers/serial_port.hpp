#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

// 시리얼 링크 추상화 (실장치 / 시뮬레이터 공통)
class ISerialPort {
public:
    virtual ~ISerialPort() = default;

    virtual bool open(const std::string& target, std::uint32_t baud) = 0;

    // len 바이트 전부 써야 true. 부분 쓰기/타임아웃/끊김은 false
    virtual bool write(const std::uint8_t* data, std::size_t len, int timeout_ms) = 0;

    // 블록하지 않음. 읽은 바이트 수 (없으면 0, 에러면 -1)
    virtual long read_available(std::uint8_t* buf, std::size_t cap) = 0;

    virtual void close() = 0;
    virtual bool is_open() const = 0;
};

using SerialPortFactory = std::function<std::unique_ptr<ISerialPort>()>;
