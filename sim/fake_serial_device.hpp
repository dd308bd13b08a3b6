#pragma once
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <vector>
#include "../src/drivers/serial_port.hpp"
#include "../src/drivers/wire_packet.hpp"

// =====================
// 시뮬레이터 장치 (실제 펌웨어 대신)
// - 받은 패킷 전부 기록
// - 유효 패킷마다 status 응답 (지연/지터/드롭 적용)
// - 테스트에서 open/write 실패 주입 가능
// 여러 스레드(scheduler / 테스트)에서 접근하므로 내부 mutex 사용
// =====================
class FakeSerialDevice {
public:
    enum class Reply {
        NONE,      // 응답 안 함
        ACK,
        NAK,
        GARBAGE    // 규격 밖 바이트
    };

    struct Config {
        std::uint64_t delay_us  = 0;      // 기본 지연
        std::uint64_t jitter_us = 0;      // 0~jitter_us 추가
        double        drop_rate = 0.0;    // 응답 드롭 확률 0.0~1.0
        Reply         reply     = Reply::NONE;
    };

    FakeSerialDevice() : rng_(std::random_device{}()) {}
    explicit FakeSerialDevice(Config cfg) : cfg_(cfg), rng_(std::random_device{}()) {}

    void set_config(const Config& cfg);

    // ---- port 쪽 ----
    bool open(const std::string& target);
    void close();
    bool write(const std::uint8_t* data, std::size_t len);
    long read(std::uint8_t* buf, std::size_t cap);

    // ---- 테스트 제어 ----
    void set_fail_open(bool fail);
    void set_fail_writes(bool fail);
    // 링크 강제 끊김 (다음 write 부터 실패, 재open 하면 복구)
    void unplug();
    void inject_rx(const std::vector<std::uint8_t>& bytes);

    // ---- 관측 ----
    bool is_open() const;
    std::size_t packet_count() const;
    std::size_t valid_packet_count() const;
    std::vector<WirePacket> packets() const;
    int open_count() const;
    int close_count() const;
    std::string last_target() const;

private:
    struct Pending {
        std::uint64_t deliver_us;
        std::uint8_t  bytes[2];
    };

    void poll_locked_(std::uint64_t now_us);
    bool should_drop_();
    std::uint64_t rand_u64_(std::uint64_t lo, std::uint64_t hi);

    mutable std::mutex mu_;
    Config cfg_;

    bool open_ = false;
    bool fail_open_ = false;
    bool fail_writes_ = false;
    bool unplugged_ = false;
    int open_count_ = 0;
    int close_count_ = 0;
    std::string last_target_;

    std::vector<WirePacket> packets_;
    std::size_t valid_packets_ = 0;

    std::deque<std::uint8_t> rx_;
    std::deque<Pending> pending_rx_;

    std::mt19937 rng_;
};

// ISerialPort 로 보이는 FakeSerialDevice
class FakeSerialPort final : public ISerialPort {
public:
    explicit FakeSerialPort(std::shared_ptr<FakeSerialDevice> dev) : dev_(std::move(dev)) {}
    ~FakeSerialPort() override { close(); }

    bool open(const std::string& target, std::uint32_t baud) override;
    bool write(const std::uint8_t* data, std::size_t len, int timeout_ms) override;
    long read_available(std::uint8_t* buf, std::size_t cap) override;
    void close() override;
    bool is_open() const override { return open_; }

private:
    std::shared_ptr<FakeSerialDevice> dev_;
    bool open_ = false;
};

// Transport / Scheduler 에 넘길 factory
inline SerialPortFactory fake_port_factory(std::shared_ptr<FakeSerialDevice> dev) {
    return [dev] { return std::make_unique<FakeSerialPort>(dev); };
}
