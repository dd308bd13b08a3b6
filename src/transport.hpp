#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "../include/errors.hpp"
#include "../include/pipeline_config.hpp"
#include "drivers/serial_port.hpp"
#include "drivers/wire_codec.hpp"

struct TransportDebug {
    bool headless = true;
    bool link_up = false;

    std::uint64_t sends_ok      = 0;
    std::uint64_t write_errors  = 0;
    std::uint64_t reconnects    = 0;

    std::uint64_t acks          = 0;
    std::uint64_t naks          = 0;
    std::uint64_t malformed     = 0;
};

// =====================
// Transport: 시리얼 링크 수명 관리 + codec 적용
// - target 없음/"MOCK*" -> headless (I/O 없이 항상 성공)
// - write 실패 -> 링크 down, reconnect_interval 마다 재연결 시도
// - close() 는 몇 번이든 안전
// - scheduler 스레드 하나만 사용 (내부 동기화 없음)
// =====================
class Transport {
public:
    explicit Transport(TransportConfig cfg, SerialPortFactory factory = {});
    ~Transport() { close(); }

    Transport(const Transport&) = delete;
    Transport& operator=(const Transport&) = delete;

    ErrorCode connect();
    ErrorCode send(const std::uint8_t* data, std::size_t len);
    ErrorCode send_frame(const Frame& f);
    void close();

    // 장치 응답 비블록 수집. 이번 호출에서 본 마지막 에러(NAK/MALFORMED) 또는 NONE
    ErrorCode poll_responses();

    bool headless() const { return headless_; }
    bool link_up() const { return port_ && port_->is_open(); }

    TransportDebug debug() const;
    void reset_stats();

    static bool is_headless_target(const std::string& target);

private:
    bool try_reopen_();

    TransportConfig cfg_;
    SerialPortFactory factory_;
    std::unique_ptr<ISerialPort> port_;
    bool headless_ = true;

    std::chrono::steady_clock::time_point next_reconnect_{};

    std::vector<std::uint8_t> rx_;

    std::uint64_t sends_ok_     = 0;
    std::uint64_t write_errors_ = 0;
    std::uint64_t reconnects_   = 0;
    std::uint64_t acks_         = 0;
    std::uint64_t naks_         = 0;
    std::uint64_t malformed_    = 0;
};
