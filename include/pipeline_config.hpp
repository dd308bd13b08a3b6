#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

// transform 실패 시 이번 tick에 내보낼 Frame
enum class FallbackPolicy {
    HOLD_LAST_GOOD,   // 마지막으로 정상 publish 된 Frame 재전송
    NEUTRAL           // 기본 Frame (버튼 off, 축 0, dpad 중앙)
};

inline const char* fallback_to_string(FallbackPolicy p) {
    switch (p) {
        case FallbackPolicy::HOLD_LAST_GOOD: return "HOLD_LAST_GOOD";
        case FallbackPolicy::NEUTRAL:        return "NEUTRAL";
        default:                             return "UNKNOWN";
    }
}

struct TransportConfig {
    // 비어있거나 "MOCK"으로 시작하면 headless (I/O 없음)
    std::string target;
    std::uint32_t baud = 115200;

    int write_timeout_ms      = 5;
    int reconnect_interval_ms = 500;

    // 장치가 status 응답(0xFE, code)을 보내는 경우만 true
    bool expect_ack = false;
};

struct PipelineConfig {
    double rate_hz = 200.0;   // 5ms 주기
    FallbackPolicy fallback = FallbackPolicy::HOLD_LAST_GOOD;

    TransportConfig transport{};

    std::size_t observe_capacity = 64;

    // 늦은 tick 비율이 이 값을 넘으면 persistent_overrun 보고 (치명적 아님)
    double overrun_warn_ratio = 0.05;
    std::uint64_t overrun_min_ticks = 200;

    // 비어있으면 CSV trace 안 씀
    std::string trace_csv_path;
};
