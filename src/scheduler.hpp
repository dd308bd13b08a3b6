#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>
#include "../include/errors.hpp"
#include "../include/frame.hpp"
#include "../include/pipeline_config.hpp"
#include "../include/io/frame_source.hpp"
#include "../include/io/frame_transform.hpp"
#include "observation_channel.hpp"
#include "transport.hpp"

enum class SchedulerState {
    IDLE,
    RUNNING,
    STOPPING
};

inline const char* state_to_string(SchedulerState s) {
    switch (s) {
        case SchedulerState::IDLE:     return "IDLE";
        case SchedulerState::RUNNING:  return "RUNNING";
        case SchedulerState::STOPPING: return "STOPPING";
        default:                       return "UNKNOWN";
    }
}

struct SchedulerStats {
    SchedulerState state = SchedulerState::IDLE;

    std::uint64_t ticks              = 0;
    std::uint64_t sends_ok           = 0;
    std::uint64_t write_errors       = 0;
    std::uint64_t reconnects         = 0;
    std::uint64_t transform_failures = 0;
    std::uint64_t source_failures    = 0;
    std::uint64_t fallback_ticks     = 0;

    std::uint64_t acks                = 0;
    std::uint64_t naks                = 0;
    std::uint64_t malformed_responses = 0;

    // drift
    std::uint64_t overruns         = 0;
    std::uint64_t overrun_total_us = 0;
    std::uint64_t overrun_max_us   = 0;
    bool persistent_overrun        = false;

    ErrorCode last_error = ErrorCode::NONE;
};

// =====================
// Scheduler: 실시간 tick 루프
//  IDLE -> RUNNING -> STOPPING -> IDLE (재시작 가능)
//  tick: sources -> combine -> transforms(+fallback) -> observe -> encode/send
//  - 전용 스레드 하나가 transport / channel 의 유일한 writer
//  - tick 단위 에러는 카운터로만 남고 루프는 계속 돈다
//  - 밀린 tick 은 따라잡지 않음 (overrun 기록 후 바로 다음 tick)
// =====================
class Scheduler {
public:
    explicit Scheduler(PipelineConfig cfg, SerialPortFactory port_factory = {});
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    // IDLE 에서만 가능 (실행 중 구성 변경은 거부)
    bool add_source(std::shared_ptr<IFrameSource> src);
    bool add_transform(std::shared_ptr<IFrameTransform> tf);

    // CONFIG / CONNECTION / BAD_STATE 만 돌려줌
    ErrorCode start();

    // 아무 스레드에서 호출 가능. 루프 종료 + transport close 후 리턴
    void stop();

    // ---- 타이밍 없는 수동 구동 (IDLE 전용, 테스트/오프라인 재생용) ----
    ErrorCode open_transport();
    void close_transport();
    std::optional<Frame> step_once();

    SchedulerState state() const { return state_.load(std::memory_order_acquire); }
    SchedulerStats stats() const;

    // combine 직후 (transform 전)
    ObservationChannel& combined() { return combined_ch_; }
    // 실제 publish 된 Frame
    ObservationChannel& output() { return output_ch_; }

    const PipelineConfig& config() const { return cfg_; }

    static ErrorCode validate_config(const PipelineConfig& cfg);

private:
    struct TickResult {
        Frame frame;
        bool fallback = false;
        ErrorCode send_err = ErrorCode::NONE;
    };

    TickResult run_tick_();
    void loop_();
    void reset_stats_();
    void note_error_(ErrorCode e) {
        last_error_.store(static_cast<std::uint16_t>(e), std::memory_order_relaxed);
    }

private:
    PipelineConfig cfg_;

    std::vector<std::shared_ptr<IFrameSource>> sources_;
    std::vector<std::shared_ptr<IFrameTransform>> transforms_;

    Transport transport_;
    ObservationChannel combined_ch_;
    ObservationChannel output_ch_;

    // 루프 스레드 전용
    Frame last_good_{};
    std::vector<Frame> frames_;

    std::atomic<SchedulerState> state_{SchedulerState::IDLE};
    std::mutex lifecycle_mu_;
    std::thread worker_;

    std::mutex wait_mu_;
    std::condition_variable wait_cv_;
    bool stop_requested_ = false;   // wait_mu_ 보호
    std::atomic<bool> stop_flag_{false};

    // ---- stats (루프 스레드가 쓰고 아무나 읽음) ----
    std::atomic<std::uint64_t> ticks_{0};
    std::atomic<std::uint64_t> sends_ok_{0};
    std::atomic<std::uint64_t> write_errors_{0};
    std::atomic<std::uint64_t> reconnects_{0};
    std::atomic<std::uint64_t> transform_failures_{0};
    std::atomic<std::uint64_t> source_failures_{0};
    std::atomic<std::uint64_t> fallback_ticks_{0};
    std::atomic<std::uint64_t> acks_{0};
    std::atomic<std::uint64_t> naks_{0};
    std::atomic<std::uint64_t> malformed_{0};
    std::atomic<std::uint64_t> overruns_{0};
    std::atomic<std::uint64_t> overrun_total_us_{0};
    std::atomic<std::uint64_t> overrun_max_us_{0};
    std::atomic<bool> persistent_overrun_{false};
    std::atomic<std::uint16_t> last_error_{0};
};
