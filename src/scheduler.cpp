#include "scheduler.hpp"
#include <chrono>
#include <cmath>
#include <exception>
#include <iostream>
#include "frame_combiner.hpp"
#include "logger.hpp"

using steady = std::chrono::steady_clock;

Scheduler::Scheduler(PipelineConfig cfg, SerialPortFactory port_factory)
    : cfg_(std::move(cfg)),
      transport_(cfg_.transport, std::move(port_factory)),
      combined_ch_(cfg_.observe_capacity),
      output_ch_(cfg_.observe_capacity) {}

Scheduler::~Scheduler() {
    stop();
    transport_.close();
}

ErrorCode Scheduler::validate_config(const PipelineConfig& cfg) {
    if (!std::isfinite(cfg.rate_hz) || cfg.rate_hz <= 0.0) return ErrorCode::CONFIG;
    // t0 + period 가 steady_clock 범위를 넘으면 거부 (절반을 여유로 둠)
    const double max_period_s =
        std::chrono::duration<double>(steady::duration::max()).count() / 2.0;
    if (1.0 / cfg.rate_hz >= max_period_s) return ErrorCode::CONFIG;
    if (cfg.observe_capacity == 0) return ErrorCode::CONFIG;
    if (cfg.overrun_warn_ratio < 0.0) return ErrorCode::CONFIG;
    return ErrorCode::NONE;
}

bool Scheduler::add_source(std::shared_ptr<IFrameSource> src) {
    std::lock_guard<std::mutex> lk(lifecycle_mu_);
    if (!src || state() != SchedulerState::IDLE) return false;
    sources_.push_back(std::move(src));
    return true;
}

bool Scheduler::add_transform(std::shared_ptr<IFrameTransform> tf) {
    std::lock_guard<std::mutex> lk(lifecycle_mu_);
    if (!tf || state() != SchedulerState::IDLE) return false;
    transforms_.push_back(std::move(tf));
    return true;
}

void Scheduler::reset_stats_() {
    ticks_ = 0;
    sends_ok_ = 0;
    write_errors_ = 0;
    reconnects_ = 0;
    transform_failures_ = 0;
    source_failures_ = 0;
    fallback_ticks_ = 0;
    acks_ = 0;
    naks_ = 0;
    malformed_ = 0;
    overruns_ = 0;
    overrun_total_us_ = 0;
    overrun_max_us_ = 0;
    persistent_overrun_ = false;
    last_error_ = 0;
    transport_.reset_stats();
}

ErrorCode Scheduler::start() {
    std::lock_guard<std::mutex> lk(lifecycle_mu_);
    if (state() != SchedulerState::IDLE) return ErrorCode::BAD_STATE;

    const ErrorCode cfg_err = validate_config(cfg_);
    if (cfg_err != ErrorCode::NONE) {
        note_error_(cfg_err);
        return cfg_err;
    }

    reset_stats_();

    // 연결 실패는 시작 자체를 막음
    if (transport_.connect() != ErrorCode::NONE) {
        transport_.close();
        note_error_(ErrorCode::CONNECTION);
        return ErrorCode::CONNECTION;
    }

    last_good_ = Frame{};
    frames_.reserve(sources_.size());

    {
        std::lock_guard<std::mutex> wl(wait_mu_);
        stop_requested_ = false;
    }
    stop_flag_.store(false, std::memory_order_release);

    state_.store(SchedulerState::RUNNING, std::memory_order_release);
    worker_ = std::thread(&Scheduler::loop_, this);
    return ErrorCode::NONE;
}

void Scheduler::stop() {
    std::lock_guard<std::mutex> lk(lifecycle_mu_);
    if (state() != SchedulerState::RUNNING) return;

    state_.store(SchedulerState::STOPPING, std::memory_order_release);
    {
        std::lock_guard<std::mutex> wl(wait_mu_);
        stop_requested_ = true;
    }
    stop_flag_.store(true, std::memory_order_release);
    wait_cv_.notify_all();

    if (worker_.joinable()) worker_.join();

    transport_.close();
    state_.store(SchedulerState::IDLE, std::memory_order_release);
}

ErrorCode Scheduler::open_transport() {
    std::lock_guard<std::mutex> lk(lifecycle_mu_);
    if (state() != SchedulerState::IDLE) return ErrorCode::BAD_STATE;
    if (transport_.connect() != ErrorCode::NONE) {
        transport_.close();
        note_error_(ErrorCode::CONNECTION);
        return ErrorCode::CONNECTION;
    }
    return ErrorCode::NONE;
}

void Scheduler::close_transport() {
    std::lock_guard<std::mutex> lk(lifecycle_mu_);
    if (state() != SchedulerState::IDLE) return;
    transport_.close();
}

std::optional<Frame> Scheduler::step_once() {
    std::lock_guard<std::mutex> lk(lifecycle_mu_);
    if (state() != SchedulerState::IDLE) return std::nullopt;
    return run_tick_().frame;
}

Scheduler::TickResult Scheduler::run_tick_() {
    TickResult r;

    // 1) sources -> combine (실패한 source 는 이번 tick 에서 제외)
    frames_.clear();
    for (auto& src : sources_) {
        Frame f;
        bool ok = false;
        try {
            ok = src->read(f);
        } catch (const std::exception& e) {
            std::cerr << "[scheduler] source threw: " << e.what() << "\n";
            ok = false;
        } catch (...) {
            std::cerr << "[scheduler] source threw (non-std exception)\n";
            ok = false;
        }
        if (ok) {
            frames_.push_back(f);
        } else {
            source_failures_.fetch_add(1, std::memory_order_relaxed);
            note_error_(ErrorCode::SOURCE_FAILURE);
        }
    }

    const Frame merged = combine_frames(frames_);
    combined_ch_.publish(merged);

    // 2) transform chain. 하나라도 실패하면 이번 tick 체인 중단
    Frame cur = merged;
    bool chain_ok = true;
    for (auto& tf : transforms_) {
        Frame next;
        bool ok = false;
        try {
            ok = tf->apply(cur, next);
        } catch (const std::exception& e) {
            std::cerr << "[scheduler] transform threw: " << e.what() << "\n";
            ok = false;
        } catch (...) {
            std::cerr << "[scheduler] transform threw (non-std exception)\n";
            ok = false;
        }
        if (!ok) {
            chain_ok = false;
            break;
        }
        cur = next;
    }

    if (chain_ok) {
        last_good_ = cur;
    } else {
        transform_failures_.fetch_add(1, std::memory_order_relaxed);
        fallback_ticks_.fetch_add(1, std::memory_order_relaxed);
        note_error_(ErrorCode::TRANSFORM_FAILURE);

        cur = (cfg_.fallback == FallbackPolicy::HOLD_LAST_GOOD) ? last_good_ : Frame{};
        r.fallback = true;
    }

    // 3) 관찰 채널 (블록 안 함, 밀리면 오래된 것 버림)
    output_ch_.publish(cur);

    // 4) encode + send. write 실패는 기록만
    r.send_err = transport_.send_frame(cur);
    if (r.send_err == ErrorCode::NONE) {
        sends_ok_.fetch_add(1, std::memory_order_relaxed);
    } else {
        write_errors_.fetch_add(1, std::memory_order_relaxed);
        note_error_(r.send_err);
    }

    const ErrorCode resp = transport_.poll_responses();
    if (resp != ErrorCode::NONE) note_error_(resp);

    const TransportDebug td = transport_.debug();
    reconnects_.store(td.reconnects, std::memory_order_relaxed);
    acks_.store(td.acks, std::memory_order_relaxed);
    naks_.store(td.naks, std::memory_order_relaxed);
    malformed_.store(td.malformed, std::memory_order_relaxed);

    ticks_.fetch_add(1, std::memory_order_relaxed);

    r.frame = cur;
    return r;
}

void Scheduler::loop_() {
    // 어떤 경로로 빠져나가든 transport 는 닫힘
    struct TransportCloser {
        Transport& t;
        ~TransportCloser() { t.close(); }
    } closer{transport_};

    CSVLogger trace(cfg_.trace_csv_path);

    const auto period = std::chrono::duration_cast<steady::duration>(
        std::chrono::duration<double>(1.0 / cfg_.rate_hz));
    const double period_s = 1.0 / cfg_.rate_hz;

    bool warned = false;

    // stop 신호는 tick 경계에서만 확인
    while (!stop_flag_.load(std::memory_order_acquire)) {
        const auto t0 = steady::now();

        const TickResult r = run_tick_();

        const auto elapsed = steady::now() - t0;
        long overrun_us = 0;

        if (elapsed > period) {
            overrun_us = static_cast<long>(
                std::chrono::duration_cast<std::chrono::microseconds>(elapsed - period).count());
            const auto ou = static_cast<std::uint64_t>(overrun_us);

            overruns_.fetch_add(1, std::memory_order_relaxed);
            overrun_total_us_.fetch_add(ou, std::memory_order_relaxed);
            if (ou > overrun_max_us_.load(std::memory_order_relaxed)) {
                overrun_max_us_.store(ou, std::memory_order_relaxed);
            }
        }

        const std::uint64_t ticks = ticks_.load(std::memory_order_relaxed);
        const std::uint64_t late  = overruns_.load(std::memory_order_relaxed);
        const bool persistent =
            ticks >= cfg_.overrun_min_ticks &&
            static_cast<double>(late) > cfg_.overrun_warn_ratio * static_cast<double>(ticks);
        persistent_overrun_.store(persistent, std::memory_order_relaxed);

        if (persistent && !warned) {
            std::cerr << "[scheduler] persistent overrun: " << late << "/" << ticks
                      << " ticks late (period " << period_s * 1000.0 << " ms)\n";
            warned = true;
        }

        trace.log(ticks - 1, period_s,
                  r.fallback ? 1 : 0,
                  r.send_err == ErrorCode::NONE ? 1 : 0,
                  r.send_err == ErrorCode::NONE ? 0 : 1,
                  overrun_us, r.frame);

        // overrun 이면 deadline 이 이미 지났으므로 바로 다음 tick
        std::unique_lock<std::mutex> lk(wait_mu_);
        wait_cv_.wait_until(lk, t0 + period, [this] { return stop_requested_; });
    }
}

SchedulerStats Scheduler::stats() const {
    SchedulerStats s;
    s.state = state();
    s.ticks = ticks_.load(std::memory_order_relaxed);
    s.sends_ok = sends_ok_.load(std::memory_order_relaxed);
    s.write_errors = write_errors_.load(std::memory_order_relaxed);
    s.reconnects = reconnects_.load(std::memory_order_relaxed);
    s.transform_failures = transform_failures_.load(std::memory_order_relaxed);
    s.source_failures = source_failures_.load(std::memory_order_relaxed);
    s.fallback_ticks = fallback_ticks_.load(std::memory_order_relaxed);
    s.acks = acks_.load(std::memory_order_relaxed);
    s.naks = naks_.load(std::memory_order_relaxed);
    s.malformed_responses = malformed_.load(std::memory_order_relaxed);
    s.overruns = overruns_.load(std::memory_order_relaxed);
    s.overrun_total_us = overrun_total_us_.load(std::memory_order_relaxed);
    s.overrun_max_us = overrun_max_us_.load(std::memory_order_relaxed);
    s.persistent_overrun = persistent_overrun_.load(std::memory_order_relaxed);
    s.last_error = static_cast<ErrorCode>(last_error_.load(std::memory_order_relaxed));
    return s;
}
