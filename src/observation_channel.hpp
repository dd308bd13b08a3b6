#pragma once
#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>
#include "../include/frame.hpp"

// 링 버퍼 (writer 1 + reader N). 정의는 observation_channel.cpp
struct ObservationRing;

// =====================
// FrameObserver: 채널에서 Frame을 자기 속도로 읽는 핸들
// - attach 시점 이후 publish 된 Frame만 보임 (backlog 없음)
// - 못 따라가면 오래된 것부터 빠짐 (중복/역순 없음)
// - 한 observer 핸들은 한 스레드에서만 사용
// =====================
class FrameObserver {
public:
    FrameObserver() = default;
    ~FrameObserver() { detach(); }

    FrameObserver(FrameObserver&& other) noexcept;
    FrameObserver& operator=(FrameObserver&& other) noexcept;
    FrameObserver(const FrameObserver&) = delete;
    FrameObserver& operator=(const FrameObserver&) = delete;

    // 읽을 게 없으면 false (블록 안 함)
    bool poll(Frame& out);

    // 지금 밀려있는 개수 (최대 capacity)
    std::size_t pending() const;

    // 지금까지 놓친 Frame 수
    std::uint64_t dropped() const { return dropped_; }

    bool attached() const { return ring_ != nullptr; }
    void detach();

private:
    friend class ObservationChannel;
    FrameObserver(std::shared_ptr<ObservationRing> ring, std::uint64_t cursor)
        : ring_(std::move(ring)), cursor_(cursor) {}

    std::shared_ptr<ObservationRing> ring_;
    std::uint64_t cursor_ = 0;
    std::uint64_t dropped_ = 0;
};

// =====================
// ObservationChannel: drop-oldest 브로드캐스트
// - publish() 는 scheduler 스레드 전용, lock 없음, 절대 블록 안 함
// - attach()/detach() 는 아무 스레드에서 언제든 가능 (실행 중 포함)
// =====================
class ObservationChannel {
public:
    explicit ObservationChannel(std::size_t capacity);

    ObservationChannel(const ObservationChannel&) = delete;
    ObservationChannel& operator=(const ObservationChannel&) = delete;

    void publish(const Frame& f);

    FrameObserver attach();

    std::size_t capacity() const;
    std::size_t observers() const;
    std::uint64_t published() const;

private:
    std::shared_ptr<ObservationRing> ring_;
};
