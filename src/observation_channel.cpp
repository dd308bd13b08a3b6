#include "observation_channel.hpp"
#include <algorithm>
#include <cstring>

constexpr std::size_t FRAME_WORDS = 1 + NUM_AXES;

using FrameWords = std::array<std::uint64_t, FRAME_WORDS>;

// word0: buttons mask | dpad x << 16 | dpad y << 24, word1~6: 축 double 비트
static FrameWords pack(const Frame& f) {
    FrameWords w{};
    std::uint64_t head = 0;
    for (std::size_t i = 0; i < NUM_BUTTONS; ++i) {
        if (f.buttons()[i]) head |= (1ull << i);
    }
    head |= static_cast<std::uint64_t>(static_cast<std::uint8_t>(f.dpad().x)) << 16;
    head |= static_cast<std::uint64_t>(static_cast<std::uint8_t>(f.dpad().y)) << 24;
    w[0] = head;

    for (std::size_t i = 0; i < NUM_AXES; ++i) {
        std::memcpy(&w[1 + i], &f.axes()[i], sizeof(double));
    }
    return w;
}

static Frame unpack(const FrameWords& w) {
    Buttons b{};
    for (std::size_t i = 0; i < NUM_BUTTONS; ++i) b[i] = (w[0] >> i) & 1;

    const Dpad d{static_cast<std::int8_t>((w[0] >> 16) & 0xFF),
                 static_cast<std::int8_t>((w[0] >> 24) & 0xFF)};

    Axes a{};
    for (std::size_t i = 0; i < NUM_AXES; ++i) {
        std::memcpy(&a[i], &w[1 + i], sizeof(double));
    }
    return Frame::clamped(b, a, d);
}

// seqlock 슬롯: seq 홀수 = 쓰는 중, 짝수 = 안정
// 데이터도 전부 atomic word 라서 reader 가 찢어진 값을 읽어도 UB 아님 (seq 로 걸러냄)
struct ObservationSlot {
    std::atomic<std::uint64_t> seq{0};
    std::atomic<std::uint64_t> number{0};   // publish 번호 + 1 (0 = 빈 슬롯)
    std::array<std::atomic<std::uint64_t>, FRAME_WORDS> words{};
};

struct ObservationRing {
    explicit ObservationRing(std::size_t cap) : slots(cap) {}

    std::vector<ObservationSlot> slots;
    std::atomic<std::uint64_t> write_idx{0};
    std::atomic<std::size_t> attached{0};
};

// ----- ObservationChannel -----

ObservationChannel::ObservationChannel(std::size_t capacity)
    : ring_(std::make_shared<ObservationRing>(std::max<std::size_t>(capacity, 1))) {}

void ObservationChannel::publish(const Frame& f) {
    ObservationRing& r = *ring_;
    const std::uint64_t w = r.write_idx.load(std::memory_order_relaxed);
    ObservationSlot& slot = r.slots[w % r.slots.size()];

    const FrameWords words = pack(f);

    const std::uint64_t s = slot.seq.load(std::memory_order_relaxed);
    slot.seq.store(s + 1, std::memory_order_relaxed);
    std::atomic_thread_fence(std::memory_order_release);

    slot.number.store(w + 1, std::memory_order_relaxed);
    for (std::size_t i = 0; i < FRAME_WORDS; ++i) {
        slot.words[i].store(words[i], std::memory_order_relaxed);
    }

    slot.seq.store(s + 2, std::memory_order_release);
    r.write_idx.store(w + 1, std::memory_order_release);
}

FrameObserver ObservationChannel::attach() {
    ring_->attached.fetch_add(1, std::memory_order_relaxed);
    return FrameObserver(ring_, ring_->write_idx.load(std::memory_order_acquire));
}

std::size_t ObservationChannel::capacity() const {
    return ring_->slots.size();
}

std::size_t ObservationChannel::observers() const {
    return ring_->attached.load(std::memory_order_relaxed);
}

std::uint64_t ObservationChannel::published() const {
    return ring_->write_idx.load(std::memory_order_acquire);
}

// ----- FrameObserver -----

FrameObserver::FrameObserver(FrameObserver&& other) noexcept
    : ring_(std::move(other.ring_)), cursor_(other.cursor_), dropped_(other.dropped_) {
    other.ring_.reset();
}

FrameObserver& FrameObserver::operator=(FrameObserver&& other) noexcept {
    if (this != &other) {
        detach();
        ring_ = std::move(other.ring_);
        cursor_ = other.cursor_;
        dropped_ = other.dropped_;
        other.ring_.reset();
    }
    return *this;
}

void FrameObserver::detach() {
    if (!ring_) return;
    ring_->attached.fetch_sub(1, std::memory_order_relaxed);
    ring_.reset();
}

std::size_t FrameObserver::pending() const {
    if (!ring_) return 0;
    const std::uint64_t w = ring_->write_idx.load(std::memory_order_acquire);
    return static_cast<std::size_t>(std::min<std::uint64_t>(w - cursor_, ring_->slots.size()));
}

bool FrameObserver::poll(Frame& out) {
    if (!ring_) return false;
    ObservationRing& r = *ring_;
    const std::uint64_t cap = r.slots.size();

    while (true) {
        const std::uint64_t w = r.write_idx.load(std::memory_order_acquire);
        if (cursor_ == w) return false;

        // 한 바퀴 이상 밀렸으면 가장 오래된 유효 위치로 점프
        if (w - cursor_ > cap) {
            dropped_ += (w - cap) - cursor_;
            cursor_ = w - cap;
        }

        const ObservationSlot& slot = r.slots[cursor_ % cap];

        const std::uint64_t s1 = slot.seq.load(std::memory_order_acquire);
        if (s1 & 1) continue;   // writer 가 덮어쓰는 중

        const std::uint64_t number = slot.number.load(std::memory_order_relaxed);
        FrameWords words{};
        for (std::size_t i = 0; i < FRAME_WORDS; ++i) {
            words[i] = slot.words[i].load(std::memory_order_relaxed);
        }

        std::atomic_thread_fence(std::memory_order_acquire);
        const std::uint64_t s2 = slot.seq.load(std::memory_order_relaxed);
        if (s1 != s2) continue;

        // 읽는 사이에 다음 바퀴로 덮어써짐 -> write_idx 다시 보고 점프
        if (number != cursor_ + 1) continue;

        out = unpack(words);
        ++cursor_;
        return true;
    }
}
