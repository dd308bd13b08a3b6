#pragma once
#include <atomic>
#include "frame_source.hpp"

// Scenario 는 const로 받아도 frame(tick)만 계산하니까 const 유지 가능
// ScenarioT 요구사항: end_tick(), bool frame(int tick, Frame& out) const
template <typename ScenarioT>
class ScenarioFrameSource final : public IFrameSource {
public:
    explicit ScenarioFrameSource(const ScenarioT& sc, bool loop = false)
        : sc_(sc), loop_(loop) {}

    bool read(Frame& out) override {
        int t = tick_.load(std::memory_order_relaxed);
        if (t >= sc_.end_tick()) {
            if (!loop_) return false;
            t = 0;
        }
        const bool ok = sc_.frame(t, out);
        tick_.store(t + 1, std::memory_order_relaxed);
        return ok;
    }

    int tick() const { return tick_.load(std::memory_order_relaxed); }

private:
    const ScenarioT& sc_;
    bool loop_ = false;
    std::atomic<int> tick_{0};
};
