#pragma once
#include "../../include/frame.hpp"

// 두 source 가 같은 축을 동시에 밀 때 (합 1.8 -> clamp 1.0)
// A: dpad y 는 앞 25 tick 동안만 위, x 는 항상 0
// B: dpad 항상 (-1, -1)
struct TriggerOverlapA {
  const char* name() const { return "SCENARIO: overlap source A"; }

  int end_tick() const { return 50; }
  int dpad_release_tick() const { return 25; }

  bool frame(int tick, Frame& out) const {
    Buttons b{};
    b[BTN_A] = true;
    Axes a{};
    a[LEFT_X] = 0.9;
    a[LEFT_Y] = -0.9;
    a[RIGHT_TRIGGER] = 0.9;
    auto f = Frame::make(b, a, Dpad{0, (tick < dpad_release_tick()) ? 1 : 0});
    if (!f) return false;
    out = *f;
    return true;
  }
};

struct TriggerOverlapB {
  const char* name() const { return "SCENARIO: overlap source B"; }

  int end_tick() const { return 50; }

  bool frame(int /*tick*/, Frame& out) const {
    Buttons b{};
    b[BTN_B] = true;
    Axes a{};
    a[LEFT_X] = 0.9;
    a[LEFT_Y] = -0.9;
    a[RIGHT_TRIGGER] = 0.9;
    auto f = Frame::make(b, a, Dpad{-1, -1});
    if (!f) return false;
    out = *f;
    return true;
  }
};
