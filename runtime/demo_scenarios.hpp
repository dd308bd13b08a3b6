#pragma once
#include <cmath>
#include "frame.hpp"

// 왼쪽 스틱 원 그리기 + RT 톱니파 + A 버튼 1Hz 토글
struct CircleDemo {
  double rate_hz = 200.0;

  int end_tick() const { return static_cast<int>(rate_hz * 4.0); }   // 4초 한 바퀴

  bool frame(int tick, Frame& out) const {
    const double t = tick / rate_hz;
    constexpr double PI = 3.14159265358979323846;
    const double w = 2.0 * PI / 4.0;

    Buttons b{};
    b[BTN_A] = (static_cast<int>(t) % 2) == 0;

    Axes a{};
    a[LEFT_X] = std::cos(w * t);
    a[LEFT_Y] = std::sin(w * t);
    a[RIGHT_TRIGGER] = std::fmod(t, 1.0);

    const Dpad d = (a[LEFT_Y] > 0.7) ? DpadDir::UP : (a[LEFT_Y] < -0.7) ? DpadDir::DOWN : DpadDir::CENTER;

    auto f = Frame::make(b, a, d);
    if (!f) return false;
    out = *f;
    return true;
  }
};
