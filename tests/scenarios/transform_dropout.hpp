#pragma once

// transform 이 [fail_start, fail_end) 구간에서 실패
struct TransformDropout {
  const char* name() const { return "SCENARIO: transform dropout window"; }

  int end_tick()   const { return 60; }
  int fail_start() const { return 10; }
  int fail_end()   const { return 30; }

  bool failing(int tick) const { return tick >= fail_start() && tick < fail_end(); }
};
