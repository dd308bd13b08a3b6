#pragma once
#include <vector>
#include "../include/frame.hpp"

// 여러 source 결과를 tick당 Frame 하나로 병합
// - buttons: OR
// - axes: 합산 후 [-1, 1] clamp
// - dpad: 등록 순서상 첫 non-zero (x, y 각각 독립)
// - source 0개면 기본 Frame
Frame combine_frames(const std::vector<Frame>& frames);
