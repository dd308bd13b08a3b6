#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>
#include "errors.hpp"

// =====================
// Index 규약 (강제는 안 함, 순서만 약속)
// =====================
enum Axis : std::size_t {
    LEFT_X = 0,
    LEFT_Y,
    RIGHT_X,
    RIGHT_Y,
    LEFT_TRIGGER,
    RIGHT_TRIGGER
};

enum Button : std::size_t {
    BTN_A = 0,
    BTN_B,
    BTN_X,
    BTN_Y,
    BTN_LB,
    BTN_RB,
    BTN_BACK,
    BTN_START,
    BTN_LS,
    BTN_RS
};

constexpr std::size_t NUM_BUTTONS = 10;
constexpr std::size_t NUM_AXES    = 6;

using Buttons = std::array<bool, NUM_BUTTONS>;
using Axes    = std::array<double, NUM_AXES>;

struct Dpad {
    int x = 0;   // -1 left, +1 right
    int y = 0;   // -1 down, +1 up

    bool operator==(const Dpad&) const = default;
};

namespace DpadDir {
    constexpr Dpad CENTER{0, 0};
    constexpr Dpad UP{0, 1};
    constexpr Dpad DOWN{0, -1};
    constexpr Dpad LEFT{-1, 0};
    constexpr Dpad RIGHT{1, 0};
    constexpr Dpad UP_LEFT{-1, 1};
    constexpr Dpad UP_RIGHT{1, 1};
    constexpr Dpad DOWN_LEFT{-1, -1};
    constexpr Dpad DOWN_RIGHT{1, -1};
}

// 느슨한 모양의 입력 (길이/범위 보장 없음)
struct RawFrame {
    std::vector<bool>   buttons;
    std::vector<double> axes;
    std::vector<int>    dpad;
};

// =====================
// Frame: 한 tick의 컨트롤러 상태 (불변 값 타입)
// - buttons 10개, axes 6개 ([-1, 1]), dpad 각 성분 {-1, 0, 1}
// - 생성 경로는 전부 불변식을 만족하는 값만 만든다
// =====================
class Frame {
public:
    // 전부 기본값 (버튼 off, 축 0.0, dpad 중앙)
    Frame() = default;

    // 범위 밖/NaN 이면 nullopt (자르거나 채우지 않음)
    static std::optional<Frame> make(const Buttons& b, const Axes& a, Dpad d);

    // 길이까지 검사. 실패 시 err 에 VALIDATION
    static std::optional<Frame> from_raw(const RawFrame& raw, ErrorCode* err = nullptr);

    // 명시적 clamp 생성 (combiner / transform 용)
    static Frame clamped(const Buttons& b, const Axes& a, Dpad d);

    const Buttons& buttons() const { return buttons_; }
    const Axes& axes() const { return axes_; }
    Dpad dpad() const { return dpad_; }

    bool button(std::size_t i) const { return buttons_.at(i); }
    double axis(std::size_t i) const { return axes_.at(i); }

    // 새 Frame 반환 (원본은 그대로)
    Frame with_button(std::size_t i, bool pressed) const;
    Frame with_axis(std::size_t i, double v) const;   // clamp 적용
    Frame with_dpad(Dpad d) const;                    // clamp 적용

    RawFrame to_raw() const;

    bool operator==(const Frame&) const = default;

    static bool valid_axis(double v);
    static bool valid_dpad(int v) { return v >= -1 && v <= 1; }
    static double clamp_axis(double v);
    static int clamp_dpad(int v);

private:
    Frame(const Buttons& b, const Axes& a, Dpad d)
        : buttons_(b), axes_(a), dpad_(d) {}

    Buttons buttons_{};
    Axes    axes_{};
    Dpad    dpad_{};
};
