#include "frame.hpp"
#include <algorithm>
#include <cmath>

bool Frame::valid_axis(double v) {
    return std::isfinite(v) && v >= -1.0 && v <= 1.0;
}

double Frame::clamp_axis(double v) {
    if (std::isnan(v)) return 0.0;
    return std::clamp(v, -1.0, 1.0);
}

int Frame::clamp_dpad(int v) {
    return std::clamp(v, -1, 1);
}

std::optional<Frame> Frame::make(const Buttons& b, const Axes& a, Dpad d) {
    for (double v : a) {
        if (!valid_axis(v)) return std::nullopt;
    }
    if (!valid_dpad(d.x) || !valid_dpad(d.y)) return std::nullopt;
    return Frame(b, a, d);
}

std::optional<Frame> Frame::from_raw(const RawFrame& raw, ErrorCode* err) {
    auto fail = [err]() -> std::optional<Frame> {
        if (err) *err = ErrorCode::VALIDATION;
        return std::nullopt;
    };

    if (raw.buttons.size() != NUM_BUTTONS) return fail();
    if (raw.axes.size() != NUM_AXES)       return fail();
    if (raw.dpad.size() != 2)              return fail();

    Buttons b{};
    Axes a{};
    std::copy(raw.buttons.begin(), raw.buttons.end(), b.begin());
    std::copy(raw.axes.begin(), raw.axes.end(), a.begin());

    auto f = make(b, a, Dpad{raw.dpad[0], raw.dpad[1]});
    if (!f) return fail();

    if (err) *err = ErrorCode::NONE;
    return f;
}

Frame Frame::clamped(const Buttons& b, const Axes& a, Dpad d) {
    Axes c{};
    for (std::size_t i = 0; i < NUM_AXES; ++i) c[i] = clamp_axis(a[i]);
    return Frame(b, c, Dpad{clamp_dpad(d.x), clamp_dpad(d.y)});
}

Frame Frame::with_button(std::size_t i, bool pressed) const {
    Buttons b = buttons_;
    b.at(i) = pressed;
    return Frame(b, axes_, dpad_);
}

Frame Frame::with_axis(std::size_t i, double v) const {
    Axes a = axes_;
    a.at(i) = clamp_axis(v);
    return Frame(buttons_, a, dpad_);
}

Frame Frame::with_dpad(Dpad d) const {
    return Frame(buttons_, axes_, Dpad{clamp_dpad(d.x), clamp_dpad(d.y)});
}

RawFrame Frame::to_raw() const {
    RawFrame r;
    r.buttons.assign(buttons_.begin(), buttons_.end());
    r.axes.assign(axes_.begin(), axes_.end());
    r.dpad = {dpad_.x, dpad_.y};
    return r;
}
