#include "frame_combiner.hpp"

Frame combine_frames(const std::vector<Frame>& frames) {
    Buttons b{};
    Axes sum{};
    Dpad d{};

    for (const Frame& f : frames) {
        for (std::size_t i = 0; i < NUM_BUTTONS; ++i) {
            b[i] = b[i] || f.buttons()[i];
        }
        for (std::size_t i = 0; i < NUM_AXES; ++i) {
            sum[i] += f.axes()[i];
        }
        if (d.x == 0) d.x = f.dpad().x;
        if (d.y == 0) d.y = f.dpad().y;
    }

    return Frame::clamped(b, sum, d);
}
