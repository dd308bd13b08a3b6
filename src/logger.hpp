#pragma once
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <string>
#include "../include/frame.hpp"

// tick 단위 trace (scheduler 스레드에서만 씀)
struct CSVLogger {
    std::ofstream file;
    bool enabled = true;

    CSVLogger(const std::string& path, bool enable = true)
        : enabled(enable && !path.empty())
    {
        if (!enabled) return;
        file.open(path);
        if (!file.is_open()) {
            enabled = false;
            return;
        }
        file << "tick,time_s,fallback,sent,write_err,overrun_us,"
                "buttons,lx,ly,rx,ry,lt,rt,dx,dy\n";
        file.flush();
    }

    ~CSVLogger() {
        if (file.is_open()) file.close();
    }

    void log(
        std::uint64_t tick,
        double period_s,
        int fallback, int sent, int write_err,
        long overrun_us,
        const Frame& f
    ) {
        if (!enabled || !file.is_open()) return;

        const double time_s = static_cast<double>(tick) * period_s;

        unsigned mask = 0;
        for (std::size_t i = 0; i < NUM_BUTTONS; ++i) {
            if (f.buttons()[i]) mask |= (1u << i);
        }

        file << tick << ","
             << std::fixed << std::setprecision(3) << time_s << ","
             << fallback << "," << sent << "," << write_err << ","
             << overrun_us << ","
             << mask;
        for (std::size_t i = 0; i < NUM_AXES; ++i) {
            file << "," << std::setprecision(4) << f.axes()[i];
        }
        file << "," << f.dpad().x << "," << f.dpad().y << "\n";
    }
};
