#pragma once
#include <vector>

// Brightness of a recording with three shutter clicks: baseline ~20, plateau ~180,
// ramps on both sides of every event.
inline std::vector<double> sample_brightness_series() {
    return {
        // closed, frames 0-9
        20.0, 21.0, 19.0, 20.0, 22.0, 18.0, 21.0, 20.0, 19.0, 20.0,
        // event 1 opens at frame 10
        40.0, 80.0, 140.0, 175.0, 180.0, 182.0, 180.0, 178.0, 180.0, 140.0, 80.0, 40.0,
        20.0, 21.0, 19.0,
        20.0, 18.0, 21.0, 20.0, 19.0, 22.0, 20.0, 18.0, 21.0, 20.0,
        // event 2 opens at frame 35
        50.0, 120.0, 175.0, 180.0, 178.0, 140.0, 60.0, 21.0, 20.0, 19.0,
        20.0, 21.0, 18.0, 20.0, 22.0, 19.0, 20.0, 21.0, 20.0, 18.0,
        // event 3 opens at frame 55
        30.0, 60.0, 100.0, 150.0, 175.0, 180.0, 182.0, 180.0, 181.0, 180.0,
        180.0, 179.0, 180.0, 181.0, 180.0, 178.0, 150.0, 100.0, 60.0, 30.0,
        // closed
        20.0, 21.0, 19.0, 20.0, 18.0, 21.0, 20.0, 19.0, 22.0, 20.0};
}
