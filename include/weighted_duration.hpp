#pragma once
#include <cstdint>
#include <vector>

// Sub-frame event length. Each frame is weighted by how far it sits between
// the baseline (0.0) and the event's own median brightness (1.0); frames at or
// above the median count as fully open.
//
// Falls back to duration_frames when there are no samples or when the event
// median does not rise above the baseline.
double weighted_duration_frames(const std::vector<double>& brightness_values, double baseline,
                                int64_t duration_frames);
