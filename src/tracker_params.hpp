#pragma once
#include <string>
#include <vector>
#include "data_types.hpp"

struct TrackerParams {
    int m = 5;                    // regression window (most recent items)
    double bound_tight = 0.05;    // gating radius
    Timestamp time_limit = 5;     // ticks of inactivity before a track expires

    // Track birth and confirmation
    Timestamp birth_max_gap = 1;      // max ticks between the two seed items
    double birth_max_speed = 0.25;    // max seed displacement per tick
    Timestamp birth_lookahead = 5;    // ticks scanned for supporting items
    int birth_min_support = 2;        // supporting items within bound_tight
    double birth_loose_factor = 2.0;  // loose support radius, in bound_tight
    int confirm_hits = 2;             // matched items to leave Provisional

    std::vector<Timestamp> vb;    // timestamps to render, non-negative
    std::string vb_save;          // output prefix; empty shows a window
    bool verbose = false;
};

// Throws ParameterError on the first out-of-range field.
void validate_params(const TrackerParams& params);
