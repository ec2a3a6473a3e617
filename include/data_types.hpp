#pragma once
#include <cstdint>
#include <string>
#include <vector>

using Timestamp = std::int64_t;

struct Item {
    int id;          // index into the input arrays
    double x, y;     // normalized to [0, 1]
    Timestamp t;
};

struct Frame {
    Timestamp t;
    std::vector<Item> items;
};

enum class TrackState { Provisional, Confirmed, Expired };

struct Track {
    int id;
    std::vector<int> items;      // item ids, chronological
    TrackState state;
    Timestamp last_update_time;
    int hits;                    // items matched after birth
};

struct Prediction {
    double x, y;
    bool extrapolated; // false when falling back to the last known position
};

// Read-only view of the tracker state handed to the renderer.
struct TrackView {
    int id;
    TrackState state;
    std::vector<Item> history;
    Prediction line_start;  // fit evaluated at the oldest item of the window
    Prediction predicted;
};

struct ItemView {
    Item item;
    bool assigned;
};

struct Snapshot {
    Timestamp t;
    double bound_tight;
    std::vector<TrackView> tracks;
    std::vector<ItemView> items;     // items of this frame
    std::vector<Item> leftovers;     // unmatched items of the previous frame
};

inline const char* to_string(TrackState state) {
    switch (state) {
        case TrackState::Provisional: return "provisional";
        case TrackState::Confirmed: return "confirmed";
        case TrackState::Expired: return "expired";
    }
    return "unknown";
}
