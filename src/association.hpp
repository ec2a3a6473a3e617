#pragma once
#include <map>
#include <vector>
#include "data_types.hpp"
#include "track_registry.hpp"

struct Match {
    int track_id;
    int item_id;
    double distance;
};

struct AssociationResult {
    std::vector<Match> matches;            // in acceptance order
    std::vector<int> unmatched_items;      // ascending item id
    std::map<int, Prediction> predictions; // per active track, at the frame time
};

// Gated greedy nearest-first matching of one frame against the active
// tracks. Candidates farther than bound_tight from a track's prediction are
// dropped; the rest are accepted by ascending distance, then item id, then
// track id, each track and item at most once.
AssociationResult associate_frame(const Frame& frame, const TrackRegistry& registry,
                                  const std::vector<Item>& items, int m, double bound_tight);

// Appends every matched item to its track.
void apply_matches(TrackRegistry& registry, const AssociationResult& result, Timestamp t);
