#include "association.hpp"
#include "trajectory_model.hpp"
#include <algorithm>
#include <cmath>
#include <set>

AssociationResult associate_frame(const Frame& frame, const TrackRegistry& registry,
                                  const std::vector<Item>& items, int m, double bound_tight) {
    AssociationResult result;
    std::vector<int> track_ids = registry.active_ids();
    for (int id : track_ids) {
        const Track* track = registry.find(id);
        result.predictions[id] = predict_position(history_window(*track, items, m), m, frame.t);
    }

    // Gated candidates (track x item distance matrix, sparse).
    std::vector<Match> candidates;
    for (int id : track_ids) {
        const Prediction& p = result.predictions[id];
        for (const auto& item : frame.items) {
            double dist = std::hypot(item.x - p.x, item.y - p.y);
            if (dist <= bound_tight) candidates.push_back({id, item.id, dist});
        }
    }
    std::sort(candidates.begin(), candidates.end(), [](const Match& a, const Match& b) {
        if (a.distance != b.distance) return a.distance < b.distance;
        if (a.item_id != b.item_id) return a.item_id < b.item_id;
        return a.track_id < b.track_id;
    });

    std::set<int> used_tracks, used_items;
    for (const auto& c : candidates) {
        if (used_tracks.count(c.track_id) || used_items.count(c.item_id)) continue;
        used_tracks.insert(c.track_id);
        used_items.insert(c.item_id);
        result.matches.push_back(c);
    }

    for (const auto& item : frame.items) {
        if (!used_items.count(item.id)) result.unmatched_items.push_back(item.id);
    }
    std::sort(result.unmatched_items.begin(), result.unmatched_items.end());
    return result;
}

void apply_matches(TrackRegistry& registry, const AssociationResult& result, Timestamp t) {
    for (const auto& match : result.matches) {
        registry.append(match.track_id, match.item_id, t);
    }
}
