#pragma once
#include <map>
#include <vector>
#include "data_types.hpp"
#include "track_registry.hpp"
#include "tracker_params.hpp"

// Candidate seed for a new track: an unmatched item from a recent frame
// paired with an unmatched item of the current frame.
struct SeedCandidate {
    int prev_item;
    int cur_item;
    int tight;   // look-ahead items within bound_tight of the seed line
    int loose;   // look-ahead items within birth_loose_factor * bound_tight
};

class TrackLifecycleManager {
public:
    explicit TrackLifecycleManager(const TrackerParams& params);

    // Expires stale confirmed tracks and discards stale provisional ones.
    // Returns the ids that left the active set.
    std::vector<int> expire_stale(TrackRegistry& registry, Timestamp now) const;

    // Promotes provisional tracks with enough matched items. Returns their ids.
    std::vector<int> promote(TrackRegistry& registry) const;

    // Seeds provisional tracks from the current frame's unmatched items and
    // the remembered unmatched items of recent frames. `lookahead` holds the
    // items of the following birth_lookahead ticks. Returns the new ids.
    std::vector<int> spawn_tracks(TrackRegistry& registry, const std::vector<Item>& items,
                                  Timestamp now, const std::vector<int>& unmatched,
                                  const std::vector<int>& lookahead) const;

    // Scored, coherent seed pairs, best first.
    std::vector<SeedCandidate> seed_candidates(const TrackRegistry& registry,
                                               const std::vector<Item>& items, Timestamp now,
                                               const std::vector<int>& unmatched,
                                               const std::vector<int>& lookahead) const;

    // Keeps the still-unassigned items of frame `now` for later births.
    void remember_unmatched(const TrackRegistry& registry, Timestamp now,
                            const std::vector<int>& unmatched);

    // Remembered items of the frames within birth_max_gap before `now`.
    std::vector<int> recent_unmatched(const TrackRegistry& registry, Timestamp now) const;

private:
    TrackerParams params_;
    std::map<Timestamp, std::vector<int>> pending_;
};
