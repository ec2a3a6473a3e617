#pragma once
#include <map>
#include <vector>
#include "data_types.hpp"

// Owns every track of a run, keyed by track id, and remembers which track
// consumed each item. An item is consumed at most once, even if its track
// is later removed.
class TrackRegistry {
public:
    static constexpr int kNoTrack = -1;

    explicit TrackRegistry(size_t num_items);

    // New provisional track holding the given items (chronological).
    int create(const std::vector<int>& item_ids, Timestamp last_time);
    void append(int track_id, int item_id, Timestamp t);
    void set_state(int track_id, TrackState state);
    void remove(int track_id);

    Track* find(int track_id);
    const Track* find(int track_id) const;
    int owner_of(int item_id) const;
    bool is_consumed(int item_id) const;

    // Ids of non-expired tracks, ascending.
    std::vector<int> active_ids() const;
    const std::map<int, Track>& tracks() const { return tracks_; }
    size_t size() const { return tracks_.size(); }

private:
    std::map<int, Track> tracks_;
    std::vector<int> item_owner_;
    std::vector<bool> item_consumed_;
    int next_id_;

    Track& get(int track_id);
    void claim(int item_id, int track_id);
};
