#pragma once
#include <functional>
#include <map>
#include <string>
#include <vector>
#include "data_types.hpp"
#include "tracker_params.hpp"
#include "track_registry.hpp"
#include "track_lifecycle.hpp"

// Receives a read-only snapshot for every requested timestamp. May throw
// RenderError; tracking continues regardless.
using SnapshotRenderer = std::function<void(const Snapshot&)>;

struct TrackingResult {
    // Input indices per track, for tracks that reached Confirmed (including
    // those that have since expired), in track id order.
    std::vector<std::vector<int>> obj_list;
    // Indices in no obj_list entry, ascending.
    std::vector<int> unassigned;
    std::vector<Track> tracks;
    std::vector<std::string> render_warnings;
};

class Tracker {
public:
    Tracker(std::vector<Item> items, const TrackerParams& params);

    // Visits every frame (and every params.vb timestamp) in increasing time
    // order, handing a snapshot to the renderer at the vb timestamps.
    TrackingResult run(const SnapshotRenderer& renderer = nullptr);

    // One tracking step: expiry, association, promotion, birth. Frames must
    // arrive in strictly increasing time order.
    void process_frame(const Frame& frame);

    Snapshot snapshot(const Frame& frame) const;
    TrackingResult result() const;

    const TrackRegistry& registry() const { return registry_; }
    const std::map<Timestamp, Frame>& frames() const { return frames_; }

private:
    std::vector<Item> items_;
    TrackerParams params_;
    std::map<Timestamp, Frame> frames_;
    TrackRegistry registry_;
    TrackLifecycleManager lifecycle_;
    bool started_;
    Timestamp last_time_;
    std::map<int, Prediction> last_predictions_;
    std::vector<std::string> render_warnings_;

    std::vector<int> lookahead_items(Timestamp t) const;
};

// Groups the observations into tracks. x, y and t must have equal lengths and
// t must be non-negative (InputShapeError); params are validated first (ParameterError). Without a
// renderer, snapshots requested through params.vb go to the OpenCV renderer.
TrackingResult track_objects(const std::vector<double>& x, const std::vector<double>& y,
                             const std::vector<Timestamp>& t, const TrackerParams& params = {},
                             const SnapshotRenderer& renderer = nullptr);
