#include "tracker.hpp"
#include "association.hpp"
#include "errors.hpp"
#include "trajectory_model.hpp"
#include "visualizer.hpp"
#include <iostream>
#include <limits>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>

Tracker::Tracker(std::vector<Item> items, const TrackerParams& params)
    : items_(std::move(items)),
      params_(params),
      registry_(items_.size()),
      lifecycle_(params),
      started_(false),
      last_time_(0) {
    for (const auto& item : items_) {
        Frame& frame = frames_[item.t];
        frame.t = item.t;
        frame.items.push_back(item);
    }
}

TrackingResult Tracker::run(const SnapshotRenderer& renderer) {
    std::set<Timestamp> schedule;
    for (const auto& [t, frame] : frames_) schedule.insert(t);
    std::set<Timestamp> render_at(params_.vb.begin(), params_.vb.end());
    schedule.insert(render_at.begin(), render_at.end());

    for (Timestamp t : schedule) {
        auto it = frames_.find(t);
        Frame frame = it != frames_.end() ? it->second : Frame{t, {}};
        process_frame(frame);
        if (!render_at.count(t) || !renderer) continue;
        try {
            renderer(snapshot(frame));
        } catch (const RenderError& e) {
            std::cerr << "[WARN] t=" << t << ": " << e.what() << std::endl;
            render_warnings_.push_back(e.what());
        } catch (const std::exception& e) {
            std::cerr << "[WARN] t=" << t << ": renderer failed: " << e.what() << std::endl;
            render_warnings_.push_back(e.what());
        }
    }
    return result();
}

void Tracker::process_frame(const Frame& frame) {
    if (started_ && frame.t <= last_time_)
        throw std::logic_error("frame t=" + std::to_string(frame.t) + " is not after t=" +
                               std::to_string(last_time_));
    started_ = true;
    last_time_ = frame.t;

    lifecycle_.expire_stale(registry_, frame.t);

    AssociationResult assoc = associate_frame(frame, registry_, items_, params_.m, params_.bound_tight);
    apply_matches(registry_, assoc, frame.t);
    last_predictions_ = assoc.predictions;

    lifecycle_.promote(registry_);
    std::vector<int> born = lifecycle_.spawn_tracks(registry_, items_, frame.t, assoc.unmatched_items,
                                                    lookahead_items(frame.t));
    lifecycle_.remember_unmatched(registry_, frame.t, assoc.unmatched_items);

    if (params_.verbose) {
        std::cout << "[DEBUG] t=" << frame.t << ": " << frame.items.size() << " items, "
                  << assoc.predictions.size() << " active tracks, " << assoc.matches.size()
                  << " matched, " << born.size() << " new" << std::endl;
    }
}

Snapshot Tracker::snapshot(const Frame& frame) const {
    Snapshot snap;
    snap.t = frame.t;
    snap.bound_tight = params_.bound_tight;
    for (const auto& [id, track] : registry_.tracks()) {
        TrackView view;
        view.id = id;
        view.state = track.state;
        for (int item_id : track.items) view.history.push_back(items_[item_id]);
        std::vector<Item> window = history_window(track, items_, params_.m);
        LinearFit fit = fit_linear(window, params_.m);
        view.line_start = evaluate(fit, window.front().t);
        auto pred = last_predictions_.find(id);
        view.predicted = pred != last_predictions_.end() ? pred->second : evaluate(fit, frame.t);
        snap.tracks.push_back(std::move(view));
    }
    for (const auto& item : frame.items) {
        snap.items.push_back({item, registry_.is_consumed(item.id)});
    }
    for (int id : lifecycle_.recent_unmatched(registry_, frame.t)) {
        snap.leftovers.push_back(items_[id]);
    }
    return snap;
}

TrackingResult Tracker::result() const {
    TrackingResult out;
    std::vector<bool> reported(items_.size(), false);
    for (const auto& [id, track] : registry_.tracks()) {
        out.tracks.push_back(track);
        if (track.state == TrackState::Provisional) continue;
        out.obj_list.push_back(track.items);
        for (int item_id : track.items) reported[item_id] = true;
    }
    for (size_t i = 0; i < reported.size(); ++i) {
        if (!reported[i]) out.unassigned.push_back(static_cast<int>(i));
    }
    out.render_warnings = render_warnings_;
    return out;
}

std::vector<int> Tracker::lookahead_items(Timestamp t) const {
    std::vector<int> ids;
    auto end = t > std::numeric_limits<Timestamp>::max() - params_.birth_lookahead
                   ? frames_.end()
                   : frames_.upper_bound(t + params_.birth_lookahead);
    for (auto it = frames_.upper_bound(t); it != end; ++it) {
        for (const auto& item : it->second.items) ids.push_back(item.id);
    }
    return ids;
}

TrackingResult track_objects(const std::vector<double>& x, const std::vector<double>& y,
                             const std::vector<Timestamp>& t, const TrackerParams& params,
                             const SnapshotRenderer& renderer) {
    if (x.size() != y.size())
        throw InputShapeError("The shapes of x and y must be equal, whereas the shapes of x and y are " +
                              std::to_string(x.size()) + " and " + std::to_string(y.size()));
    if (x.size() != t.size())
        throw InputShapeError("The shapes of x and t must be equal, whereas the shapes of x and t are " +
                              std::to_string(x.size()) + " and " + std::to_string(t.size()));
    for (size_t i = 0; i < t.size(); ++i) {
        if (t[i] < 0)
            throw InputShapeError("Timestamps must be non-negative, whereas t[" + std::to_string(i) +
                                  "] is " + std::to_string(t[i]));
    }
    validate_params(params);

    std::vector<Item> items;
    items.reserve(x.size());
    for (size_t i = 0; i < x.size(); ++i) {
        items.push_back({static_cast<int>(i), x[i], y[i], t[i]});
    }
    Tracker tracker(std::move(items), params);
    if (renderer || params.vb.empty()) return tracker.run(renderer);
    return tracker.run(make_snapshot_renderer(params.vb_save));
}
