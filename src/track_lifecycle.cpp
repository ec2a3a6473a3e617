#include "track_lifecycle.hpp"
#include "trajectory_model.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <set>
#include <utility>

TrackLifecycleManager::TrackLifecycleManager(const TrackerParams& params) : params_(params) {}

std::vector<int> TrackLifecycleManager::expire_stale(TrackRegistry& registry, Timestamp now) const {
    std::vector<int> gone;
    for (int id : registry.active_ids()) {
        const Track* track = registry.find(id);
        if (now - track->last_update_time <= params_.time_limit) continue;
        if (track->state == TrackState::Provisional) {
            if (params_.verbose)
                std::cout << "[DEBUG] t=" << now << ": discarding provisional track " << id << std::endl;
            registry.remove(id);
        } else {
            if (params_.verbose)
                std::cout << "[DEBUG] t=" << now << ": track " << id << " expired (last update t="
                          << track->last_update_time << ")" << std::endl;
            registry.set_state(id, TrackState::Expired);
        }
        gone.push_back(id);
    }
    return gone;
}

std::vector<int> TrackLifecycleManager::promote(TrackRegistry& registry) const {
    std::vector<int> promoted;
    for (int id : registry.active_ids()) {
        const Track* track = registry.find(id);
        if (track->state != TrackState::Provisional || track->hits < params_.confirm_hits) continue;
        registry.set_state(id, TrackState::Confirmed);
        promoted.push_back(id);
        if (params_.verbose)
            std::cout << "[DEBUG] track " << id << " confirmed with " << track->items.size()
                      << " items" << std::endl;
    }
    return promoted;
}

std::vector<SeedCandidate> TrackLifecycleManager::seed_candidates(
    const TrackRegistry& registry, const std::vector<Item>& items, Timestamp now,
    const std::vector<int>& unmatched, const std::vector<int>& lookahead) const {
    std::vector<int> current;
    for (int id : unmatched) {
        if (!registry.is_consumed(id)) current.push_back(id);
    }
    std::sort(current.begin(), current.end());
    std::vector<int> previous = recent_unmatched(registry, now);

    const double loose_bound = params_.bound_tight * params_.birth_loose_factor;
    std::vector<SeedCandidate> candidates;
    for (int p : previous) {
        const Item& a = items.at(p);
        for (int c : current) {
            const Item& b = items.at(c);
            Timestamp dt = b.t - a.t;
            if (dt <= 0) continue;
            double step = std::hypot(b.x - a.x, b.y - a.y) / static_cast<double>(dt);
            if (step > params_.birth_max_speed) continue;

            LinearFit line = fit_linear({a, b}, 2);
            SeedCandidate seed{p, c, 0, 0};
            for (int f : lookahead) {
                const Item& future = items.at(f);
                Prediction at = evaluate(line, future.t);
                double dist = std::hypot(future.x - at.x, future.y - at.y);
                if (dist <= params_.bound_tight) seed.tight++;
                if (dist <= loose_bound) seed.loose++;
            }
            if (seed.tight >= params_.birth_min_support) candidates.push_back(seed);
        }
    }
    std::sort(candidates.begin(), candidates.end(), [](const SeedCandidate& l, const SeedCandidate& r) {
        int ls = l.tight + l.loose, rs = r.tight + r.loose;
        if (ls != rs) return ls > rs;
        if (l.prev_item != r.prev_item) return l.prev_item < r.prev_item;
        return l.cur_item < r.cur_item;
    });
    return candidates;
}

std::vector<int> TrackLifecycleManager::spawn_tracks(TrackRegistry& registry,
                                                     const std::vector<Item>& items, Timestamp now,
                                                     const std::vector<int>& unmatched,
                                                     const std::vector<int>& lookahead) const {
    std::vector<int> born;
    std::set<int> used;
    for (const auto& seed : seed_candidates(registry, items, now, unmatched, lookahead)) {
        if (used.count(seed.prev_item) || used.count(seed.cur_item)) continue;
        used.insert(seed.prev_item);
        used.insert(seed.cur_item);
        int id = registry.create({seed.prev_item, seed.cur_item}, now);
        born.push_back(id);
        if (params_.verbose)
            std::cout << "[DEBUG] t=" << now << ": new track " << id << " from items "
                      << seed.prev_item << ", " << seed.cur_item << " (support " << seed.tight
                      << "/" << seed.loose << ")" << std::endl;
    }
    return born;
}

void TrackLifecycleManager::remember_unmatched(const TrackRegistry& registry, Timestamp now,
                                               const std::vector<int>& unmatched) {
    std::vector<int> left;
    for (int id : unmatched) {
        if (!registry.is_consumed(id)) left.push_back(id);
    }
    if (!left.empty()) pending_[now] = std::move(left);
    // Frames older than this can no longer seed a birth.
    pending_.erase(pending_.begin(), pending_.lower_bound(now - (params_.birth_max_gap - 1)));
}

std::vector<int> TrackLifecycleManager::recent_unmatched(const TrackRegistry& registry,
                                                         Timestamp now) const {
    std::vector<int> ids;
    for (const auto& [t, frame_items] : pending_) {
        if (t >= now || now - t > params_.birth_max_gap) continue;
        for (int id : frame_items) {
            if (!registry.is_consumed(id)) ids.push_back(id);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}
