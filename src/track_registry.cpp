#include "track_registry.hpp"
#include <stdexcept>
#include <string>
#include <utility>

TrackRegistry::TrackRegistry(size_t num_items)
    : item_owner_(num_items, kNoTrack), item_consumed_(num_items, false), next_id_(0) {}

int TrackRegistry::create(const std::vector<int>& item_ids, Timestamp last_time) {
    if (item_ids.empty()) throw std::logic_error("cannot create a track without items");
    for (int item_id : item_ids) {
        if (is_consumed(item_id))
            throw std::logic_error("item " + std::to_string(item_id) + " already assigned");
    }
    int id = next_id_++;
    for (int item_id : item_ids) claim(item_id, id);
    Track track;
    track.id = id;
    track.items = item_ids;
    track.state = TrackState::Provisional;
    track.last_update_time = last_time;
    track.hits = 0;
    tracks_.emplace(id, std::move(track));
    return id;
}

void TrackRegistry::append(int track_id, int item_id, Timestamp t) {
    Track& track = get(track_id);
    if (track.state == TrackState::Expired)
        throw std::logic_error("track " + std::to_string(track_id) + " is expired");
    if (t <= track.last_update_time)
        throw std::logic_error("track " + std::to_string(track_id) + ": append at t=" +
                               std::to_string(t) + " not after " +
                               std::to_string(track.last_update_time));
    claim(item_id, track_id);
    track.items.push_back(item_id);
    track.last_update_time = t;
    track.hits++;
}

void TrackRegistry::set_state(int track_id, TrackState state) {
    get(track_id).state = state;
}

void TrackRegistry::remove(int track_id) {
    auto it = tracks_.find(track_id);
    if (it == tracks_.end())
        throw std::logic_error("unknown track " + std::to_string(track_id));
    for (int item_id : it->second.items) item_owner_[item_id] = kNoTrack;
    tracks_.erase(it);
}

Track* TrackRegistry::find(int track_id) {
    auto it = tracks_.find(track_id);
    return it == tracks_.end() ? nullptr : &it->second;
}

const Track* TrackRegistry::find(int track_id) const {
    auto it = tracks_.find(track_id);
    return it == tracks_.end() ? nullptr : &it->second;
}

int TrackRegistry::owner_of(int item_id) const {
    return item_owner_.at(item_id);
}

bool TrackRegistry::is_consumed(int item_id) const {
    return item_consumed_.at(item_id);
}

std::vector<int> TrackRegistry::active_ids() const {
    std::vector<int> ids;
    for (const auto& [id, track] : tracks_) {
        if (track.state != TrackState::Expired) ids.push_back(id);
    }
    return ids;
}

Track& TrackRegistry::get(int track_id) {
    Track* track = find(track_id);
    if (!track) throw std::logic_error("unknown track " + std::to_string(track_id));
    return *track;
}

void TrackRegistry::claim(int item_id, int track_id) {
    if (item_id < 0 || static_cast<size_t>(item_id) >= item_owner_.size())
        throw std::logic_error("item " + std::to_string(item_id) + " out of range");
    if (item_consumed_[item_id])
        throw std::logic_error("item " + std::to_string(item_id) + " already assigned");
    item_consumed_[item_id] = true;
    item_owner_[item_id] = track_id;
}
