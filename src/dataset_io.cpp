#include "dataset_io.hpp"
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

Observations parse_observations(const json& j) {
    Observations obs;
    if (j.is_object()) {
        obs.x = j.at("x").get<std::vector<double>>();
        obs.y = j.at("y").get<std::vector<double>>();
        obs.t = j.at("t").get<std::vector<Timestamp>>();
        return obs;
    }
    if (!j.is_array()) throw std::runtime_error("observations must be an object of arrays or an array of records");
    for (const auto& rec : j) {
        obs.x.push_back(rec.at("x").get<double>());
        obs.y.push_back(rec.at("y").get<double>());
        obs.t.push_back(rec.at("t").get<Timestamp>());
    }
    return obs;
}

Observations load_observations(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) throw std::runtime_error("Failed to open file: " + filename);
    json j;
    file >> j;
    return parse_observations(j);
}

TrackerParams parse_params(const json& j, TrackerParams p) {
    if (!j.is_object()) throw std::runtime_error("tracker config must be a JSON object");
    p.m = j.value("m", p.m);
    p.bound_tight = j.value("bound_tight", p.bound_tight);
    p.time_limit = j.value("time_limit", p.time_limit);
    p.birth_max_gap = j.value("birth_max_gap", p.birth_max_gap);
    p.birth_max_speed = j.value("birth_max_speed", p.birth_max_speed);
    p.birth_lookahead = j.value("birth_lookahead", p.birth_lookahead);
    p.birth_min_support = j.value("birth_min_support", p.birth_min_support);
    p.birth_loose_factor = j.value("birth_loose_factor", p.birth_loose_factor);
    p.confirm_hits = j.value("confirm_hits", p.confirm_hits);
    p.vb = j.value("vb", p.vb);
    p.vb_save = j.value("vb_save", p.vb_save);
    p.verbose = j.value("verbose", p.verbose);
    return p;
}

TrackerParams load_params(const std::string& filename, TrackerParams defaults) {
    std::ifstream file(filename);
    if (!file.is_open()) throw std::runtime_error("Failed to open file: " + filename);
    json j;
    file >> j;
    return parse_params(j, defaults);
}

json result_to_json(const TrackingResult& result) {
    json out;
    out["objects"] = result.obj_list;
    out["unassigned"] = result.unassigned;
    out["tracks"] = json::array();
    for (const auto& track : result.tracks) {
        json track_json;
        track_json["id"] = track.id;
        track_json["state"] = to_string(track.state);
        track_json["items"] = track.items;
        track_json["last_update_time"] = track.last_update_time;
        out["tracks"].push_back(track_json);
    }
    out["render_warnings"] = result.render_warnings;
    return out;
}

void write_result(const std::string& filename, const TrackingResult& result) {
    std::ofstream out(filename);
    if (!out.is_open()) throw std::runtime_error("Failed to open file for writing: " + filename);
    out << result_to_json(result).dump(2) << std::endl;
    if (!out) throw std::runtime_error("Failed to write " + filename);
}

size_t count_out_of_range(const Observations& obs) {
    size_t n = 0;
    for (double v : obs.x) n += (v < 0.0 || v > 1.0);
    for (double v : obs.y) n += (v < 0.0 || v > 1.0);
    return n;
}
