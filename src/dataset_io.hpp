#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "data_types.hpp"
#include "tracker.hpp"
#include "tracker_params.hpp"

struct Observations {
    std::vector<double> x;
    std::vector<double> y;
    std::vector<Timestamp> t;
};

// Accepts {"x": [...], "y": [...], "t": [...]} or [{"x":..,"y":..,"t":..}, ...].
// Array lengths are not checked here; track_objects rejects mismatches.
Observations parse_observations(const nlohmann::json& j);
Observations load_observations(const std::string& filename);

// Overrides the fields of `defaults` present in j (same names as TrackerParams).
TrackerParams parse_params(const nlohmann::json& j, TrackerParams defaults = {});
TrackerParams load_params(const std::string& filename, TrackerParams defaults = {});

nlohmann::json result_to_json(const TrackingResult& result);
void write_result(const std::string& filename, const TrackingResult& result);

// Number of coordinates outside [0, 1].
size_t count_out_of_range(const Observations& obs);
