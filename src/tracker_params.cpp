#include "tracker_params.hpp"
#include "errors.hpp"
#include <cmath>
#include <sstream>

namespace {

template <typename T>
void require(bool ok, const char* name, T value, const char* rule) {
    if (ok) return;
    std::ostringstream ss;
    ss << name << " must be " << rule << ", whereas " << name << " was " << value;
    throw ParameterError(ss.str());
}

}

void validate_params(const TrackerParams& p) {
    require(p.m >= 2, "m", p.m, "at least 2");
    require(std::isfinite(p.bound_tight) && p.bound_tight > 0.0, "bound_tight", p.bound_tight, "> 0");
    require(p.time_limit > 0, "time_limit", p.time_limit, "> 0");
    require(p.birth_max_gap >= 1, "birth_max_gap", p.birth_max_gap, "at least 1");
    require(std::isfinite(p.birth_max_speed) && p.birth_max_speed > 0.0, "birth_max_speed",
            p.birth_max_speed, "> 0");
    require(p.birth_lookahead >= 0, "birth_lookahead", p.birth_lookahead, ">= 0");
    require(p.birth_min_support >= 0, "birth_min_support", p.birth_min_support, ">= 0");
    require(p.birth_loose_factor >= 1.0, "birth_loose_factor", p.birth_loose_factor, "at least 1");
    require(p.confirm_hits >= 1, "confirm_hits", p.confirm_hits, "at least 1");
    for (Timestamp t : p.vb) require(t >= 0, "vb timestamp", t, ">= 0");
}
