#pragma once
#include <vector>
#include <Eigen/Dense>
#include "data_types.hpp"

// Straight line p(t) = origin + velocity * (t - t_ref) fitted to x(t) and y(t).
struct LinearFit {
    bool defined;            // false with fewer than 2 points or no time spread
    double t_ref;            // mean time of the window
    Eigen::Vector2d origin;  // position at t_ref
    Eigen::Vector2d velocity;
    Eigen::Vector2d last;    // last known position, used when undefined
};

// Least-squares fit over the last m items of history (all of them if fewer).
LinearFit fit_linear(const std::vector<Item>& history, int m);

Prediction evaluate(const LinearFit& fit, Timestamp t_query);

Prediction predict_position(const std::vector<Item>& history, int m, Timestamp t_query);

// The last m items of a track, resolved against the full item list.
std::vector<Item> history_window(const Track& track, const std::vector<Item>& items, int m);
