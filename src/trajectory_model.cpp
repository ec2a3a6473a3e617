#include "trajectory_model.hpp"
#include <algorithm>

LinearFit fit_linear(const std::vector<Item>& history, int m) {
    LinearFit fit;
    fit.defined = false;
    fit.t_ref = 0.0;
    fit.origin.setZero();
    fit.velocity.setZero();
    fit.last.setZero();
    if (history.empty()) return fit;

    const Item& newest = history.back();
    fit.last = Eigen::Vector2d(newest.x, newest.y);
    fit.t_ref = static_cast<double>(newest.t);
    fit.origin = fit.last;

    size_t n = std::min(history.size(), static_cast<size_t>(std::max(m, 1)));
    if (n < 2) return fit;
    size_t first = history.size() - n;

    // Times relative to the newest item keep the sums small.
    Eigen::ArrayXd tau(n), xs(n), ys(n);
    for (size_t i = 0; i < n; ++i) {
        const Item& item = history[first + i];
        tau(i) = static_cast<double>(item.t - newest.t);
        xs(i) = item.x;
        ys(i) = item.y;
    }
    double tau_mean = tau.mean();
    Eigen::ArrayXd dt = tau - tau_mean;
    double s_tt = dt.square().sum();
    if (s_tt <= 0.0) return fit;

    fit.defined = true;
    fit.t_ref = static_cast<double>(newest.t) + tau_mean;
    fit.origin = Eigen::Vector2d(xs.mean(), ys.mean());
    fit.velocity = Eigen::Vector2d((dt * (xs - xs.mean())).sum() / s_tt,
                                   (dt * (ys - ys.mean())).sum() / s_tt);
    return fit;
}

Prediction evaluate(const LinearFit& fit, Timestamp t_query) {
    if (!fit.defined) return {fit.last.x(), fit.last.y(), false};
    Eigen::Vector2d p = fit.origin + fit.velocity * (static_cast<double>(t_query) - fit.t_ref);
    return {p.x(), p.y(), true};
}

Prediction predict_position(const std::vector<Item>& history, int m, Timestamp t_query) {
    return evaluate(fit_linear(history, m), t_query);
}

std::vector<Item> history_window(const Track& track, const std::vector<Item>& items, int m) {
    size_t n = std::min(track.items.size(), static_cast<size_t>(std::max(m, 1)));
    std::vector<Item> window;
    window.reserve(n);
    for (size_t i = track.items.size() - n; i < track.items.size(); ++i) {
        window.push_back(items.at(track.items[i]));
    }
    return window;
}
