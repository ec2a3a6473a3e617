#include <gtest/gtest.h>
#include <cmath>
#include "trajectory_model.hpp"

namespace {

constexpr double kEps = 1e-9;

}

TEST(TrajectoryModel, ExtrapolatesLinearMotion) {
    std::vector<Item> history = {{0, 0.1, 0.2, 0}, {1, 0.2, 0.2, 1}, {2, 0.3, 0.2, 2}};
    Prediction p = predict_position(history, 5, 3);
    EXPECT_TRUE(p.extrapolated);
    EXPECT_NEAR(p.x, 0.4, kEps);
    EXPECT_NEAR(p.y, 0.2, kEps);
}

TEST(TrajectoryModel, UsesOnlyTheLastMItems) {
    std::vector<Item> history = {
        {0, 0.9, 0.9, 0}, {1, 0.1, 0.5, 1}, {2, 0.2, 0.5, 2}, {3, 0.3, 0.5, 3}};
    Prediction p = predict_position(history, 3, 4);
    EXPECT_NEAR(p.x, 0.4, kEps);
    EXPECT_NEAR(p.y, 0.5, kEps);

    Prediction all = predict_position(history, 4, 4);
    EXPECT_GT(std::abs(all.y - 0.5), 0.01);
}

TEST(TrajectoryModel, LeastSquaresOverNoisyPoints) {
    // x: 0.0, 0.2, 0.1 at t = 0, 1, 2 -> slope 0.05 through (1, 0.1)
    std::vector<Item> history = {{0, 0.0, 0.5, 0}, {1, 0.2, 0.5, 1}, {2, 0.1, 0.5, 2}};
    LinearFit fit = fit_linear(history, 3);
    ASSERT_TRUE(fit.defined);
    EXPECT_NEAR(fit.velocity.x(), 0.05, kEps);
    EXPECT_NEAR(fit.velocity.y(), 0.0, kEps);
    Prediction p = evaluate(fit, 3);
    EXPECT_NEAR(p.x, 0.2, kEps);
    EXPECT_NEAR(p.y, 0.5, kEps);
}

TEST(TrajectoryModel, HandlesUnevenTimeSteps) {
    std::vector<Item> history = {{0, 0.1, 0.9, 0}, {1, 0.5, 0.5, 4}};
    Prediction p = predict_position(history, 2, 5);
    EXPECT_NEAR(p.x, 0.6, kEps);
    EXPECT_NEAR(p.y, 0.4, kEps);
}

TEST(TrajectoryModel, SinglePointFallsBackToLastPosition) {
    std::vector<Item> history = {{7, 0.3, 0.7, 4}};
    Prediction p = predict_position(history, 5, 9);
    EXPECT_FALSE(p.extrapolated);
    EXPECT_DOUBLE_EQ(p.x, 0.3);
    EXPECT_DOUBLE_EQ(p.y, 0.7);
}

TEST(TrajectoryModel, NoTimeSpreadFallsBackToLastPosition) {
    std::vector<Item> history = {{0, 0.1, 0.1, 2}, {1, 0.2, 0.3, 2}};
    LinearFit fit = fit_linear(history, 2);
    EXPECT_FALSE(fit.defined);
    Prediction p = evaluate(fit, 3);
    EXPECT_FALSE(p.extrapolated);
    EXPECT_DOUBLE_EQ(p.x, 0.2);
    EXPECT_DOUBLE_EQ(p.y, 0.3);
}

TEST(TrajectoryModel, EmptyHistoryIsUndefined) {
    LinearFit fit = fit_linear({}, 3);
    EXPECT_FALSE(fit.defined);
}

TEST(TrajectoryModel, HistoryWindowResolvesTrackItems) {
    std::vector<Item> items = {
        {0, 0.1, 0.1, 0}, {1, 0.9, 0.9, 0}, {2, 0.2, 0.2, 1}, {3, 0.3, 0.3, 2}};
    Track track{0, {0, 2, 3}, TrackState::Confirmed, 2, 1};

    std::vector<Item> window = history_window(track, items, 2);
    ASSERT_EQ(window.size(), 2u);
    EXPECT_EQ(window[0].id, 2);
    EXPECT_EQ(window[1].id, 3);

    EXPECT_EQ(history_window(track, items, 10).size(), 3u);
}
