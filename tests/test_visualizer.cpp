#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "errors.hpp"
#include "visualizer.hpp"

namespace fs = std::filesystem;

namespace {

Snapshot sample_snapshot() {
    Snapshot snap;
    snap.t = 2;
    snap.bound_tight = 0.05;
    TrackView view;
    view.id = 0;
    view.state = TrackState::Confirmed;
    view.history = {{0, 0.1, 0.2, 0}, {1, 0.2, 0.2, 1}, {2, 0.3, 0.2, 2}};
    view.line_start = {0.1, 0.2, true};
    view.predicted = {0.3, 0.2, true};
    snap.tracks.push_back(view);
    snap.items.push_back({{2, 0.3, 0.2, 2}, true});
    snap.items.push_back({{3, 0.7, 0.7, 2}, false});
    snap.leftovers.push_back({4, 0.5, 0.9, 1});
    return snap;
}

fs::path scratch_dir(const std::string& name) {
    fs::path dir = fs::path(::testing::TempDir()) / name;
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

}

TEST(Visualizer, SnapshotPathIsZeroPadded) {
    EXPECT_EQ(snapshot_path("out/frame", 3), "out/frame_00003.png");
    EXPECT_EQ(snapshot_path("plot", 12345), "plot_12345.png");
}

TEST(Visualizer, RendersItemsOnWhiteCanvas) {
    cv::Mat img = render_snapshot(sample_snapshot());
    ASSERT_EQ(img.rows, 480);
    ASSERT_EQ(img.cols, 480);
    EXPECT_EQ(img.type(), CV_8UC3);

    // Unassigned item at (0.7, 0.7) is drawn dark; a far corner stays white.
    cv::Vec3b item = img.at<cv::Vec3b>(336, 336);
    EXPECT_LT(item[0], 128);
    cv::Vec3b corner = img.at<cv::Vec3b>(470, 10);
    EXPECT_EQ(corner[0], 255);
    EXPECT_EQ(corner[1], 255);
    EXPECT_EQ(corner[2], 255);
}

TEST(Visualizer, ExportWritesPng) {
    fs::path dir = scratch_dir("linreg_export");
    std::string path = export_snapshot(sample_snapshot(), (dir / "nested" / "snap").string());
    EXPECT_EQ(path, (dir / "nested" / "snap_00002.png").string());
    EXPECT_TRUE(fs::exists(path));
    EXPECT_GT(fs::file_size(path), 0u);
}

TEST(Visualizer, ExportToUnwritablePrefixThrows) {
    fs::path dir = scratch_dir("linreg_blocked");
    fs::path blocker = dir / "not_a_dir";
    std::ofstream(blocker) << "x";
    EXPECT_THROW(export_snapshot(sample_snapshot(), (blocker / "snap").string()), RenderError);
}

TEST(Visualizer, TrackObjectsSavesRequestedFrames) {
    fs::path dir = scratch_dir("linreg_vb_save");
    std::vector<double> x = {0.1, 0.2, 0.3, 0.4}, y = {0.2, 0.2, 0.2, 0.2};
    std::vector<Timestamp> t = {0, 1, 2, 3};
    TrackerParams params;
    params.m = 2;
    params.vb = {1, 3};
    params.vb_save = (dir / "run").string();

    TrackingResult result = track_objects(x, y, t, params);
    EXPECT_TRUE(result.render_warnings.empty());
    EXPECT_TRUE(fs::exists(dir / "run_00001.png"));
    EXPECT_TRUE(fs::exists(dir / "run_00003.png"));
    ASSERT_EQ(result.obj_list.size(), 1u);
}

TEST(Visualizer, UnwritablePrefixBecomesWarning) {
    fs::path dir = scratch_dir("linreg_vb_blocked");
    fs::path blocker = dir / "file";
    std::ofstream(blocker) << "x";
    std::vector<double> x = {0.1, 0.2, 0.3, 0.4}, y = {0.2, 0.2, 0.2, 0.2};
    std::vector<Timestamp> t = {0, 1, 2, 3};
    TrackerParams params;
    params.m = 2;
    TrackingResult expected = track_objects(x, y, t, params);

    params.vb = {2};
    params.vb_save = (blocker / "run").string();
    TrackingResult result = track_objects(x, y, t, params);
    EXPECT_EQ(result.render_warnings.size(), 1u);
    EXPECT_EQ(result.obj_list, expected.obj_list);
}
