// Snapshot rendering for the tracker.
// Requires OpenCV (install with: sudo apt-get install libopencv-dev)
#include <opencv2/imgproc.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/highgui.hpp>
#include <cstdio>
#include <filesystem>
#include <string>
#include <system_error>
#include "visualizer.hpp"
#include "errors.hpp"

namespace fs = std::filesystem;

constexpr int IMG_SIZE = 480;
constexpr int MARKER_SIZE = 8;
const cv::Scalar BG_COLOR(255, 255, 255);        // White
const cv::Scalar LEFTOVER_COLOR(204, 204, 204);  // Light grey
const cv::Scalar EXPIRED_COLOR(170, 170, 170);
const cv::Scalar UNASSIGNED_COLOR(34, 34, 34);   // Near black
const cv::Scalar CIRCLE_COLOR(204, 204, 204);
const cv::Scalar TEXT_COLOR(0, 0, 0);

// Colour for a track id, cycling through a fixed palette.
static cv::Scalar track_color(int id) {
    static const cv::Scalar palette[] = {
        cv::Scalar(84, 1, 68),    cv::Scalar(202, 137, 72), cv::Scalar(19, 206, 50),
        cv::Scalar(37, 200, 253), cv::Scalar(37, 37, 253),  cv::Scalar(240, 255, 0),
    };
    return palette[id % 6];
}

static cv::Point to_px(double x, double y) {
    return cv::Point(static_cast<int>(x * IMG_SIZE), static_cast<int>(y * IMG_SIZE));
}

std::string snapshot_path(const std::string& prefix, Timestamp t) {
    char suffix[32];
    snprintf(suffix, sizeof(suffix), "_%05lld.png", static_cast<long long>(t));
    return prefix + suffix;
}

cv::Mat render_snapshot(const Snapshot& snapshot) {
    cv::Mat img(IMG_SIZE, IMG_SIZE, CV_8UC3, BG_COLOR);

    // History of every track; expired ones are greyed out
    for (const auto& track : snapshot.tracks) {
        cv::Scalar color = track.state == TrackState::Expired ? EXPIRED_COLOR : track_color(track.id);
        for (const auto& item : track.history) {
            cv::drawMarker(img, to_px(item.x, item.y), color, cv::MARKER_TILTED_CROSS, MARKER_SIZE, 1);
        }
    }

    for (const auto& item : snapshot.leftovers) {
        cv::drawMarker(img, to_px(item.x, item.y), LEFTOVER_COLOR, cv::MARKER_TILTED_CROSS, MARKER_SIZE, 1);
    }

    // Line of motion and gating circle of the active tracks
    int radius = static_cast<int>(snapshot.bound_tight * IMG_SIZE);
    for (const auto& track : snapshot.tracks) {
        if (track.state == TrackState::Expired) continue;
        cv::Point start = to_px(track.line_start.x, track.line_start.y);
        cv::Point end = to_px(track.predicted.x, track.predicted.y);
        cv::line(img, start, end, track_color(track.id), 1, cv::LINE_AA);
        cv::circle(img, end, radius, CIRCLE_COLOR, 1, cv::LINE_AA);
    }

    // Items of this frame
    for (const auto& view : snapshot.items) {
        cv::Point p = to_px(view.item.x, view.item.y);
        if (!view.assigned) {
            cv::drawMarker(img, p, UNASSIGNED_COLOR, cv::MARKER_TILTED_CROSS, MARKER_SIZE, 2);
            continue;
        }
        cv::Scalar color = UNASSIGNED_COLOR;
        for (const auto& track : snapshot.tracks) {
            for (const auto& item : track.history) {
                if (item.id == view.item.id) color = track_color(track.id);
            }
        }
        cv::circle(img, p, MARKER_SIZE / 2 + 1, color, 2, cv::LINE_AA);
    }

    char title[48];
    snprintf(title, sizeof(title), "t = %lld", static_cast<long long>(snapshot.t));
    cv::putText(img, title, cv::Point(IMG_SIZE / 2 - 40, 24), cv::FONT_HERSHEY_SIMPLEX, 0.7, TEXT_COLOR, 2);
    return img;
}

std::string export_snapshot(const Snapshot& snapshot, const std::string& prefix) {
    std::string path = snapshot_path(prefix, snapshot.t);
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) throw RenderError("cannot create " + parent.string() + ": " + ec.message());
    }
    bool written = false;
    try {
        written = cv::imwrite(path, render_snapshot(snapshot));
    } catch (const cv::Exception& e) {
        throw RenderError("cannot write " + path + ": " + e.what());
    }
    if (!written) throw RenderError("cannot write " + path);
    return path;
}

void show_snapshot(const Snapshot& snapshot) {
    try {
        std::string window = "t = " + std::to_string(snapshot.t);
        cv::imshow(window, render_snapshot(snapshot));
        cv::waitKey(0);
        cv::destroyWindow(window);
    } catch (const cv::Exception& e) {
        throw RenderError(std::string("cannot show snapshot: ") + e.what());
    }
}

SnapshotRenderer make_snapshot_renderer(const std::string& vb_save) {
    if (vb_save.empty()) return [](const Snapshot& snapshot) { show_snapshot(snapshot); };
    return [vb_save](const Snapshot& snapshot) { export_snapshot(snapshot, vb_save); };
}
