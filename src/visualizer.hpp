#pragma once
#include <string>
#include <opencv2/core.hpp>
#include "data_types.hpp"
#include "tracker.hpp"

// <prefix>_<t zero-padded to 5 digits>.png
std::string snapshot_path(const std::string& prefix, Timestamp t);

// Draws active tracks (history, fitted line, prediction, gating circle),
// expired tracks in grey, the previous frame's leftovers and the frame's
// items. Assigned items get a circle in their track's colour, unassigned
// ones a dark cross.
cv::Mat render_snapshot(const Snapshot& snapshot);

// Renders and writes the image; returns the path. Throws RenderError.
std::string export_snapshot(const Snapshot& snapshot, const std::string& prefix);

// Renders and shows the image in a window until a key is pressed. Throws RenderError.
void show_snapshot(const Snapshot& snapshot);

// Exports to vb_save when set, shows a window otherwise.
SnapshotRenderer make_snapshot_renderer(const std::string& vb_save);
