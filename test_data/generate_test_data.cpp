#include <algorithm>
#include <iostream>
#include <fstream>
#include <vector>
#include <random>
#include <cmath>
#include <string>
#include <filesystem>
#include <stdexcept>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Object moving at constant velocity through the unit square
struct Object {
    int id;
    double x0, y0;   // position at its first frame
    double vx, vy;   // per frame
    int first_frame;
    std::vector<std::pair<int, int>> dropouts; // (start_frame, end_frame)
};

// Helper: Euclidean distance
double dist(double x1, double y1, double x2, double y2) {
    return std::sqrt((x1-x2)*(x1-x2) + (y1-y2)*(y1-y2));
}

// Helper: Check if point is inside the unit square
bool in_stage(double x, double y) {
    return x >= 0.0 && x <= 1.0 && y >= 0.0 && y <= 1.0;
}

std::string get_arg(int argc, char** argv, const std::string& flag, const std::string& def) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string(argv[i]) == flag) return argv[i + 1];
    }
    return def;
}

// Main generator
int main(int argc, char** argv) {
    std::string output_path = get_arg(argc, argv, "--output", "test_data/data/input_data.json");
    int num_objects = std::stoi(get_arg(argc, argv, "--objects", "8"));
    int num_frames = std::stoi(get_arg(argc, argv, "--frames", "60"));
    double noise_stddev_pos = std::stod(get_arg(argc, argv, "--noise", "0.003"));
    double dropout_probability = std::stod(get_arg(argc, argv, "--dropout", "0.05"));
    unsigned seed = static_cast<unsigned>(std::stoul(get_arg(argc, argv, "--seed", "7")));
    int dropout_min = 1, dropout_max = 2;
    double speed_min = 0.005, speed_max = 0.02;
    double min_object_distance = 0.15;

    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> pos_dist(0.1, 0.9);
    std::uniform_real_distribution<double> speed_dist(speed_min, speed_max);
    std::uniform_real_distribution<double> angle_dist(0.0, 2.0 * M_PI);
    std::uniform_int_distribution<int> start_dist(0, std::max(0, num_frames / 2));
    std::normal_distribution<double> noise_pos(0.0, std::max(noise_stddev_pos, 1e-12));
    auto noise = [&]() { return noise_stddev_pos > 0 ? noise_pos(rng) : 0.0; };

    // 1. Place objects apart from each other
    std::vector<Object> objects;
    for (int i = 0; i < num_objects; ++i) {
        double x, y;
        int tries = 0;
        while (true) {
            x = pos_dist(rng);
            y = pos_dist(rng);
            bool ok = true;
            for (const auto& obj : objects) {
                if (dist(x, y, obj.x0, obj.y0) < min_object_distance)
                    ok = false;
            }
            if (ok) break;
            if (++tries > 1000) throw std::runtime_error("Can't place objects with given min distance");
        }
        double speed = speed_dist(rng);
        double angle = angle_dist(rng);
        objects.push_back({i, x, y, speed * std::cos(angle), speed * std::sin(angle), start_dist(rng), {}});
    }

    // 2. Assign dropouts (frames where the detector misses the object)
    std::uniform_real_distribution<double> drop_chance(0.0, 1.0);
    std::uniform_int_distribution<int> drop_len(dropout_min, dropout_max);
    for (auto& obj : objects) {
        int f = obj.first_frame + 2;
        while (f < num_frames) {
            if (drop_chance(rng) < dropout_probability) {
                int len = drop_len(rng);
                obj.dropouts.push_back({f, std::min(f+len-1, num_frames-1)});
                f += len;
            } else {
                ++f;
            }
        }
    }

    // 3. Generate observations frame by frame
    json x = json::array(), y = json::array(), t = json::array(), truth = json::array();
    for (int frame = 0; frame < num_frames; ++frame) {
        for (const auto& obj : objects) {
            if (frame < obj.first_frame) continue;
            bool dropped = false;
            for (const auto& d : obj.dropouts) {
                if (frame >= d.first && frame <= d.second) {
                    dropped = true;
                    break;
                }
            }
            if (dropped) continue;
            int k = frame - obj.first_frame;
            double ox = obj.x0 + obj.vx * k;
            double oy = obj.y0 + obj.vy * k;
            if (!in_stage(ox, oy)) continue;
            double nx = std::clamp(ox + noise(), 0.0, 1.0);
            double ny = std::clamp(oy + noise(), 0.0, 1.0);
            x.push_back(nx);
            y.push_back(ny);
            t.push_back(frame);
            truth.push_back(obj.id);
        }
    }

    // 4. Write to file
    std::filesystem::path parent = std::filesystem::path(output_path).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent);
    std::ofstream out(output_path);
    if (!out.is_open()) {
        std::cerr << "Failed to open file: " << output_path << std::endl;
        return 1;
    }
    json data = {{"x", x}, {"y", y}, {"t", t}, {"truth", truth}};
    out << data.dump(2) << std::endl;
    std::cout << "Test data (" << x.size() << " observations) written to " << output_path << std::endl;
    return 0;
}
