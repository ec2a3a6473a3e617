#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include "dataset_io.hpp"
#include "errors.hpp"
#include "tracker.hpp"

std::string get_arg(int argc, char** argv, const std::string& flag, const std::string& def) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string(argv[i]) == flag) return argv[i + 1];
    }
    return def;
}

bool has_flag(int argc, char** argv, const std::string& flag) {
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == flag) return true;
    }
    return false;
}

// "1,3,10" -> {1, 3, 10}
std::vector<Timestamp> parse_timestamps(const std::string& list) {
    std::vector<Timestamp> out;
    std::stringstream ss(list);
    std::string token;
    while (std::getline(ss, token, ',')) {
        if (!token.empty()) out.push_back(std::stoll(token));
    }
    return out;
}

int main(int argc, char** argv) {
    std::string input_file = get_arg(argc, argv, "--input", "test_data/data/input_data.json");
    std::string output_file = get_arg(argc, argv, "--output", "output.json");
    std::string config_file = get_arg(argc, argv, "--config", "");

    try {
        TrackerParams params;
        if (!config_file.empty()) params = load_params(config_file);
        std::string arg;
        if (!(arg = get_arg(argc, argv, "--m", "")).empty()) params.m = std::stoi(arg);
        if (!(arg = get_arg(argc, argv, "--bound-tight", "")).empty()) params.bound_tight = std::stod(arg);
        if (!(arg = get_arg(argc, argv, "--time-limit", "")).empty()) params.time_limit = std::stoll(arg);
        if (!(arg = get_arg(argc, argv, "--confirm-hits", "")).empty()) params.confirm_hits = std::stoi(arg);
        std::string vb = get_arg(argc, argv, "--vb", "");
        if (!vb.empty()) params.vb = parse_timestamps(vb);
        params.vb_save = get_arg(argc, argv, "--vb-save", params.vb_save);
        if (has_flag(argc, argv, "--verbose")) params.verbose = true;

        Observations obs = load_observations(input_file);
        std::cout << "Loaded " << obs.x.size() << " observations from " << input_file << std::endl;
        size_t out_of_range = count_out_of_range(obs);
        if (out_of_range > 0) {
            std::cerr << "[WARN] " << out_of_range
                      << " coordinates lie outside [0, 1]; scale x and y before tracking" << std::endl;
        }

        TrackingResult result = track_objects(obs.x, obs.y, obs.t, params);
        write_result(output_file, result);
        std::cout << "Tracked " << result.obj_list.size() << " objects, " << result.unassigned.size()
                  << " unassigned items" << std::endl;
        std::cout << "Wrote output to " << output_file << std::endl;
    } catch (const InputShapeError& e) {
        std::cerr << "Input error: " << e.what() << std::endl;
        return 1;
    } catch (const ParameterError& e) {
        std::cerr << "Parameter error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
