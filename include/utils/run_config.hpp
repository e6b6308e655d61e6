// run_config.hpp
#pragma once

#include <iosfwd>
#include <string>

namespace depth_contour {
namespace utils {

enum class RunMode {
    LIVE,       // Camera frames shown in windows
    FOLDER      // Images from input_path, results written to output_path
};

// Everything the pipeline stages need, passed explicitly
struct RunConfig {
    RunMode mode = RunMode::LIVE;

    std::string input_path = "input";
    std::string output_path = "output";
    std::string model_weights;                  // Empty -> preset default
    std::string model_type = "midas_v21_small";
    std::string config_path;

    bool optimize = true;
    bool use_cuda = true;

    // Camera
    int camera_id = 0;
    int frame_width = 0;            // 0 keeps the driver default
    int frame_height = 0;
    int read_timeout_ms = 0;        // 0 keeps the backend default
    int max_capture_failures = 30;

    // Postprocess / segmentation
    double depth_divisor = 1000.0;
    double intensity_scale = 255.0;
    int threshold_level = 125;
    int contour_thickness = 3;

    int key_poll_ms = 1;

    bool show_help = false;
};

/**
 * @brief Builds the configuration from the command line.
 *
 * A --config file is applied first so that explicit flags override it.
 * Throws std::invalid_argument for unknown flags or malformed values.
 */
RunConfig parseArgs(int argc, char** argv);

// Reads keys named like the RunConfig fields from a cv::FileStorage file
void loadConfigFile(const std::string& path, RunConfig& config);

// Fills model_weights from the model type preset when it was not given
void resolveModelWeights(RunConfig& config);

void printUsage(std::ostream& os, const std::string& program);
void printConfig(std::ostream& os, const RunConfig& config);

}  // namespace utils
}  // namespace depth_contour
