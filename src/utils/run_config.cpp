#include "utils/run_config.hpp"
#include "utils/midas_utils.hpp"

#include <opencv2/core.hpp>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace depth_contour {
namespace utils {

namespace {

RunMode parseMode(const std::string& value) {
    if (value == "live") return RunMode::LIVE;
    if (value == "folder") return RunMode::FOLDER;
    throw std::invalid_argument("Unknown mode: " + value + " (expected live or folder)");
}

int parseInt(const std::string& flag, const std::string& value) {
    try {
        size_t used = 0;
        int result = std::stoi(value, &used);
        if (used != value.size()) {
            throw std::invalid_argument(value);
        }
        return result;
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid integer for " + flag + ": " + value);
    }
}

// Splits "--flag=value" into its parts; value stays empty without '='
void splitFlag(const std::string& arg, std::string& flag, std::string& value, bool& has_value) {
    size_t eq = arg.find('=');
    if (arg.rfind("--", 0) == 0 && eq != std::string::npos) {
        flag = arg.substr(0, eq);
        value = arg.substr(eq + 1);
        has_value = true;
    } else {
        flag = arg;
        value.clear();
        has_value = false;
    }
}

template <typename T>
void readNode(const cv::FileStorage& fs, const char* key, T& out) {
    cv::FileNode node = fs[key];
    if (!node.empty()) {
        node >> out;
    }
}

void readBoolNode(const cv::FileStorage& fs, const char* key, bool& out) {
    cv::FileNode node = fs[key];
    if (!node.empty()) {
        int value = 0;
        node >> value;
        out = value != 0;
    }
}

// Range checks for values that would otherwise only fail once the camera is open
void validateConfig(const RunConfig& config) {
    if (config.max_capture_failures < 1) {
        throw std::invalid_argument("max_capture_failures must be at least 1");
    }
    if (config.threshold_level < 0 || config.threshold_level > 255) {
        throw std::invalid_argument("Threshold level must be in [0, 255], got " +
                                    std::to_string(config.threshold_level));
    }
    if (config.contour_thickness < 1) {
        throw std::invalid_argument("contour_thickness must be at least 1");
    }
    if (!(config.depth_divisor > 0.0)) {
        throw std::invalid_argument("depth_divisor must be positive");
    }
    if (!(config.intensity_scale > 0.0)) {
        throw std::invalid_argument("intensity_scale must be positive");
    }
    // waitKey(0) blocks until a key is pressed
    if (config.key_poll_ms < 1) {
        throw std::invalid_argument("key_poll_ms must be at least 1");
    }
}

}  // namespace

void loadConfigFile(const std::string& path, RunConfig& config) {
    cv::FileStorage fs;
    try {
        fs.open(path, cv::FileStorage::READ);
    } catch (const cv::Exception& e) {
        throw std::invalid_argument("Failed to parse config file " + path + ": " + e.what());
    }
    if (!fs.isOpened()) {
        throw std::invalid_argument("Failed to open config file: " + path);
    }

    std::string mode;
    readNode(fs, "mode", mode);
    if (!mode.empty()) config.mode = parseMode(mode);

    readNode(fs, "input_path", config.input_path);
    readNode(fs, "output_path", config.output_path);
    readNode(fs, "model_weights", config.model_weights);
    readNode(fs, "model_type", config.model_type);
    readBoolNode(fs, "optimize", config.optimize);
    readBoolNode(fs, "use_cuda", config.use_cuda);
    readNode(fs, "camera_id", config.camera_id);
    readNode(fs, "frame_width", config.frame_width);
    readNode(fs, "frame_height", config.frame_height);
    readNode(fs, "read_timeout_ms", config.read_timeout_ms);
    readNode(fs, "max_capture_failures", config.max_capture_failures);
    readNode(fs, "depth_divisor", config.depth_divisor);
    readNode(fs, "intensity_scale", config.intensity_scale);
    readNode(fs, "threshold_level", config.threshold_level);
    readNode(fs, "contour_thickness", config.contour_thickness);
    readNode(fs, "key_poll_ms", config.key_poll_ms);
    fs.release();

    config.config_path = path;
}

RunConfig parseArgs(int argc, char** argv) {
    RunConfig config;
    std::vector<std::string> args(argv + 1, argv + argc);

    // Config file first, flags override it
    for (size_t i = 0; i < args.size(); ++i) {
        std::string flag, value;
        bool has_value = false;
        splitFlag(args[i], flag, value, has_value);
        if (flag != "--config") continue;

        if (!has_value) {
            if (i + 1 >= args.size()) {
                throw std::invalid_argument("Missing value for --config");
            }
            value = args[i + 1];
        }
        loadConfigFile(value, config);
    }

    for (size_t i = 0; i < args.size(); ++i) {
        std::string flag, value;
        bool has_value = false;
        splitFlag(args[i], flag, value, has_value);

        auto nextValue = [&]() -> std::string {
            if (has_value) return value;
            if (i + 1 >= args.size()) {
                throw std::invalid_argument("Missing value for " + flag);
            }
            return args[++i];
        };

        if (flag == "-h" || flag == "--help") {
            config.show_help = true;
        } else if (flag == "-i" || flag == "--input_path") {
            config.input_path = nextValue();
        } else if (flag == "-o" || flag == "--output_path") {
            config.output_path = nextValue();
        } else if (flag == "-m" || flag == "--model_weights") {
            config.model_weights = nextValue();
        } else if (flag == "-t" || flag == "--model_type") {
            config.model_type = nextValue();
        } else if (flag == "--optimize") {
            config.optimize = true;
        } else if (flag == "--no-optimize") {
            config.optimize = false;
        } else if (flag == "--cpu") {
            config.use_cuda = false;
        } else if (flag == "-c" || flag == "--camera") {
            config.camera_id = parseInt(flag, nextValue());
        } else if (flag == "--threshold") {
            config.threshold_level = parseInt(flag, nextValue());
        } else if (flag == "--folder") {
            config.mode = RunMode::FOLDER;
        } else if (flag == "--config") {
            nextValue();  // already applied
        } else {
            throw std::invalid_argument("Unknown argument: " + args[i]);
        }
    }

    // Fail early on a model type without a preset
    presetFor(config.model_type);

    validateConfig(config);
    return config;
}

void resolveModelWeights(RunConfig& config) {
    if (config.model_weights.empty()) {
        config.model_weights = presetFor(config.model_type).default_weights;
    }
}

void printUsage(std::ostream& os, const std::string& program) {
    os << "Usage: " << program << " [options]\n\n"
       << "  -i, --input_path PATH      folder with input images (--folder mode, default: input)\n"
       << "  -o, --output_path PATH     folder for output images (--folder mode, default: output)\n"
       << "  -m, --model_weights PATH   TorchScript MiDaS checkpoint (default: preset weights)\n"
       << "  -t, --model_type TYPE      ";
    const auto types = availableModelTypes();
    for (size_t i = 0; i < types.size(); ++i) {
        os << (i ? ", " : "") << types[i];
    }
    os << " (default: midas_v21_small)\n"
       << "      --optimize             half precision + channels-last on CUDA (default)\n"
       << "      --no-optimize          keep float32 weights\n"
       << "      --cpu                  never use CUDA\n"
       << "  -c, --camera ID            camera index (default: 0)\n"
       << "      --threshold LEVEL      binary threshold on the 8-bit depth image (default: 125)\n"
       << "      --folder               process input_path instead of the camera\n"
       << "      --config FILE          YAML/XML/JSON settings read with cv::FileStorage\n"
       << "  -h, --help                 show this message\n\n"
       << "Press ESC in any window to quit.\n";
}

void printConfig(std::ostream& os, const RunConfig& config) {
    os << "Configuration:\n";
    os << "  Mode: " << (config.mode == RunMode::LIVE ? "live" : "folder") << "\n";
    if (config.mode == RunMode::LIVE) {
        os << "  Camera ID: " << config.camera_id << "\n";
    } else {
        os << "  Input: " << config.input_path << "\n";
        os << "  Output: " << config.output_path << "\n";
    }
    os << "  Model type: " << config.model_type << "\n";
    os << "  Model weights: " << config.model_weights << "\n";
    os << "  Optimize: " << (config.optimize ? "on" : "off") << "\n";
    os << "  Threshold: " << config.threshold_level << "\n";
    if (!config.config_path.empty()) {
        os << "  Config file: " << config.config_path << "\n";
    }
    os << "\n";
}

}  // namespace utils
}  // namespace depth_contour
