#include "utils/frame_io.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace depth_contour {
namespace utils {

bool isExitKey(int key) {
    return key >= 0 && key % 256 == kEscKey;
}

// ---------------- CameraSource -----------------

CameraSource::CameraSource(int camera_id, int width, int height, int read_timeout_ms)
    : camera_id_(camera_id), frame_index_(0) {
    if (!cap_.open(camera_id)) {
        throw std::runtime_error("Cannot open camera " + std::to_string(camera_id));
    }

    if (width > 0) cap_.set(cv::CAP_PROP_FRAME_WIDTH, width);
    if (height > 0) cap_.set(cv::CAP_PROP_FRAME_HEIGHT, height);
    cap_.set(cv::CAP_PROP_BUFFERSIZE, 1);

    if (read_timeout_ms > 0 && !cap_.set(cv::CAP_PROP_READ_TIMEOUT_MSEC, read_timeout_ms)) {
        std::cerr << "[WARN] Camera backend " << cap_.getBackendName()
                  << " ignores the read timeout" << std::endl;
    }

    std::cout << "[INFO] Camera " << camera_id << " opened ("
              << cap_.get(cv::CAP_PROP_FRAME_WIDTH) << "x"
              << cap_.get(cv::CAP_PROP_FRAME_HEIGHT) << ")" << std::endl;
}

CameraSource::~CameraSource() {
    if (cap_.isOpened()) {
        cap_.release();
        std::cout << "[INFO] Camera " << camera_id_ << " released" << std::endl;
    }
}

bool CameraSource::read(cv::Mat& frame) {
    if (!cap_.read(frame) || frame.empty()) {
        return false;
    }
    frame_index_++;
    return true;
}

std::string CameraSource::frameName() const {
    return "frame_" + std::to_string(frame_index_);
}

// ---------------- ImageFolderSource -----------------

ImageFolderSource::ImageFolderSource(const std::string& input_path)
    : next_(0) {
    if (!fs::is_directory(input_path)) {
        throw std::runtime_error("Input folder not found: " + input_path);
    }

    std::vector<cv::String> candidates;
    cv::glob(input_path + "/*", candidates, false);
    for (const auto& path : candidates) {
        // Checks the file signature without decoding the image
        if (fs::is_regular_file(path) && cv::haveImageReader(path)) {
            paths_.push_back(path);
        }
    }
    std::cout << "[INFO] Found " << paths_.size() << " images among "
              << candidates.size() << " files in " << input_path << std::endl;
}

std::string ImageFolderSource::frameNameFor(const std::string& path) {
    // "a.png" -> "a_png", so a.jpg and a.png never share output files
    std::string name = fs::path(path).filename().string();
    std::replace(name.begin(), name.end(), '.', '_');
    return name;
}

bool ImageFolderSource::read(cv::Mat& frame) {
    while (next_ < paths_.size()) {
        const cv::String& path = paths_[next_++];
        frame = cv::imread(path, cv::IMREAD_COLOR);
        if (!frame.empty()) {
            current_name_ = frameNameFor(path);
            return true;
        }
        std::cerr << "[WARN] Skipping unreadable image: " << path << std::endl;
    }
    return false;
}

// ---------------- WindowDisplay -----------------

WindowDisplay::WindowDisplay(const std::vector<std::string>& windows)
    : windows_(windows) {
    for (size_t i = 0; i < windows_.size(); ++i) {
        // The annotated input window is resizable, the others follow the image
        cv::namedWindow(windows_[i], i == 0 ? cv::WINDOW_NORMAL : cv::WINDOW_AUTOSIZE);
    }
}

WindowDisplay::~WindowDisplay() {
    cv::destroyAllWindows();
}

void WindowDisplay::show(const std::string& window, const cv::Mat& image) {
    cv::imshow(window, image);
}

int WindowDisplay::pollKey(int delay_ms) {
    return cv::waitKey(delay_ms);
}

// ---------------- ImageWriterDisplay -----------------

ImageWriterDisplay::ImageWriterDisplay(const std::string& output_path)
    : output_path_(output_path), frame_name_("frame") {
    fs::create_directories(output_path_);
}

void ImageWriterDisplay::beginFrame(const std::string& frame_name) {
    frame_name_ = frame_name;
}

void ImageWriterDisplay::show(const std::string& window, const cv::Mat& image) {
    const std::string path = (fs::path(output_path_) / (frame_name_ + "_" + window + ".png")).string();
    if (!cv::imwrite(path, image)) {
        throw std::runtime_error("Failed to write " + path);
    }
}

int ImageWriterDisplay::pollKey(int delay_ms) {
    (void)delay_ms;
    return -1;
}

}  // namespace utils
}  // namespace depth_contour
