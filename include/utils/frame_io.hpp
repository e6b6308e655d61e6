// frame_io.hpp
#pragma once

#include <opencv2/opencv.hpp>
#include <string>
#include <vector>

namespace depth_contour {
namespace utils {

constexpr int kEscKey = 27;

// True for the ESC key code as returned by cv::waitKey
bool isExitKey(int key);

// ---------------- Frame sources -----------------

class FrameSource {
public:
    virtual ~FrameSource() = default;

    // Returns false when no usable frame could be read
    virtual bool read(cv::Mat& frame) = 0;

    // True once a finite source has delivered all of its frames
    virtual bool exhausted() const = 0;

    // Label for the frame last returned by read()
    virtual std::string frameName() const = 0;
};

// Live camera. Releases the device when destroyed.
class CameraSource : public FrameSource {
public:
    CameraSource(int camera_id, int width = 0, int height = 0, int read_timeout_ms = 0);
    ~CameraSource() override;

    CameraSource(const CameraSource&) = delete;
    CameraSource& operator=(const CameraSource&) = delete;

    bool read(cv::Mat& frame) override;
    bool exhausted() const override { return false; }
    std::string frameName() const override;

private:
    cv::VideoCapture cap_;
    int camera_id_;
    long frame_index_;
};

// Every decodable image of a folder, in sorted path order
class ImageFolderSource : public FrameSource {
public:
    explicit ImageFolderSource(const std::string& input_path);

    bool read(cv::Mat& frame) override;
    bool exhausted() const override { return next_ >= paths_.size(); }
    std::string frameName() const override { return current_name_; }

    size_t size() const { return paths_.size(); }

    // Output label for an input file, built from the full file name
    static std::string frameNameFor(const std::string& path);

private:
    std::vector<cv::String> paths_;
    size_t next_;
    std::string current_name_;
};

// ---------------- Displays -----------------

class Display {
public:
    virtual ~Display() = default;

    virtual void show(const std::string& window, const cv::Mat& image) = 0;

    // Key code pressed within delay_ms, or -1
    virtual int pollKey(int delay_ms) = 0;

    // Called before the images of a new frame are shown
    virtual void beginFrame(const std::string& frame_name) { (void)frame_name; }
};

// HighGUI windows. Destroys its windows when destroyed.
class WindowDisplay : public Display {
public:
    explicit WindowDisplay(const std::vector<std::string>& windows);
    ~WindowDisplay() override;

    WindowDisplay(const WindowDisplay&) = delete;
    WindowDisplay& operator=(const WindowDisplay&) = delete;

    void show(const std::string& window, const cv::Mat& image) override;
    int pollKey(int delay_ms) override;

private:
    std::vector<std::string> windows_;
};

// Writes every shown image to <output_path>/<frame>_<window>.png
class ImageWriterDisplay : public Display {
public:
    explicit ImageWriterDisplay(const std::string& output_path);

    void show(const std::string& window, const cv::Mat& image) override;
    int pollKey(int delay_ms) override;
    void beginFrame(const std::string& frame_name) override;

private:
    std::string output_path_;
    std::string frame_name_;
};

}  // namespace utils
}  // namespace depth_contour
