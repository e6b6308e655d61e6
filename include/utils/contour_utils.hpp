// contour_utils.hpp
#pragma once

#include <opencv2/opencv.hpp>
#include <vector>

namespace depth_contour {
namespace utils {

using Contour = std::vector<cv::Point>;

struct SegmentationResult {
    cv::Mat mask;                     // CV_8UC1, 0 or 255
    std::vector<Contour> contours;    // Outer and inner boundaries of the mask
};

class ContourSegmenter {
public:
    explicit ContourSegmenter(int threshold_level = 125);

    // Pixels at or above the level become 255, the rest 0
    cv::Mat threshold(const cv::Mat& intensity) const;

    std::vector<Contour> findContours(const cv::Mat& mask) const;

    SegmentationResult segment(const cv::Mat& intensity) const;

    int thresholdLevel() const { return threshold_level_; }

private:
    int threshold_level_;
};

// Draws every contour on a copy of the frame
cv::Mat drawContours(const cv::Mat& frame,
                     const std::vector<Contour>& contours,
                     const cv::Scalar& color = cv::Scalar(0, 255, 0),
                     int thickness = 3);

}  // namespace utils
}  // namespace depth_contour
