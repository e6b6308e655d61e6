#include "utils/contour_utils.hpp"
#include <stdexcept>
#include <string>

namespace depth_contour {
namespace utils {

ContourSegmenter::ContourSegmenter(int threshold_level)
    : threshold_level_(threshold_level) {
    if (threshold_level < 0 || threshold_level > 255) {
        throw std::invalid_argument("Threshold level out of range: " +
                                    std::to_string(threshold_level));
    }
}

cv::Mat ContourSegmenter::threshold(const cv::Mat& intensity) const {
    if (intensity.empty() || intensity.type() != CV_8UC1) {
        throw std::invalid_argument("Thresholding expects a non-empty CV_8UC1 image");
    }

    // cv::compare writes 255 where the predicate holds and 0 elsewhere
    cv::Mat mask;
    cv::compare(intensity, cv::Scalar(threshold_level_), mask, cv::CMP_GE);
    return mask;
}

std::vector<Contour> ContourSegmenter::findContours(const cv::Mat& mask) const {
    std::vector<Contour> contours;
    cv::findContours(mask, contours, cv::RETR_TREE, cv::CHAIN_APPROX_SIMPLE);
    return contours;
}

SegmentationResult ContourSegmenter::segment(const cv::Mat& intensity) const {
    SegmentationResult result;
    result.mask = threshold(intensity);
    result.contours = findContours(result.mask);
    return result;
}

cv::Mat drawContours(const cv::Mat& frame,
                     const std::vector<Contour>& contours,
                     const cv::Scalar& color,
                     int thickness) {
    cv::Mat annotated = frame.clone();
    cv::drawContours(annotated, contours, -1, color, thickness);
    return annotated;
}

}  // namespace utils
}  // namespace depth_contour
