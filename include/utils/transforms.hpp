// transforms.hpp
#pragma once

#include <opencv2/opencv.hpp>
#include <string>

namespace depth_contour {
namespace utils {

// How the target size bounds the resized image
enum class ResizeMethod {
    LOWER_BOUND,    // Output covers the target (at least net_w x net_h)
    UPPER_BOUND,    // Output fits inside the target (at most net_w x net_h)
    MINIMAL         // Scale as little as possible
};

ResizeMethod parseResizeMethod(const std::string& name);
std::string toString(ResizeMethod method);

// Rounds x to a multiple of `multiple` (half to even). Falls back to floor
// when the result exceeds max_val (ignored if max_val <= 0) and to ceil when
// it is below min_val.
int constrainToMultipleOf(double x, int multiple, int min_val = 0, int max_val = 0);

/**
 * @brief Network input size for a source image.
 *
 * Both returned dimensions are multiples of `multiple` and never zero.
 * Throws std::invalid_argument for an empty source size.
 */
cv::Size computeResizeSize(const cv::Size& src,
                           int net_w, int net_h,
                           bool keep_aspect_ratio,
                           int multiple,
                           ResizeMethod method);

// Bicubic resize to the given size
cv::Mat resizeForNet(const cv::Mat& image, const cv::Size& size);

// BGR uint8 -> RGB float32, scaled to [0,1] and normalized per channel.
// mean and std are given in RGB order.
cv::Mat normalizeImage(const cv::Mat& bgr, const cv::Scalar& mean, const cv::Scalar& stddev);

}  // namespace utils
}  // namespace depth_contour
