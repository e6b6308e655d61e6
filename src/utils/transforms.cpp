#include "utils/transforms.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace depth_contour {
namespace utils {

ResizeMethod parseResizeMethod(const std::string& name) {
    if (name == "lower_bound") return ResizeMethod::LOWER_BOUND;
    if (name == "upper_bound") return ResizeMethod::UPPER_BOUND;
    if (name == "minimal") return ResizeMethod::MINIMAL;
    throw std::invalid_argument("Unknown resize method: " + name);
}

std::string toString(ResizeMethod method) {
    switch (method) {
        case ResizeMethod::LOWER_BOUND: return "lower_bound";
        case ResizeMethod::UPPER_BOUND: return "upper_bound";
        case ResizeMethod::MINIMAL: return "minimal";
    }
    return "unknown";
}

int constrainToMultipleOf(double x, int multiple, int min_val, int max_val) {
    // std::nearbyint rounds half to even under the default rounding mode
    int y = static_cast<int>(std::nearbyint(x / multiple) * multiple);

    if (max_val > 0 && y > max_val) {
        y = static_cast<int>(std::floor(x / multiple) * multiple);
    }
    if (y < min_val) {
        y = static_cast<int>(std::ceil(x / multiple) * multiple);
    }
    return y;
}

cv::Size computeResizeSize(const cv::Size& src,
                           int net_w, int net_h,
                           bool keep_aspect_ratio,
                           int multiple,
                           ResizeMethod method) {
    if (src.width <= 0 || src.height <= 0) {
        throw std::invalid_argument("Cannot resize an empty image");
    }
    if (net_w <= 0 || net_h <= 0 || multiple <= 0) {
        throw std::invalid_argument("Network size and stride must be positive");
    }

    double scale_height = static_cast<double>(net_h) / src.height;
    double scale_width = static_cast<double>(net_w) / src.width;

    if (keep_aspect_ratio) {
        switch (method) {
            case ResizeMethod::LOWER_BOUND:
                // scale such that output size is lower bound
                if (scale_width > scale_height) {
                    scale_height = scale_width;
                } else {
                    scale_width = scale_height;
                }
                break;
            case ResizeMethod::UPPER_BOUND:
                // scale such that output size is upper bound
                if (scale_width < scale_height) {
                    scale_height = scale_width;
                } else {
                    scale_width = scale_height;
                }
                break;
            case ResizeMethod::MINIMAL:
                if (std::abs(1.0 - scale_width) < std::abs(1.0 - scale_height)) {
                    scale_height = scale_width;
                } else {
                    scale_width = scale_height;
                }
                break;
        }
    }

    int new_height = 0;
    int new_width = 0;
    switch (method) {
        case ResizeMethod::LOWER_BOUND:
            new_height = constrainToMultipleOf(scale_height * src.height, multiple, net_h);
            new_width = constrainToMultipleOf(scale_width * src.width, multiple, net_w);
            break;
        case ResizeMethod::UPPER_BOUND:
            new_height = constrainToMultipleOf(scale_height * src.height, multiple, 0, net_h);
            new_width = constrainToMultipleOf(scale_width * src.width, multiple, 0, net_w);
            break;
        case ResizeMethod::MINIMAL:
            new_height = constrainToMultipleOf(scale_height * src.height, multiple);
            new_width = constrainToMultipleOf(scale_width * src.width, multiple);
            break;
    }

    // Very elongated frames can round one side down to nothing
    new_height = std::max(new_height, multiple);
    new_width = std::max(new_width, multiple);

    return cv::Size(new_width, new_height);
}

cv::Mat resizeForNet(const cv::Mat& image, const cv::Size& size) {
    cv::Mat resized;
    cv::resize(image, resized, size, 0, 0, cv::INTER_CUBIC);
    return resized;
}

cv::Mat normalizeImage(const cv::Mat& bgr, const cv::Scalar& mean, const cv::Scalar& stddev) {
    if (bgr.empty() || bgr.channels() != 3) {
        throw std::invalid_argument("normalizeImage expects a 3-channel image");
    }

    cv::Mat rgb;
    cv::cvtColor(bgr, rgb, cv::COLOR_BGR2RGB);

    cv::Mat float_img;
    rgb.convertTo(float_img, CV_32FC3, 1.0 / 255.0);

    cv::subtract(float_img, mean, float_img);
    cv::divide(float_img, stddev, float_img);
    return float_img;
}

}  // namespace utils
}  // namespace depth_contour
