// midas_utils.hpp
#pragma once

#include <torch/torch.h>
#include <torch/script.h>
#include <opencv2/opencv.hpp>
#include <string>
#include <vector>

#include "utils/transforms.hpp"

namespace depth_contour {
namespace utils {

// Input geometry and normalization expected by one MiDaS checkpoint family
struct ModelPreset {
    std::string model_type;
    std::string default_weights;
    int net_w;
    int net_h;
    ResizeMethod resize_method;
    cv::Scalar mean;      // RGB order
    cv::Scalar stddev;    // RGB order
};

// Throws std::invalid_argument for an unknown model type
const ModelPreset& presetFor(const std::string& model_type);
std::vector<std::string> availableModelTypes();

/**
 * @brief Monocular depth estimation with a TorchScript MiDaS checkpoint.
 *
 * The network output is relative inverse depth: larger values are closer.
 */
class MiDaSDepth {
public:
    static constexpr int kStride = 32;

    MiDaSDepth(const std::string& model_path, const ModelPreset& preset,
               bool use_cuda = true, bool optimize = true);

    // Wraps an already loaded module
    MiDaSDepth(torch::jit::script::Module model, const ModelPreset& preset,
               bool use_cuda = true, bool optimize = true);

    // Depth map (CV_32FC1) at the resolution of the input frame
    cv::Mat getDepthMap(const cv::Mat& frame);

    // Frame -> normalized [1,3,h,w] float tensor on the model device
    torch::Tensor preprocess(const cv::Mat& frame);

    // One forward pass. Returns a [1,h,w] float tensor.
    torch::Tensor infer(const torch::Tensor& sample);

    // Bicubic upsample of a [1,h,w] prediction to orig_size
    cv::Mat upsample(const torch::Tensor& prediction, const cv::Size& orig_size);

    const ModelPreset& preset() const { return preset_; }
    torch::Device device() const { return device_; }
    bool halfPrecision() const { return half_precision_; }
    double lastInferenceMs() const { return last_inference_ms_; }

private:
    torch::jit::script::Module model_;
    ModelPreset preset_;
    torch::Device device_;
    bool use_cuda_;
    bool half_precision_;
    double last_inference_ms_;

    void prepareModel(bool optimize);
};

// depth / divisor * scale, saturated to [0,255] as CV_8UC1
cv::Mat depthToIntensity(const cv::Mat& depth, double divisor = 1000.0, double scale = 255.0);

}  // namespace utils
}  // namespace depth_contour
