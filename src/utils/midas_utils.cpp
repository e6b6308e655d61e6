#include "utils/midas_utils.hpp"
#include <chrono>
#include <cstring>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace depth_contour {
namespace utils {

namespace {

const cv::Scalar kImageNetMean(0.485, 0.456, 0.406);
const cv::Scalar kImageNetStd(0.229, 0.224, 0.225);

const std::vector<ModelPreset>& presetTable() {
    static const std::vector<ModelPreset> presets = {
        {"midas_v21_small", "weights/midas_v21_small-70d6b9c8.pt",
         256, 256, ResizeMethod::UPPER_BOUND, kImageNetMean, kImageNetStd},
        {"midas_v21_large", "weights/midas_v21-f6b98070.pt",
         384, 384, ResizeMethod::UPPER_BOUND, kImageNetMean, kImageNetStd},
        {"dpt_large", "weights/dpt_large-midas-2f21e586.pt",
         384, 384, ResizeMethod::MINIMAL, cv::Scalar(0.5, 0.5, 0.5), cv::Scalar(0.5, 0.5, 0.5)},
        {"dpt_hybrid", "weights/dpt_hybrid-midas-501f0c75.pt",
         384, 384, ResizeMethod::MINIMAL, cv::Scalar(0.5, 0.5, 0.5), cv::Scalar(0.5, 0.5, 0.5)},
    };
    return presets;
}

}  // namespace

const ModelPreset& presetFor(const std::string& model_type) {
    // "midas_v21" is the name used by the released weight files
    const std::string key = (model_type == "midas_v21") ? "midas_v21_large" : model_type;

    for (const auto& preset : presetTable()) {
        if (preset.model_type == key) {
            return preset;
        }
    }
    throw std::invalid_argument("Unknown model type: " + model_type);
}

std::vector<std::string> availableModelTypes() {
    std::vector<std::string> names;
    for (const auto& preset : presetTable()) {
        names.push_back(preset.model_type);
    }
    return names;
}

MiDaSDepth::MiDaSDepth(const std::string& model_path, const ModelPreset& preset,
                       bool use_cuda, bool optimize)
    : preset_(preset),
      device_((use_cuda && torch::cuda::is_available()) ? torch::kCUDA : torch::kCPU),
      use_cuda_(use_cuda),
      half_precision_(false),
      last_inference_ms_(0.0) {
    if (!std::ifstream(model_path).good()) {
        throw std::runtime_error("MiDaS checkpoint not found: " + model_path);
    }

    try {
        model_ = torch::jit::load(model_path, device_);
    }
    catch (const c10::Error& e) {
        std::cerr << "[ERROR] Error loading the MiDaS model: " << e.what_without_backtrace() << std::endl;
        throw std::runtime_error("Failed to load MiDaS checkpoint " + model_path +
                                 " (expected a TorchScript export)");
    }

    prepareModel(optimize);
    std::cout << "[INFO] Loaded MiDaS model " << preset_.model_type
              << " from " << model_path << std::endl;
}

MiDaSDepth::MiDaSDepth(torch::jit::script::Module model, const ModelPreset& preset,
                       bool use_cuda, bool optimize)
    : model_(std::move(model)),
      preset_(preset),
      device_((use_cuda && torch::cuda::is_available()) ? torch::kCUDA : torch::kCPU),
      use_cuda_(use_cuda),
      half_precision_(false),
      last_inference_ms_(0.0) {
    prepareModel(optimize);
}

void MiDaSDepth::prepareModel(bool optimize) {
    if (use_cuda_ && !device_.is_cuda()) {
        std::cout << "[WARN] CUDA requested but not available, running MiDaS on CPU" << std::endl;
    }
    std::cout << "[INFO] MiDaS device: " << device_ << std::endl;

    model_.eval();
    model_.to(device_);

    if (device_.is_cuda()) {
        at::globalContext().setUserEnabledCuDNN(true);
        at::globalContext().setBenchmarkCuDNN(true);
    }

    // Half precision and channels-last only pay off on the GPU
    if (optimize && device_.is_cuda()) {
        model_.to(torch::kHalf);
        for (auto param : model_.parameters()) {
            if (param.dim() == 4) {
                param.set_data(param.contiguous(torch::MemoryFormat::ChannelsLast));
            }
        }
        half_precision_ = true;
        std::cout << "[INFO] MiDaS optimized: half precision, channels-last" << std::endl;
    }
}

torch::Tensor MiDaSDepth::preprocess(const cv::Mat& frame) {
    if (frame.empty() || frame.channels() != 3) {
        throw std::invalid_argument("MiDaS expects a non-empty 3-channel frame");
    }

    cv::Size net_size = computeResizeSize(frame.size(), preset_.net_w, preset_.net_h,
                                          /*keep_aspect_ratio=*/true, kStride,
                                          preset_.resize_method);

    cv::Mat resized = resizeForNet(frame, net_size);
    cv::Mat normalized = normalizeImage(resized, preset_.mean, preset_.stddev);

    torch::Tensor tensor_image = torch::from_blob(
        normalized.data,
        {1, normalized.rows, normalized.cols, 3},
        torch::kFloat32
    );

    // NHWC -> NCHW; contiguous() copies out of the cv::Mat buffer
    tensor_image = tensor_image.permute({0, 3, 1, 2}).contiguous();

    return tensor_image.to(device_);
}

torch::Tensor MiDaSDepth::infer(const torch::Tensor& sample) {
    torch::NoGradGuard no_grad;

    torch::Tensor input = sample.to(device_);
    if (half_precision_) {
        input = input.contiguous(torch::MemoryFormat::ChannelsLast).to(torch::kHalf);
    }

    torch::Tensor prediction = model_.forward({input}).toTensor();

    if (prediction.dim() == 4) {
        prediction = prediction.squeeze(1);
    } else if (prediction.dim() == 2) {
        prediction = prediction.unsqueeze(0);
    }
    if (prediction.dim() != 3) {
        throw std::runtime_error("Unexpected MiDaS output rank: " +
                                 std::to_string(prediction.dim()));
    }

    return prediction.to(torch::kFloat32);
}

cv::Mat MiDaSDepth::upsample(const torch::Tensor& prediction, const cv::Size& orig_size) {
    torch::NoGradGuard no_grad;

    auto resized = torch::nn::functional::interpolate(
        prediction.to(torch::kFloat32).unsqueeze(1),
        torch::nn::functional::InterpolateFuncOptions()
            .size(std::vector<int64_t>{orig_size.height, orig_size.width})
            .mode(torch::kBicubic)
            .align_corners(false)
    ).squeeze(1).squeeze(0).to(torch::kCPU).contiguous();

    cv::Mat depth_map(orig_size.height, orig_size.width, CV_32FC1);
    std::memcpy(depth_map.data, resized.data_ptr<float>(),
                sizeof(float) * orig_size.height * orig_size.width);

    return depth_map;
}

cv::Mat MiDaSDepth::getDepthMap(const cv::Mat& frame) {
    auto start = std::chrono::steady_clock::now();

    torch::Tensor sample = preprocess(frame);
    torch::Tensor prediction = infer(sample);
    cv::Mat depth_map = upsample(prediction, frame.size());

    auto end = std::chrono::steady_clock::now();
    last_inference_ms_ = std::chrono::duration<double, std::milli>(end - start).count();

    return depth_map;
}

cv::Mat depthToIntensity(const cv::Mat& depth, double divisor, double scale) {
    if (divisor == 0.0) {
        throw std::invalid_argument("Depth divisor must be non-zero");
    }

    // Divide, then scale, in double so exact values like 400 -> 102 stay exact
    cv::Mat scaled;
    depth.convertTo(scaled, CV_64F);
    scaled = scaled / divisor * scale;
    scaled = cv::min(cv::max(scaled, 0.0), 255.0);

    // Truncate toward zero; convertTo alone would round to nearest
    cv::Mat intensity(scaled.size(), CV_8UC1);
    for (int r = 0; r < scaled.rows; ++r) {
        const double* src = scaled.ptr<double>(r);
        uchar* dst = intensity.ptr<uchar>(r);
        for (int c = 0; c < scaled.cols; ++c) {
            dst[c] = static_cast<uchar>(src[c]);
        }
    }
    return intensity;
}

}  // namespace utils
}  // namespace depth_contour
