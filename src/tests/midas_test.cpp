#include "utils/contour_utils.hpp"
#include "utils/midas_utils.hpp"
#include "test_common.hpp"

#include <torch/torch.h>
#include <torch/script.h>
#include <opencv2/opencv.hpp>
#include <cmath>
#include <cstring>
#include <stdexcept>

using namespace depth_contour::utils;

namespace {

// Stand-in for a MiDaS checkpoint: [1,3,h,w] -> [1,h,w]
torch::jit::script::Module makeStubModel() {
    torch::jit::script::Module module("StubDepth");
    module.define(R"(
    def forward(self, x):
        return x.mean(dim=1) * 100.0 + 500.0
    )");
    return module;
}

// Horizontal gradient with a bright square, like a near object
cv::Mat makeTestFrame() {
    cv::Mat frame(480, 640, CV_8UC3);
    for (int y = 0; y < frame.rows; ++y) {
        for (int x = 0; x < frame.cols; ++x) {
            uchar v = static_cast<uchar>((x * 255) / frame.cols);
            frame.at<cv::Vec3b>(y, x) = cv::Vec3b(v, v, v);
        }
    }
    cv::rectangle(frame, cv::Rect(200, 150, 160, 120), cv::Scalar(255, 255, 255), cv::FILLED);
    return frame;
}

void testPresets() {
    test::section("model presets");

    const ModelPreset& small = presetFor("midas_v21_small");
    test::expect(small.net_w == 256 && small.net_h == 256, "midas_v21_small uses 256x256");
    test::expect(small.resize_method == ResizeMethod::UPPER_BOUND, "midas_v21_small resizes upper_bound");
    test::expect(small.default_weights == "weights/midas_v21_small-70d6b9c8.pt",
                 "midas_v21_small default weights");

    test::expect(presetFor("midas_v21").model_type == "midas_v21_large", "midas_v21 aliases midas_v21_large");

    const ModelPreset& dpt = presetFor("dpt_large");
    test::expect(dpt.net_w == 384 && dpt.resize_method == ResizeMethod::MINIMAL,
                 "dpt_large uses 384 and minimal resize");
    test::expect(dpt.mean == cv::Scalar(0.5, 0.5, 0.5), "dpt_large normalizes with 0.5");

    bool threw = false;
    try {
        presetFor("resnet50");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    test::expect(threw, "unknown model type is rejected");
}

void testMissingCheckpoint() {
    test::section("checkpoint loading");

    bool threw = false;
    try {
        MiDaSDepth midas("weights/does-not-exist.pt", presetFor("midas_v21_small"), false);
    } catch (const std::runtime_error& e) {
        threw = std::string(e.what()).find("does-not-exist.pt") != std::string::npos;
    }
    test::expect(threw, "missing checkpoint fails fast with its path in the message");
}

void testPreprocess(MiDaSDepth& midas) {
    test::section("preprocess");

    torch::Tensor sample = midas.preprocess(makeTestFrame());
    test::expect(sample.dim() == 4, "sample is 4-D");
    test::expect(sample.size(0) == 1 && sample.size(1) == 3, "sample is [1,3,h,w]");
    test::expect(sample.size(2) == 192 && sample.size(3) == 256, "640x480 frame -> 256x192 network input");
    test::expect(sample.scalar_type() == torch::kFloat32, "sample is float32");

    bool threw = false;
    try {
        midas.preprocess(cv::Mat());
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    test::expect(threw, "empty frame is rejected");

    threw = false;
    try {
        midas.preprocess(cv::Mat(480, 640, CV_8UC1, cv::Scalar(0)));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    test::expect(threw, "single-channel frame is rejected");
}

void testBicubicIdentity(MiDaSDepth& midas) {
    test::section("bicubic upsample");

    torch::manual_seed(7);
    torch::Tensor grid = torch::rand({1, 5, 6}) * 1000.0;

    // With an odd integer factor, output pixel 3k+1 sits exactly on source sample k
    cv::Mat upsampled = midas.upsample(grid, cv::Size(18, 15));
    test::expect(upsampled.size() == cv::Size(18, 15) && upsampled.type() == CV_32FC1,
                 "upsampled to 18x15 CV_32FC1");

    auto acc = grid.accessor<float, 3>();
    float max_err = 0.0f;
    for (int i = 0; i < 5; ++i) {
        for (int j = 0; j < 6; ++j) {
            float expected = acc[0][i][j];
            float actual = upsampled.at<float>(3 * i + 1, 3 * j + 1);
            max_err = std::max(max_err, std::abs(expected - actual));
        }
    }
    std::cout << "  max error at sample points: " << max_err << "\n";
    test::expect(max_err < 1e-2f, "known values reproduced at the source sample points");
}

void testIntensity() {
    test::section("depth to intensity");

    cv::Mat depth = (cv::Mat_<float>(1, 5) << -500.0f, 0.0f, 400.0f, 1000.0f, 5000.0f);
    cv::Mat intensity = depthToIntensity(depth);

    test::expect(intensity.type() == CV_8UC1, "intensity is CV_8UC1");
    test::expect(intensity.at<uchar>(0, 0) == 0, "negative depth clamps to 0");
    test::expect(intensity.at<uchar>(0, 1) == 0, "zero depth -> 0");
    test::expect(intensity.at<uchar>(0, 2) == 102, "400 -> 400/1000*255 = 102");
    test::expect(intensity.at<uchar>(0, 3) == 255, "1000 -> 255");
    test::expect(intensity.at<uchar>(0, 4) == 255, "5000 clamps to 255 instead of wrapping");

    // 489 -> 124.695 and 490 -> 124.95 truncate below the 125 level; 491 -> 125.205 does not
    cv::Mat near_level = (cv::Mat_<float>(1, 3) << 489.0f, 490.0f, 491.0f);
    cv::Mat near_intensity = depthToIntensity(near_level);
    test::expect(near_intensity.at<uchar>(0, 0) == 124, "489 truncates to 124");
    test::expect(near_intensity.at<uchar>(0, 1) == 124, "490 truncates to 124");
    test::expect(near_intensity.at<uchar>(0, 2) == 125, "491 truncates to 125");

    cv::Mat mask = ContourSegmenter(125).threshold(near_intensity);
    test::expect(mask.at<uchar>(0, 0) == 0 && mask.at<uchar>(0, 1) == 0,
                 "fractional values just under the level stay background");
    test::expect(mask.at<uchar>(0, 2) == 255, "value at the level becomes foreground");
}

void testEndToEndDeterminism(MiDaSDepth& midas) {
    test::section("end-to-end determinism");

    cv::Mat frame = makeTestFrame();
    ContourSegmenter segmenter(125);

    cv::Mat depth_a = midas.getDepthMap(frame);
    cv::Mat depth_b = midas.getDepthMap(frame);

    test::expect(depth_a.size() == frame.size(), "depth map matches the frame size");
    test::expect(std::memcmp(depth_a.data, depth_b.data, depth_a.total() * depth_a.elemSize()) == 0,
                 "depth maps are byte-identical across runs");

    SegmentationResult seg_a = segmenter.segment(depthToIntensity(depth_a));
    SegmentationResult seg_b = segmenter.segment(depthToIntensity(depth_b));

    test::expect(cv::countNonZero(seg_a.mask != seg_b.mask) == 0, "masks are byte-identical");
    test::expect(seg_a.contours == seg_b.contours, "contours are identical");
    test::expect(!seg_a.contours.empty(), "bright square produces contours");
    test::expect(midas.lastInferenceMs() > 0.0, "inference time recorded");
}

}  // namespace

int main() {
    std::cout << "\n========================================\n";
    std::cout << "  MiDaS Depth Test\n";
    std::cout << "========================================\n";

    testPresets();
    testMissingCheckpoint();
    testIntensity();

    try {
        MiDaSDepth midas(makeStubModel(), presetFor("midas_v21_small"),
                         /*use_cuda=*/false, /*optimize=*/true);
        test::expect(!midas.halfPrecision(), "optimize leaves a CPU model in float32");

        testPreprocess(midas);
        testBicubicIdentity(midas);
        testEndToEndDeterminism(midas);
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        test::expect(false, "stub model pipeline ran without exceptions");
    }

    return test::finish("MiDaS Depth Test");
}
