#include "running_state.hpp"
#include "utils/frame_io.hpp"
#include "utils/midas_utils.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace depth_contour {

RunningState::RunningState(StateCommand& state_command)
    : state_command_(state_command),
      segmenter_(state_command.config.threshold_level),
      consecutive_failures_(0) {
    if (!state_command_.midas || !state_command_.source || !state_command_.display) {
        throw std::runtime_error("RunningState: Required components not initialized!");
    }
}

FrameResult RunningState::processFrame(const cv::Mat& frame) {
    const utils::RunConfig& config = state_command_.config;
    FrameResult result;

    cv::Mat depth_map = state_command_.midas->getDepthMap(frame);
    result.intensity = utils::depthToIntensity(depth_map, config.depth_divisor, config.intensity_scale);

    utils::SegmentationResult segmentation = segmenter_.segment(result.intensity);
    result.mask = segmentation.mask;
    result.contour_count = segmentation.contours.size();
    result.annotated = utils::drawContours(frame, segmentation.contours,
                                           cv::Scalar(0, 255, 0), config.contour_thickness);
    return result;
}

void RunningState::render(const FrameResult& result) {
    utils::Display& display = *state_command_.display;
    display.show(kInputWindow, result.annotated);
    display.show(kMaskWindow, result.mask);
    display.show(kDepthWindow, result.intensity);
}

SystemState RunningState::run() {
    const utils::RunConfig& config = state_command_.config;
    utils::FrameSource& source = *state_command_.source;
    utils::Display& display = *state_command_.display;
    const bool per_frame_log = config.mode == utils::RunMode::FOLDER;

    std::cout << "RunningState: Starting depth loop (threshold "
              << segmenter_.thresholdLevel() << ")...\n";
    if (config.mode == utils::RunMode::LIVE) {
        std::cout << "Press ESC to quit\n\n";
    }

    auto start_time = std::chrono::steady_clock::now();
    double inference_ms_total = 0.0;
    int frames_since_status = 0;
    cv::Mat frame;

    while (true) {
        // Capture frame
        if (!source.read(frame)) {
            if (source.exhausted()) {
                std::cout << "[INFO] Frame source exhausted after "
                          << state_command_.frames_processed << " frames\n";
                return SystemState::TERMINATED;
            }

            consecutive_failures_++;
            std::cerr << "[WARN] Failed to capture frame (" << consecutive_failures_
                      << "/" << config.max_capture_failures << ")\n";
            if (consecutive_failures_ >= config.max_capture_failures) {
                state_command_.error_message = "Camera capture failed " +
                    std::to_string(consecutive_failures_) + " times in a row";
                return SystemState::ERROR;
            }
            continue;
        }
        consecutive_failures_ = 0;

        FrameResult result;
        try {
            display.beginFrame(source.frameName());
            result = processFrame(frame);
            render(result);
        } catch (const std::exception& e) {
            std::cerr << "[ERROR] Frame processing failed: " << e.what() << std::endl;
            state_command_.error_message = e.what();
            return SystemState::ERROR;
        }

        state_command_.frames_processed++;
        frames_since_status++;
        inference_ms_total += state_command_.midas->lastInferenceMs();

        if (per_frame_log) {
            std::cout << "[INFO] " << source.frameName() << ": "
                      << result.contour_count << " contours, "
                      << std::fixed << std::setprecision(1)
                      << state_command_.midas->lastInferenceMs() << " ms\n";
        } else if (frames_since_status == STATUS_INTERVAL) {
            auto current_time = std::chrono::steady_clock::now();
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                current_time - start_time).count();
            float fps = elapsed > 0 ? (STATUS_INTERVAL * 1000.0f) / elapsed : 0.0f;

            std::cout << "Frame " << state_command_.frames_processed
                      << " - FPS: " << std::fixed << std::setprecision(1) << fps
                      << " - Depth: " << inference_ms_total / STATUS_INTERVAL << " ms"
                      << " - Contours: " << result.contour_count << "\n";

            start_time = current_time;
            inference_ms_total = 0.0;
            frames_since_status = 0;
        }

        int key = display.pollKey(config.key_poll_ms);
        if (utils::isExitKey(key)) {
            std::cout << "Escape hit, closing...\n";
            return SystemState::TERMINATED;
        }
    }
}

}  // namespace depth_contour
