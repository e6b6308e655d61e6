#ifndef DEPTH_CONTOUR_RUNNING_STATE_HPP_
#define DEPTH_CONTOUR_RUNNING_STATE_HPP_

#include <opencv2/opencv.hpp>

#include "state_command.hpp"
#include "utils/contour_utils.hpp"

namespace depth_contour {

// Artifacts of one processed frame
struct FrameResult {
    cv::Mat annotated;      // Input frame with contours drawn
    cv::Mat mask;           // Binary mask
    cv::Mat intensity;      // 8-bit depth image
    size_t contour_count = 0;
};

/**
 * @brief RunningState - the capture / depth / contour / render loop
 *
 * Runs until ESC is read from the display, the frame source runs out, or
 * capture keeps failing (fatal).
 */
class RunningState {
 public:
  explicit RunningState(StateCommand& state_command);

  // Returns TERMINATED or ERROR
  SystemState run();

  // Depth, threshold and contours for a single frame, no capture or display
  FrameResult processFrame(const cv::Mat& frame);

 private:
  StateCommand& state_command_;
  utils::ContourSegmenter segmenter_;
  int consecutive_failures_;

  static constexpr int STATUS_INTERVAL = 30;

  void render(const FrameResult& result);
};

}  // namespace depth_contour

#endif  // DEPTH_CONTOUR_RUNNING_STATE_HPP_
