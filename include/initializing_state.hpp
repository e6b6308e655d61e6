#ifndef DEPTH_CONTOUR_INITIALIZING_STATE_HPP_
#define DEPTH_CONTOUR_INITIALIZING_STATE_HPP_

#include "state_command.hpp"

namespace depth_contour {

/**
 * @brief InitializingState - load and verify the pipeline components
 *
 * Responsibilities:
 * - Resolve the checkpoint path from the model type preset
 * - Load MiDaS on the selected device (fails fast on a bad checkpoint)
 * - Open the camera or the input folder (fails fast when unavailable)
 * - Create the display surfaces
 *
 * Components already present in StateCommand are kept as they are.
 */
class InitializingState {
 public:
  explicit InitializingState(StateCommand& state_command);

  // Returns RUNNING on success, ERROR with error_message set otherwise
  SystemState run();

 private:
  StateCommand& state_command_;

  void initializeModel();
  void initializeSource();
  void initializeDisplay();
};

}  // namespace depth_contour

#endif  // DEPTH_CONTOUR_INITIALIZING_STATE_HPP_
