#ifndef DEPTH_CONTOUR_STATE_COMMAND_HPP_
#define DEPTH_CONTOUR_STATE_COMMAND_HPP_

#include <memory>
#include <string>

#include "utils/run_config.hpp"

namespace depth_contour {

namespace utils {
    class MiDaSDepth;
    class FrameSource;
    class Display;
}

// Enum for system states
enum class SystemState {
    INITIALIZING,   // Load the model, open the frame source and the display
    RUNNING,        // Capture -> depth -> contours -> render loop
    ERROR,          // Fatal fault, error_message says why
    TERMINATED      // ESC pressed or the frame source ran out
};

const char* toString(SystemState state);

// Window titles, in display order
constexpr const char* kInputWindow = "input";
constexpr const char* kMaskWindow = "blurred";
constexpr const char* kDepthWindow = "output";

// Data shared between states. Owns the long-lived components, so the
// camera and the windows are released on every exit path.
struct StateCommand {
    SystemState current_state = SystemState::INITIALIZING;

    utils::RunConfig config;

    std::unique_ptr<utils::MiDaSDepth> midas;
    std::unique_ptr<utils::FrameSource> source;
    std::unique_ptr<utils::Display> display;

    // Frames fully processed so far
    long frames_processed = 0;

    std::string error_message;

    explicit StateCommand(const utils::RunConfig& cfg);
    ~StateCommand();

    StateCommand(const StateCommand&) = delete;
    StateCommand& operator=(const StateCommand&) = delete;
};

}  // namespace depth_contour

#endif  // DEPTH_CONTOUR_STATE_COMMAND_HPP_
