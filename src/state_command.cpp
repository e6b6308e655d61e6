#include "state_command.hpp"
#include "utils/frame_io.hpp"
#include "utils/midas_utils.hpp"

namespace depth_contour {

const char* toString(SystemState state) {
    switch (state) {
        case SystemState::INITIALIZING: return "INITIALIZING";
        case SystemState::RUNNING: return "RUNNING";
        case SystemState::ERROR: return "ERROR";
        case SystemState::TERMINATED: return "TERMINATED";
    }
    return "UNKNOWN";
}

StateCommand::StateCommand(const utils::RunConfig& cfg)
    : config(cfg) {}

// Defined here where the component types are complete
StateCommand::~StateCommand() = default;

}  // namespace depth_contour
