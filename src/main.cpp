#include <iostream>
#include <stdexcept>

#include "initializing_state.hpp"
#include "running_state.hpp"
#include "state_command.hpp"
#include "utils/run_config.hpp"

using namespace depth_contour;

int main(int argc, char** argv) {
    std::cout << "========================================\n";
    std::cout << "  MiDaS Depth Contours\n";
    std::cout << "========================================\n\n";

    utils::RunConfig config;
    try {
        config = utils::parseArgs(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        utils::printUsage(std::cerr, argv[0]);
        return 2;
    }

    if (config.show_help) {
        utils::printUsage(std::cout, argv[0]);
        return 0;
    }

    utils::resolveModelWeights(config);
    utils::printConfig(std::cout, config);

    int exit_code = 0;
    try {
        // Owns the model, the camera and the windows; all released on scope exit
        StateCommand state_command(config);

        // State machine loop
        while (state_command.current_state != SystemState::TERMINATED) {
            switch (state_command.current_state) {
                case SystemState::INITIALIZING: {
                    std::cout << "\n========================================\n";
                    std::cout << "  ENTERING " << toString(state_command.current_state) << " STATE\n";
                    std::cout << "========================================\n\n";

                    InitializingState initializing_state(state_command);
                    state_command.current_state = initializing_state.run();
                    break;
                }

                case SystemState::RUNNING: {
                    std::cout << "\n========================================\n";
                    std::cout << "  ENTERING " << toString(state_command.current_state) << " STATE\n";
                    std::cout << "========================================\n\n";

                    RunningState running_state(state_command);
                    state_command.current_state = running_state.run();
                    break;
                }

                case SystemState::ERROR: {
                    std::cerr << "\n========================================\n";
                    std::cerr << "  " << toString(state_command.current_state) << " STATE\n";
                    std::cerr << "========================================\n";
                    std::cerr << "Error: " << state_command.error_message << "\n\n";

                    exit_code = 1;
                    state_command.current_state = SystemState::TERMINATED;
                    break;
                }

                case SystemState::TERMINATED:
                    // Will exit loop
                    break;
            }
        }

        std::cout << "\nShutting down after " << state_command.frames_processed << " frames...\n";
    } catch (const std::exception& e) {
        std::cerr << "Fatal Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "Shutdown complete.\n";
    return exit_code;
}
