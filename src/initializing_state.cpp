#include "initializing_state.hpp"
#include "utils/frame_io.hpp"
#include "utils/midas_utils.hpp"

#include <iostream>
#include <stdexcept>

namespace depth_contour {

InitializingState::InitializingState(StateCommand& state_command)
    : state_command_(state_command) {}

SystemState InitializingState::run() {
    std::cout << "InitializingState: Initializing...\n";

    try {
        initializeModel();
        initializeSource();
        initializeDisplay();
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] Initialization failed: " << e.what() << std::endl;
        state_command_.error_message = e.what();
        return SystemState::ERROR;
    }

    std::cout << "InitializingState: Initialization complete\n\n";
    return SystemState::RUNNING;
}

void InitializingState::initializeModel() {
    if (state_command_.midas) {
        std::cout << "  - MiDaS model already loaded\n";
        return;
    }

    utils::RunConfig& config = state_command_.config;
    utils::resolveModelWeights(config);

    state_command_.midas = std::make_unique<utils::MiDaSDepth>(
        config.model_weights, utils::presetFor(config.model_type),
        config.use_cuda, config.optimize);

    const utils::ModelPreset& preset = state_command_.midas->preset();
    std::cout << "  - MiDaS depth initialized (" << preset.model_type << ", "
              << preset.net_w << "x" << preset.net_h << ", "
              << utils::toString(preset.resize_method) << ", "
              << state_command_.midas->device() << ")\n";
}

void InitializingState::initializeSource() {
    if (state_command_.source) {
        std::cout << "  - Frame source already open\n";
        return;
    }

    const utils::RunConfig& config = state_command_.config;
    if (config.mode == utils::RunMode::FOLDER) {
        auto folder = std::make_unique<utils::ImageFolderSource>(config.input_path);
        if (folder->size() == 0) {
            throw std::runtime_error("No decodable images in " + config.input_path);
        }
        state_command_.source = std::move(folder);
        std::cout << "  - Image folder opened: " << config.input_path << "\n";
    } else {
        state_command_.source = std::make_unique<utils::CameraSource>(
            config.camera_id, config.frame_width, config.frame_height, config.read_timeout_ms);
        std::cout << "  - Camera " << config.camera_id << " opened\n";
    }
}

void InitializingState::initializeDisplay() {
    if (state_command_.display) {
        std::cout << "  - Display already created\n";
        return;
    }

    const utils::RunConfig& config = state_command_.config;
    if (config.mode == utils::RunMode::FOLDER) {
        state_command_.display = std::make_unique<utils::ImageWriterDisplay>(config.output_path);
        std::cout << "  - Writing results to " << config.output_path << "\n";
    } else {
        state_command_.display = std::make_unique<utils::WindowDisplay>(
            std::vector<std::string>{kInputWindow, kMaskWindow, kDepthWindow});
        std::cout << "  - Windows created\n";
    }
}

}  // namespace depth_contour
