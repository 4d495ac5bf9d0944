#include "anchorage/session/session_config.h"
#include "anchorage/tracking/hit_picking/hit_picker.h"
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace anchorage {

std::unique_ptr<HitPicker> SessionConfig::createHitPicker() const {
    switch (hit_picker_strategy) {
        case HitPickerStrategy::LAYERED:
            if (enable_debug_output) {
                std::cout << "Session: Using layered hit picker" << std::endl;
            }
            return std::make_unique<LayeredHitPicker>();

        case HitPickerStrategy::NEAREST:
            if (enable_debug_output) {
                std::cout << "Session: Using nearest hit picker" << std::endl;
            }
            return std::make_unique<NearestHitPicker>();

        default:
            std::cout << "Session: Unknown hit picker strategy, defaulting to layered" << std::endl;
            return std::make_unique<LayeredHitPicker>();
    }
}

SessionConfig SessionConfig::load(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw std::runtime_error("could not open session config: " + path);
    }
    SessionConfig config = nlohmann::json::parse(ifs).get<SessionConfig>();
    return config;
}

void SessionConfig::save(const std::string& path) const {
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        throw std::runtime_error("could not write session config: " + path);
    }
    ofs << nlohmann::json(*this).dump(2) << std::endl;
}

void to_json(nlohmann::json& j, const SessionConfig& config) {
    j = nlohmann::json{
        {"hit_picker_strategy", config.hit_picker_strategy},
        {"vertical_offset", config.vertical_offset},
        {"stale_after_frames", config.stale_after_frames},
        {"enable_debug_output", config.enable_debug_output},
    };
}

void from_json(const nlohmann::json& j, SessionConfig& config) {
    SessionConfig defaults;
    config.hit_picker_strategy = j.value("hit_picker_strategy", defaults.hit_picker_strategy);
    config.vertical_offset = j.value("vertical_offset", defaults.vertical_offset);
    // Read signed so a negative count is rejected rather than wrapped
    long long stale_after_frames = j.value("stale_after_frames",
                                           static_cast<long long>(defaults.stale_after_frames));
    if (stale_after_frames <= 0) {
        throw std::invalid_argument("stale_after_frames must be positive, got " +
                                    std::to_string(stale_after_frames));
    }
    config.stale_after_frames = static_cast<std::size_t>(stale_after_frames);
    config.enable_debug_output = j.value("enable_debug_output", defaults.enable_debug_output);
}

} // namespace anchorage
