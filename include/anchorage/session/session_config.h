#ifndef ANCHORAGE_SESSION_SESSION_CONFIG_H
#define ANCHORAGE_SESSION_SESSION_CONFIG_H

#include <cmath>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace anchorage {

// Forward declaration to avoid circular dependency
class HitPicker;

/**
 * Configuration object for Session with all tunable parameters.
 */
struct SessionConfig {

    // === Hit Picking ===
    enum class HitPickerStrategy {
        LAYERED,   // plane with extent > plane > other surface > first feature point
        NEAREST    // nearest hit of any type
    };
    HitPickerStrategy hit_picker_strategy = HitPickerStrategy::LAYERED;

    std::unique_ptr<HitPicker> createHitPicker() const;

    // === Calibration ===
    // Added to the Y translation of every pose a hit test reports. 1.1m is the
    // sitting eye-height baseline; 0 disables the correction.
    double vertical_offset = 1.1;

    // === Anchor Synchronization ===
    std::size_t stale_after_frames = 30;  // update turns without a backend report before TRACKED -> STALE

    // === Debugging ===
    bool enable_debug_output = false;

    // === Persistence ===
    /**
     * Load configuration from a JSON file. Missing keys keep their defaults.
     * @throws std::runtime_error if the file cannot be read
     * @throws std::invalid_argument if stale_after_frames is not positive
     */
    static SessionConfig load(const std::string& path);
    void save(const std::string& path) const;

    // === Validation ===
    bool isValid() const {
        return std::isfinite(vertical_offset) &&
               stale_after_frames > 0;
    }
};

NLOHMANN_JSON_SERIALIZE_ENUM(SessionConfig::HitPickerStrategy, {
    {SessionConfig::HitPickerStrategy::LAYERED, "layered"},
    {SessionConfig::HitPickerStrategy::NEAREST, "nearest"},
})

void to_json(nlohmann::json& j, const SessionConfig& config);
void from_json(const nlohmann::json& j, SessionConfig& config);

} // namespace anchorage

#endif /* ANCHORAGE_SESSION_SESSION_CONFIG_H */
