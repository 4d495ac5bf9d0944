#include "anchorage/tracking/hit_candidate.h"
#include <stdexcept>

namespace anchorage {

std::string toString(HitType type) {
    return nlohmann::json(type).get<std::string>();
}

HitType hitTypeFromString(const std::string& name) {
    nlohmann::json j = name;
    HitType type = j.get<HitType>();
    // Unmapped names fall back to the first enumerator
    if (nlohmann::json(type) != j) {
        throw std::invalid_argument("unknown hit type '" + name + "'");
    }
    return type;
}

} // namespace anchorage
