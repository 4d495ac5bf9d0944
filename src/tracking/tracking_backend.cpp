#include <utility>
#include "anchorage/tracking/tracking_backend.h"

namespace anchorage {

HitTestResponse HitTestResponse::hits(std::vector<HitCandidate> candidates) {
    HitTestResponse response;
    response.success = true;
    response.candidates = std::move(candidates);
    return response;
}

HitTestResponse HitTestResponse::failure(std::string error) {
    HitTestResponse response;
    response.success = false;
    response.error = std::move(error);
    return response;
}

} // namespace anchorage
