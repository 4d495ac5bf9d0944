#include "anchorage/tracking/backends/null_backend.h"

namespace anchorage {

void NullBackend::queryHitTest(double screen_x, double screen_y, HitTestCallback callback) {
    if (callback) {
        callback(HitTestResponse::hits({}));
    }
}

} // namespace anchorage
