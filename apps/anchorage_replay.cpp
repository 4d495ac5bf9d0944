#include <iostream>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "anchorage/session/session.h"
#include "anchorage/tracking/backends/replay_backend.h"

using namespace std;

int main(int argc, const char* argv[]){
  if (argc < 2) {
    std::cerr << "usage: " << argv[0] << " <recording.json> [config.json]" << std::endl;
    return 1;
  }

  try {
    anchorage::SessionConfig config;
    if (argc > 2) {
      config = anchorage::SessionConfig::load(argv[2]);
    }

    std::unique_ptr<anchorage::ReplayBackend> backend = anchorage::ReplayBackend::load(argv[1]);
    anchorage::Session session(*backend, config);
    std::shared_ptr<anchorage::CoordinateSpace> camera = session.createSpace("camera");

    std::cout << "=== Replaying " << backend->pendingHitTests().size() << " hit tests, "
              << backend->remainingFrames() << " frames ===" << std::endl;

    // Hit tests are answered inline, so each tap resolves before the next
    while (!backend->pendingHitTests().empty()) {
      const anchorage::ReplayBackend::RecordedHitTest& hit_test = backend->pendingHitTests().front();
      double x = hit_test.screen_x;
      double y = hit_test.screen_y;

      session.findAnchor(x, y, *camera, [x, y](const anchorage::AnchorResolver::Result& result) {
        std::cout << "tap (" << x << ", " << y << "): ";
        switch (result.status) {
          case anchorage::AnchorResolver::Result::Status::HIT:
            std::cout << "anchor '" << result.offset.anchor_id << "' offset "
                      << nlohmann::json(result.offset.pose).dump() << std::endl;
            break;
          case anchorage::AnchorResolver::Result::Status::NO_HIT:
            std::cout << "no hit" << std::endl;
            break;
          case anchorage::AnchorResolver::Result::Status::BACKEND_QUERY_FAILED:
            std::cout << "query failed: " << result.error << std::endl;
            break;
        }
      });
    }

    // Flush the confirmations for anchors created by the taps
    session.update();

    size_t frame = 0;
    while (backend->advanceFrame()) {
      anchorage::AnchorSynchronizer::UpdateSummary summary = session.update();
      std::cout << "frame " << frame++ << ": " << summary.applied << " applied, "
                << summary.dropped << " dropped, " << summary.turned_stale.size() << " stale" << std::endl;
    }

    std::cout << std::endl << "=== Anchors ===" << std::endl;
    for (const anchorage::Anchor* anchor : session.anchors().all()) {
      std::cout << anchor->id << " [" << anchorage::toString(anchor->state) << "] "
                << nlohmann::json(anchor->pose).dump() << std::endl;
    }
  } catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
