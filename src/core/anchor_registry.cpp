#include <algorithm>
#include <iostream>
#include <stdexcept>
#include "anchorage/core/anchor_registry.h"

namespace anchorage {

  AnchorRegistry::AnchorRegistry() {
  }

  Anchor& AnchorRegistry::create(const Pose& pose) {
    return insert(generateId(), pose);
  }

  Anchor& AnchorRegistry::create(const Pose& pose, const std::string& id) {
    if (id.empty()) {
      throw std::invalid_argument("anchor id must not be empty");
    }
    if (anchors_.count(id)) {
      throw std::invalid_argument("anchor '" + id + "' already exists");
    }
    if (retired_ids_.count(id)) {
      throw std::invalid_argument("anchor '" + id + "' was removed and cannot be recreated");
    }
    return insert(id, pose);
  }

  Anchor* AnchorRegistry::get(const std::string& id) {
    auto it = anchors_.find(id);
    return it == anchors_.end() ? nullptr : &it->second;
  }

  const Anchor* AnchorRegistry::get(const std::string& id) const {
    auto it = anchors_.find(id);
    return it == anchors_.end() ? nullptr : &it->second;
  }

  bool AnchorRegistry::contains(const std::string& id) const {
    return anchors_.count(id) > 0;
  }

  bool AnchorRegistry::isRetired(const std::string& id) const {
    return retired_ids_.count(id) > 0;
  }

  void AnchorRegistry::remove(const std::string& id) {
    auto it = anchors_.find(id);
    if (it == anchors_.end()) {
      return;
    }

    // Notify BEFORE deletion so observers still see the anchor data
    it->second.state = Anchor::TrackingState::REMOVED;
    if (on_will_remove_anchor) {
      on_will_remove_anchor(it->second);
    }

    retired_ids_.insert(id);
    anchors_.erase(it);
  }

  void AnchorRegistry::updatePose(const std::string& id, const Pose& pose) {
    Anchor* anchor = get(id);
    if (anchor == nullptr) {
      std::cout << "WARNING: AnchorRegistry: pose update for unknown anchor '" << id
                << "' ignored" << std::endl;
      return;
    }

    anchor->pose = pose;
    anchor->frames_since_update = 0;
    anchor->state = Anchor::TrackingState::TRACKED;  // PENDING/STALE -> TRACKED

    if (on_did_update_anchor) {
      on_did_update_anchor(*anchor);
    }
  }

  std::vector<std::string> AnchorRegistry::advanceFrame(std::size_t stale_after_frames) {
    std::vector<std::string> turned_stale;
    for (auto& [id, anchor] : anchors_) {
      if (anchor.state != Anchor::TrackingState::TRACKED) {
        continue;
      }
      // The turn that delivered the last report counts too, so this fires on
      // the stale_after_frames-th silent turn
      anchor.frames_since_update++;
      if (anchor.frames_since_update > stale_after_frames) {
        anchor.state = Anchor::TrackingState::STALE;
        turned_stale.push_back(id);
      }
    }
    std::sort(turned_stale.begin(), turned_stale.end());

    if (on_did_update_anchor) {
      for (const std::string& id : turned_stale) {
        on_did_update_anchor(anchors_.at(id));
      }
    }
    return turned_stale;
  }

  std::vector<const Anchor*> AnchorRegistry::all() const {
    std::vector<const Anchor*> result;
    result.reserve(anchors_.size());
    for (const auto& [id, anchor] : anchors_) {
      result.push_back(&anchor);
    }
    std::sort(result.begin(), result.end(),
      [](const Anchor* a, const Anchor* b) { return a->id < b->id; });
    return result;
  }

  // Callback setters
  void AnchorRegistry::setDidAddAnchorCallback(DidAddAnchorCallback callback) {
    on_did_add_anchor = callback;
  }

  void AnchorRegistry::setDidUpdateAnchorCallback(DidUpdateAnchorCallback callback) {
    on_did_update_anchor = callback;
  }

  void AnchorRegistry::setWillRemoveAnchorCallback(WillRemoveAnchorCallback callback) {
    on_will_remove_anchor = callback;
  }

  // Private Methods

  std::string AnchorRegistry::generateId() {
    // Skip ids a caller has claimed explicitly or that were retired
    std::string id;
    do {
      id = "anchor-" + std::to_string(next_id_++);
    } while (anchors_.count(id) || retired_ids_.count(id));
    return id;
  }

  Anchor& AnchorRegistry::insert(const std::string& id, const Pose& pose) {
    auto [it, inserted] = anchors_.emplace(id, Anchor{id, pose});
    if (on_did_add_anchor) {
      on_did_add_anchor(it->second);
    }
    return it->second;
  }

}
