#ifndef ANCHORAGE_CORE_ANCHOR_REGISTRY_H
#define ANCHORAGE_CORE_ANCHOR_REGISTRY_H

#include <functional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "anchorage/core/anchor.h"

namespace anchorage {

  /**
   * Sole owner of all anchors, keyed by id. Everything else refers to an
   * anchor by id only.
   *
   * Not internally synchronized: mutate from the host's update thread.
   * Backend callbacks arriving on other threads go through
   * AnchorSynchronizer first.
   */
  class AnchorRegistry {
    public:
      AnchorRegistry();

      /**
       * Create an anchor in PENDING state with a freshly generated id
       * @param pose Pose in tracker space
       */
      Anchor& create(const Pose& pose);

      /**
       * Create an anchor with a caller-chosen id
       * @throws std::invalid_argument if id is empty, live, or was removed before
       */
      Anchor& create(const Pose& pose, const std::string& id);

      Anchor* get(const std::string& id);
      const Anchor* get(const std::string& id) const;
      bool contains(const std::string& id) const;

      // Removed ids are never handed out again
      bool isRetired(const std::string& id) const;

      /**
       * Remove an anchor. Removing an absent id is a no-op.
       */
      void remove(const std::string& id);

      /**
       * Overwrite an anchor's pose with a backend report and mark it TRACKED.
       * Unknown ids are logged and ignored, since backend updates can race
       * with local removal.
       */
      void updatePose(const std::string& id, const Pose& pose);

      /**
       * Age every TRACKED anchor by one frame. Anchors that have gone
       * stale_after_frames frames without an update become STALE.
       * @return ids that turned stale on this frame
       */
      std::vector<std::string> advanceFrame(std::size_t stale_after_frames);

      std::size_t size() const { return anchors_.size(); }
      std::vector<const Anchor*> all() const;

      using DidAddAnchorCallback = std::function<void(const Anchor&)>;
      using DidUpdateAnchorCallback = std::function<void(const Anchor&)>;
      using WillRemoveAnchorCallback = std::function<void(const Anchor&)>;

      void setDidAddAnchorCallback(DidAddAnchorCallback callback);
      void setDidUpdateAnchorCallback(DidUpdateAnchorCallback callback);
      void setWillRemoveAnchorCallback(WillRemoveAnchorCallback callback);

      friend void to_json(nlohmann::json& j, const AnchorRegistry& registry) {
        j = nlohmann::json::array();
        for (const Anchor* anchor : registry.all()) {
          j.push_back(*anchor);
        }
      }

    private:
      std::unordered_map<std::string, Anchor> anchors_;
      std::unordered_set<std::string> retired_ids_;
      std::size_t next_id_ = 0;

      DidAddAnchorCallback on_did_add_anchor;
      DidUpdateAnchorCallback on_did_update_anchor;
      WillRemoveAnchorCallback on_will_remove_anchor;

      std::string generateId();
      Anchor& insert(const std::string& id, const Pose& pose);
  };

}

#endif /* ANCHORAGE_CORE_ANCHOR_REGISTRY_H */
