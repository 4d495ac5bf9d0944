#ifndef ANCHORAGE_CORE_COORDINATE_SPACE_H
#define ANCHORAGE_CORE_COORDINATE_SPACE_H

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "anchorage/core/pose.h"

namespace anchorage {

  /**
   * Raised when a transform is requested between two spaces that have no
   * common ancestor. This is a programming error on the caller's side.
   */
  class DisjointSpaceError : public std::runtime_error {
    public:
      DisjointSpaceError(const std::string& from, const std::string& to);
  };

  /**
   * Named reference frame in a tree of frames.
   *
   * COORDINATE CONVENTIONS:
   * - pose(): this space's pose IN its parent space (T_parent_from_this)
   * - The tracker space is the root; anchors are stored there
   * - Parents are held weakly. A space whose parent has been destroyed
   *   becomes a root of its own and is disjoint from its old tree.
   */
  class CoordinateSpace {
    public:
      static std::shared_ptr<CoordinateSpace> createRoot(const std::string& name);
      static std::shared_ptr<CoordinateSpace> createChild(const std::string& name,
                                                          const std::shared_ptr<CoordinateSpace>& parent,
                                                          const Pose& pose_in_parent = Pose::Identity());

      const std::string& name() const { return name_; }
      std::shared_ptr<CoordinateSpace> parent() const { return parent_.lock(); }
      bool isRoot() const { return parent_.expired(); }

      const Pose& pose() const { return pose_; }
      void setPose(const Pose& pose_in_parent);

      const CoordinateSpace& root() const;
      bool sharesRootWith(const CoordinateSpace& other) const;
      bool isAncestorOf(const CoordinateSpace& other) const;

      /**
       * Pose of this space expressed in one of its ancestors (or itself)
       * @throws DisjointSpaceError if ancestor is not on this space's chain
       */
      Pose poseInAncestor(const CoordinateSpace& ancestor) const;

      /**
       * Re-express a pose given in from_space as a pose in to_space.
       * Composes through the lowest common ancestor of the two spaces.
       * @throws DisjointSpaceError if the spaces share no ancestor
       */
      static Pose transformPose(const Pose& pose,
                                const CoordinateSpace& from_space,
                                const CoordinateSpace& to_space);

      Eigen::Matrix4d transformTo(const CoordinateSpace& other) const;

    private:
      CoordinateSpace(const std::string& name,
                      const std::shared_ptr<CoordinateSpace>& parent,
                      const Pose& pose_in_parent);

      // self first, root last
      std::vector<const CoordinateSpace*> ancestry() const;

      std::string name_;
      std::weak_ptr<CoordinateSpace> parent_;
      Pose pose_;
  };

}

#endif /* ANCHORAGE_CORE_COORDINATE_SPACE_H */
