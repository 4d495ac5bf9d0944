#include <algorithm>
#include "anchorage/core/coordinate_space.h"

namespace anchorage {

  DisjointSpaceError::DisjointSpaceError(const std::string& from, const std::string& to) :
    std::runtime_error("no common ancestor between coordinate spaces '" + from + "' and '" + to + "'") {
  }

  CoordinateSpace::CoordinateSpace(const std::string& name,
                                   const std::shared_ptr<CoordinateSpace>& parent,
                                   const Pose& pose_in_parent) :
    name_(name),
    parent_(parent),
    pose_(pose_in_parent) {
  }

  std::shared_ptr<CoordinateSpace> CoordinateSpace::createRoot(const std::string& name) {
    return std::shared_ptr<CoordinateSpace>(new CoordinateSpace(name, nullptr, Pose::Identity()));
  }

  std::shared_ptr<CoordinateSpace> CoordinateSpace::createChild(const std::string& name,
                                                                const std::shared_ptr<CoordinateSpace>& parent,
                                                                const Pose& pose_in_parent) {
    if (!parent) {
      throw std::invalid_argument("coordinate space '" + name + "' requires a parent");
    }
    return std::shared_ptr<CoordinateSpace>(new CoordinateSpace(name, parent, pose_in_parent));
  }

  void CoordinateSpace::setPose(const Pose& pose_in_parent) {
    pose_ = pose_in_parent;
  }

  std::vector<const CoordinateSpace*> CoordinateSpace::ancestry() const {
    std::vector<const CoordinateSpace*> chain;
    const CoordinateSpace* current = this;
    while (current != nullptr) {
      chain.push_back(current);
      std::shared_ptr<CoordinateSpace> parent = current->parent_.lock();
      current = parent.get();
    }
    return chain;
  }

  const CoordinateSpace& CoordinateSpace::root() const {
    return *ancestry().back();
  }

  bool CoordinateSpace::sharesRootWith(const CoordinateSpace& other) const {
    return &root() == &other.root();
  }

  bool CoordinateSpace::isAncestorOf(const CoordinateSpace& other) const {
    std::vector<const CoordinateSpace*> chain = other.ancestry();
    return std::find(chain.begin(), chain.end(), this) != chain.end();
  }

  Pose CoordinateSpace::poseInAncestor(const CoordinateSpace& ancestor) const {
    Pose result = Pose::Identity();
    for (const CoordinateSpace* space : ancestry()) {
      if (space == &ancestor) {
        return result;
      }
      result = space->pose_ * result;
    }
    throw DisjointSpaceError(name_, ancestor.name());
  }

  Pose CoordinateSpace::transformPose(const Pose& pose,
                                      const CoordinateSpace& from_space,
                                      const CoordinateSpace& to_space) {
    if (&from_space == &to_space) {
      return pose;
    }

    std::vector<const CoordinateSpace*> from_chain = from_space.ancestry();
    std::vector<const CoordinateSpace*> to_chain = to_space.ancestry();

    // Lowest common ancestor: first space on the target chain that also
    // appears on the source chain
    const CoordinateSpace* common = nullptr;
    for (const CoordinateSpace* candidate : to_chain) {
      if (std::find(from_chain.begin(), from_chain.end(), candidate) != from_chain.end()) {
        common = candidate;
        break;
      }
    }
    if (common == nullptr) {
      throw DisjointSpaceError(from_space.name(), to_space.name());
    }

    Pose T_common_from_source = from_space.poseInAncestor(*common);
    Pose T_common_from_target = to_space.poseInAncestor(*common);
    return T_common_from_target.inverse() * T_common_from_source * pose;
  }

  Eigen::Matrix4d CoordinateSpace::transformTo(const CoordinateSpace& other) const {
    return transformPose(Pose::Identity(), *this, other).toMatrix();
  }

}
