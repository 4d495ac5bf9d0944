#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <memory>
#include <type_traits>
#include <vector>
#include "anchorage/tracking/anchor_resolver.h"
#include "anchorage/tracking/hit_picking/hit_picker.h"
#include "tracking/fake_backend.h"

using namespace anchorage;
using anchorage::test_support::FakeBackend;
using anchorage::test_support::makeCandidate;
using anchorage::test_support::poseAt;

class AnchorResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        tracker_ = CoordinateSpace::createRoot("tracker");
        camera_ = CoordinateSpace::createChild("camera", tracker_, poseAt(0, 1.5, 0));
        resolver_ = makeResolver(config_);
    }

    std::unique_ptr<AnchorResolver> makeResolver(const SessionConfig& config) {
        return std::make_unique<AnchorResolver>(backend_, registry_, tracker_,
                                                config.createHitPicker(), config);
    }

    // Resolve against an inline backend and return the single result
    AnchorResolver::Result resolve(double x = 0.5, double y = 0.5) {
        std::vector<AnchorResolver::Result> results;
        resolver_->resolveHit(x, y, *camera_, [&](const AnchorResolver::Result& result) {
            results.push_back(result);
        });
        EXPECT_EQ(results.size(), 1);
        return results.empty() ? AnchorResolver::Result() : results.front();
    }

    FakeBackend backend_;
    AnchorRegistry registry_;
    SessionConfig config_;
    std::shared_ptr<CoordinateSpace> tracker_;
    std::shared_ptr<CoordinateSpace> camera_;
    std::unique_ptr<AnchorResolver> resolver_;
};

// ============================================================================
// Result Status
// ============================================================================

TEST_F(AnchorResolverTest, EmptyCandidatesIsNoHit) {
    // Given
    backend_.script(HitTestResponse::hits({}));
    // When
    AnchorResolver::Result result = resolve();
    // Then
    EXPECT_EQ(result.status, AnchorResolver::Result::Status::NO_HIT);
    EXPECT_FALSE(result.hit());
    EXPECT_EQ(registry_.size(), 0);
    EXPECT_TRUE(backend_.added.empty());
}

TEST_F(AnchorResolverTest, BackendFailureIsNotNoHit) {
    // Given
    backend_.script(HitTestResponse::failure("session interrupted"));
    // When
    AnchorResolver::Result result = resolve();
    // Then
    EXPECT_EQ(result.status, AnchorResolver::Result::Status::BACKEND_QUERY_FAILED);
    EXPECT_EQ(result.error, "session interrupted");
    EXPECT_EQ(registry_.size(), 0);
}

TEST_F(AnchorResolverTest, QueryForwardsScreenPoint) {
    // When
    resolve(0.25, 0.75);
    // Then
    ASSERT_EQ(backend_.queries.size(), 1);
    EXPECT_DOUBLE_EQ(backend_.queries[0].first, 0.25);
    EXPECT_DOUBLE_EQ(backend_.queries[0].second, 0.75);
}

// ============================================================================
// Anchor Matching
// ============================================================================

TEST_F(AnchorResolverTest, SameSurfaceResolvesToSameAnchor) {
    // Given
    Pose plane = poseAt(0, 0, -2);
    backend_.script(HitTestResponse::hits({
        makeCandidate(HitType::EXISTING_PLANE_USING_EXTENT, 2.0, "plane-1", plane, poseAt(0.2, 0, -2))}));
    backend_.script(HitTestResponse::hits({
        makeCandidate(HitType::EXISTING_PLANE_USING_EXTENT, 2.1, "plane-1", plane, poseAt(-0.3, 0, -1.8))}));
    // When
    AnchorResolver::Result first = resolve();
    AnchorResolver::Result second = resolve();
    // Then
    ASSERT_TRUE(first.hit());
    ASSERT_TRUE(second.hit());
    EXPECT_EQ(first.offset.anchor_id, "plane-1");
    EXPECT_EQ(second.offset.anchor_id, first.offset.anchor_id);
    EXPECT_EQ(registry_.size(), 1);
    EXPECT_EQ(backend_.added.size(), 1);
}

TEST_F(AnchorResolverTest, HitsWithoutSurfaceIdGetFreshAnchors) {
    // Given
    backend_.script(HitTestResponse::hits({makeCandidate(HitType::FEATURE_POINT, 1.0, "", poseAt(1, 0, 0))}));
    backend_.script(HitTestResponse::hits({makeCandidate(HitType::FEATURE_POINT, 1.0, "", poseAt(1, 0, 0))}));
    // When
    AnchorResolver::Result first = resolve();
    AnchorResolver::Result second = resolve();
    // Then
    ASSERT_TRUE(first.hit());
    ASSERT_TRUE(second.hit());
    EXPECT_NE(first.offset.anchor_id, second.offset.anchor_id);
    EXPECT_EQ(registry_.size(), 2);
}

TEST_F(AnchorResolverTest, RemovedSurfaceAnchorIsNotResurrected) {
    // Given
    for (int i = 0; i < 3; i++) {
        backend_.script(HitTestResponse::hits({makeCandidate(HitType::EXISTING_PLANE, 1.0, "plane-1")}));
    }
    AnchorResolver::Result original = resolve();
    registry_.remove(original.offset.anchor_id);
    // When
    AnchorResolver::Result replacement = resolve();
    AnchorResolver::Result again = resolve();
    // Then
    EXPECT_EQ(original.offset.anchor_id, "plane-1");
    EXPECT_NE(replacement.offset.anchor_id, "plane-1");
    EXPECT_TRUE(registry_.contains(replacement.offset.anchor_id));
    EXPECT_EQ(again.offset.anchor_id, replacement.offset.anchor_id);
    EXPECT_EQ(registry_.size(), 1);
}

TEST_F(AnchorResolverTest, ManualAnchorWithSurfaceIdIsNotReused) {
    // Given: a caller-placed anchor already holds the surface's name
    config_.vertical_offset = 0.0;
    resolver_ = makeResolver(config_);
    registry_.create(poseAt(5, 0, 5), "plane-1");
    Pose surface = poseAt(0, 0, 0);
    Pose hit = poseAt(0.2, 0, 0.1);
    backend_.script(HitTestResponse::hits({
        makeCandidate(HitType::EXISTING_PLANE, 1.0, "plane-1", surface, hit)}));
    backend_.script(HitTestResponse::hits({
        makeCandidate(HitType::EXISTING_PLANE, 1.0, "plane-1", surface, hit)}));
    // When
    AnchorResolver::Result first = resolve();
    AnchorResolver::Result second = resolve();
    // Then
    ASSERT_TRUE(first.hit());
    EXPECT_NE(first.offset.anchor_id, "plane-1");
    EXPECT_EQ(second.offset.anchor_id, first.offset.anchor_id);
    EXPECT_EQ(registry_.size(), 2);

    const Anchor* anchor = registry_.get(first.offset.anchor_id);
    ASSERT_NE(anchor, nullptr);
    EXPECT_TRUE(first.offset.absolutePose(anchor->pose).isApprox(hit, 1e-9));
    EXPECT_TRUE(registry_.get("plane-1")->pose.isApprox(poseAt(5, 0, 5), 1e-12));
}

TEST_F(AnchorResolverTest, GeneratedAnchorIdUsedAsSurfaceNameIsNotReused) {
    // Given: a featureless hit creates a generated id, then a surface reuses it
    backend_.script(HitTestResponse::hits({makeCandidate(HitType::FEATURE_POINT, 1.0, "", poseAt(3, 0, 3))}));
    AnchorResolver::Result point = resolve();
    ASSERT_TRUE(point.hit());
    backend_.script(HitTestResponse::hits({
        makeCandidate(HitType::EXISTING_PLANE, 1.0, point.offset.anchor_id, poseAt(0, 0, -1))}));
    // When
    AnchorResolver::Result plane = resolve();
    // Then
    ASSERT_TRUE(plane.hit());
    EXPECT_NE(plane.offset.anchor_id, point.offset.anchor_id);
    EXPECT_EQ(registry_.size(), 2);
}

TEST(AnchorResolverTypeTest, NotCopyableOrMovable) {
    // In-flight callbacks capture the resolver address
    EXPECT_FALSE(std::is_copy_constructible<AnchorResolver>::value);
    EXPECT_FALSE(std::is_move_constructible<AnchorResolver>::value);
    EXPECT_FALSE(std::is_move_assignable<AnchorResolver>::value);
}

TEST_F(AnchorResolverTest, PickerChoosesAnchoredSurface) {
    // Given
    backend_.script(HitTestResponse::hits({
        makeCandidate(HitType::FEATURE_POINT, 0.5, "point-9"),
        makeCandidate(HitType::EXISTING_PLANE_USING_EXTENT, 3.0, "plane-2"),
    }));
    // When
    AnchorResolver::Result result = resolve();
    // Then
    EXPECT_EQ(result.offset.anchor_id, "plane-2");
    EXPECT_STREQ(resolver_->picker().name(), "layered");
}

// ============================================================================
// Offset Computation
// ============================================================================

TEST_F(AnchorResolverTest, OffsetRoundTripIncludesVerticalOffset) {
    // Given
    Pose surface = poseAt(1.0, 0.0, -2.0, 0.5);
    Pose hit = poseAt(1.4, 0.1, -2.3, 1.2);
    backend_.script(HitTestResponse::hits({
        makeCandidate(HitType::EXISTING_PLANE_USING_EXTENT, 2.2, "plane-1", surface, hit)}));
    // When
    AnchorResolver::Result result = resolve();
    // Then
    ASSERT_TRUE(result.hit());
    const Anchor* anchor = registry_.get(result.offset.anchor_id);
    ASSERT_NE(anchor, nullptr);

    Pose expected = hit;
    expected.position.y() += config_.vertical_offset;
    EXPECT_TRUE(result.offset.absolutePose(anchor->pose).isApprox(expected, 1e-9));
    EXPECT_NEAR(anchor->pose.position.y(), 1.1, 1e-12);
}

TEST_F(AnchorResolverTest, OffsetIsDifferenceOfPoses) {
    // Given
    Pose surface = poseAt(1.0, 0.0, -2.0, 0.3);
    Pose hit = poseAt(1.5, 0.25, -2.5, 0.9);
    backend_.script(HitTestResponse::hits({
        makeCandidate(HitType::EXISTING_PLANE, 2.0, "plane-1", surface, hit)}));
    // When
    AnchorResolver::Result result = resolve();
    // Then
    EXPECT_NEAR(result.offset.pose.position.x(), 0.5, 1e-12);
    EXPECT_NEAR(result.offset.pose.position.y(), 0.25, 1e-12);
    EXPECT_NEAR(result.offset.pose.position.z(), -0.5, 1e-12);
    EXPECT_NEAR(Eigen::AngleAxisd(result.offset.pose.orientation).angle(), 0.6, 1e-9);
}

TEST_F(AnchorResolverTest, BackendReceivesNativeAnchorPose) {
    // Given
    backend_.script(HitTestResponse::hits({
        makeCandidate(HitType::EXISTING_PLANE, 2.0, "plane-1", poseAt(0, 0.2, -1))}));
    // When
    resolve();
    // Then
    ASSERT_EQ(backend_.added.size(), 1);
    EXPECT_EQ(backend_.added[0].first, "plane-1");
    EXPECT_NEAR(backend_.added[0].second.position.y(), 0.2, 1e-12);
    EXPECT_NEAR(registry_.get("plane-1")->pose.position.y(), 1.3, 1e-12);
}

TEST_F(AnchorResolverTest, ZeroVerticalOffsetDisablesCorrection) {
    // Given
    SessionConfig config;
    config.vertical_offset = 0.0;
    resolver_ = makeResolver(config);
    backend_.script(HitTestResponse::hits({
        makeCandidate(HitType::EXISTING_PLANE, 2.0, "plane-1", poseAt(0, 0.2, -1))}));
    // When
    resolve();
    // Then
    EXPECT_NEAR(registry_.get("plane-1")->pose.position.y(), 0.2, 1e-12);
}

TEST_F(AnchorResolverTest, ResolveCandidatesSkipsBackend) {
    // When
    AnchorResolver::Result result = resolver_->resolveCandidates({
        makeCandidate(HitType::ESTIMATED_PLANE, 1.0, "plane-3")});
    // Then
    EXPECT_TRUE(result.hit());
    EXPECT_EQ(result.offset.anchor_id, "plane-3");
    EXPECT_TRUE(backend_.queries.empty());
}

// ============================================================================
// Input Validation
// ============================================================================

TEST_F(AnchorResolverTest, DisjointActiveSpaceThrowsBeforeQuery) {
    // Given
    std::shared_ptr<CoordinateSpace> elsewhere = CoordinateSpace::createRoot("elsewhere");
    bool called = false;
    // Then
    EXPECT_THROW(resolver_->resolveHit(0.5, 0.5, *elsewhere,
                     [&](const AnchorResolver::Result&) { called = true; }),
                 DisjointSpaceError);
    EXPECT_TRUE(backend_.queries.empty());
    EXPECT_FALSE(called);
}

TEST_F(AnchorResolverTest, ScreenPointOutOfRangeThrows) {
    // Given
    auto ignore = [](const AnchorResolver::Result&) {};
    // Then
    EXPECT_THROW(resolver_->resolveHit(1.5, 0.5, *camera_, ignore), std::invalid_argument);
    EXPECT_THROW(resolver_->resolveHit(0.5, -0.1, *camera_, ignore), std::invalid_argument);
    EXPECT_THROW(resolver_->resolveHit(std::numeric_limits<double>::quiet_NaN(), 0.5, *camera_, ignore),
                 std::invalid_argument);
    EXPECT_NO_THROW(resolver_->resolveHit(0.0, 1.0, *camera_, ignore));
    EXPECT_EQ(backend_.queries.size(), 1);
}

TEST_F(AnchorResolverTest, ConstructorRejectsMissingParts) {
    // Then
    EXPECT_THROW({
        AnchorResolver resolver(backend_, registry_, nullptr, config_.createHitPicker(), config_);
    }, std::invalid_argument);
    EXPECT_THROW({
        AnchorResolver resolver(backend_, registry_, tracker_, nullptr, config_);
    }, std::invalid_argument);
}

// ============================================================================
// Asynchronous Completion
// ============================================================================

TEST_F(AnchorResolverTest, DeferredAnswerCompletesLater) {
    // Given
    backend_.mode = FakeBackend::Mode::DEFERRED;
    backend_.script(HitTestResponse::hits({makeCandidate(HitType::EXISTING_PLANE, 1.0, "plane-1")}));
    std::vector<AnchorResolver::Result> results;
    // When
    resolver_->resolveHit(0.5, 0.5, *camera_, [&](const AnchorResolver::Result& result) {
        results.push_back(result);
    });
    // Then
    EXPECT_TRUE(results.empty());
    EXPECT_EQ(backend_.deferredCount(), 1);

    // When
    backend_.complete();
    // Then
    ASSERT_EQ(results.size(), 1);
    EXPECT_EQ(results[0].offset.anchor_id, "plane-1");
}

TEST_F(AnchorResolverTest, LateAnswerAfterDestructionIsDropped) {
    // Given
    backend_.mode = FakeBackend::Mode::DEFERRED;
    backend_.script(HitTestResponse::hits({makeCandidate(HitType::EXISTING_PLANE, 1.0, "plane-1")}));
    bool called = false;
    resolver_->resolveHit(0.5, 0.5, *camera_, [&](const AnchorResolver::Result&) { called = true; });
    // When
    resolver_.reset();
    backend_.complete();
    // Then
    EXPECT_FALSE(called);
    EXPECT_EQ(registry_.size(), 0);
}
