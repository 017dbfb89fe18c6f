#include "gtest/gtest.h"

#include <string>

#include "common/math/Geodesy.hpp"
#include "plan/CameraKeyframe.hpp"
#include "plan/PlatformRecommender.hpp"
#include "plan/ShotPlan.hpp"

using namespace skyshot;
using namespace skyshot::plan;

namespace {

const geo::GeoPoint kStart{40.7484, -73.9857};

// Straight eastbound track sampled once per second.
KeyframeSequence MakeTrack(double speed_mps, double altitude_m, double climb_mps,
                           std::size_t count = 11) {
  KeyframeSequence keyframes;
  for (std::size_t i = 0; i < count; ++i) {
    const double t = static_cast<double>(i);
    const geo::GeoPoint p = geo::Destination(kStart, 90.0, speed_mps * t);
    CameraKeyframe k;
    k.time_s = t;
    k.latitude_deg = p.latitude_deg;
    k.longitude_deg = p.longitude_deg;
    k.altitude_m = altitude_m + climb_mps * t;
    k.heading_deg = 90.0;
    k.tilt_deg = 60.0;
    keyframes.push_back(k);
  }
  return keyframes;
}

bool HasReasonContaining(const Recommendation& rec, const std::string& needle) {
  for (const auto& reason : rec.reasons) {
    if (reason.find(needle) != std::string::npos) {
      return true;
    }
  }
  return false;
}

}  // namespace

TEST(PlatformRecommenderTest, ProfileMeasuresSpeedAltitudeAndLength) {
  const KinematicProfile profile = ComputeKinematicProfile(MakeTrack(8.0, 50.0, 2.0));

  EXPECT_EQ(profile.segment_count, 10u);
  EXPECT_NEAR(profile.max_horizontal_speed_mps, 8.0, 1e-6);
  EXPECT_NEAR(profile.min_horizontal_speed_mps, 8.0, 1e-6);
  EXPECT_NEAR(profile.avg_horizontal_speed_mps, 8.0, 1e-6);
  EXPECT_NEAR(profile.max_vertical_rate_mps, 2.0, 1e-9);
  EXPECT_NEAR(profile.horizontal_path_length_m, 80.0, 1e-5);
  EXPECT_DOUBLE_EQ(profile.min_altitude_m, 50.0);
  EXPECT_DOUBLE_EQ(profile.max_altitude_m, 70.0);
  EXPECT_DOUBLE_EQ(profile.mean_altitude_m, 60.0);
}

TEST(PlatformRecommenderTest, SkipsSegmentsWithoutTimeAdvance) {
  KeyframeSequence keyframes = MakeTrack(5.0, 50.0, 0.0, 3);
  keyframes[2].time_s = keyframes[1].time_s;
  const KinematicProfile profile = ComputeKinematicProfile(keyframes);
  EXPECT_EQ(profile.segment_count, 1u);
}

TEST(PlatformRecommenderTest, SlowLowShotIsDrone) {
  const Recommendation rec = Recommend(MakeTrack(5.0, 50.0, 0.0), RecommenderThresholds{});

  EXPECT_EQ(rec.platform, Platform::kDrone);
  // Altitude has the least headroom: (120 - 50) / 120.
  EXPECT_NEAR(rec.confidence, 70.0 / 120.0, 1e-6);
  EXPECT_EQ(rec.reasons.size(), 3u);
  EXPECT_TRUE(HasReasonContaining(rec, "max altitude 50.0 m within drone envelope 120.0 m"));
}

TEST(PlatformRecommenderTest, HighAltitudeIsHelicopter) {
  const Recommendation rec = Recommend(MakeTrack(5.0, 500.0, 0.0), RecommenderThresholds{});

  EXPECT_EQ(rec.platform, Platform::kHelicopter);
  EXPECT_NEAR(rec.confidence, 0.25, 1e-9);
  ASSERT_EQ(rec.reasons.size(), 1u);
  EXPECT_EQ(rec.reasons.front(), "max altitude 500.0 m exceeds drone limit 400.0 m");
}

TEST(PlatformRecommenderTest, FastPassIsHelicopter) {
  const Recommendation rec = Recommend(MakeTrack(40.0, 100.0, 0.0), RecommenderThresholds{});

  EXPECT_EQ(rec.platform, Platform::kHelicopter);
  EXPECT_NEAR(rec.confidence, 15.0 / 25.0, 1e-6);
  EXPECT_TRUE(HasReasonContaining(rec, "max horizontal speed 40.0 m/s exceeds drone limit"));
}

TEST(PlatformRecommenderTest, BetweenEnvelopeAndLimitIsEither) {
  const Recommendation rec = Recommend(MakeTrack(17.0, 50.0, 0.0), RecommenderThresholds{});

  EXPECT_EQ(rec.platform, Platform::kEither);
  // 2 m/s above the envelope, half band is 5 m/s.
  EXPECT_NEAR(rec.confidence, 0.4, 1e-6);
  EXPECT_TRUE(HasReasonContaining(rec, "above drone envelope 15.0 m/s"));
}

TEST(PlatformRecommenderTest, CustomThresholdsShiftTheDecision) {
  RecommenderThresholds strict;
  strict.drone_envelope = PlatformEnvelope{40.0, 15.0, 5.0};
  strict.drone_hard_limit = PlatformEnvelope{45.0, 25.0, 10.0};

  EXPECT_EQ(Recommend(MakeTrack(5.0, 50.0, 0.0), strict).platform, Platform::kHelicopter);
  EXPECT_EQ(Recommend(MakeTrack(5.0, 50.0, 0.0), RecommenderThresholds{}).platform,
            Platform::kDrone);
}

TEST(PlatformRecommenderTest, NoSegmentsGivesEitherWithZeroConfidence) {
  for (const KeyframeSequence& keyframes : {KeyframeSequence{}, MakeTrack(5.0, 50.0, 0.0, 1)}) {
    const Recommendation rec = Recommend(keyframes, RecommenderThresholds{});
    EXPECT_EQ(rec.platform, Platform::kEither);
    EXPECT_DOUBLE_EQ(rec.confidence, 0.0);
    ASSERT_EQ(rec.reasons.size(), 1u);
    EXPECT_EQ(rec.reasons.front(), "no moving segments to evaluate");
  }
}

TEST(PlatformRecommenderTest, RecommendationIsDeterministic) {
  const KeyframeSequence keyframes = MakeTrack(12.0, 90.0, 3.0);
  const Recommendation a = Recommend(keyframes, RecommenderThresholds{});
  const Recommendation b = Recommend(keyframes, RecommenderThresholds{});
  EXPECT_EQ(a.platform, b.platform);
  EXPECT_EQ(a.confidence, b.confidence);
  EXPECT_EQ(a.reasons, b.reasons);
}

TEST(PlatformRecommenderTest, AnnotateFlagsImplausibleSpeed) {
  ShotPlan shot;
  shot.keyframes = MakeTrack(200.0, 100.0, 0.0);
  AnnotateShot(shot, RecommenderThresholds{});

  ASSERT_TRUE(shot.metadata.recommendation.has_value());
  ASSERT_TRUE(shot.metadata.kinematics.has_value());
  EXPECT_EQ(shot.metadata.recommendation->platform, Platform::kHelicopter);
  EXPECT_DOUBLE_EQ(shot.metadata.recommendation->confidence, 1.0);
  ASSERT_EQ(shot.metadata.warnings.size(), 1u);
  EXPECT_NE(shot.metadata.warnings.front().find("exceeds plausible limit 150.0 m/s"),
            std::string::npos);
  EXPECT_EQ(shot.keyframes.size(), 11u);
}

TEST(PlatformRecommenderTest, PlatformNames) {
  EXPECT_STREQ(PlatformName(Platform::kDrone), "drone");
  EXPECT_STREQ(PlatformName(Platform::kHelicopter), "helicopter");
  EXPECT_STREQ(PlatformName(Platform::kEither), "either");
}

int main(int argc, char** argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
