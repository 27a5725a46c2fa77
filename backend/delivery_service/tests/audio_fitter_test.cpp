#include <gtest/gtest.h>
#include "application/audio_fitter.hpp"

using namespace delivery_service;

namespace {

AudioFitter defaultFitter() {
  return AudioFitter(50'000'000, 1'500'000, {192, 160, 128, 112, 96, 80, 64, 48, 32});
}

}

TEST(AudioFitterTest, TenMinutesFitsAtTopRung) {
  auto plan = defaultFitter().fit(600);
  ASSERT_TRUE(plan);
  EXPECT_EQ(plan->bitrate_kbps, 192);
  EXPECT_EQ(plan->estimated_bytes, 14'400'000);
  EXPECT_EQ(plan->quality_label, "mp3 192kbps");
}

TEST(AudioFitterTest, LongerAudioStepsDownTheLadder) {
  // 192 kbps for 2100 s is 50.4 MB
  auto plan = defaultFitter().fit(2100);
  ASSERT_TRUE(plan);
  EXPECT_EQ(plan->bitrate_kbps, 160);
  EXPECT_LE(plan->estimated_bytes + 1'500'000, 50'000'000);
}

TEST(AudioFitterTest, TooLongForLowestRung) {
  auto plan = defaultFitter().fit(20'000);
  ASSERT_FALSE(plan);
  EXPECT_EQ(plan.error().kind, AudioPlanError::Kind::AudioTooLarge);
  EXPECT_NE(plan.error().reason.find("47.7 MB"), std::string::npos);
}

TEST(AudioFitterTest, UnknownDurationIsRefused) {
  auto plan = defaultFitter().fit(std::nullopt);
  ASSERT_FALSE(plan);
  EXPECT_EQ(plan.error().kind, AudioPlanError::Kind::UnknownDuration);

  EXPECT_FALSE(defaultFitter().fit(0));
}

TEST(AudioFitterTest, ExactFitIsAccepted) {
  AudioFitter fitter(2'000'000, 500'000, {120});
  // 100 s at 120 kbps is exactly 1.5 MB
  auto plan = fitter.fit(100);
  ASSERT_TRUE(plan);
  EXPECT_EQ(plan->estimated_bytes, 1'500'000);
}
