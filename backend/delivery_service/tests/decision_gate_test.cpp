#include <gtest/gtest.h>
#include "application/decision_gate.hpp"

using namespace delivery_service;

namespace {

constexpr int64_t kCeiling = 50'000'000;

SingleFilePlan singleFile(std::optional<int64_t> bytes, bool confident) {
  SingleFilePlan p;
  p.format_id = "18";
  p.size = {bytes, confident};
  p.quality_label = "360p";
  return p;
}

std::expected<AudioPlan, AudioPlanError> someAudio() {
  return AudioPlan{192, 14'400'000, "mp3 192kbps"};
}

}

TEST(DecisionGateTest, ConfidentFittingVideoIsOffered) {
  auto d = decide(singleFile(45'000'000, true), someAudio(), kCeiling);
  EXPECT_EQ(d.verdict, DeliveryDecision::Verdict::Offer);
  EXPECT_TRUE(d.offersVideo());
  EXPECT_TRUE(d.offersAudio());
  EXPECT_EQ(d.video_size, 45'000'000);
}

TEST(DecisionGateTest, SizeAtCeilingIsOffered) {
  auto d = decide(singleFile(kCeiling, true), someAudio(), kCeiling);
  EXPECT_EQ(d.verdict, DeliveryDecision::Verdict::Offer);
}

TEST(DecisionGateTest, OversizeOffersAudioOnly) {
  auto d = decide(singleFile(kCeiling + 1, true), someAudio(), kCeiling);
  EXPECT_EQ(d.verdict, DeliveryDecision::Verdict::VideoTooLarge);
  EXPECT_FALSE(d.offersVideo());
  EXPECT_TRUE(d.offersAudio());
}

TEST(DecisionGateTest, SmallGuessIsStillRefused) {
  auto d = decide(singleFile(1'000'000, false), someAudio(), kCeiling);
  EXPECT_EQ(d.verdict, DeliveryDecision::Verdict::VideoUnconfirmed);
  EXPECT_FALSE(d.offersVideo());
}

TEST(DecisionGateTest, ZeroSizeIsUnconfirmed) {
  auto d = decide(singleFile(0, true), someAudio(), kCeiling);
  EXPECT_EQ(d.verdict, DeliveryDecision::Verdict::VideoUnconfirmed);
}

TEST(DecisionGateTest, UnresolvedPlanIsUnconfirmed) {
  auto d = decide(UnresolvedPlan{}, someAudio(), kCeiling);
  EXPECT_EQ(d.verdict, DeliveryDecision::Verdict::VideoUnconfirmed);
  EXPECT_FALSE(d.video_size);
}

TEST(DecisionGateTest, AudioReasonCarriedWhenUnavailable) {
  std::expected<AudioPlan, AudioPlanError> audio =
    std::unexpected(AudioPlanError{AudioPlanError::Kind::UnknownDuration, "no duration"});
  auto d = decide(UnresolvedPlan{}, audio, kCeiling);
  EXPECT_FALSE(d.offersAnything());
  EXPECT_EQ(d.audio_reason, "no duration");
}
