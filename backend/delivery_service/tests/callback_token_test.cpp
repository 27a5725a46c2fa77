#include <gtest/gtest.h>
#include "application/callback_token.hpp"

using namespace delivery_service;

TEST(CallbackTokenTest, ParsesModeSelection) {
  auto token = parseCallbackToken(modeSelectionToken(DeliveryMode::Document, "abc123"));
  const auto* selection = std::get_if<ModeSelection>(&token);
  ASSERT_NE(selection, nullptr);
  EXPECT_EQ(selection->mode_tag, "doc");
  EXPECT_EQ(selection->request_id, "abc123");
}

TEST(CallbackTokenTest, ParsesCancel) {
  auto token = parseCallbackToken("cnl|job42");
  const auto* cancel = std::get_if<CancelRequest>(&token);
  ASSERT_NE(cancel, nullptr);
  EXPECT_EQ(cancel->job_id, "job42");
}

TEST(CallbackTokenTest, RejectsMalformedPayloads) {
  for (const auto* data : {"", "dl|video", "dl|video|", "cnl|", "cnl|a|b", "xx|1|2", "dl|video|a|b"}) {
    EXPECT_TRUE(std::holds_alternative<MalformedToken>(parseCallbackToken(data))) << data;
  }
}

TEST(CallbackTokenTest, CancelKeyboardHasOneButton) {
  auto keyboard = cancelKeyboard("j1");
  ASSERT_EQ(keyboard.size(), 1u);
  ASSERT_EQ(keyboard[0].size(), 1u);
  EXPECT_EQ(keyboard[0][0].text, "Cancel");
  EXPECT_EQ(keyboard[0][0].callback_data, "cnl|j1");
}
