#include <gtest/gtest.h>
#include <cmath>
#include <cstdio>
#include <limits>
#include <stdexcept>
#include "anchorage/session/session_config.h"
#include "anchorage/tracking/hit_picking/hit_picker.h"

using namespace anchorage;
using json = nlohmann::json;

TEST(SessionConfigTest, Defaults) {
  // Given
  SessionConfig config;
  // Then
  EXPECT_EQ(config.hit_picker_strategy, SessionConfig::HitPickerStrategy::LAYERED);
  EXPECT_DOUBLE_EQ(config.vertical_offset, 1.1);
  EXPECT_EQ(config.stale_after_frames, 30);
  EXPECT_FALSE(config.enable_debug_output);
  EXPECT_TRUE(config.isValid());
}

TEST(SessionConfigTest, Validation) {
  // Given
  SessionConfig zero_offset;
  zero_offset.vertical_offset = 0.0;
  SessionConfig nan_offset;
  nan_offset.vertical_offset = std::numeric_limits<double>::quiet_NaN();
  SessionConfig never_stale;
  never_stale.stale_after_frames = 0;
  // Then
  EXPECT_TRUE(zero_offset.isValid());
  EXPECT_FALSE(nan_offset.isValid());
  EXPECT_FALSE(never_stale.isValid());
}

TEST(SessionConfigTest, CreatesConfiguredPicker) {
  // Given
  SessionConfig config;
  // When
  std::unique_ptr<HitPicker> layered = config.createHitPicker();
  config.hit_picker_strategy = SessionConfig::HitPickerStrategy::NEAREST;
  std::unique_ptr<HitPicker> nearest = config.createHitPicker();
  // Then
  EXPECT_STREQ(layered->name(), "layered");
  EXPECT_STREQ(nearest->name(), "nearest");
}

TEST(SessionConfigTest, JSONSerialization) {
  // Given
  SessionConfig config;
  config.hit_picker_strategy = SessionConfig::HitPickerStrategy::NEAREST;
  config.vertical_offset = 0.0;
  config.stale_after_frames = 12;
  // When
  json config_json = config;
  SessionConfig parsed = config_json;
  // Then
  EXPECT_EQ(config_json["hit_picker_strategy"], "nearest");
  EXPECT_EQ(parsed.hit_picker_strategy, SessionConfig::HitPickerStrategy::NEAREST);
  EXPECT_DOUBLE_EQ(parsed.vertical_offset, 0.0);
  EXPECT_EQ(parsed.stale_after_frames, 12);
  EXPECT_FALSE(parsed.enable_debug_output);
}

TEST(SessionConfigTest, MissingKeysKeepDefaults) {
  // Given
  json config_json = json::parse("{\"stale_after_frames\": 5}");
  // When
  SessionConfig config = config_json;
  // Then
  EXPECT_EQ(config.stale_after_frames, 5);
  EXPECT_DOUBLE_EQ(config.vertical_offset, 1.1);
  EXPECT_EQ(config.hit_picker_strategy, SessionConfig::HitPickerStrategy::LAYERED);
}

TEST(SessionConfigTest, NonPositiveStaleFramesRejected) {
  // Given
  json negative = json::parse("{\"stale_after_frames\": -1}");
  json zero = json::parse("{\"stale_after_frames\": 0}");
  // Then
  EXPECT_THROW(negative.get<SessionConfig>(), std::invalid_argument);
  EXPECT_THROW(zero.get<SessionConfig>(), std::invalid_argument);
}

TEST(SessionConfigTest, SaveAndLoad) {
  // Given
  std::string path = "session_config_test.json";
  SessionConfig config;
  config.vertical_offset = 1.6;
  config.enable_debug_output = true;
  // When
  config.save(path);
  SessionConfig loaded = SessionConfig::load(path);
  std::remove(path.c_str());
  // Then
  EXPECT_DOUBLE_EQ(loaded.vertical_offset, 1.6);
  EXPECT_TRUE(loaded.enable_debug_output);
}

TEST(SessionConfigTest, LoadMissingFileThrows) {
  // Then
  EXPECT_THROW(SessionConfig::load("./does-not-exist/config.json"), std::runtime_error);
}
