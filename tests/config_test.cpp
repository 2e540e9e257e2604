/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <satclass/config.hpp>

#include <chrono>

namespace satclass {
namespace {

using namespace std::chrono;

TEST(ConfigTest, Defaults) {
    Config config;
    EXPECT_EQ(config.getGroup(), "active");
    EXPECT_EQ(config.getTimeoutSeconds(), 30);
    EXPECT_EQ(config.getCacheMaxAgeHours(), 2);
    EXPECT_DOUBLE_EQ(config.getThreshold(), 0.6);
    EXPECT_FALSE(config.getVerbose());
    EXPECT_FALSE(config.getPretty());
    EXPECT_FALSE(config.hasTime());
}

TEST(ConfigTest, EmptyGroupIsActive) {
    Config config;
    config.setGroup("");
    EXPECT_EQ(config.getGroup(), "active");
    config.setGroup("stations");
    EXPECT_EQ(config.getGroup(), "stations");
}

TEST(ConfigTest, TimeoutIsClamped) {
    Config config;
    config.setTimeoutSeconds(0);
    EXPECT_EQ(config.getTimeoutSeconds(), 1);
    config.setTimeoutSeconds(1000);
    EXPECT_EQ(config.getTimeoutSeconds(), 300);
    config.setTimeoutSeconds(45);
    EXPECT_EQ(config.getTimeoutSeconds(), 45);
}

TEST(ConfigTest, CacheMaxAgeIsClamped) {
    Config config;
    config.setCacheMaxAgeHours(-3);
    EXPECT_EQ(config.getCacheMaxAgeHours(), 1);
    config.setCacheMaxAgeHours(500);
    EXPECT_EQ(config.getCacheMaxAgeHours(), 168);
    config.setCacheMaxAgeHours(6);
    EXPECT_EQ(config.getCacheMaxAgeHours(), 6);
}

TEST(ConfigTest, ThresholdIsClamped) {
    Config config;
    config.setThreshold(-0.5);
    EXPECT_DOUBLE_EQ(config.getThreshold(), 0.0);
    config.setThreshold(1.5);
    EXPECT_DOUBLE_EQ(config.getThreshold(), 1.0);
    config.setThreshold(0.75);
    EXPECT_DOUBLE_EQ(config.getThreshold(), 0.75);
}

TEST(ConfigTest, TimeOverride) {
    Config config;
    time_point fixed = sys_days{year{2025}/November/30} + hours(3);
    config.setTime(fixed);
    EXPECT_TRUE(config.hasTime());
    EXPECT_EQ(config.getTime(), fixed);

    config.clearTime();
    EXPECT_FALSE(config.hasTime());
    EXPECT_NE(config.getTime(), fixed);
}

} // namespace
} // namespace satclass
