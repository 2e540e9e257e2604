/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <satclass/classifier.hpp>

#include <cmath>
#include <limits>
#include <optional>
#include <sstream>
#include <string>

namespace satclass {
namespace {

void expectProba(const ClassificationResult &result, double payload, double rocketBody, double debris) {
    EXPECT_DOUBLE_EQ(result.proba.payload, payload);
    EXPECT_DOUBLE_EQ(result.proba.rocketBody, rocketBody);
    EXPECT_DOUBLE_EQ(result.proba.debris, debris);
}

// ============================================================================
// Name Rule Tests
// ============================================================================

TEST(NameRuleTest, StarlinkIsPayload) {
    auto result = classify("STARLINK-1234", 550.0);
    EXPECT_EQ(result.predictedClass, ObjectClass::PAYLOAD);
    EXPECT_DOUBLE_EQ(result.confidence, 0.92);
    expectProba(result, 0.92, 0.05, 0.03);
    EXPECT_NE(result.reason.find("STARLINK"), std::string::npos);
}

TEST(NameRuleTest, DebrisMarker) {
    auto result = classify("COSMOS 2251 DEB", 790.0);
    EXPECT_EQ(result.predictedClass, ObjectClass::DEBRIS);
    EXPECT_DOUBLE_EQ(result.confidence, 0.95);
    expectProba(result, 0.02, 0.03, 0.95);
    EXPECT_EQ(result.reason, "Nombre contiene 'DEB'");
}

TEST(NameRuleTest, RocketBodyMarker) {
    auto result = classify("SL-16 R/B", 840.0);
    EXPECT_EQ(result.predictedClass, ObjectClass::ROCKET_BODY);
    EXPECT_DOUBLE_EQ(result.confidence, 0.90);
    expectProba(result, 0.05, 0.90, 0.05);
    EXPECT_EQ(result.reason, "Nombre contiene 'R/B'");
}

TEST(NameRuleTest, MatchingIsCaseInsensitive) {
    auto result = classify("starlink-30001", 550.0);
    EXPECT_EQ(result.predictedClass, ObjectClass::PAYLOAD);
    EXPECT_EQ(result.reason, "Constelación conocida: STARLINK");
}

TEST(NameRuleTest, DebrisBeforePayload) {
    auto result = classify("STARLINK DEB", 550.0);
    EXPECT_EQ(result.predictedClass, ObjectClass::DEBRIS);
}

TEST(NameRuleTest, RocketBodyBeforePayload) {
    auto result = classify("GPS ROCKET", 20200.0);
    EXPECT_EQ(result.predictedClass, ObjectClass::ROCKET_BODY);
}

TEST(NameRuleTest, DeltaMatchesAsSubstring) {
    auto result = classify("DELTA 2 R/B(1)", 600.0);
    EXPECT_EQ(result.predictedClass, ObjectClass::ROCKET_BODY);
    EXPECT_EQ(result.reason, "Nombre contiene 'R/B'");
}

TEST(NameRuleTest, NameOverridesAltitude) {
    auto result = classify("IRIDIUM 33", 150.0);
    EXPECT_EQ(result.predictedClass, ObjectClass::PAYLOAD);
    EXPECT_DOUBLE_EQ(result.confidence, 0.92);
}

TEST(NameRuleTest, RulesAreOrderedDebrisRocketPayload) {
    const auto &rules = nameRules();
    ASSERT_FALSE(rules.empty());
    EXPECT_EQ(rules.front().outcome.predictedClass, ObjectClass::DEBRIS);
    EXPECT_EQ(rules.back().outcome.predictedClass, ObjectClass::PAYLOAD);
}

// ============================================================================
// Altitude Band Tests
// ============================================================================

TEST(AltitudeBandTest, VeryLowIsDebris) {
    auto result = classify(std::nullopt, 150.0);
    EXPECT_EQ(result.predictedClass, ObjectClass::DEBRIS);
    EXPECT_DOUBLE_EQ(result.confidence, 0.70);
    expectProba(result, 0.15, 0.15, 0.70);
    EXPECT_NE(result.reason.find("<300km"), std::string::npos);
}

TEST(AltitudeBandTest, LowLEOIsPayload) {
    auto result = classify(std::nullopt, 300.0);
    EXPECT_EQ(result.predictedClass, ObjectClass::PAYLOAD);
    EXPECT_DOUBLE_EQ(result.confidence, 0.65);
    expectProba(result, 0.65, 0.20, 0.15);
}

TEST(AltitudeBandTest, MidLEOIsPayload) {
    auto result = classify(std::nullopt, 600.0);
    EXPECT_EQ(result.predictedClass, ObjectClass::PAYLOAD);
    EXPECT_DOUBLE_EQ(result.confidence, 0.55);
    expectProba(result, 0.55, 0.25, 0.20);
}

TEST(AltitudeBandTest, HighLEOIsDebris) {
    auto result = classify(std::nullopt, 1000.0);
    EXPECT_EQ(result.predictedClass, ObjectClass::DEBRIS);
    EXPECT_DOUBLE_EQ(result.confidence, 0.50);
    expectProba(result, 0.30, 0.20, 0.50);
}

TEST(AltitudeBandTest, GEOIsPayload) {
    auto result = classify(std::nullopt, 35786.0);
    EXPECT_EQ(result.predictedClass, ObjectClass::PAYLOAD);
    EXPECT_DOUBLE_EQ(result.confidence, 0.85);
    expectProba(result, 0.85, 0.10, 0.05);
}

TEST(AltitudeBandTest, MEOIsUnknown) {
    auto result = classify(std::nullopt, 20200.0);
    EXPECT_EQ(result.predictedClass, ObjectClass::UNKNOWN);
    EXPECT_DOUBLE_EQ(result.confidence, 0.40);
    expectProba(result, 0.40, 0.30, 0.30);
}

TEST(AltitudeBandTest, GapBelowGEOIsUnknown) {
    EXPECT_EQ(classify(std::nullopt, 34999.9).predictedClass, ObjectClass::UNKNOWN);
    EXPECT_EQ(classify(std::nullopt, 36500.0).predictedClass, ObjectClass::UNKNOWN);
}

TEST(AltitudeBandTest, NegativeAltitudeIsDebris) {
    EXPECT_EQ(classify(std::nullopt, -200.0).predictedClass, ObjectClass::DEBRIS);
}

TEST(AltitudeBandTest, NaNIsUnknown) {
    auto result = classify(std::nullopt, std::numeric_limits<double>::quiet_NaN());
    EXPECT_EQ(result.predictedClass, ObjectClass::UNKNOWN);
}

TEST(AltitudeBandTest, EveryAltitudeMatchesExactlyOneBand) {
    const auto &bands = altitudeBands();
    for (double altitude = -500.0; altitude <= 40000.0; altitude += 12.5) {
        ClassificationInput input{.upperName = "", .altitudeInKilometers = altitude};
        int matches = 0;
        // The last band catches everything the others miss
        for (std::size_t i = 0; i + 1 < bands.size(); ++i) {
            if (bands[i].matches(input)) {
                matches++;
            }
        }
        EXPECT_LE(matches, 1) << "altitude: " << altitude;
        EXPECT_TRUE(bands.back().matches(input));
    }
}

TEST(AltitudeBandTest, UnmatchedNameUsesAltitude) {
    auto result = classify("HUBBLE SPACE TELESCOPE", 540.0);
    EXPECT_EQ(result.predictedClass, ObjectClass::PAYLOAD);
    EXPECT_DOUBLE_EQ(result.confidence, 0.65);
}

// ============================================================================
// Threshold Tests
// ============================================================================

TEST(ThresholdTest, AboveThresholdKeepsClass) {
    auto result = classify("STARLINK-1234", 550.0, 0.6);
    EXPECT_EQ(result.predictedClass, ObjectClass::PAYLOAD);
}

TEST(ThresholdTest, BelowThresholdIsUnknown) {
    auto result = classify(std::nullopt, 150.0, 0.9);
    EXPECT_EQ(result.predictedClass, ObjectClass::UNKNOWN);
    EXPECT_DOUBLE_EQ(result.confidence, 0.70);
    expectProba(result, 0.15, 0.15, 0.70);
    EXPECT_EQ(result.reason, "Confianza (70%) menor al umbral (90%)");
}

TEST(ThresholdTest, EqualToThresholdKeepsClass) {
    auto result = classify(std::nullopt, 400.0, 0.65);
    EXPECT_EQ(result.predictedClass, ObjectClass::PAYLOAD);
}

TEST(ThresholdTest, ZeroThresholdNeverOverrides) {
    auto result = classify(std::nullopt, 20200.0, 0.0);
    EXPECT_EQ(result.predictedClass, ObjectClass::UNKNOWN);
    EXPECT_EQ(result.reason, "Órbita atípica - clasificación incierta");
}

// ============================================================================
// Class Name Tests
// ============================================================================

TEST(ObjectClassTest, Names) {
    EXPECT_EQ(toString(ObjectClass::PAYLOAD), "payload");
    EXPECT_EQ(toString(ObjectClass::ROCKET_BODY), "rocket_body");
    EXPECT_EQ(toString(ObjectClass::DEBRIS), "debris");
    EXPECT_EQ(toString(ObjectClass::UNKNOWN), "unknown");

    std::ostringstream os;
    os << ObjectClass::ROCKET_BODY;
    EXPECT_EQ(os.str(), "rocket_body");
}

} // namespace
} // namespace satclass
