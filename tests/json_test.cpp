/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <satclass/json.hpp>

#include <chrono>
#include <limits>
#include <string>

#include <rapidjson/document.h>

namespace satclass {
namespace {

using namespace std::chrono;

rapidjson::Document parse(const std::string &text) {
    rapidjson::Document doc;
    doc.Parse(text.c_str());
    EXPECT_FALSE(doc.HasParseError()) << text;
    return doc;
}

ClassificationReport sampleReport() {
    auto epoch = sys_days{year{2025}/November/29} + hours(20);
    auto now = epoch + hours(36);

    ClassificationReport report;
    report.objectID = 44713;
    report.satelliteName = "STARLINK-1007";
    report.classification = ClassificationResult{
        ObjectClass::PAYLOAD, 0.92, {0.92, 0.05, 0.03}, "Constelación conocida: STARLINK"
    };
    report.altitudeInKilometers = 548.123456;
    report.velocityInKmPerSecond = 7.5912345;
    report.region = Region::LEO;
    report.tleAge = evaluateAge(epoch, now);
    report.propagation = makeOrbitalState({1000.1234, -6000.5678, 2500.0}, {-7.1234567, 1.0, 0.5}, now);
    report.features = Features{
        .meanMotion = 15.063999875,
        .altitudeInKilometers = 548.123456,
        .tleAgeDays = 1.5
    };
    report.processingTimeInMilliseconds = 0.4567;
    return report;
}

// ============================================================================
// Report Encoding Tests
// ============================================================================

TEST(ReportEncodingTest, TopLevelFields) {
    auto doc = parse(json::encode(sampleReport()));
    ASSERT_TRUE(doc.IsObject());

    EXPECT_EQ(doc["object_id"].GetInt(), 44713);
    EXPECT_STREQ(doc["satellite_name"].GetString(), "STARLINK-1007");
    EXPECT_STREQ(doc["predicted_class"].GetString(), "payload");
    EXPECT_STREQ(doc["classification_reason"].GetString(), "Constelación conocida: STARLINK");
    EXPECT_STREQ(doc["region"].GetString(), "LEO");
    EXPECT_DOUBLE_EQ(doc["confidence"].GetDouble(), 0.92);
}

TEST(ReportEncodingTest, Rounding) {
    auto doc = parse(json::encode(sampleReport()));

    EXPECT_DOUBLE_EQ(doc["orbital_stats"]["altitude_km"].GetDouble(), 548.12);
    EXPECT_DOUBLE_EQ(doc["orbital_stats"]["velocity_kms"].GetDouble(), 7.591);
    EXPECT_DOUBLE_EQ(doc["features"]["mean_motion"].GetDouble(), 15.064);
    EXPECT_DOUBLE_EQ(doc["features"]["altitude_km"].GetDouble(), 548.12);
    EXPECT_DOUBLE_EQ(doc["features"]["tle_age_days"].GetDouble(), 1.5);
    EXPECT_DOUBLE_EQ(doc["metadata"]["processing_time_ms"].GetDouble(), 0.46);
}

TEST(ReportEncodingTest, Probabilities) {
    auto doc = parse(json::encode(sampleReport()));
    const auto &proba = doc["proba"];
    EXPECT_DOUBLE_EQ(proba["payload"].GetDouble(), 0.92);
    EXPECT_DOUBLE_EQ(proba["rocket_body"].GetDouble(), 0.05);
    EXPECT_DOUBLE_EQ(proba["debris"].GetDouble(), 0.03);
}

TEST(ReportEncodingTest, TLEInfo) {
    auto doc = parse(json::encode(sampleReport()));
    const auto &info = doc["tle_info"];
    EXPECT_STREQ(info["epoch"].GetString(), "2025-11-29T20:00:00.000000+00:00");
    EXPECT_DOUBLE_EQ(info["age_hours"].GetDouble(), 36.0);
    EXPECT_DOUBLE_EQ(info["age_days"].GetDouble(), 1.5);
    EXPECT_FALSE(info["is_stale"].GetBool());
    EXPECT_STREQ(info["warning"].GetString(), "TLE de 1.5 días. Considere actualizar.");
}

TEST(ReportEncodingTest, Propagation) {
    auto doc = parse(json::encode(sampleReport()));
    const auto &propagation = doc["propagation"];
    ASSERT_TRUE(propagation.IsObject());
    EXPECT_DOUBLE_EQ(propagation["position_km"]["x"].GetDouble(), 1000.123);
    EXPECT_DOUBLE_EQ(propagation["position_km"]["y"].GetDouble(), -6000.568);
    EXPECT_DOUBLE_EQ(propagation["velocity_kms"]["x"].GetDouble(), -7.123457);
    EXPECT_STREQ(propagation["calculated_at"].GetString(), "2025-12-01T08:00:00.000000+00:00");
}

TEST(ReportEncodingTest, Metadata) {
    auto doc = parse(json::encode(sampleReport()));
    EXPECT_STREQ(doc["metadata"]["model_version"].GetString(), "heuristic-v1.0");
}

TEST(ReportEncodingTest, AbsentValuesAreNull) {
    auto report = sampleReport();
    report.satelliteName.reset();
    report.propagation.reset();
    report.tleAge->warning.reset();

    auto doc = parse(json::encode(report));
    EXPECT_TRUE(doc["satellite_name"].IsNull());
    EXPECT_TRUE(doc["propagation"].IsNull());
    EXPECT_TRUE(doc["tle_info"]["warning"].IsNull());
}

TEST(ReportEncodingTest, NonFiniteNumbersAreNull) {
    auto report = sampleReport();
    report.altitudeInKilometers = std::numeric_limits<double>::quiet_NaN();
    report.features.altitudeInKilometers = std::numeric_limits<double>::infinity();

    auto doc = parse(json::encode(report));
    EXPECT_TRUE(doc["orbital_stats"]["altitude_km"].IsNull());
    EXPECT_TRUE(doc["features"]["altitude_km"].IsNull());
}

TEST(ReportEncodingTest, PrettyIsEquivalent) {
    auto compact = json::encode(sampleReport(), false);
    auto pretty = json::encode(sampleReport(), true);
    EXPECT_EQ(compact.find('\n'), std::string::npos);
    EXPECT_NE(pretty.find('\n'), std::string::npos);
    auto compactDoc = parse(compact);
    auto prettyDoc = parse(pretty);
    const rapidjson::Value &a = compactDoc;
    const rapidjson::Value &b = prettyDoc;
    EXPECT_TRUE(a == b);
}

// ============================================================================
// Listing and Health Encoding Tests
// ============================================================================

TEST(ListingEncodingTest, Entries) {
    std::vector<CatalogEntry> entries{
        CatalogEntry{
            .noradID = "00005",
            .name = "VANGUARD 1",
            .line1 = "1 00005U",
            .line2 = "2 00005",
            .epoch = "2025-11-21T12:00:00.000000+00:00",
            .ageHours = 205.004,
            .ageDays = 8.5418,
            .isStale = true
        }
    };

    auto doc = parse(json::encode(entries));
    ASSERT_TRUE(doc.IsArray());
    ASSERT_EQ(doc.Size(), 1);
    const auto &entry = doc[0];
    EXPECT_STREQ(entry["norad_id"].GetString(), "00005");
    EXPECT_STREQ(entry["name"].GetString(), "VANGUARD 1");
    EXPECT_DOUBLE_EQ(entry["age_hours"].GetDouble(), 205.0);
    EXPECT_DOUBLE_EQ(entry["age_days"].GetDouble(), 8.54);
    EXPECT_TRUE(entry["is_stale"].GetBool());
}

TEST(ListingEncodingTest, EmptyListing) {
    EXPECT_EQ(json::encode(std::vector<CatalogEntry>{}), "[]");
}

TEST(HealthEncodingTest, Ok) {
    EXPECT_EQ(json::encode(HealthStatus{}), "{\"status\":\"ok\"}");
}

// ============================================================================
// Snapshot Decoding Tests
// ============================================================================

TEST(SnapshotDecodingTest, MissingFieldIsRejected) {
    std::string text =
        "{\"cached_at\": \"2025-11-30T00:00:00+00:00\", \"satellites\": ["
        "{\"norad_id\": \"25544\", \"name\": \"ISS\", \"line1\": \"1\", \"line2\": \"2\","
        " \"epoch\": \"2025-11-29T20:00:00+00:00\", \"age_hours\": 4.0, \"is_stale\": false}]}";
    EXPECT_FALSE(json::decodeSnapshot(text).has_value());
}

TEST(SnapshotDecodingTest, NumericNoradIDIsRejected) {
    std::string text =
        "{\"cached_at\": \"2025-11-30T00:00:00+00:00\", \"satellites\": ["
        "{\"norad_id\": 25544, \"name\": \"ISS\", \"line1\": \"1\", \"line2\": \"2\","
        " \"epoch\": \"2025-11-29T20:00:00+00:00\", \"age_hours\": 4.0, \"age_days\": 0.17,"
        " \"is_stale\": false}]}";
    EXPECT_FALSE(json::decodeSnapshot(text).has_value());
}

TEST(SnapshotDecodingTest, IntegerAgesAreAccepted) {
    std::string text =
        "{\"cached_at\": \"2025-11-30T00:00:00+00:00\", \"satellites\": ["
        "{\"norad_id\": \"25544\", \"name\": \"ISS\", \"line1\": \"1\", \"line2\": \"2\","
        " \"epoch\": \"2025-11-29T20:00:00+00:00\", \"age_hours\": 4, \"age_days\": 0,"
        " \"is_stale\": false}]}";
    auto snapshot = json::decodeSnapshot(text);
    ASSERT_TRUE(snapshot.has_value());
    ASSERT_EQ(snapshot->satellites.size(), 1);
    EXPECT_DOUBLE_EQ(snapshot->satellites[0].ageHours, 4.0);
}

TEST(SnapshotDecodingTest, NotJSON) {
    EXPECT_FALSE(json::decodeSnapshot("not json at all").has_value());
    EXPECT_FALSE(json::decodeSnapshot("").has_value());
}

} // namespace
} // namespace satclass
