/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <satclass/json.hpp>
#include <satclass/orbit.hpp>

#include <cmath>
#include <string>

#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace satclass::json {

// Non-finite numbers are not valid JSON; write them as null
template <typename Writer>
void writeNumber(Writer &writer, double value, int decimals) {
    if (std::isfinite(value)) {
        writer.Double(roundTo(value, decimals));
    } else {
        writer.Null();
    }
}

template <typename Writer>
void writeString(Writer &writer, const std::string &value) {
    writer.String(value.c_str(), static_cast<rapidjson::SizeType>(value.size()));
}

template <typename Writer>
void writeOptionalString(Writer &writer, const std::optional<std::string> &value) {
    if (value.has_value()) {
        writeString(writer, *value);
    } else {
        writer.Null();
    }
}

template <typename Writer>
void writeVector(Writer &writer, const Vec3 &v, int decimals) {
    writer.StartObject();
    writer.Key("x");
    writeNumber(writer, v.x, decimals);
    writer.Key("y");
    writeNumber(writer, v.y, decimals);
    writer.Key("z");
    writeNumber(writer, v.z, decimals);
    writer.EndObject();
}

template <typename Writer>
void writeReport(Writer &writer, const ClassificationReport &report) {
    const auto &result = report.classification;

    writer.StartObject();
    writer.Key("object_id");
    writer.Int(report.objectID);
    writer.Key("satellite_name");
    writeOptionalString(writer, report.satelliteName);
    writer.Key("predicted_class");
    writeString(writer, toString(result.predictedClass));
    writer.Key("classification_reason");
    writeString(writer, result.reason);

    writer.Key("orbital_stats");
    writer.StartObject();
    writer.Key("altitude_km");
    writeNumber(writer, report.altitudeInKilometers, 2);
    writer.Key("velocity_kms");
    writeNumber(writer, report.velocityInKmPerSecond, 3);
    writer.EndObject();

    writer.Key("confidence");
    writeNumber(writer, result.confidence, 4);
    writer.Key("region");
    writeString(writer, toString(report.region));

    writer.Key("proba");
    writer.StartObject();
    writer.Key("payload");
    writeNumber(writer, result.proba.payload, 4);
    writer.Key("rocket_body");
    writeNumber(writer, result.proba.rocketBody, 4);
    writer.Key("debris");
    writeNumber(writer, result.proba.debris, 4);
    writer.EndObject();

    writer.Key("tle_info");
    if (report.tleAge.has_value()) {
        const auto &age = *report.tleAge;
        writer.StartObject();
        writer.Key("epoch");
        writeString(writer, toISO8601(age.epoch));
        writer.Key("age_hours");
        writeNumber(writer, age.ageHours, 2);
        writer.Key("age_days");
        writeNumber(writer, age.ageDays, 2);
        writer.Key("is_stale");
        writer.Bool(age.isStale);
        writer.Key("warning");
        writeOptionalString(writer, age.warning);
        writer.EndObject();
    } else {
        writer.Null();
    }

    writer.Key("propagation");
    if (report.propagation.has_value()) {
        const auto &state = *report.propagation;
        writer.StartObject();
        writer.Key("position_km");
        writeVector(writer, state.positionInKilometers, POSITION_DECIMALS);
        writer.Key("velocity_kms");
        writeVector(writer, state.velocityInKmPerSecond, VELOCITY_DECIMALS);
        writer.Key("calculated_at");
        writeString(writer, toISO8601(state.calculatedAt));
        writer.EndObject();
    } else {
        writer.Null();
    }

    writer.Key("features");
    writer.StartObject();
    writer.Key("mean_motion");
    writeNumber(writer, report.features.meanMotion, 6);
    writer.Key("altitude_km");
    writeNumber(writer, report.features.altitudeInKilometers, 2);
    writer.Key("tle_age_days");
    writeNumber(writer, report.features.tleAgeDays, 2);
    writer.EndObject();

    writer.Key("metadata");
    writer.StartObject();
    writer.Key("model_version");
    writeString(writer, report.modelVersion);
    writer.Key("processing_time_ms");
    writeNumber(writer, report.processingTimeInMilliseconds, 2);
    writer.EndObject();

    writer.EndObject();
}

template <typename Writer>
void writeEntry(Writer &writer, const CatalogEntry &entry) {
    writer.StartObject();
    writer.Key("norad_id");
    writeString(writer, entry.noradID);
    writer.Key("name");
    writeString(writer, entry.name);
    writer.Key("line1");
    writeString(writer, entry.line1);
    writer.Key("line2");
    writeString(writer, entry.line2);
    writer.Key("epoch");
    writeString(writer, entry.epoch);
    writer.Key("age_hours");
    writeNumber(writer, entry.ageHours, 2);
    writer.Key("age_days");
    writeNumber(writer, entry.ageDays, 2);
    writer.Key("is_stale");
    writer.Bool(entry.isStale);
    writer.EndObject();
}

template <typename Writer>
void writeEntries(Writer &writer, const std::vector<CatalogEntry> &entries) {
    writer.StartArray();
    for (const auto &entry : entries) {
        writeEntry(writer, entry);
    }
    writer.EndArray();
}

template <typename Writer>
void writeSnapshot(Writer &writer, const CacheSnapshot &snapshot) {
    writer.StartObject();
    writer.Key("cached_at");
    writeString(writer, toISO8601(snapshot.cachedAt));
    writer.Key("satellites");
    writeEntries(writer, snapshot.satellites);
    writer.EndObject();
}

template <typename Write>
std::string render(bool pretty, Write write) {
    rapidjson::StringBuffer buffer;
    if (pretty) {
        rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
        writer.SetIndent(' ', 2);
        write(writer);
    } else {
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        write(writer);
    }
    return buffer.GetString();
}

std::string encode(const ClassificationReport &report, bool pretty) {
    return render(pretty, [&report](auto &writer) { writeReport(writer, report); });
}

std::string encode(const std::vector<CatalogEntry> &entries, bool pretty) {
    return render(pretty, [&entries](auto &writer) { writeEntries(writer, entries); });
}

std::string encode(const HealthStatus &status, bool pretty) {
    return render(pretty, [&status](auto &writer) {
        writer.StartObject();
        writer.Key("status");
        writeString(writer, status.status);
        writer.EndObject();
    });
}

std::string encode(const CacheSnapshot &snapshot, bool pretty) {
    return render(pretty, [&snapshot](auto &writer) { writeSnapshot(writer, snapshot); });
}

// ============================================================================
// Decoding
// ============================================================================

static bool hasString(const rapidjson::Value &object, const char *key) {
    return object.HasMember(key) && object[key].IsString();
}

static bool hasNumber(const rapidjson::Value &object, const char *key) {
    return object.HasMember(key) && object[key].IsNumber();
}

static std::optional<CatalogEntry> decodeEntry(const rapidjson::Value &value) {
    if (!value.IsObject()) {
        return std::nullopt;
    }
    for (const char *key : {"norad_id", "name", "line1", "line2", "epoch"}) {
        if (!hasString(value, key)) {
            return std::nullopt;
        }
    }
    if (!hasNumber(value, "age_hours") || !hasNumber(value, "age_days")
            || !value.HasMember("is_stale") || !value["is_stale"].IsBool()) {
        return std::nullopt;
    }

    return CatalogEntry{
        .noradID = value["norad_id"].GetString(),
        .name = value["name"].GetString(),
        .line1 = value["line1"].GetString(),
        .line2 = value["line2"].GetString(),
        .epoch = value["epoch"].GetString(),
        .ageHours = value["age_hours"].GetDouble(),
        .ageDays = value["age_days"].GetDouble(),
        .isStale = value["is_stale"].GetBool()
    };
}

std::optional<CacheSnapshot> decodeSnapshot(std::string_view text) {
    rapidjson::Document doc;
    doc.Parse(text.data(), text.size());

    if (doc.HasParseError() || !doc.IsObject()) {
        return std::nullopt;
    }
    if (!hasString(doc, "cached_at") || !doc.HasMember("satellites") || !doc["satellites"].IsArray()) {
        return std::nullopt;
    }

    auto cachedAt = parseISO8601(doc["cached_at"].GetString());
    if (!cachedAt.has_value()) {
        return std::nullopt;
    }

    CacheSnapshot snapshot{.cachedAt = *cachedAt, .satellites = {}};
    auto satellites = doc["satellites"].GetArray();
    snapshot.satellites.reserve(satellites.Size());
    for (const auto &value : satellites) {
        auto entry = decodeEntry(value);
        if (!entry.has_value()) {
            return std::nullopt;
        }
        snapshot.satellites.push_back(std::move(*entry));
    }
    return snapshot;
}

}
