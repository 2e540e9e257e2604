/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SATCLASS_TLE_HPP
#define __SATCLASS_TLE_HPP

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace satclass {

using time_point = std::chrono::system_clock::time_point;

// Fixed TLE column layout (0-indexed offsets)
constexpr std::size_t EPOCH_OFFSET = 18;              // Line 1, columns 19-32
constexpr std::size_t EPOCH_LENGTH = 14;
constexpr std::size_t MEAN_MOTION_OFFSET = 52;        // Line 2, columns 53-63
constexpr std::size_t MEAN_MOTION_LENGTH = 11;
constexpr std::size_t CATALOG_NUMBER_OFFSET = 2;      // Line 1, columns 3-7
constexpr std::size_t CATALOG_NUMBER_LENGTH = 5;

// Two-digit years at or above the pivot belong to the 1900s
constexpr int YEAR_PIVOT = 57;

// Mean motion assumed when line 2 cannot be read (revolutions per day)
constexpr double DEFAULT_MEAN_MOTION = 15.0;

// Largest day-of-year offset accepted from an epoch field. Keeps the result
// well inside the range of the nanosecond system clock.
constexpr double MAX_EPOCH_DAY_OFFSET = 36500.0;

// TLE staleness policy
constexpr double STALE_AFTER_DAYS = 3.0;
constexpr double VERY_STALE_AFTER_DAYS = 7.0;
constexpr double ADVISORY_AFTER_HOURS = 24.0;

// Unix epoch (1970-01-01 00:00 UTC) as a Julian Date
constexpr double UNIX_EPOCH_JD = 2440587.5;

// ============================================================================
// Data Types
// ============================================================================

/**
 * A two-line element set as received from a caller or the catalog feed.
 */
struct TLERecord {
    int noradID = 0;                      ///< NORAD Catalog ID
    std::optional<std::string> name;      ///< Object name, if known
    std::string line1;                    ///< First TLE line ("1 ...")
    std::string line2;                    ///< Second TLE line ("2 ...")
};

/**
 * Outcome of reading a single fixed-column TLE field.
 *
 * Malformed fields never raise. Instead the parser substitutes a documented
 * default and records why, so callers can tell a computed value from a
 * fallback.
 */
template <typename T>
struct FieldParse {
    T value;
    std::optional<std::string> fallbackReason;

    bool isFallback() const {
        return fallbackReason.has_value();
    }
};

/**
 * Age of a TLE relative to an evaluation instant.
 */
struct TLEAge {
    time_point epoch;                     ///< Absolute epoch of the element set
    double ageHours = 0.0;                ///< Negative when the epoch is in the future
    double ageDays = 0.0;
    bool isStale = false;                 ///< True when ageDays > STALE_AFTER_DAYS
    std::optional<std::string> warning;   ///< Human readable staleness warning
};

// ============================================================================
// TLE Field Parsing
// ============================================================================

/**
 * Positional substring that tolerates short lines.
 * Returns an empty or shortened view instead of throwing.
 */
std::string_view slice(std::string_view line, std::size_t offset, std::size_t length);

/**
 * Expands a two-digit TLE year using the NORAD pivot (57).
 */
int pivotYear(int twoDigitYear);

/**
 * Builds an absolute UTC time from a four-digit year and a fractional
 * day-of-year, where day 1.0 is January 1st 00:00 UTC.
 * @throws std::out_of_range if the day is more than MAX_EPOCH_DAY_OFFSET
 *         days away from January 1st
 */
time_point epochFromDayOfYear(int fourDigitYear, double dayOfYear);

/**
 * Parses the epoch field (YYDDD.DDDDDDDD) of TLE line 1.
 *
 * @param line1 First TLE line
 * @param fallback Value returned when the field is malformed (usually "now")
 */
FieldParse<time_point> parseEpoch(std::string_view line1, time_point fallback);

/**
 * Parses the mean motion field (revolutions per day) of TLE line 2.
 * Falls back to DEFAULT_MEAN_MOTION when the field is malformed or is not a
 * positive finite number.
 */
FieldParse<double> parseMeanMotion(std::string_view line2);

/**
 * Returns the trimmed catalog number text from line 1, columns 3-7.
 */
std::string parseCatalogNumber(std::string_view line1);

// ============================================================================
// Epoch Age Evaluation
// ============================================================================

/**
 * Computes the age of an epoch at the given instant and applies the
 * staleness banding.
 */
TLEAge evaluateAge(time_point epoch, time_point now);

/**
 * Staleness warning for an age, or nothing when the TLE is recent.
 */
std::optional<std::string> ageWarning(double ageHours, double ageDays);

// ============================================================================
// Time Functions
// ============================================================================

/**
 * Converts a time_point to Julian Date.
 */
double toJulianDate(time_point tp);

/**
 * Splits a time_point into the Julian Date of the preceding 0h UTC and the
 * elapsed fraction of that day.
 */
std::pair<double, double> julianDateParts(time_point tp);

/**
 * Formats a time_point as ISO-8601 UTC with microseconds,
 * e.g. "2025-11-29T20:01:44.058240+00:00".
 */
std::string toISO8601(time_point tp);

/**
 * Parses an ISO-8601 timestamp with or without a UTC offset.
 */
std::optional<time_point> parseISO8601(std::string_view text);

}

#endif
