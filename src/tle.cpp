/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <satclass/tle.hpp>

#include <charconv>
#include <chrono>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

#include <date/date.h>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

using spdlog::debug;
using spdlog::warn;

namespace satclass {

// Helper function to trim spaces and line endings from both ends of a string_view
static std::string_view trim(const std::string_view &str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) {
        return "";
    }
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

// Helper function to convert a whole substring to a numeric type
template <typename T>
inline T toNumber(const std::string_view &str) {
    T value;
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (ec != std::errc() || ptr != str.data() + str.size()) {
        throw std::invalid_argument("Couldn't convert value: '" + std::string(str) + "'");
    }
    return value;
}

std::string_view slice(std::string_view line, std::size_t offset, std::size_t length) {
    if (offset >= line.size()) {
        return "";
    }
    return line.substr(offset, length);
}

int pivotYear(int twoDigitYear) {
    if (twoDigitYear >= YEAR_PIVOT) {
        return 1900 + twoDigitYear;
    }
    return 2000 + twoDigitYear;
}

time_point epochFromDayOfYear(int fourDigitYear, double dayOfYear) {
    using namespace std::chrono;

    if (!(std::abs(dayOfYear - 1.0) <= MAX_EPOCH_DAY_OFFSET)) {
        throw std::out_of_range("Day of year out of range: " + std::to_string(dayOfYear));
    }

    auto january1 = sys_days{year{fourDigitYear}/January/1};
    auto offset = duration_cast<microseconds>(duration<double, days::period>{dayOfYear - 1.0});

    return time_point_cast<system_clock::duration>(january1 + offset);
}

FieldParse<time_point> parseEpoch(std::string_view line1, time_point fallback) {
    // Epoch is columns 19-32: YYDDD.DDDDDDDD
    std::string_view field = trim(slice(line1, EPOCH_OFFSET, EPOCH_LENGTH));
    try {
        if (field.size() < 3) {
            throw std::invalid_argument("Epoch field too short: '" + std::string(field) + "'");
        }
        int y = toNumber<int>(field.substr(0, 2));
        double dayOfYear = toNumber<double>(field.substr(2));
        if (y < 0 || !std::isfinite(dayOfYear)) {
            throw std::invalid_argument("Epoch out of range: '" + std::string(field) + "'");
        }
        auto epoch = epochFromDayOfYear(pivotYear(y), dayOfYear);
        debug("Parsed TLE epoch '{}' as {}", field, toISO8601(epoch));
        return {epoch, std::nullopt};
    } catch (const std::exception &e) {
        warn("Error parsing epoch: {}. Using evaluation time instead.", e.what());
        return {fallback, std::string(e.what())};
    }
}

FieldParse<double> parseMeanMotion(std::string_view line2) {
    // Mean Motion is columns 53-63
    std::string_view field = trim(slice(line2, MEAN_MOTION_OFFSET, MEAN_MOTION_LENGTH));
    try {
        double meanMotion = toNumber<double>(field);
        if (!std::isfinite(meanMotion) || meanMotion <= 0.0) {
            throw std::invalid_argument("Mean motion must be a positive number: '" + std::string(field) + "'");
        }
        return {meanMotion, std::nullopt};
    } catch (const std::exception &e) {
        warn("Error parsing mean motion: {}. Using {} rev/day.", e.what(), DEFAULT_MEAN_MOTION);
        return {DEFAULT_MEAN_MOTION, std::string(e.what())};
    }
}

std::string parseCatalogNumber(std::string_view line1) {
    return std::string(trim(slice(line1, CATALOG_NUMBER_OFFSET, CATALOG_NUMBER_LENGTH)));
}

std::optional<std::string> ageWarning(double ageHours, double ageDays) {
    if (ageDays > VERY_STALE_AFTER_DAYS) {
        return fmt::format("⚠️ TLE muy viejo ({:.1f} días). Posición MUY poco confiable.", ageDays);
    }
    if (ageDays > STALE_AFTER_DAYS) {
        return fmt::format("⚠️ TLE viejo ({:.1f} días). Posición poco confiable.", ageDays);
    }
    if (ageHours > ADVISORY_AFTER_HOURS) {
        return fmt::format("TLE de {:.1f} días. Considere actualizar.", ageDays);
    }
    return std::nullopt;
}

TLEAge evaluateAge(time_point epoch, time_point now) {
    using namespace std::chrono;

    double ageHours = duration<double, hours::period>(now - epoch).count();
    double ageDays = ageHours / 24.0;

    return TLEAge{
        .epoch = epoch,
        .ageHours = ageHours,
        .ageDays = ageDays,
        .isStale = ageDays > STALE_AFTER_DAYS,
        .warning = ageWarning(ageHours, ageDays)
    };
}

// Convert a time_point to Julian Date
double toJulianDate(time_point tp) {
    using namespace std::chrono;

    auto daysSinceEpoch = duration_cast<duration<double, days::period>>(
        tp.time_since_epoch()
    ).count();

    return UNIX_EPOCH_JD + daysSinceEpoch;
}

std::pair<double, double> julianDateParts(time_point tp) {
    using namespace std::chrono;

    auto midnight = floor<days>(tp);
    double jd = UNIX_EPOCH_JD + static_cast<double>(midnight.time_since_epoch().count());
    double fraction = duration<double, days::period>(tp - midnight).count();

    return {jd, fraction};
}

std::string toISO8601(time_point tp) {
    auto truncated = date::floor<std::chrono::microseconds>(tp);
    return date::format("%FT%T", truncated) + "+00:00";
}

std::optional<time_point> parseISO8601(std::string_view text) {
    date::sys_time<std::chrono::microseconds> tp;
    {
        std::istringstream in{std::string(text)};
        in >> date::parse("%FT%T%Ez", tp);
        if (!in.fail()) {
            return std::chrono::time_point_cast<std::chrono::system_clock::duration>(tp);
        }
    }
    {
        // Naive timestamps are taken as UTC
        std::istringstream in{std::string(text)};
        in >> date::parse("%FT%T", tp);
        if (!in.fail()) {
            return std::chrono::time_point_cast<std::chrono::system_clock::duration>(tp);
        }
    }
    return std::nullopt;
}

}
