/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SATCLASS_CELESTRAK_HPP
#define __SATCLASS_CELESTRAK_HPP

#include <stdexcept>
#include <string>
#include <vector>

namespace celestrak {

// Seconds to wait for the whole transfer before giving up
constexpr long DEFAULT_TIMEOUT_SECONDS = 30;

/**
 * Raised when the feed cannot be downloaded or reports an error.
 */
class FetchException : public std::runtime_error {
public:
    explicit FetchException(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * A single TLE entry containing the satellite name and two-line elements
 */
struct TLEEntry {
    std::string name;
    std::string line1;
    std::string line2;
};

/**
 * Response containing multiple TLE entries from a group query
 */
struct TLEResponse {
    std::string group;
    std::vector<TLEEntry> entries;
};

/**
 * Build the GP query URL for a group in TLE format
 */
std::string groupURL(const std::string& group);

/**
 * Parse a plain-text TLE feed into entries.
 *
 * Lines are trimmed and blank lines dropped. The remaining lines are read as
 * name/line1/line2 triples. When a triple is misaligned (its second line does
 * not start with "1 " or its third with "2 ") the reader skips a single line
 * and tries again, so one bad entry does not shift the rest of the stream.
 */
std::vector<TLEEntry> parseTLEResponse(const std::string& response);

/**
 * Download TLE data for a satellite group from Celestrak
 * @param group The group name (e.g., "active", "stations", "weather", etc.)
 *              Defaults to "active" if empty
 * @param timeoutSeconds Transfer timeout
 * @return TLE data for all satellites in the group
 * @throws FetchException if the download fails, the server answers with a
 *         non-2xx status, or Celestrak reports that the group has no data
 */
TLEResponse getTLE(const std::string& group = "active", long timeoutSeconds = DEFAULT_TIMEOUT_SECONDS);

} // namespace celestrak

#endif
