/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <satclass/celestrak.hpp>
#include <curlpp/cURLpp.hpp>
#include <curlpp/Easy.hpp>
#include <curlpp/Infos.hpp>
#include <curlpp/Options.hpp>
#include <spdlog/spdlog.h>
#include <sstream>

using spdlog::debug;
using spdlog::info;

namespace celestrak {

// Celestrak GP data URL
// Documentation: https://celestrak.org/NORAD/documentation/gp-data-formats.php
#define BASE_URI "https://celestrak.org/NORAD/elements/gp.php"

std::string doGet(const std::string& url, long timeoutSeconds) {
    // Initialize curlpp
    curlpp::Cleanup cleaner;
    curlpp::Easy request;

    debug("GET {}", url);

    // Set up the request
    request.setOpt(new curlpp::options::Url(url));
    request.setOpt(new curlpp::options::FollowLocation(true));
    request.setOpt(new curlpp::options::Timeout(timeoutSeconds));
    request.setOpt(new curlpp::options::UserAgent("satclass"));

    // Perform the request and capture response
    std::ostringstream responseStream;
    request.setOpt(new curlpp::options::WriteStream(&responseStream));

    long status = 0;
    try {
        request.perform();
        status = curlpp::infos::ResponseCode::get(request);
    } catch (curlpp::RuntimeError& e) {
        throw FetchException(std::string("HTTP request failed: ") + e.what());
    } catch (curlpp::LogicError& e) {
        throw FetchException(std::string("HTTP logic error: ") + e.what());
    }

    if (status < 200 || status >= 300) {
        throw FetchException("HTTP request failed with status " + std::to_string(status) + ": " + url);
    }

    std::string response = responseStream.str();
    debug("Response length: {} bytes", response.length());

    return response;
}

// Helper function to trim whitespace from both ends of a string
std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

std::string groupURL(const std::string& group) {
    std::string groupName = group.empty() ? "active" : group;
    std::ostringstream urlBuilder;
    urlBuilder << BASE_URI << "?GROUP=" << groupName << "&FORMAT=tle";
    return urlBuilder.str();
}

// Parse TLE format response into entries
// TLE format: Name line, Line 1, Line 2, repeated
std::vector<TLEEntry> parseTLEResponse(const std::string& response) {
    std::vector<std::string> lines;
    std::istringstream stream(response);
    std::string line;

    // Read all non-empty lines
    while (std::getline(stream, line)) {
        std::string trimmed = trim(line);
        if (!trimmed.empty()) {
            lines.push_back(std::move(trimmed));
        }
    }

    std::vector<TLEEntry> entries;
    std::size_t i = 0;
    while (i + 2 < lines.size()) {
        const std::string& line1 = lines[i + 1];
        const std::string& line2 = lines[i + 2];

        // Misaligned triple: move forward one line and try again
        if (!line1.starts_with("1 ") || !line2.starts_with("2 ")) {
            debug("Skipping misaligned feed line {}: '{}'", i, lines[i]);
            i++;
            continue;
        }

        entries.push_back(TLEEntry{
            .name = lines[i],
            .line1 = line1,
            .line2 = line2
        });
        i += 3;
    }
    return entries;
}

TLEResponse getTLE(const std::string& group, long timeoutSeconds) {
    // Use "active" as default if group is empty
    std::string groupName = group.empty() ? "active" : group;

    // Fetch the data
    std::string response = doGet(groupURL(groupName), timeoutSeconds);

    // Check for error responses
    if (response.find("No GP data found") != std::string::npos) {
        throw FetchException("Celestrak error: No GP data found for group '" + groupName + "'");
    }

    // Parse the TLE data
    std::vector<TLEEntry> entries = parseTLEResponse(response);
    info("Downloaded {} TLE entries for group '{}'", entries.size(), groupName);

    return TLEResponse{
        .group = groupName,
        .entries = std::move(entries)
    };
}

} // namespace celestrak
