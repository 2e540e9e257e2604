/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <satclass/catalog.hpp>
#include <satclass/json.hpp>
#include <satclass/orbit.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <functional>
#include <sstream>
#include <thread>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

using spdlog::debug;
using spdlog::info;
using spdlog::warn;
using spdlog::error;

namespace fs = std::filesystem;

namespace satclass {

CatalogEntry makeCatalogEntry(const celestrak::TLEEntry &entry, time_point now) {
    auto epoch = parseEpoch(entry.line1, now);
    auto age = evaluateAge(epoch.value, now);

    return CatalogEntry{
        .noradID = parseCatalogNumber(entry.line1),
        .name = entry.name,
        .line1 = entry.line1,
        .line2 = entry.line2,
        .epoch = toISO8601(epoch.value),
        .ageHours = roundTo(age.ageHours, 2),
        .ageDays = roundTo(age.ageDays, 2),
        .isStale = age.isStale
    };
}

// ============================================================================
// FileCacheStore
// ============================================================================

const fs::path& FileCacheStore::getPath() const {
    return path;
}

std::optional<CacheSnapshot> FileCacheStore::load() {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (ec) {
            warn("Cannot read catalog cache {}: {}", path.string(), ec.message());
        } else {
            debug("No catalog cache at {}", path.string());
        }
        return std::nullopt;
    }
    std::ifstream file(path);
    if (!file.is_open()) {
        warn("Failed to open catalog cache {}", path.string());
        return std::nullopt;
    }
    std::ostringstream contents;
    contents << file.rdbuf();

    auto snapshot = json::decodeSnapshot(contents.str());
    if (!snapshot.has_value()) {
        warn("Ignoring unreadable catalog cache {}", path.string());
    }
    return snapshot;
}

void FileCacheStore::save(const CacheSnapshot &snapshot) {
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }

    // Unique per writer so concurrent refreshes never share a temp file
    auto writer = std::hash<std::thread::id>{}(std::this_thread::get_id());
    fs::path temp = path;
    temp += fmt::format(".{}.tmp", writer);

    try {
        {
            std::ofstream file(temp, std::ios::out | std::ios::trunc);
            if (!file.is_open()) {
                throw std::runtime_error("Failed to open file for writing: " + temp.string());
            }
            file << json::encode(snapshot);
            file.flush();
            if (!file) {
                throw std::runtime_error("Failed to write catalog cache: " + temp.string());
            }
        }
        fs::rename(temp, path);
    } catch (const std::exception &) {
        std::error_code ec;
        fs::remove(temp, ec);
        throw;
    }

    info("Saved {} catalog entries to {}", snapshot.satellites.size(), path.string());
}

// ============================================================================
// CelestrakFeed
// ============================================================================

std::vector<celestrak::TLEEntry> CelestrakFeed::fetch() {
    return celestrak::getTLE(group, timeoutSeconds).entries;
}

// ============================================================================
// Listing filters
// ============================================================================

std::ostream& operator<<(std::ostream &os, const AgeFilter &filter) {
    switch (filter) {
        case AgeFilter::ALL:
            os << "all";
            break;
        case AgeFilter::FRESH:
            os << "fresh";
            break;
        case AgeFilter::RECENT:
            os << "recent";
            break;
        case AgeFilter::STALE:
            os << "stale";
            break;
    }
    return os;
}

AgeFilter parseAgeFilter(std::string_view text) {
    if (text == "all") {
        return AgeFilter::ALL;
    } else if (text == "fresh") {
        return AgeFilter::FRESH;
    } else if (text == "recent") {
        return AgeFilter::RECENT;
    } else if (text == "stale") {
        return AgeFilter::STALE;
    }
    throw std::invalid_argument("Invalid age filter: " + std::string(text));
}

static std::string toLower(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

static bool matchesAge(const CatalogEntry &entry, AgeFilter filter) {
    switch (filter) {
        case AgeFilter::ALL:
            return true;
        case AgeFilter::FRESH:
            return entry.ageHours < FRESH_MAX_AGE_HOURS;
        case AgeFilter::RECENT:
            return entry.ageDays < RECENT_MAX_AGE_DAYS;
        case AgeFilter::STALE:
            return entry.isStale;
    }
    return true;
}

std::vector<CatalogEntry> filterEntries(const std::vector<CatalogEntry> &entries, const ListingQuery &query) {
    std::string search = toLower(query.search);

    std::vector<CatalogEntry> result;
    for (const auto &entry : entries) {
        if (query.limit > 0 && result.size() >= query.limit) {
            break;
        }
        if (!search.empty()
                && toLower(entry.name).find(search) == std::string::npos
                && entry.noradID.find(query.search) == std::string::npos) {
            continue;
        }
        if (!matchesAge(entry, query.age)) {
            continue;
        }
        result.push_back(entry);
    }
    return result;
}

// ============================================================================
// Catalog
// ============================================================================

Catalog::Catalog(std::shared_ptr<CacheStore> store,
                 std::shared_ptr<FeedSource> feed,
                 std::chrono::seconds maxAge,
                 Clock clock)
    : store(std::move(store)), feed(std::move(feed)), maxAge(maxAge), clock(std::move(clock)) {}

bool Catalog::isFresh(const CacheSnapshot &snapshot, time_point now) const {
    return now - snapshot.cachedAt <= maxAge;
}

CacheSnapshot Catalog::refresh(time_point now) {
    info("Refreshing satellite catalog...");
    auto entries = feed->fetch();

    CacheSnapshot snapshot{.cachedAt = now, .satellites = {}};
    snapshot.satellites.reserve(entries.size());
    for (const auto &entry : entries) {
        snapshot.satellites.push_back(makeCatalogEntry(entry, now));
    }

    try {
        store->save(snapshot);
    } catch (const std::exception &e) {
        // The fetched data is still good for this request
        error("Failed to save catalog cache: {}", e.what());
    }
    return snapshot;
}

CacheSnapshot Catalog::snapshot() {
    auto now = clock();
    auto cached = store->load();

    if (cached.has_value() && isFresh(*cached, now)) {
        debug("Serving cached catalog from {}", toISO8601(cached->cachedAt));
        return *cached;
    }

    try {
        return refresh(now);
    } catch (const std::exception &e) {
        if (cached.has_value()) {
            warn("Catalog refresh failed ({}). Serving cache from {}.", e.what(), toISO8601(cached->cachedAt));
            return *cached;
        }
        throw CatalogUnavailableException(std::string("Error fetching satellite catalog: ") + e.what());
    }
}

std::vector<CatalogEntry> Catalog::list(const ListingQuery &query) {
    return filterEntries(snapshot().satellites, query);
}

// Strip leading zeros so "00005" and "5" name the same object
static std::string_view canonicalID(std::string_view id) {
    auto pos = id.find_first_not_of('0');
    return pos == std::string_view::npos ? std::string_view("0") : id.substr(pos);
}

std::optional<CatalogEntry> Catalog::find(std::string_view noradID) {
    auto wanted = canonicalID(noradID);
    for (const auto &entry : snapshot().satellites) {
        if (canonicalID(entry.noradID) == wanted) {
            return entry;
        }
    }
    return std::nullopt;
}

}
