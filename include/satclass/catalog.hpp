/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SATCLASS_CATALOG_HPP
#define __SATCLASS_CATALOG_HPP

#include <satclass/celestrak.hpp>
#include <satclass/tle.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace satclass {

using Clock = std::function<time_point()>;

// A snapshot older than this is refetched
constexpr auto DEFAULT_CACHE_MAX_AGE = std::chrono::hours(2);

// Listing size when the caller does not ask for one
constexpr std::size_t DEFAULT_LISTING_LIMIT = 100;

// Age filter bounds used by the listing
constexpr double FRESH_MAX_AGE_HOURS = 12.0;
constexpr double RECENT_MAX_AGE_DAYS = 1.0;

/**
 * Raised when the feed cannot be fetched and no snapshot exists to fall
 * back on.
 */
class CatalogUnavailableException : public std::runtime_error {
public:
    explicit CatalogUnavailableException(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * One satellite of the active catalog. Ages are computed when the feed is
 * fetched and stored rounded to two decimals.
 */
struct CatalogEntry {
    std::string noradID;       ///< Catalog number text from line 1
    std::string name;
    std::string line1;
    std::string line2;
    std::string epoch;         ///< ISO-8601 epoch
    double ageHours = 0.0;
    double ageDays = 0.0;
    bool isStale = false;
};

/**
 * The whole cached catalog. Always replaced as a unit.
 */
struct CacheSnapshot {
    time_point cachedAt;
    std::vector<CatalogEntry> satellites;
};

/**
 * Builds a catalog entry from a feed entry, aging it against "now".
 */
CatalogEntry makeCatalogEntry(const celestrak::TLEEntry &entry, time_point now);

// ============================================================================
// Collaborators
// ============================================================================

/**
 * Persistence for the catalog snapshot.
 */
class CacheStore {
public:
    virtual ~CacheStore() = default;

    /**
     * Returns the stored snapshot regardless of its age, or nothing when the
     * store is empty or unreadable.
     */
    virtual std::optional<CacheSnapshot> load() = 0;

    /**
     * Replaces the stored snapshot.
     * @throws std::runtime_error if the snapshot cannot be written
     */
    virtual void save(const CacheSnapshot &snapshot) = 0;
};

/**
 * Stores the snapshot as a single JSON document on disk. Writes go to a
 * temporary file that is then renamed over the target, so readers see either
 * the old or the new document.
 */
class FileCacheStore : public CacheStore {
public:
    explicit FileCacheStore(std::filesystem::path path) : path(std::move(path)) {}
    ~FileCacheStore() override = default;

    std::optional<CacheSnapshot> load() override;
    void save(const CacheSnapshot &snapshot) override;

    const std::filesystem::path& getPath() const;

private:
    std::filesystem::path path;
};

/**
 * Source of the raw TLE feed.
 */
class FeedSource {
public:
    virtual ~FeedSource() = default;

    /**
     * @throws celestrak::FetchException (or another std::exception) on failure
     */
    virtual std::vector<celestrak::TLEEntry> fetch() = 0;
};

/**
 * Fetches a group from Celestrak.
 */
class CelestrakFeed : public FeedSource {
public:
    CelestrakFeed(std::string group = "active", long timeoutSeconds = celestrak::DEFAULT_TIMEOUT_SECONDS)
        : group(std::move(group)), timeoutSeconds(timeoutSeconds) {}
    ~CelestrakFeed() override = default;

    std::vector<celestrak::TLEEntry> fetch() override;

private:
    std::string group;
    long timeoutSeconds;
};

// ============================================================================
// Catalog
// ============================================================================

enum class AgeFilter {
    ALL,
    FRESH,      ///< ageHours < 12
    RECENT,     ///< ageDays < 1
    STALE       ///< isStale
};

std::ostream& operator<<(std::ostream &os, const AgeFilter &filter);

/**
 * Parse "all", "fresh", "recent" or "stale".
 * @throws std::invalid_argument for anything else
 */
AgeFilter parseAgeFilter(std::string_view text);

struct ListingQuery {
    std::size_t limit = DEFAULT_LISTING_LIMIT;   ///< 0 means no limit
    std::string search;                          ///< Name (case-insensitive) or NORAD ID substring
    AgeFilter age = AgeFilter::ALL;
};

/**
 * Applies the search and age filters, then the limit.
 */
std::vector<CatalogEntry> filterEntries(const std::vector<CatalogEntry> &entries, const ListingQuery &query);

/**
 * Read path over the cached active-satellite catalog.
 *
 * A snapshot no older than the maximum age is served as is. Otherwise the
 * feed is fetched and the snapshot replaced. If that fetch fails, whatever
 * snapshot exists is served even when expired; with no snapshot at all the
 * listing fails.
 *
 * There is no locking: concurrent misses each fetch and the last save wins.
 */
class Catalog {
public:
    Catalog(std::shared_ptr<CacheStore> store,
            std::shared_ptr<FeedSource> feed,
            std::chrono::seconds maxAge = DEFAULT_CACHE_MAX_AGE,
            Clock clock = [] { return std::chrono::system_clock::now(); });
    ~Catalog() = default;

    /**
     * Returns a usable snapshot, refreshing it when needed.
     * @throws CatalogUnavailableException if there is nothing to serve
     */
    CacheSnapshot snapshot();

    /**
     * Lists catalog entries in feed order.
     * @throws CatalogUnavailableException if there is nothing to serve
     */
    std::vector<CatalogEntry> list(const ListingQuery &query = {});

    /**
     * Looks up one entry by catalog number (leading zeros are ignored).
     */
    std::optional<CatalogEntry> find(std::string_view noradID);

    /**
     * True when the snapshot is no older than the maximum age at "now".
     */
    bool isFresh(const CacheSnapshot &snapshot, time_point now) const;

private:
    CacheSnapshot refresh(time_point now);

    std::shared_ptr<CacheStore> store;
    std::shared_ptr<FeedSource> feed;
    std::chrono::seconds maxAge;
    Clock clock;
};

}

#endif
