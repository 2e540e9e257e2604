/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SATCLASS_SERVICE_HPP
#define __SATCLASS_SERVICE_HPP

#include <satclass/catalog.hpp>
#include <satclass/classifier.hpp>
#include <satclass/orbit.hpp>
#include <satclass/propagator.hpp>
#include <satclass/tle.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace satclass {

constexpr const char* MODEL_VERSION = "heuristic-v1.0";

struct ClassificationRequest {
    int objectID = 0;
    std::string line1;
    std::string line2;
    std::optional<std::string> satelliteName;
    std::optional<double> threshold;          ///< DEFAULT_THRESHOLD when absent
};

/**
 * Inputs the rules were evaluated on.
 */
struct Features {
    double meanMotion;
    double altitudeInKilometers;
    double tleAgeDays;
};

/**
 * Everything known about one classified object.
 *
 * Values are kept at full precision; the JSON encoder applies the output
 * rounding.
 */
struct ClassificationReport {
    int objectID = 0;
    std::optional<std::string> satelliteName;
    ClassificationResult classification;
    double altitudeInKilometers = 0.0;        ///< Propagated when available, otherwise two-body
    double velocityInKmPerSecond = 0.0;       ///< Two-body circular speed
    Region region = Region::LEO;              ///< From the two-body altitude
    std::optional<TLEAge> tleAge;
    std::optional<OrbitalState> propagation;
    Features features{};
    std::string modelVersion = MODEL_VERSION;
    double processingTimeInMilliseconds = 0.0;

    // Set when a TLE field was unreadable and a default was used
    std::optional<std::string> epochFallback;
    std::optional<std::string> meanMotionFallback;
};

struct HealthStatus {
    std::string status = "ok";
};

/**
 * The three public operations: classify an object, list the catalog and
 * report liveness.
 */
class Service {
public:
    Service(std::shared_ptr<const Propagator> propagator,
            std::shared_ptr<Catalog> catalog,
            Clock clock = [] { return std::chrono::system_clock::now(); });
    ~Service() = default;

    /**
     * Classifies one object from its TLE. Never throws for bad TLE content.
     */
    ClassificationReport classify(const ClassificationRequest &request) const;

    /**
     * Classifies an object taken from the catalog by its NORAD ID.
     * @return Nothing when the catalog does not list the object
     * @throws CatalogUnavailableException if the catalog cannot be read
     */
    std::optional<ClassificationReport> classifyCatalogEntry(std::string_view noradID,
                                                             std::optional<double> threshold);

    /**
     * @throws CatalogUnavailableException if the catalog cannot be read
     */
    std::vector<CatalogEntry> listSatellites(const ListingQuery &query = {});

    HealthStatus health() const;

private:
    std::shared_ptr<const Propagator> propagator;
    std::shared_ptr<Catalog> catalog;
    Clock clock;
};

}

#endif
