/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <satclass/service.hpp>

#include <charconv>
#include <chrono>

#include <spdlog/spdlog.h>

using spdlog::debug;
using spdlog::warn;

namespace satclass {

Service::Service(std::shared_ptr<const Propagator> propagator,
                 std::shared_ptr<Catalog> catalog,
                 Clock clock)
    : propagator(std::move(propagator)), catalog(std::move(catalog)), clock(std::move(clock)) {}

ClassificationReport Service::classify(const ClassificationRequest &request) const {
    auto started = std::chrono::steady_clock::now();
    auto now = clock();

    ClassificationReport report;
    report.objectID = request.objectID;
    report.satelliteName = request.satelliteName;

    auto epoch = parseEpoch(request.line1, now);
    auto meanMotion = parseMeanMotion(request.line2);
    report.epochFallback = epoch.fallbackReason;
    report.meanMotionFallback = meanMotion.fallbackReason;

    auto age = evaluateAge(epoch.value, now);
    auto params = calculateOrbitalParameters(meanMotion.value);

    report.altitudeInKilometers = params.altitudeInKilometers;
    report.velocityInKmPerSecond = params.velocityInKmPerSecond;
    report.region = params.region;

    if (propagator) {
        TLERecord tle{
            .noradID = request.objectID,
            .name = request.satelliteName,
            .line1 = request.line1,
            .line2 = request.line2
        };
        report.propagation = propagator->propagate(tle, now);
        if (report.propagation.has_value()) {
            report.altitudeInKilometers = propagatedAltitude(*report.propagation);
        }
    }

    double threshold = request.threshold.value_or(DEFAULT_THRESHOLD);
    report.classification = satclass::classify(request.satelliteName, report.altitudeInKilometers, threshold);

    report.features = Features{
        .meanMotion = meanMotion.value,
        .altitudeInKilometers = report.altitudeInKilometers,
        .tleAgeDays = age.ageDays
    };
    report.tleAge = std::move(age);

    auto elapsed = std::chrono::steady_clock::now() - started;
    report.processingTimeInMilliseconds =
        std::chrono::duration<double, std::milli>(elapsed).count();

    debug("Classified {} as {} ({:.2f}) at {:.2f} km",
          request.objectID, toString(report.classification.predictedClass),
          report.classification.confidence, report.altitudeInKilometers);

    return report;
}

std::optional<ClassificationReport> Service::classifyCatalogEntry(std::string_view noradID,
                                                                  std::optional<double> threshold) {
    auto entry = catalog->find(noradID);
    if (!entry.has_value()) {
        warn("Satellite {} is not in the catalog", noradID);
        return std::nullopt;
    }

    int objectID = 0;
    auto [ptr, ec] = std::from_chars(entry->noradID.data(), entry->noradID.data() + entry->noradID.size(), objectID);
    if (ec != std::errc()) {
        warn("Catalog entry has a non-numeric NORAD ID: '{}'", entry->noradID);
    }

    return classify(ClassificationRequest{
        .objectID = objectID,
        .line1 = entry->line1,
        .line2 = entry->line2,
        .satelliteName = entry->name,
        .threshold = threshold
    });
}

std::vector<CatalogEntry> Service::listSatellites(const ListingQuery &query) {
    return catalog->list(query);
}

HealthStatus Service::health() const {
    return HealthStatus{};
}

}
