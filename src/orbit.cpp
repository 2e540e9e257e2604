/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <satclass/orbit.hpp>

#include <cmath>
#include <numbers>

namespace satclass {

Region regionForAltitude(double altitudeInKilometers) {
    if (altitudeInKilometers < LEO_CEILING_KM) {
        return Region::LEO;
    }
    if (altitudeInKilometers < MEO_CEILING_KM) {
        return Region::MEO;
    }
    return Region::GEO;
}

// Kepler's third law on a circular orbit:
//   T = 86400 / n,  a = (mu * (T / 2pi)^2)^(1/3),  v = sqrt(mu / a)
OrbitalParameters calculateOrbitalParameters(double meanMotion) {
    double period = SECONDS_PER_DAY / meanMotion;
    double angular = period / (2.0 * std::numbers::pi);
    double a = std::cbrt(MU * angular * angular);
    double altitude = a - RADIUS_EARTH_KM;

    return OrbitalParameters{
        .periodInSeconds = period,
        .semiMajorAxisInKilometers = a,
        .altitudeInKilometers = altitude,
        .velocityInKmPerSecond = std::sqrt(MU / a),
        .region = regionForAltitude(altitude)
    };
}

double roundTo(double value, int decimals) {
    double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

std::string toString(Region region) {
    switch (region) {
        case Region::LEO:
            return "LEO";
        case Region::MEO:
            return "MEO";
        case Region::GEO:
            return "GEO";
    }
    return "UNKNOWN";
}

std::ostream& operator<<(std::ostream &os, const Region &region) {
    os << toString(region);
    return os;
}

}
