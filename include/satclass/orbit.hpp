/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SATCLASS_ORBIT_HPP
#define __SATCLASS_ORBIT_HPP

#include <cmath>
#include <iostream>
#include <string>

namespace satclass {

// Two-body constants
constexpr double MU = 398600.4418;           // Earth gravitational parameter (km^3/s^2)
constexpr double RADIUS_EARTH_KM = 6371.0;   // Earth mean radius (km)
constexpr double SECONDS_PER_DAY = 86400.0;

// Region ladder upper bounds (km)
constexpr double LEO_CEILING_KM = 2000.0;
constexpr double MEO_CEILING_KM = 35786.0;

/**
 * 3D vector in Cartesian coordinates.
 */
struct Vec3 {
    double x, y, z;

    double magnitude() const {
        return std::sqrt(x*x + y*y + z*z);
    }
};

/**
 * Coarse altitude-based orbital region.
 */
enum class Region {
    LEO,
    MEO,
    GEO
};

std::ostream& operator<<(std::ostream &os, const Region &region);
std::string toString(Region region);

/**
 * Orbit size and speed derived from mean motion with two-body mechanics.
 * Assumes a near-circular orbit.
 */
struct OrbitalParameters {
    double periodInSeconds;
    double semiMajorAxisInKilometers;
    double altitudeInKilometers;       ///< Semi-major axis minus Earth's mean radius
    double velocityInKmPerSecond;      ///< Circular orbit speed
    Region region;
};

/**
 * Derives orbital parameters from mean motion.
 *
 * @param meanMotion Mean motion in revolutions per day (must be positive)
 */
OrbitalParameters calculateOrbitalParameters(double meanMotion);

/**
 * Maps an altitude to LEO (< 2000 km), MEO (< 35786 km) or GEO.
 */
Region regionForAltitude(double altitudeInKilometers);

/**
 * Rounds a value to a fixed number of decimal places.
 */
double roundTo(double value, int decimals);

}

#endif
