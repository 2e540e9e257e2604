/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SATCLASS_PROPAGATOR_HPP
#define __SATCLASS_PROPAGATOR_HPP

#include <satclass/orbit.hpp>
#include <satclass/tle.hpp>

#include <optional>

namespace satclass {

// Decimal places kept on propagated vectors
constexpr int POSITION_DECIMALS = 3;
constexpr int VELOCITY_DECIMALS = 6;

/**
 * Position and velocity of an object at a given instant, in the TEME
 * (Earth-centered inertial) frame.
 */
struct OrbitalState {
    Vec3 positionInKilometers;
    Vec3 velocityInKmPerSecond;
    time_point calculatedAt;
};

/**
 * Builds an OrbitalState with position rounded to 3 decimals and velocity
 * rounded to 6 decimals.
 */
OrbitalState makeOrbitalState(const Vec3 &position, const Vec3 &velocity, time_point calculatedAt);

/**
 * Altitude above Earth's mean radius implied by a propagated position.
 */
double propagatedAltitude(const OrbitalState &state);

/**
 * Advances a TLE to an arbitrary instant.
 *
 * Implementations never throw. Any numerical failure is reported as an
 * empty result so callers can fall back to the two-body approximation.
 */
class Propagator {
public:
    virtual ~Propagator() = default;

    virtual std::optional<OrbitalState> propagate(const TLERecord &tle, time_point instant) const = 0;
};

/**
 * Propagator backed by the libsgp4 SGP4/SDP4 implementation.
 *
 * Stateless: the SGP4 model is built per call, so a single instance may be
 * shared between threads.
 */
class SGP4Propagator : public Propagator {
public:
    SGP4Propagator() = default;
    ~SGP4Propagator() override = default;

    std::optional<OrbitalState> propagate(const TLERecord &tle, time_point instant) const override;
};

}

#endif
