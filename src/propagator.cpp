/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <satclass/propagator.hpp>

#include <exception>
#include <string>

#include <Eci.h>
#include <SGP4.h>
#include <Tle.h>

#include <spdlog/spdlog.h>

using spdlog::debug;
using spdlog::warn;

namespace satclass {

constexpr double MINUTES_PER_DAY = 1440.0;

OrbitalState makeOrbitalState(const Vec3 &position, const Vec3 &velocity, time_point calculatedAt) {
    return OrbitalState{
        .positionInKilometers = {
            roundTo(position.x, POSITION_DECIMALS),
            roundTo(position.y, POSITION_DECIMALS),
            roundTo(position.z, POSITION_DECIMALS)
        },
        .velocityInKmPerSecond = {
            roundTo(velocity.x, VELOCITY_DECIMALS),
            roundTo(velocity.y, VELOCITY_DECIMALS),
            roundTo(velocity.z, VELOCITY_DECIMALS)
        },
        .calculatedAt = calculatedAt
    };
}

double propagatedAltitude(const OrbitalState &state) {
    return state.positionInKilometers.magnitude() - RADIUS_EARTH_KM;
}

std::optional<OrbitalState> SGP4Propagator::propagate(const TLERecord &tle, time_point instant) const {
    try {
        libsgp4::Tle elements(tle.name.value_or(""), tle.line1, tle.line2);
        libsgp4::SGP4 model(elements);

        // Time since epoch in minutes, from the split Julian Date of the instant
        auto [jd, fraction] = julianDateParts(instant);
        double epochJD = elements.Epoch().ToJulian();
        double tsince = ((jd - epochJD) + fraction) * MINUTES_PER_DAY;

        libsgp4::Eci eci = model.FindPosition(tsince);
        const libsgp4::Vector &r = eci.Position();
        const libsgp4::Vector &v = eci.Velocity();

        debug("SGP4 propagated {} by {:.3f} min", tle.noradID, tsince);

        return makeOrbitalState({r.x, r.y, r.z}, {v.x, v.y, v.z}, instant);
    } catch (const std::exception &e) {
        // Decay, out-of-range eccentricity and malformed elements all end here
        warn("SGP4 propagation failed for {}: {}", tle.noradID, e.what());
        return std::nullopt;
    }
}

}
