/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <satclass/classifier.hpp>

#include <algorithm>
#include <cctype>
#include <limits>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

using spdlog::debug;

namespace satclass {

// Name markers, checked in this order. The first marker found anywhere in
// the name decides the class.
static const std::vector<std::string> DEBRIS_PATTERNS = {
    "DEB", "DEBRIS", " DEB ", "/DEB", "-DEB"
};

static const std::vector<std::string> ROCKET_BODY_PATTERNS = {
    "R/B", "ROCKET", "ROCKET BODY", " RB", "/RB", "FREGAT", "BRIZ", "CENTAUR", "DELTA"
};

static const std::vector<std::string> PAYLOAD_PATTERNS = {
    "STARLINK", "ONEWEB", "IRIDIUM", "GPS", "GLONASS", "GALILEO", "BEIDOU", "COSMOS", "INTELSAT"
};

static Rule nameRule(const std::string &pattern, ClassificationResult outcome) {
    return Rule{
        .label = "name contains " + pattern,
        .matches = [pattern](const ClassificationInput &input) {
            return input.upperName.find(pattern) != std::string::npos;
        },
        .outcome = std::move(outcome)
    };
}

static std::vector<Rule> buildNameRules() {
    std::vector<Rule> rules;
    for (const auto &pattern : DEBRIS_PATTERNS) {
        rules.push_back(nameRule(pattern, {
            ObjectClass::DEBRIS, 0.95, {0.02, 0.03, 0.95},
            fmt::format("Nombre contiene '{}'", pattern)
        }));
    }
    for (const auto &pattern : ROCKET_BODY_PATTERNS) {
        rules.push_back(nameRule(pattern, {
            ObjectClass::ROCKET_BODY, 0.90, {0.05, 0.90, 0.05},
            fmt::format("Nombre contiene '{}'", pattern)
        }));
    }
    for (const auto &pattern : PAYLOAD_PATTERNS) {
        rules.push_back(nameRule(pattern, {
            ObjectClass::PAYLOAD, 0.92, {0.92, 0.05, 0.03},
            fmt::format("Constelación conocida: {}", pattern)
        }));
    }
    return rules;
}

// Half-open altitude band [low, high) in km
static Rule altitudeBand(std::string label, double low, double high, ClassificationResult outcome) {
    return Rule{
        .label = std::move(label),
        .matches = [low, high](const ClassificationInput &input) {
            return input.altitudeInKilometers >= low && input.altitudeInKilometers < high;
        },
        .outcome = std::move(outcome)
    };
}

static std::vector<Rule> buildAltitudeBands() {
    constexpr double NO_LOWER_BOUND = -std::numeric_limits<double>::infinity();

    std::vector<Rule> bands;
    bands.push_back(altitudeBand("altitude < 300 km", NO_LOWER_BOUND, 300.0, {
        ObjectClass::DEBRIS, 0.70, {0.15, 0.15, 0.70},
        "Altitud muy baja (<300km) - posible decaimiento"
    }));
    bands.push_back(altitudeBand("altitude 300-600 km", 300.0, 600.0, {
        ObjectClass::PAYLOAD, 0.65, {0.65, 0.20, 0.15},
        "Altitud típica de payloads LEO (300-600km)"
    }));
    bands.push_back(altitudeBand("altitude 600-1000 km", 600.0, 1000.0, {
        ObjectClass::PAYLOAD, 0.55, {0.55, 0.25, 0.20},
        "Altitud LEO media - probablemente payload"
    }));
    bands.push_back(altitudeBand("altitude 1000-2000 km", 1000.0, 2000.0, {
        ObjectClass::DEBRIS, 0.50, {0.30, 0.20, 0.50},
        "LEO alta (1000-2000km) - zona con mucho debris"
    }));
    bands.push_back(altitudeBand("altitude 35000-36500 km", 35000.0, 36500.0, {
        ObjectClass::PAYLOAD, 0.85, {0.85, 0.10, 0.05},
        "Órbita GEO - típicamente satélites de comunicaciones"
    }));
    // MEO and anything else: altitude alone is not enough
    bands.push_back(Rule{
        .label = "any other altitude",
        .matches = [](const ClassificationInput &) { return true; },
        .outcome = {
            ObjectClass::UNKNOWN, 0.40, {0.40, 0.30, 0.30},
            "Órbita atípica - clasificación incierta"
        }
    });
    return bands;
}

const std::vector<Rule>& nameRules() {
    static const std::vector<Rule> rules = buildNameRules();
    return rules;
}

const std::vector<Rule>& altitudeBands() {
    static const std::vector<Rule> bands = buildAltitudeBands();
    return bands;
}

ClassificationResult classify(std::optional<std::string_view> name, double altitudeInKilometers) {
    ClassificationInput input{
        .upperName = std::string(name.value_or("")),
        .altitudeInKilometers = altitudeInKilometers
    };
    std::transform(input.upperName.begin(), input.upperName.end(), input.upperName.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    for (const auto *rules : {&nameRules(), &altitudeBands()}) {
        for (const auto &rule : *rules) {
            if (rule.matches(input)) {
                debug("Classification rule fired: {}", rule.label);
                return rule.outcome;
            }
        }
    }

    // Unreachable: the last altitude band matches everything
    return altitudeBands().back().outcome;
}

ClassificationResult applyThreshold(ClassificationResult result, double threshold) {
    if (result.confidence < threshold) {
        result.predictedClass = ObjectClass::UNKNOWN;
        result.reason = fmt::format("Confianza ({:.0f}%) menor al umbral ({:.0f}%)",
                                    result.confidence * 100.0, threshold * 100.0);
    }
    return result;
}

ClassificationResult classify(std::optional<std::string_view> name, double altitudeInKilometers, double threshold) {
    return applyThreshold(classify(name, altitudeInKilometers), threshold);
}

std::string toString(ObjectClass objectClass) {
    switch (objectClass) {
        case ObjectClass::PAYLOAD:
            return "payload";
        case ObjectClass::ROCKET_BODY:
            return "rocket_body";
        case ObjectClass::DEBRIS:
            return "debris";
        case ObjectClass::UNKNOWN:
            return "unknown";
    }
    return "unknown";
}

std::ostream& operator<<(std::ostream &os, const ObjectClass &objectClass) {
    os << toString(objectClass);
    return os;
}

}
