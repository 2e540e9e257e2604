/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SATCLASS_CLASSIFIER_HPP
#define __SATCLASS_CLASSIFIER_HPP

#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace satclass {

// Confidence below which a prediction is reported as unknown
constexpr double DEFAULT_THRESHOLD = 0.6;

enum class ObjectClass {
    PAYLOAD,
    ROCKET_BODY,
    DEBRIS,
    UNKNOWN
};

std::ostream& operator<<(std::ostream &os, const ObjectClass &objectClass);

/**
 * Wire name of a class ("payload", "rocket_body", "debris", "unknown").
 */
std::string toString(ObjectClass objectClass);

/**
 * Probability mass over the three substantive classes.
 * "unknown" has no entry of its own.
 */
struct Probabilities {
    double payload;
    double rocketBody;
    double debris;
};

struct ClassificationResult {
    ObjectClass predictedClass;
    double confidence;
    Probabilities proba;
    std::string reason;        ///< Which rule fired, in words
};

/**
 * Facts a rule can look at.
 */
struct ClassificationInput {
    std::string upperName;     ///< Upper-cased object name, empty when unknown
    double altitudeInKilometers;
};

/**
 * One entry of the rule cascade: when the predicate matches, the outcome is
 * the classification.
 */
struct Rule {
    std::string label;
    std::function<bool(const ClassificationInput&)> matches;
    ClassificationResult outcome;
};

/**
 * Name pattern rules in priority order: debris markers, then rocket body
 * markers, then known payload constellations.
 */
const std::vector<Rule>& nameRules();

/**
 * Altitude band rules in evaluation order. The last band matches every
 * altitude (including NaN), so the ladder is total.
 */
const std::vector<Rule>& altitudeBands();

/**
 * Runs the rule cascade (name rules first, then altitude bands) and returns
 * the first matching outcome.
 */
ClassificationResult classify(std::optional<std::string_view> name, double altitudeInKilometers);

/**
 * Forces the class to UNKNOWN when the confidence is strictly below the
 * threshold. Confidence and probabilities are left untouched.
 */
ClassificationResult applyThreshold(ClassificationResult result, double threshold);

/**
 * classify() followed by applyThreshold().
 */
ClassificationResult classify(std::optional<std::string_view> name, double altitudeInKilometers, double threshold);

}

#endif
