/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <satclass/config.hpp>

namespace satclass {

std::string Config::getCacheFile() {
    return cacheFile;
}

void Config::setCacheFile(const std::string &path) {
    cacheFile = path;
}

std::string Config::getGroup() {
    return group.empty() ? "active" : group;
}

void Config::setGroup(const std::string &g) {
    group = g;
}

int Config::getTimeoutSeconds() {
    if (timeoutSeconds >= 1 && timeoutSeconds <= 300) {
        return timeoutSeconds;
    }
    if (timeoutSeconds > 300) {
        return 300;
    }
    return 1;
}

void Config::setTimeoutSeconds(const int seconds) {
    if (seconds >= 1 && seconds <= 300) {
        timeoutSeconds = seconds;
    } else if (seconds > 300) {
        timeoutSeconds = 300;
    } else {
        timeoutSeconds = 1;
    }
}

int Config::getCacheMaxAgeHours() {
    if (cacheMaxAgeHours >= 1 && cacheMaxAgeHours <= 168) {
        return cacheMaxAgeHours;
    }
    if (cacheMaxAgeHours > 168) {
        return 168;
    }
    return 1;
}

void Config::setCacheMaxAgeHours(const int hours) {
    if (hours >= 1 && hours <= 168) {
        cacheMaxAgeHours = hours;
    } else if (hours > 168) {
        cacheMaxAgeHours = 168;
    } else {
        cacheMaxAgeHours = 1;
    }
}

double Config::getThreshold() {
    if (threshold >= 0.0 && threshold <= 1.0) {
        return threshold;
    }
    if (threshold > 1.0) {
        return 1.0;
    }
    return 0.0;
}

void Config::setThreshold(const double t) {
    if (t >= 0.0 && t <= 1.0) {
        threshold = t;
    } else if (t > 1.0) {
        threshold = 1.0;
    } else {
        threshold = 0.0;
    }
}

bool Config::getVerbose() {
    return verbose;
}

void Config::setVerbose(bool v) {
    verbose = v;
}

bool Config::getPretty() {
    return pretty;
}

void Config::setPretty(bool p) {
    pretty = p;
}

bool Config::hasTime() {
    return time.has_value();
}

void Config::clearTime() {
    time.reset();
}

time_point Config::getTime() {
    return time.value_or(std::chrono::system_clock::now());
}

void Config::setTime(const time_point tp) {
    time = tp;
}

}
