/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SATCLASS_CONFIG_HPP
#define __SATCLASS_CONFIG_HPP

#include <chrono>
#include <optional>
#include <string>

namespace satclass {

using time_point = std::chrono::system_clock::time_point;

class Config {
public:
    // Empty constructor
    Config() = default;
    ~Config() = default;

    std::string getCacheFile();
    void setCacheFile(const std::string &path);

    std::string getGroup();
    void setGroup(const std::string &group);

    int getTimeoutSeconds();
    void setTimeoutSeconds(const int seconds);

    int getCacheMaxAgeHours();
    void setCacheMaxAgeHours(const int hours);

    double getThreshold();
    void setThreshold(const double threshold);

    bool getVerbose();
    void setVerbose(bool);

    bool getPretty();
    void setPretty(bool);

    bool hasTime();
    void clearTime();
    time_point getTime();
    void setTime(const time_point tp);

private:
    std::string cacheFile;
    std::string group = "active";
    int timeoutSeconds = 30;
    int cacheMaxAgeHours = 2;
    double threshold = 0.6;
    bool verbose = false;
    bool pretty = false;
    std::optional<time_point> time;
};

}

#endif
