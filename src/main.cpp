/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <satclass.hpp>
#include <CLI/CLI.hpp>
#include <date/date.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stderr_color_sinks.h>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

using spdlog::error;

/** Replace ~ with HOME directory */
std::string expandTilde(const std::string &path) {
    if (!path.empty() && path[0] == '~') {
        const char *home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

/** Log to stderr so stdout only carries JSON */
void setupLogging(bool verbose) {
    auto logger = spdlog::stderr_color_mt("satclass");
    spdlog::set_default_logger(logger);
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
}

/** Wire the service to the on-disk cache and Celestrak */
satclass::Service makeService(satclass::Config &config) {
    using namespace satclass;

    auto store = std::make_shared<FileCacheStore>(expandTilde(config.getCacheFile()));
    auto feed = std::make_shared<CelestrakFeed>(config.getGroup(), config.getTimeoutSeconds());

    // A fixed --time applies to both the catalog ages and the classification
    Clock clock = [&config] { return config.getTime(); };

    auto catalog = std::make_shared<Catalog>(store, feed,
                                             std::chrono::hours(config.getCacheMaxAgeHours()),
                                             clock);
    return Service(std::make_shared<SGP4Propagator>(), catalog, clock);
}

/** Program entry point */
int main(int argc, char* argv[]) {

    satclass::Config config;
    config.setCacheFile("~/.satclass-cache.json");
    config.setGroup("active");
    config.setTimeoutSeconds(celestrak::DEFAULT_TIMEOUT_SECONDS);
    config.setCacheMaxAgeHours(2);
    config.setThreshold(satclass::DEFAULT_THRESHOLD);
    config.setVerbose(false);
    config.setPretty(false);

    auto configFile = expandTilde("~/.satclass.toml");

    CLI::App app{"SatClass"};
    argv = app.ensure_utf8(argv);

    app.set_config("--config", configFile, "Read configuration from this file (default: " + configFile + ").");

    app.add_option_function<std::string>("--cache",
        [&config](const std::string &path) { config.setCacheFile(path); },
        "Catalog cache file (default ~/.satclass-cache.json)");
    app.add_option_function<std::string>("--group",
        [&config](const std::string &group) { config.setGroup(group); },
        "Celestrak group to catalog (default active)");
    app.add_option_function<int>("--timeout",
        [&config](const int seconds) { config.setTimeoutSeconds(seconds); },
        "Catalog download timeout in seconds (default 30, max 300)");
    app.add_option_function<int>("--max-age",
        [&config](const int hours) { config.setCacheMaxAgeHours(hours); },
        "Refetch the catalog when the cache is older than this many hours (default 2)");
    app.add_option_function<std::string>("--time",
        [&config](const std::string &timeStr) {
            std::istringstream in(timeStr);
            std::chrono::system_clock::time_point tp;
            in >> date::parse("%Y-%m-%d %H:%M:%S", tp);
            if (in.fail()) {
                throw std::invalid_argument("Invalid time format (expected YYYY-MM-DD HH:MM:SS UTC): " + timeStr);
            }
            config.setTime(tp);
        }, "Evaluate ages and positions at this time instead of now (format: YYYY-MM-DD HH:MM:SS UTC)"
    );
    app.add_option_function<double>("--threshold",
        [&config](const double t) { config.setThreshold(t); },
        "Default minimum confidence for a class (default 0.6, range 0 to 1)")
        ->check(CLI::Range(0.0, 1.0));
    app.add_flag_function("--pretty",
        [&config](const int64_t p) { config.setPretty(p > 0); },
        "Indent JSON output");
    app.add_flag_function("-v,--verbose",
        [&config](const int64_t v) { config.setVerbose(v > 0); },
        "Display debugging information");

    app.ignore_case();

    // classify command - classify one object from its TLE
    auto classifyCommand = app.add_subcommand("classify", "Classify an orbital object from its TLE");

    int objectID = 0;
    std::string line1;
    std::string line2;
    std::optional<std::string> satelliteName;
    std::optional<double> threshold;
    std::string catalogID;

    auto idOption = classifyCommand->add_option("--id", objectID, "Norad ID of the object (ie. 25544)");
    auto line1Option = classifyCommand->add_option("--line1", line1, "First TLE line");
    auto line2Option = classifyCommand->add_option("--line2", line2, "Second TLE line");
    classifyCommand->add_option_function<std::string>("--name",
        [&satelliteName](const std::string &name) { satelliteName = name; },
        "Object name, if known");
    classifyCommand->add_option_function<double>("--threshold",
        [&threshold](const double t) { threshold = t; },
        "Minimum confidence for a class, overriding the global --threshold")
        ->check(CLI::Range(0.0, 1.0));
    auto catalogOption = classifyCommand->add_option("--catalog-id", catalogID,
        "Classify an object from the cached catalog instead (ie. 25544)");

    catalogOption->excludes(idOption)->excludes(line1Option)->excludes(line2Option);
    line1Option->needs(line2Option);
    line2Option->needs(line1Option);

    // satellites command - list the cached catalog
    auto satellitesCommand = app.add_subcommand("satellites", "List the active satellite catalog");

    satclass::ListingQuery query;
    std::string ageFilter = "all";
    satellitesCommand->add_option("--limit", query.limit, "Maximum number of entries, 0 for all (default 100)");
    satellitesCommand->add_option("--search", query.search, "Filter by name or Norad ID");
    satellitesCommand->add_option("--age", ageFilter, "Filter by TLE age: all, fresh, recent or stale (default all)")
        ->check(CLI::IsMember({"all", "fresh", "recent", "stale"}));

    // health command - liveness check
    auto healthCommand = app.add_subcommand("health", "Report service status");

    // Command callbacks

    classifyCommand->final_callback([&]() {
        if (catalogID.empty() && (line1.empty() || line2.empty())) {
            std::cerr << "Please provide --line1 and --line2, or --catalog-id." << std::endl;
            std::cerr << classifyCommand->help() << std::endl;
            std::exit(1);
        }
        setupLogging(config.getVerbose());
        try {
            auto service = makeService(config);
            auto t = threshold.value_or(config.getThreshold());

            if (!catalogID.empty()) {
                auto report = service.classifyCatalogEntry(catalogID, t);
                if (!report.has_value()) {
                    std::cerr << "Satellite with Norad ID " << catalogID << " not found in the catalog." << std::endl;
                    std::exit(1);
                }
                std::cout << satclass::json::encode(*report, config.getPretty()) << std::endl;
                return;
            }

            auto report = service.classify(satclass::ClassificationRequest{
                .objectID = objectID,
                .line1 = line1,
                .line2 = line2,
                .satelliteName = satelliteName,
                .threshold = t
            });
            std::cout << satclass::json::encode(report, config.getPretty()) << std::endl;
        } catch (const std::exception &err) {
            error("{}", err.what());
            std::exit(1);
        }
    });

    satellitesCommand->final_callback([&]() {
        setupLogging(config.getVerbose());
        try {
            query.age = satclass::parseAgeFilter(ageFilter);
            auto service = makeService(config);
            auto entries = service.listSatellites(query);
            std::cout << satclass::json::encode(entries, config.getPretty()) << std::endl;
        } catch (const std::exception &err) {
            error("{}", err.what());
            std::exit(1);
        }
    });

    healthCommand->final_callback([&]() {
        setupLogging(config.getVerbose());
        auto service = makeService(config);
        std::cout << satclass::json::encode(service.health(), config.getPretty()) << std::endl;
    });

    CLI11_PARSE(app, argc, argv);

    if (app.get_subcommands().empty()) {
        std::cerr << app.help() << std::endl;
        std::exit(1);
    }

    return 0;
}
