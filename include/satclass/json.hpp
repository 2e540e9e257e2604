/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SATCLASS_JSON_HPP
#define __SATCLASS_JSON_HPP

#include <satclass/catalog.hpp>
#include <satclass/service.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace satclass::json {

/**
 * Classification report with output rounding applied:
 * altitude 2 decimals, velocity 3, confidence and probabilities 4,
 * ages 2, mean motion 6, processing time 2.
 */
std::string encode(const ClassificationReport &report, bool pretty = false);

/**
 * Catalog listing as a JSON array.
 */
std::string encode(const std::vector<CatalogEntry> &entries, bool pretty = false);

std::string encode(const HealthStatus &status, bool pretty = false);

/**
 * The persisted cache document: {"cached_at": ..., "satellites": [...]}.
 */
std::string encode(const CacheSnapshot &snapshot, bool pretty = false);

/**
 * Reads a cache document. Returns nothing when the text is not valid JSON or
 * does not have the expected shape.
 */
std::optional<CacheSnapshot> decodeSnapshot(std::string_view text);

}

#endif
