/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SATCLASS_HPP
#define __SATCLASS_HPP

#include <satclass/config.hpp>
#include <satclass/tle.hpp>
#include <satclass/orbit.hpp>
#include <satclass/propagator.hpp>
#include <satclass/classifier.hpp>
#include <satclass/celestrak.hpp>
#include <satclass/catalog.hpp>
#include <satclass/service.hpp>
#include <satclass/json.hpp>

#endif
