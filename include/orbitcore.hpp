/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORBITCORE_HPP
#define __ORBITCORE_HPP

#include <orbitcore/config.hpp>
#include <orbitcore/satellite.hpp>
#include <orbitcore/ephemeris_table.hpp>
#include <orbitcore/simulation_context.hpp>
#include <orbitcore/orbit_trail.hpp>
#include <orbitcore/sun_moon.hpp>
#include <orbitcore/frame_loop.hpp>

#endif
