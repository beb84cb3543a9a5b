/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SKYWATCH_HPP
#define __SKYWATCH_HPP

#include <skywatch/config.hpp>
#include <skywatch/elements.hpp>
#include <skywatch/catalog.hpp>
#include <skywatch/propagator.hpp>
#include <skywatch/fusion.hpp>
#include <skywatch/trajectory.hpp>
#include <skywatch/mission.hpp>
#include <skywatch/session.hpp>
#include <skywatch/celestrak.hpp>
#include <skywatch/monitor.hpp>

#endif
