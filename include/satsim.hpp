/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SATSIM_HPP
#define __SATSIM_HPP

#include <satsim/config.hpp>
#include <satsim/simulation.hpp>
#include <satsim/steplog.hpp>

#endif
