//  SPDX-License-Identifier: GPL-3.0-or-later
//
//  Copyright (c) 2026 The p44home Authors
//
//  This file is part of p44home.
//
//  p44home is free software: you can redistribute it and/or modify
//  it under the terms of the GNU General Public License as published by
//  the Free Software Foundation, either version 3 of the License, or
//  (at your option) any later version.
//
//  p44home is distributed in the hope that it will be useful,
//  but WITHOUT ANY WARRANTY; without even the implied warranty of
//  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//  GNU General Public License for more details.
//
//  You should have received a copy of the GNU General Public License
//  along with p44home. If not, see <http://www.gnu.org/licenses/>.
//

#ifndef __p44home__common__
#define __p44home__common__

#include "p44home_config.hpp"

#include "p44utils_common.hpp"
#include "error.hpp"
#include "logger.hpp"
#include "utils.hpp"
#include "jsonobject.hpp"

#include <string>
#include <vector>
#include <map>
#include <set>

/// version of the change event format delivered to subscribers
/// 1 : flat status map per device, house scoped events, security alerts
#define P44HOME_EVENT_FORMAT_VERSION 1

#endif /* defined(__p44home__common__) */
