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

#ifndef __p44home__config__
#define __p44home__config__

/// number of consecutive failed unlocks on one lock that trigger the house alarm, unless configured otherwise
#ifndef P44HOME_DEFAULT_ALARM_THRESHOLD
  #define P44HOME_DEFAULT_ALARM_THRESHOLD 3
#endif

/// default log level for the core (LOG_NOTICE)
#ifndef P44HOME_DEFAULT_LOGLEVEL
  #define P44HOME_DEFAULT_LOGLEVEL 5
#endif

/// lock code length limits (decimal digits)
#define P44HOME_MIN_CODE_LEN 4
#define P44HOME_MAX_CODE_LEN 8

#endif /* defined(__p44home__config__) */
