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

#ifndef __p44home__p44utils_config__
#define __p44home__p44utils_config__

// p44utils features needed by p44home

#define ENABLE_NAMED_ERRORS 1
#define ENABLE_JSON_APPLICATION 0
#define ENABLE_APPLICATION_SUPPORT 0
#define ENABLE_P44SCRIPT 0
#define ENABLE_EXPRESSIONS 0
#define ENABLE_P44LRGRAPHICS 0

#endif /* defined(__p44home__p44utils_config__) */
