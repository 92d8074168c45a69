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

#ifndef __p44home__actionparams__
#define __p44home__actionparams__

#include "homeerror.hpp"

using namespace std;

namespace p44home {

  /// @name parameter access for actions and attribute sets
  /// @note all of these return InvalidValue errors naming the parameter. A parameter that is
  ///   absent leaves the target value untouched and is only an error when aMandatory is set.
  /// @{

  /// @return true if aParams is an object containing aParamName (with a non-null value)
  bool hasParam(JsonObjectPtr aParams, const char *aParamName);

  ErrorPtr checkIntParam(JsonObjectPtr aParams, const char *aParamName, int &aValue, int aMin, int aMax, bool aMandatory = false);
  ErrorPtr checkBoolParam(JsonObjectPtr aParams, const char *aParamName, bool &aValue, bool aMandatory = false);
  ErrorPtr checkStringParam(JsonObjectPtr aParams, const char *aParamName, string &aValue, bool aMandatory = false);

  /// @}

} // namespace p44home

#endif /* defined(__p44home__actionparams__) */
