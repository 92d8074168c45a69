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

#include "homeerror.hpp"

using namespace p44home;


static const char *kindNames[HomeError::numErrorCodes] = {
  "ok",
  "not-found",
  "invalid-value",
  "duplicate",
  "alarm-active",
  "permission-denied"
};


const char *HomeError::kindName(ErrorCodes aErrorCode)
{
  if (aErrorCode<0 || aErrorCode>=numErrorCodes) return "internal";
  return kindNames[aErrorCode];
}


const char *HomeError::kindOf(ErrorPtr aError)
{
  if (Error::isOK(aError)) return kindNames[OK];
  if (!aError->isDomain(HomeError::domain())) return "internal";
  return kindName((ErrorCodes)aError->getErrorCode());
}
