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

#include "actionparams.hpp"

using namespace p44home;


bool p44home::hasParam(JsonObjectPtr aParams, const char *aParamName)
{
  JsonObjectPtr o;
  return aParams && aParams->isType(json_type_object) && aParams->get(aParamName, o) && o && !o->isType(json_type_null);
}


static ErrorPtr getParam(JsonObjectPtr aParams, const char *aParamName, bool aMandatory, JsonObjectPtr &aParam)
{
  aParam.reset();
  if (aParams && !aParams->isType(json_type_object)) {
    return Error::err<HomeError>(HomeError::InvalidValue, "parameters must be an object");
  }
  if (!hasParam(aParams, aParamName)) {
    if (aMandatory) return Error::err<HomeError>(HomeError::InvalidValue, "missing parameter '%s'", aParamName);
    return ErrorPtr();
  }
  aParams->get(aParamName, aParam);
  return ErrorPtr();
}


ErrorPtr p44home::checkIntParam(JsonObjectPtr aParams, const char *aParamName, int &aValue, int aMin, int aMax, bool aMandatory)
{
  JsonObjectPtr o;
  ErrorPtr err = getParam(aParams, aParamName, aMandatory, o);
  if (Error::notOK(err) || !o) return err;
  if (!o->isType(json_type_int)) {
    return Error::err<HomeError>(HomeError::InvalidValue, "parameter '%s' must be an integer", aParamName);
  }
  int v = o->int32Value();
  if (v<aMin || v>aMax) {
    return Error::err<HomeError>(HomeError::InvalidValue, "parameter '%s' must be within %d..%d, is %d", aParamName, aMin, aMax, v);
  }
  aValue = v;
  return ErrorPtr();
}


ErrorPtr p44home::checkBoolParam(JsonObjectPtr aParams, const char *aParamName, bool &aValue, bool aMandatory)
{
  JsonObjectPtr o;
  ErrorPtr err = getParam(aParams, aParamName, aMandatory, o);
  if (Error::notOK(err) || !o) return err;
  if (!o->isType(json_type_boolean)) {
    return Error::err<HomeError>(HomeError::InvalidValue, "parameter '%s' must be a boolean", aParamName);
  }
  aValue = o->boolValue();
  return ErrorPtr();
}


ErrorPtr p44home::checkStringParam(JsonObjectPtr aParams, const char *aParamName, string &aValue, bool aMandatory)
{
  JsonObjectPtr o;
  ErrorPtr err = getParam(aParams, aParamName, aMandatory, o);
  if (Error::notOK(err) || !o) return err;
  if (!o->isType(json_type_string)) {
    return Error::err<HomeError>(HomeError::InvalidValue, "parameter '%s' must be a string", aParamName);
  }
  aValue = o->stringValue();
  return ErrorPtr();
}
