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

#include "lightbehaviour.hpp"

using namespace p44home;


static const char *lightColors[] = {
  "red", "green", "blue", "white", "yellow", "purple", "orange", NULL
};


// MARK: - LightState

LightState::LightState() :
  mOn(false),
  mBrightness(100),
  mColor("white")
{
}


// MARK: - light behaviour

bool p44home::isLightColor(const string &aColor)
{
  string c = lowerCase(aColor);
  for (const char **cP = lightColors; *cP; cP++) {
    if (c==*cP) return true;
  }
  return false;
}


string p44home::lightColorList()
{
  string l;
  for (const char **cP = lightColors; *cP; cP++) {
    if (!l.empty()) l += ", ";
    l += *cP;
  }
  return l;
}


/// validate all of "on", "brightness", "color" present in aValues, apply to aLight only when all are valid
static ErrorPtr applyLightValues(LightState &aLight, JsonObjectPtr aValues)
{
  LightState newState = aLight;
  ErrorPtr err;
  if (Error::notOK(err = checkBoolParam(aValues, "on", newState.mOn))) return err;
  if (Error::notOK(err = checkIntParam(aValues, "brightness", newState.mBrightness, 0, 100))) return err;
  string color;
  if (Error::notOK(err = checkStringParam(aValues, "color", color))) return err;
  if (hasParam(aValues, "color")) {
    if (!isLightColor(color)) {
      return Error::err<HomeError>(HomeError::InvalidValue, "invalid color '%s', supported colors: %s", color.c_str(), lightColorList().c_str());
    }
    newState.mColor = lowerCase(color);
  }
  aLight = newState;
  return ErrorPtr();
}


ErrorPtr p44home::configureLight(LightState &aLight, JsonObjectPtr aAttributes)
{
  return applyLightValues(aLight, aAttributes);
}


ErrorPtr p44home::performLightAction(LightState &aLight, const string &aAction, JsonObjectPtr aParams)
{
  if (aAction=="on" || aAction=="off") {
    aLight.mOn = aAction=="on";
    return ErrorPtr();
  }
  else if (aAction=="toggle") {
    aLight.mOn = !aLight.mOn;
    return ErrorPtr();
  }
  else if (aAction=="dim") {
    int level = aLight.mBrightness;
    ErrorPtr err = checkIntParam(aParams, "level", level, 0, 100, true);
    if (Error::notOK(err)) return err;
    aLight.mBrightness = level;
    return ErrorPtr();
  }
  else if (aAction=="color") {
    string color;
    ErrorPtr err = checkStringParam(aParams, "color", color, true);
    if (Error::notOK(err)) return err;
    if (!isLightColor(color)) {
      return Error::err<HomeError>(HomeError::InvalidValue, "invalid color '%s', supported colors: %s", color.c_str(), lightColorList().c_str());
    }
    aLight.mColor = lowerCase(color);
    return ErrorPtr();
  }
  else if (aAction=="set") {
    if (!hasParam(aParams, "on") && !hasParam(aParams, "brightness") && !hasParam(aParams, "color")) {
      return Error::err<HomeError>(HomeError::InvalidValue, "'set' needs at least one of 'on', 'brightness', 'color'");
    }
    return applyLightValues(aLight, aParams);
  }
  return Error::err<HomeError>(HomeError::InvalidValue, "unknown light action '%s'", aAction.c_str());
}


void p44home::addLightStatus(const LightState &aLight, JsonObjectPtr aStatus)
{
  aStatus->add("on", JsonObject::newBool(aLight.mOn));
  aStatus->add("brightness", JsonObject::newInt32(aLight.mBrightness));
  aStatus->add("color", JsonObject::newString(aLight.mColor));
}
