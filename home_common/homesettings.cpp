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

#include "homesettings.hpp"
#include "actionparams.hpp"

using namespace p44home;


HomeSettings::HomeSettings() :
  mAlarmThreshold(P44HOME_DEFAULT_ALARM_THRESHOLD),
  mEchoToOriginator(false),
  mLogLevel(P44HOME_DEFAULT_LOGLEVEL)
{
}


ErrorPtr HomeSettings::loadFromJson(JsonObjectPtr aSettings)
{
  if (!aSettings || !aSettings->isType(json_type_object)) {
    return Error::err<HomeError>(HomeError::InvalidValue, "settings must be a JSON object");
  }
  // validate everything before changing anything
  int threshold = mAlarmThreshold;
  bool echo = mEchoToOriginator;
  int logLevel = mLogLevel;
  ErrorPtr err;
  if (Error::notOK(err = checkIntParam(aSettings, "alarmThreshold", threshold, 1, INT32_MAX))) return err;
  if (Error::notOK(err = checkBoolParam(aSettings, "echoToOriginator", echo))) return err;
  if (Error::notOK(err = checkIntParam(aSettings, "logLevel", logLevel, 0, 7))) return err;
  mAlarmThreshold = threshold;
  mEchoToOriginator = echo;
  mLogLevel = logLevel;
  return ErrorPtr();
}


ErrorPtr HomeSettings::loadFromFile(const string &aFilePath)
{
  ErrorPtr err;
  JsonObjectPtr j = JsonObject::objFromFile(aFilePath.c_str(), &err);
  if (Error::notOK(err)) {
    LOG(LOG_ERR, "cannot read settings file '%s': %s", aFilePath.c_str(), err->text());
    return err;
  }
  err = loadFromJson(j);
  if (Error::notOK(err)) {
    LOG(LOG_ERR, "invalid settings in '%s': %s", aFilePath.c_str(), err->text());
  }
  else {
    LOG(LOG_INFO, "loaded settings from '%s'", aFilePath.c_str());
  }
  return err;
}


void HomeSettings::applyLogLevel() const
{
  SETLOGLEVEL(mLogLevel);
}


JsonObjectPtr HomeSettings::jsonObject() const
{
  JsonObjectPtr s = JsonObject::newObj();
  s->add("alarmThreshold", JsonObject::newInt32(mAlarmThreshold));
  s->add("echoToOriginator", JsonObject::newBool(mEchoToOriginator));
  s->add("logLevel", JsonObject::newInt32(mLogLevel));
  return s;
}
