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

#include "homedefs.hpp"

using namespace p44home;


static const char *deviceTypeNames[numDeviceTypes] = {
  "Lamp",
  "CeilingLight",
  "Lock",
  "Blinds"
};

static const char *alarmStateNames[numAlarmStates] = {
  "disarmed",
  "armed",
  "triggered"
};

static const char *userRoleNames[numUserRoles] = {
  "guest",
  "regular",
  "admin"
};


const char *p44home::deviceTypeName(DeviceType aType)
{
  if (aType<0 || aType>=numDeviceTypes) return "unknown";
  return deviceTypeNames[aType];
}


bool p44home::deviceTypeFromName(const string &aName, DeviceType &aType)
{
  string n = lowerCase(aName);
  for (int i=0; i<numDeviceTypes; i++) {
    if (n==lowerCase(deviceTypeNames[i])) {
      aType = (DeviceType)i;
      return true;
    }
  }
  return false;
}


const char *p44home::alarmStateName(AlarmState aState)
{
  if (aState<0 || aState>=numAlarmStates) return "unknown";
  return alarmStateNames[aState];
}


bool p44home::alarmStateFromName(const string &aName, AlarmState &aState)
{
  string n = lowerCase(aName);
  for (int i=0; i<numAlarmStates; i++) {
    if (n==alarmStateNames[i]) {
      aState = (AlarmState)i;
      return true;
    }
  }
  return false;
}


const char *p44home::userRoleName(UserRole aRole)
{
  if (aRole<0 || aRole>=numUserRoles) return "unknown";
  return userRoleNames[aRole];
}
