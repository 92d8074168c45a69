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

#include "securitycontroller.hpp"

using namespace p44home;


static const char *alarmActionNames[numAlarmActions] = {
  "arm",
  "disarm",
  "trigger",
  "stop"
};


bool p44home::alarmActionFromName(const string &aName, AlarmAction &aAction)
{
  string n = lowerCase(aName);
  for (int i=0; i<numAlarmActions; i++) {
    if (n==alarmActionNames[i]) {
      aAction = (AlarmAction)i;
      return true;
    }
  }
  return false;
}


const char *p44home::alarmActionName(AlarmAction aAction)
{
  if (aAction<0 || aAction>=numAlarmActions) return "unknown";
  return alarmActionNames[aAction];
}


// MARK: - SecurityController

SecurityController::SecurityController()
{
}


ErrorPtr SecurityController::checkDeviceAction(const House &aHouse, const Device &aDevice) const
{
  if (aHouse.mAlarm.isTriggered() && !aDevice.isSecurityDevice()) {
    return Error::err<HomeError>(HomeError::AlarmActive, "alarm is active in %s - %s cannot be operated", aHouse.shortDesc().c_str(), aDevice.shortDesc().c_str());
  }
  return ErrorPtr();
}


bool SecurityController::noteUnlockAttempt(House &aHouse, Device &aLock, bool aAccepted)
{
  if (aAccepted) {
    if (aLock.mLock.mFailedAttempts>0) {
      LOG(LOG_INFO, "%s: successful unlock after %d failed attempts", aLock.shortDesc().c_str(), aLock.mLock.mFailedAttempts);
    }
    aLock.mLock.mFailedAttempts = 0;
    return false;
  }
  aLock.mLock.mFailedAttempts++;
  LOG(LOG_NOTICE, "%s in %s: wrong code, %d consecutive failed attempts (threshold %d)", aLock.shortDesc().c_str(), aHouse.shortDesc().c_str(), aLock.mLock.mFailedAttempts, aHouse.mAlarm.mThreshold);
  if (aLock.mLock.mFailedAttempts>=aHouse.mAlarm.mThreshold) {
    if (aHouse.mAlarm.forceTrigger()) {
      LOG(LOG_WARNING, "ALARM TRIGGERED in %s: too many failed unlock attempts on %s", aHouse.shortDesc().c_str(), aLock.shortDesc().c_str());
      return true;
    }
    if (aHouse.mAlarm.mState==alarm_disarmed) {
      LOG(LOG_NOTICE, "%s: failed unlock threshold reached, but alarm is not armed", aHouse.shortDesc().c_str());
    }
  }
  return false;
}


ErrorPtr SecurityController::changeAlarm(House &aHouse, AlarmAction aAction, bool &aChanged)
{
  ErrorPtr err;
  AlarmState before = aHouse.mAlarm.mState;
  switch (aAction) {
    case alarmaction_arm: err = aHouse.mAlarm.arm(aChanged); break;
    case alarmaction_disarm: err = aHouse.mAlarm.disarm(aChanged); break;
    case alarmaction_trigger: err = aHouse.mAlarm.trigger(aChanged); break;
    case alarmaction_stop: err = aHouse.mAlarm.stop(aChanged); break;
    default:
      aChanged = false;
      return Error::err<HomeError>(HomeError::InvalidValue, "unknown alarm action");
  }
  if (Error::notOK(err)) return err;
  if (aAction==alarmaction_disarm || aAction==alarmaction_stop) {
    resetLockCounters(aHouse);
  }
  if (aChanged) {
    LOG(LOG_NOTICE, "%s: alarm %s -> %s", aHouse.shortDesc().c_str(), alarmStateName(before), alarmStateName(aHouse.mAlarm.mState));
  }
  return ErrorPtr();
}


void SecurityController::resetLockCounters(House &aHouse)
{
  for (RoomsVector::iterator rpos = aHouse.mRooms.begin(); rpos!=aHouse.mRooms.end(); ++rpos) {
    for (Room::DevicesMap::iterator dpos = rpos->mDevices.begin(); dpos!=rpos->mDevices.end(); ++dpos) {
      if (dpos->second.mType==devicetype_lock) {
        dpos->second.mLock.mFailedAttempts = 0;
      }
    }
  }
}
