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

#include "lockbehaviour.hpp"

#include <ctype.h>

using namespace p44home;


// MARK: - LockState

LockState::LockState() :
  mUnlocked(false),
  mFailedAttempts(0)
{
}


// MARK: - lock behaviour

bool p44home::isLockCode(const string &aCode)
{
  if (aCode.size()<P44HOME_MIN_CODE_LEN || aCode.size()>P44HOME_MAX_CODE_LEN) return false;
  for (size_t i=0; i<aCode.size(); i++) {
    if (!isdigit((unsigned char)aCode[i])) return false;
  }
  return true;
}


static ErrorPtr checkCodeParam(JsonObjectPtr aParams, string &aCode)
{
  ErrorPtr err = checkStringParam(aParams, "code", aCode, true);
  if (Error::notOK(err)) return err;
  if (!isLockCode(aCode)) {
    return Error::err<HomeError>(HomeError::InvalidValue, "lock code must be %d..%d digits", P44HOME_MIN_CODE_LEN, P44HOME_MAX_CODE_LEN);
  }
  return ErrorPtr();
}


ErrorPtr p44home::configureLock(LockState &aLock, JsonObjectPtr aAttributes)
{
  LockState newState = aLock;
  ErrorPtr err;
  if (Error::notOK(err = checkCodeParam(aAttributes, newState.mCode))) return err;
  if (Error::notOK(err = checkBoolParam(aAttributes, "unlocked", newState.mUnlocked))) return err;
  aLock = newState;
  return ErrorPtr();
}


ErrorPtr p44home::performLockAction(LockState &aLock, const string &aAction, JsonObjectPtr aParams, bool &aUnlockAttempt, bool &aCodeAccepted)
{
  aUnlockAttempt = false;
  aCodeAccepted = false;
  if (aAction=="lock") {
    aLock.mUnlocked = false;
    return ErrorPtr();
  }
  else if (aAction=="unlock") {
    string code;
    ErrorPtr err = checkCodeParam(aParams, code);
    if (Error::notOK(err)) return err;
    aUnlockAttempt = true;
    if (code==aLock.mCode) {
      aCodeAccepted = true;
      aLock.mUnlocked = true;
    }
    return ErrorPtr();
  }
  return Error::err<HomeError>(HomeError::InvalidValue, "unknown lock action '%s'", aAction.c_str());
}


void p44home::addLockStatus(const LockState &aLock, JsonObjectPtr aStatus)
{
  aStatus->add("unlocked", JsonObject::newBool(aLock.mUnlocked));
  aStatus->add("failed_attempts", JsonObject::newInt32(aLock.mFailedAttempts));
}
