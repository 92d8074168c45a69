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

#ifndef __p44home__lockbehaviour__
#define __p44home__lockbehaviour__

#include "actionparams.hpp"

using namespace std;

namespace p44home {

  /// state of a door lock
  class LockState
  {
  public:

    bool mUnlocked; ///< lock is currently unlocked
    string mCode; ///< the code expected for unlocking. Never exposed in status
    int mFailedAttempts; ///< consecutive failed unlock attempts, maintained by the SecurityController

    LockState();

  };


  /// @return true if aCode has the format of a lock code (P44HOME_MIN_CODE_LEN..P44HOME_MAX_CODE_LEN decimal digits)
  bool isLockCode(const string &aCode);

  /// configure a new lock from creation attributes: "code" (mandatory), "unlocked" (optional)
  ErrorPtr configureLock(LockState &aLock, JsonObjectPtr aAttributes);

  /// perform a lock action
  /// @param aLock the lock state
  /// @param aAction "lock" or "unlock" (param "code")
  /// @param aParams action parameters
  /// @param aUnlockAttempt will be set when the action was a well-formed unlock attempt
  /// @param aCodeAccepted will be set when the unlock attempt used the correct code
  /// @return InvalidValue for unknown actions or malformed codes. A wrong (but well-formed) code is not an error,
  ///   but reported via aUnlockAttempt/aCodeAccepted
  /// @note the failed attempts counter is not touched here, see SecurityController::noteUnlockAttempt()
  ErrorPtr performLockAction(LockState &aLock, const string &aAction, JsonObjectPtr aParams, bool &aUnlockAttempt, bool &aCodeAccepted);

  /// add lock status attributes to aStatus (the code is never included)
  void addLockStatus(const LockState &aLock, JsonObjectPtr aStatus);

} // namespace p44home

#endif /* defined(__p44home__lockbehaviour__) */
