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

#ifndef __p44home__securitycontroller__
#define __p44home__securitycontroller__

#include "house.hpp"

using namespace std;

namespace p44home {

  /// alarm related actions for SecurityController::changeAlarm()
  typedef enum {
    alarmaction_arm,
    alarmaction_disarm,
    alarmaction_trigger,
    alarmaction_stop,
    numAlarmActions
  } AlarmAction;

  bool alarmActionFromName(const string &aName, AlarmAction &aAction);
  const char *alarmActionName(AlarmAction aAction);


  /// Lock <-> Alarm interaction and the alarm guard.
  /// @note SecurityController keeps no state of its own, all state is in the House it operates on.
  ///   All methods must be called by the owner of the house's lock (SharedStateManager), so the
  ///   guard and the action it guards are evaluated in the same critical section.
  class SecurityController
  {
  public:

    SecurityController();

    /// guard predicate: check if an action on a device is currently allowed
    /// @param aHouse the house containing the device
    /// @param aDevice the device the action is for
    /// @return AlarmActive error if the house alarm is triggered and the device is not a security device
    ErrorPtr checkDeviceAction(const House &aHouse, const Device &aDevice) const;

    /// account for an unlock attempt on a lock
    /// @param aHouse the house containing the lock
    /// @param aLock the lock device
    /// @param aAccepted true if the correct code was used
    /// @return true if this attempt caused the alarm to be triggered (which happens only once, when
    ///   the lock's failure count reaches the threshold while the alarm is armed)
    /// @note failures are counted in any alarm state
    bool noteUnlockAttempt(House &aHouse, Device &aLock, bool aAccepted);

    /// change the alarm state
    /// @param aHouse the house
    /// @param aAction the requested alarm action
    /// @param aChanged will be set if alarm state changed
    /// @return InvalidValue if action is not allowed in the current alarm state
    /// @note disarming or stopping the alarm clears the failed attempt counters of all locks in the house
    ErrorPtr changeAlarm(House &aHouse, AlarmAction aAction, bool &aChanged);

  private:

    void resetLockCounters(House &aHouse);

  };

} // namespace p44home

#endif /* defined(__p44home__securitycontroller__) */
