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

#ifndef __p44home__homedefs__
#define __p44home__homedefs__

#include "p44home_common.hpp"

using namespace std;
using namespace p44;

namespace p44home {

  typedef uint32_t HouseId;
  typedef uint32_t RoomId;
  typedef uint32_t DeviceId;

  /// client handle, as assigned by the transport collaborator
  typedef uint64_t ClientId;
  typedef vector<ClientId> ClientIdList;

  /// no client (e.g. nobody to exclude from a broadcast)
  const ClientId NO_CLIENT = 0;

  /// no room/device in a change event path
  const RoomId NO_ROOM = 0;
  const DeviceId NO_DEVICE = 0;

  /// device types
  typedef enum {
    devicetype_lamp,
    devicetype_ceilinglight,
    devicetype_lock,
    devicetype_blinds,
    numDeviceTypes
  } DeviceType;

  /// alarm states
  typedef enum {
    alarm_disarmed,
    alarm_armed,
    alarm_triggered,
    numAlarmStates
  } AlarmState;

  /// user roles within a house, as established by the session layer
  typedef enum {
    role_guest, ///< can only query
    role_regular, ///< can control devices
    role_admin, ///< can control devices and modify the structure (rooms, devices)
    numUserRoles
  } UserRole;

  /// @return type name as used in the API ("Lamp", "CeilingLight", "Lock", "Blinds")
  const char *deviceTypeName(DeviceType aType);

  /// @param aName type name, case insensitive
  /// @param aType will be set to the type if aName is known
  /// @return false if aName is not a known device type
  bool deviceTypeFromName(const string &aName, DeviceType &aType);

  const char *alarmStateName(AlarmState aState);
  bool alarmStateFromName(const string &aName, AlarmState &aState);

  const char *userRoleName(UserRole aRole);

} // namespace p44home

#endif /* defined(__p44home__homedefs__) */
