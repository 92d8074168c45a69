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

#ifndef __p44home__room__
#define __p44home__room__

#include "device.hpp"

using namespace std;

namespace p44home {

  /// a room: container of devices, owns device id assignment
  class Room
  {
  public:

    typedef map<DeviceId, Device> DevicesMap;

    RoomId mRoomId; ///< id, unique within the house
    string mName; ///< user facing name
    DevicesMap mDevices; ///< devices by id
    DeviceId mNextDeviceId; ///< next id to assign. Ids are never reused within the lifetime of the room

    Room();
    Room(RoomId aRoomId, const string &aName);

    /// get device by id
    /// @return device or NULL if none with this id exists
    Device *getDevice(DeviceId aDeviceId);
    const Device *getDevice(DeviceId aDeviceId) const;

    /// @return true if the room contains a device of the given type
    bool hasDeviceOfType(DeviceType aType) const;

    /// add a new device, assigning the next device id
    /// @param aDevice the device to add. On success, its mDeviceId and mRoomId are updated to the assigned values
    /// @return Duplicate when adding a second CeilingLight or Blinds. The room is unchanged in case of error
    ErrorPtr addDevice(Device &aDevice);

    /// insert a device with an id already assigned (e.g. when loading a house from its persisted description)
    /// @return Duplicate if the id is in use or for a second CeilingLight or Blinds
    ErrorPtr insertDevice(const Device &aDevice);

    /// remove a device
    /// @return NotFound if no such device
    ErrorPtr removeDevice(DeviceId aDeviceId);

    /// append copies of all devices of a type to aDevices
    void devicesOfType(DeviceType aType, DeviceVector &aDevices) const;

    /// append copies of all devices to aDevices
    void allDevices(DeviceVector &aDevices) const;

    /// @param aWithStatus if set, device status is included
    /// @return room description with its devices
    JsonObjectPtr jsonObject(bool aWithStatus = true) const;

    string shortDesc() const;

  private:

    /// @return Duplicate if aType may exist only once per room and is already present
    ErrorPtr checkSingleInstance(DeviceType aType) const;

  };
  typedef vector<Room> RoomsVector;

} // namespace p44home

#endif /* defined(__p44home__room__) */
