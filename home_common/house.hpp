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

#ifndef __p44home__house__
#define __p44home__house__

#include "room.hpp"

using namespace std;

namespace p44home {

  /// the house alarm state machine
  /// @note only state transitions are handled here, the interaction with locks is in SecurityController
  class Alarm
  {
  public:

    AlarmState mState; ///< current state
    int mThreshold; ///< number of consecutive failed unlocks on one lock that trigger the alarm

    Alarm();
    explicit Alarm(int aThreshold);

    bool isTriggered() const { return mState==alarm_triggered; };

    /// @name state transitions
    /// @param aChanged will be set if the state actually changed
    /// @return InvalidValue if the transition is not allowed from the current state
    /// @{
    ErrorPtr arm(bool &aChanged); ///< disarmed -> armed, no-op when armed
    ErrorPtr disarm(bool &aChanged); ///< any -> disarmed
    ErrorPtr trigger(bool &aChanged); ///< armed -> triggered, no-op when triggered
    ErrorPtr stop(bool &aChanged); ///< triggered -> disarmed
    /// @}

    /// trigger because a security breach was detected (lock threshold)
    /// @note only an armed alarm can be triggered this way, a disarmed house stays disarmed
    /// @return true if state changed from armed to triggered
    bool forceTrigger();

    JsonObjectPtr status() const;

  };


  /// a house: rooms plus alarm
  /// @note House is a plain value, SharedStateManager provides the locking
  class House
  {
  public:

    HouseId mHouseId;
    string mName;
    RoomsVector mRooms; ///< rooms, in order of creation
    RoomId mNextRoomId; ///< next room id to assign
    Alarm mAlarm;
    uint64_t mChangeSeq; ///< incremented on every change, stamped onto change events

    House();
    House(HouseId aHouseId, const string &aName, int aAlarmThreshold);

    /// get room by id
    /// @return room or NULL if none
    Room *getRoom(RoomId aRoomId);
    const Room *getRoom(RoomId aRoomId) const;

    /// add new room with next room id
    /// @param aName name of the room, must not be empty
    /// @param aNewRoomId will be set to the assigned id
    ErrorPtr addRoom(const string &aName, RoomId &aNewRoomId);

    /// insert a room with an already assigned id (with its devices)
    /// @return Duplicate if the room id already exists
    ErrorPtr insertRoom(const Room &aRoom);

    /// remove a room and all of its devices
    /// @param aRemovedDevices will be set to the number of devices removed along with the room
    /// @return NotFound if no such room
    ErrorPtr removeRoom(RoomId aRoomId, size_t &aRemovedDevices);

    /// append copies of all devices of a type in all rooms
    void devicesOfType(DeviceType aType, DeviceVector &aDevices) const;

    /// append copies of all devices in all rooms
    void allDevices(DeviceVector &aDevices) const;

    /// @return complete house description including rooms, devices and alarm
    JsonObjectPtr jsonObject() const;

    string shortDesc() const;

    /// create a house from a description as produced by jsonObject()
    /// @param aDesc description with "house_id", "name", optional "alarm" ("state", "threshold") and "rooms"
    ///   (array or object of rooms with "room_id", "name" and "devices", each device with "device_id", "type"
    ///   and either a "status" object or the attributes inline). Locks need their "code".
    /// @param aDefaultThreshold alarm threshold to use when the description does not specify one
    /// @param aHouse will be set to the new house. Not touched in case of error.
    /// @return error if description is invalid or contains duplicates
    static ErrorPtr fromJson(JsonObjectPtr aDesc, int aDefaultThreshold, House &aHouse);

  };

} // namespace p44home

#endif /* defined(__p44home__house__) */
