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

#ifndef __p44home__changeevent__
#define __p44home__changeevent__

#include "device.hpp"

using namespace std;

namespace p44home {

  /// kinds of change events
  typedef enum {
    event_device_update,
    event_room_added,
    event_room_deleted,
    event_device_added,
    event_device_deleted,
    event_alarm_update,
    event_security_alert,
    numEventTypes
  } EventType;

  const char *eventTypeName(EventType aEventType);


  class ChangeEvent;
  typedef boost::intrusive_ptr<ChangeEvent> ChangeEventPtr;

  /// describes a successful mutation of shared state, to be broadcast to the subscribers of the house
  /// @note a ChangeEvent is created and rendered by the thread that performed the mutation,
  ///   it is not meant to be passed between threads (only its rendered text is).
  class ChangeEvent : public P44Obj
  {
  public:

    EventType mEventType;
    HouseId mHouseId;
    RoomId mRoomId; ///< NO_ROOM for house level events
    DeviceId mDeviceId; ///< NO_DEVICE for room or house level events
    DeviceType mDeviceType; ///< only valid when mDeviceId!=NO_DEVICE
    string mAction; ///< the action that caused the change
    uint64_t mSeq; ///< the house's change sequence number after the change
    JsonObjectPtr mStatus; ///< new attribute values (flat), or NULL

    ChangeEvent(EventType aEventType, HouseId aHouseId, uint64_t aSeq);

    /// create a device level event
    static ChangeEventPtr deviceEvent(EventType aEventType, HouseId aHouseId, uint64_t aSeq, const Device &aDevice, const string &aAction);

    /// @return event as JSON object with "type", "house_id", "room_id", "device_id", "device_type", "action", "seq", "status"
    JsonObjectPtr jsonObject() const;

    /// @return event as JSON text, ready for sending
    string text() const;

  };


  /// outcome of one device in a group action
  class GroupActionOutcome
  {
  public:
    RoomId mRoomId;
    DeviceId mDeviceId;
    ErrorPtr mError; ///< NULL if action succeeded on this device
    ChangeEventPtr mEvent; ///< change event if action succeeded
    ChangeEventPtr mSecurityAlert; ///< security alert if this action triggered the alarm
  };
  typedef vector<GroupActionOutcome> GroupActionOutcomes;


  /// result of a group action
  class GroupActionResult
  {
  public:
    DeviceType mDeviceType;
    string mAction;
    GroupActionOutcomes mOutcomes;

    GroupActionResult();

    int successes() const;
    int failures() const;

    /// @return summary as JSON object with "device_type", "action", "succeeded", "failed" and a per-device
    ///   "results" array (room_id, device_id, status or error kind)
    JsonObjectPtr jsonObject() const;

  };

} // namespace p44home

#endif /* defined(__p44home__changeevent__) */
