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

#ifndef __p44home__device__
#define __p44home__device__

#include "homeerror.hpp"

#include "lightbehaviour.hpp"
#include "lockbehaviour.hpp"
#include "shadowbehaviour.hpp"

using namespace std;

namespace p44home {

  /// A device is plain tagged data: the type tag selects which of the state records is meaningful,
  /// actions are dispatched to the behaviour matching the tag (see performDeviceAction()).
  /// Devices are values - copies are used as snapshots.
  class Device
  {
  public:

    DeviceId mDeviceId; ///< id, unique within the room, assigned by the room
    RoomId mRoomId; ///< the room this device belongs to (back reference by id)
    DeviceType mType; ///< type tag

    LightState mLight; ///< for devicetype_lamp and devicetype_ceilinglight
    LockState mLock; ///< for devicetype_lock
    BlindsState mBlinds; ///< for devicetype_blinds

    Device();
    explicit Device(DeviceType aType);

    /// create a device with initial attributes
    /// @param aType the device type
    /// @param aAttributes object with type specific initial attributes, may be NULL to get defaults
    ///   (except for locks, which need a "code")
    /// @param aDevice will be set to the new device (id and room are not yet assigned)
    /// @return InvalidValue if attributes are not valid for the type
    static ErrorPtr create(DeviceType aType, JsonObjectPtr aAttributes, Device &aDevice);

    /// @return true for lights (Lamp, CeilingLight)
    bool isLight() const { return mType==devicetype_lamp || mType==devicetype_ceilinglight; };

    /// @return true for devices whose actions are security actions, still allowed while the alarm is triggered
    bool isSecurityDevice() const { return mType==devicetype_lock; };

    /// @return current attribute values as flat object
    JsonObjectPtr status() const;

    /// @return device description including id, room, type and status
    JsonObjectPtr jsonObject() const;

    /// @return device description without status (for listings)
    JsonObjectPtr listingObject() const;

    /// @return short text description for logs
    string shortDesc() const;

  };
  typedef vector<Device> DeviceVector;


  /// perform an action on a device, dispatched by type tag
  /// @param aDevice the device
  /// @param aAction the action name
  /// @param aParams action parameters (may be NULL)
  /// @param aUnlockAttempt set when the action was a (well-formed) unlock attempt
  /// @param aCodeAccepted set when an unlock attempt had the correct code
  /// @return InvalidValue for actions not supported by the device type or invalid parameters.
  ///   The device is never partially modified.
  ErrorPtr performDeviceAction(Device &aDevice, const string &aAction, JsonObjectPtr aParams, bool &aUnlockAttempt, bool &aCodeAccepted);

} // namespace p44home

#endif /* defined(__p44home__device__) */
