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

#include "device.hpp"

using namespace p44home;


// MARK: - Device

Device::Device() :
  mDeviceId(NO_DEVICE),
  mRoomId(NO_ROOM),
  mType(devicetype_lamp)
{
}


Device::Device(DeviceType aType) :
  mDeviceId(NO_DEVICE),
  mRoomId(NO_ROOM),
  mType(aType)
{
}


ErrorPtr Device::create(DeviceType aType, JsonObjectPtr aAttributes, Device &aDevice)
{
  if (aAttributes && !aAttributes->isType(json_type_object)) {
    return Error::err<HomeError>(HomeError::InvalidValue, "device attributes must be an object");
  }
  Device dev(aType);
  ErrorPtr err;
  switch (aType) {
    case devicetype_lamp:
    case devicetype_ceilinglight:
      err = configureLight(dev.mLight, aAttributes);
      break;
    case devicetype_lock:
      err = configureLock(dev.mLock, aAttributes);
      break;
    case devicetype_blinds:
      err = configureBlinds(dev.mBlinds, aAttributes);
      break;
    default:
      err = Error::err<HomeError>(HomeError::InvalidValue, "unknown device type %d", (int)aType);
      break;
  }
  if (Error::isOK(err)) {
    aDevice = dev;
  }
  return err;
}


JsonObjectPtr Device::status() const
{
  JsonObjectPtr st = JsonObject::newObj();
  switch (mType) {
    case devicetype_lamp:
    case devicetype_ceilinglight:
      addLightStatus(mLight, st);
      break;
    case devicetype_lock:
      addLockStatus(mLock, st);
      break;
    case devicetype_blinds:
      addBlindsStatus(mBlinds, st);
      break;
    default:
      break;
  }
  return st;
}


JsonObjectPtr Device::listingObject() const
{
  JsonObjectPtr d = JsonObject::newObj();
  d->add("device_id", JsonObject::newInt64(mDeviceId));
  d->add("room_id", JsonObject::newInt64(mRoomId));
  d->add("type", JsonObject::newString(deviceTypeName(mType)));
  return d;
}


JsonObjectPtr Device::jsonObject() const
{
  JsonObjectPtr d = listingObject();
  d->add("status", status());
  return d;
}


string Device::shortDesc() const
{
  return string_format("%s #%u in room #%u", deviceTypeName(mType), mDeviceId, mRoomId);
}


// MARK: - action dispatch

ErrorPtr p44home::performDeviceAction(Device &aDevice, const string &aAction, JsonObjectPtr aParams, bool &aUnlockAttempt, bool &aCodeAccepted)
{
  aUnlockAttempt = false;
  aCodeAccepted = false;
  JsonObjectPtr params = aParams;
  if (params && params->isType(json_type_null)) params.reset();
  if (params && !params->isType(json_type_object)) {
    return Error::err<HomeError>(HomeError::InvalidValue, "action parameters must be an object");
  }
  switch (aDevice.mType) {
    case devicetype_lamp:
    case devicetype_ceilinglight:
      return performLightAction(aDevice.mLight, aAction, params);
    case devicetype_lock:
      return performLockAction(aDevice.mLock, aAction, params, aUnlockAttempt, aCodeAccepted);
    case devicetype_blinds:
      return performBlindsAction(aDevice.mBlinds, aAction, params);
    default:
      return Error::err<HomeError>(HomeError::InvalidValue, "device type does not support actions");
  }
}
