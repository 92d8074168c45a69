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

#include "room.hpp"

using namespace p44home;


Room::Room() :
  mRoomId(NO_ROOM),
  mNextDeviceId(1)
{
}


Room::Room(RoomId aRoomId, const string &aName) :
  mRoomId(aRoomId),
  mName(aName),
  mNextDeviceId(1)
{
}


Device *Room::getDevice(DeviceId aDeviceId)
{
  DevicesMap::iterator pos = mDevices.find(aDeviceId);
  if (pos==mDevices.end()) return NULL;
  return &(pos->second);
}


const Device *Room::getDevice(DeviceId aDeviceId) const
{
  DevicesMap::const_iterator pos = mDevices.find(aDeviceId);
  if (pos==mDevices.end()) return NULL;
  return &(pos->second);
}


bool Room::hasDeviceOfType(DeviceType aType) const
{
  for (DevicesMap::const_iterator pos = mDevices.begin(); pos!=mDevices.end(); ++pos) {
    if (pos->second.mType==aType) return true;
  }
  return false;
}


ErrorPtr Room::checkSingleInstance(DeviceType aType) const
{
  if ((aType==devicetype_ceilinglight || aType==devicetype_blinds) && hasDeviceOfType(aType)) {
    return Error::err<HomeError>(HomeError::Duplicate, "%s already has a %s", shortDesc().c_str(), deviceTypeName(aType));
  }
  return ErrorPtr();
}


ErrorPtr Room::addDevice(Device &aDevice)
{
  ErrorPtr err = checkSingleInstance(aDevice.mType);
  if (Error::notOK(err)) return err;
  aDevice.mDeviceId = mNextDeviceId++;
  aDevice.mRoomId = mRoomId;
  mDevices[aDevice.mDeviceId] = aDevice;
  return ErrorPtr();
}


ErrorPtr Room::insertDevice(const Device &aDevice)
{
  if (aDevice.mDeviceId==NO_DEVICE) {
    return Error::err<HomeError>(HomeError::InvalidValue, "device id must be >0");
  }
  if (getDevice(aDevice.mDeviceId)) {
    return Error::err<HomeError>(HomeError::Duplicate, "device id %u already exists in %s", aDevice.mDeviceId, shortDesc().c_str());
  }
  ErrorPtr err = checkSingleInstance(aDevice.mType);
  if (Error::notOK(err)) return err;
  Device &dev = mDevices[aDevice.mDeviceId];
  dev = aDevice;
  dev.mRoomId = mRoomId;
  if (dev.mDeviceId>=mNextDeviceId) mNextDeviceId = dev.mDeviceId+1;
  return ErrorPtr();
}


ErrorPtr Room::removeDevice(DeviceId aDeviceId)
{
  DevicesMap::iterator pos = mDevices.find(aDeviceId);
  if (pos==mDevices.end()) {
    return Error::err<HomeError>(HomeError::NotFound, "device %u not found in %s", aDeviceId, shortDesc().c_str());
  }
  mDevices.erase(pos);
  return ErrorPtr();
}


void Room::devicesOfType(DeviceType aType, DeviceVector &aDevices) const
{
  for (DevicesMap::const_iterator pos = mDevices.begin(); pos!=mDevices.end(); ++pos) {
    if (pos->second.mType==aType) aDevices.push_back(pos->second);
  }
}


void Room::allDevices(DeviceVector &aDevices) const
{
  for (DevicesMap::const_iterator pos = mDevices.begin(); pos!=mDevices.end(); ++pos) {
    aDevices.push_back(pos->second);
  }
}


JsonObjectPtr Room::jsonObject(bool aWithStatus) const
{
  JsonObjectPtr r = JsonObject::newObj();
  r->add("room_id", JsonObject::newInt64(mRoomId));
  r->add("name", JsonObject::newString(mName));
  r->add("next_device_id", JsonObject::newInt64(mNextDeviceId));
  JsonObjectPtr devs = JsonObject::newObj();
  for (DevicesMap::const_iterator pos = mDevices.begin(); pos!=mDevices.end(); ++pos) {
    devs->add(string_format("%u", pos->first).c_str(), aWithStatus ? pos->second.jsonObject() : pos->second.listingObject());
  }
  r->add("devices", devs);
  return r;
}


string Room::shortDesc() const
{
  return string_format("room #%u '%s'", mRoomId, mName.c_str());
}
