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

// File scope debugging options
// - Set ALWAYS_DEBUG to 1 to enable DBGLOG output even in non-DEBUG builds of this file
#define ALWAYS_DEBUG 0
// - set FOCUSLOGLEVEL to non-zero log level (usually, 5,6, or 7==LOG_DEBUG) to get focus (extensive logging) for this file
//   Note: must be before including "logger.hpp" (or anything that includes "logger.hpp")
#define FOCUSLOGLEVEL 0

#include "house.hpp"

using namespace p44home;


// MARK: - Alarm

Alarm::Alarm() :
  mState(alarm_disarmed),
  mThreshold(P44HOME_DEFAULT_ALARM_THRESHOLD)
{
}


Alarm::Alarm(int aThreshold) :
  mState(alarm_disarmed),
  mThreshold(aThreshold>0 ? aThreshold : P44HOME_DEFAULT_ALARM_THRESHOLD)
{
}


ErrorPtr Alarm::arm(bool &aChanged)
{
  aChanged = false;
  if (mState==alarm_triggered) {
    return Error::err<HomeError>(HomeError::InvalidValue, "alarm is triggered, must be stopped or disarmed before arming");
  }
  aChanged = mState!=alarm_armed;
  mState = alarm_armed;
  return ErrorPtr();
}


ErrorPtr Alarm::disarm(bool &aChanged)
{
  aChanged = mState!=alarm_disarmed;
  mState = alarm_disarmed;
  return ErrorPtr();
}


ErrorPtr Alarm::trigger(bool &aChanged)
{
  aChanged = false;
  if (mState==alarm_disarmed) {
    return Error::err<HomeError>(HomeError::InvalidValue, "alarm is not armed, cannot trigger");
  }
  aChanged = mState!=alarm_triggered;
  mState = alarm_triggered;
  return ErrorPtr();
}


ErrorPtr Alarm::stop(bool &aChanged)
{
  aChanged = false;
  if (mState!=alarm_triggered) {
    return Error::err<HomeError>(HomeError::InvalidValue, "alarm is not triggered, nothing to stop");
  }
  aChanged = true;
  mState = alarm_disarmed;
  return ErrorPtr();
}


bool Alarm::forceTrigger()
{
  if (mState!=alarm_armed) return false;
  mState = alarm_triggered;
  return true;
}


JsonObjectPtr Alarm::status() const
{
  JsonObjectPtr st = JsonObject::newObj();
  st->add("state", JsonObject::newString(alarmStateName(mState)));
  st->add("threshold", JsonObject::newInt32(mThreshold));
  return st;
}


// MARK: - House

House::House() :
  mHouseId(0),
  mNextRoomId(1),
  mChangeSeq(0)
{
}


House::House(HouseId aHouseId, const string &aName, int aAlarmThreshold) :
  mHouseId(aHouseId),
  mName(aName),
  mNextRoomId(1),
  mAlarm(aAlarmThreshold),
  mChangeSeq(0)
{
}


Room *House::getRoom(RoomId aRoomId)
{
  for (RoomsVector::iterator pos = mRooms.begin(); pos!=mRooms.end(); ++pos) {
    if (pos->mRoomId==aRoomId) return &(*pos);
  }
  return NULL;
}


const Room *House::getRoom(RoomId aRoomId) const
{
  for (RoomsVector::const_iterator pos = mRooms.begin(); pos!=mRooms.end(); ++pos) {
    if (pos->mRoomId==aRoomId) return &(*pos);
  }
  return NULL;
}


ErrorPtr House::addRoom(const string &aName, RoomId &aNewRoomId)
{
  if (aName.empty()) {
    return Error::err<HomeError>(HomeError::InvalidValue, "room name must not be empty");
  }
  aNewRoomId = mNextRoomId++;
  mRooms.push_back(Room(aNewRoomId, aName));
  return ErrorPtr();
}


ErrorPtr House::insertRoom(const Room &aRoom)
{
  if (aRoom.mRoomId==NO_ROOM) {
    return Error::err<HomeError>(HomeError::InvalidValue, "room id must be >0");
  }
  if (getRoom(aRoom.mRoomId)) {
    return Error::err<HomeError>(HomeError::Duplicate, "room id %u already exists in %s", aRoom.mRoomId, shortDesc().c_str());
  }
  mRooms.push_back(aRoom);
  if (aRoom.mRoomId>=mNextRoomId) mNextRoomId = aRoom.mRoomId+1;
  return ErrorPtr();
}


ErrorPtr House::removeRoom(RoomId aRoomId, size_t &aRemovedDevices)
{
  for (RoomsVector::iterator pos = mRooms.begin(); pos!=mRooms.end(); ++pos) {
    if (pos->mRoomId==aRoomId) {
      aRemovedDevices = pos->mDevices.size();
      mRooms.erase(pos);
      return ErrorPtr();
    }
  }
  return Error::err<HomeError>(HomeError::NotFound, "room %u not found in %s", aRoomId, shortDesc().c_str());
}


void House::devicesOfType(DeviceType aType, DeviceVector &aDevices) const
{
  for (RoomsVector::const_iterator pos = mRooms.begin(); pos!=mRooms.end(); ++pos) {
    pos->devicesOfType(aType, aDevices);
  }
}


void House::allDevices(DeviceVector &aDevices) const
{
  for (RoomsVector::const_iterator pos = mRooms.begin(); pos!=mRooms.end(); ++pos) {
    pos->allDevices(aDevices);
  }
}


JsonObjectPtr House::jsonObject() const
{
  JsonObjectPtr h = JsonObject::newObj();
  h->add("house_id", JsonObject::newInt64(mHouseId));
  h->add("name", JsonObject::newString(mName));
  JsonObjectPtr rooms = JsonObject::newObj();
  for (RoomsVector::const_iterator pos = mRooms.begin(); pos!=mRooms.end(); ++pos) {
    rooms->add(string_format("%u", pos->mRoomId).c_str(), pos->jsonObject());
  }
  h->add("rooms", rooms);
  h->add("alarm", mAlarm.status());
  h->add("seq", JsonObject::newInt64((int64_t)mChangeSeq));
  h->add("next_room_id", JsonObject::newInt64(mNextRoomId));
  return h;
}


string House::shortDesc() const
{
  return string_format("house #%u '%s'", mHouseId, mName.c_str());
}


// MARK: - House import

/// collect the members of a JSON array, or the values of a JSON object
static ErrorPtr collectEntries(JsonObjectPtr aContainer, const char *aWhat, vector<JsonObjectPtr> &aEntries)
{
  if (!aContainer) return ErrorPtr();
  if (aContainer->isType(json_type_array)) {
    for (int i=0; i<aContainer->arrayLength(); i++) {
      aEntries.push_back(aContainer->arrayGet(i));
    }
  }
  else if (aContainer->isType(json_type_object)) {
    aContainer->resetKeyIteration();
    string key;
    JsonObjectPtr o;
    while (aContainer->nextKeyValue(key, o)) {
      aEntries.push_back(o);
    }
  }
  else {
    return Error::err<HomeError>(HomeError::InvalidValue, "'%s' must be an array or object", aWhat);
  }
  return ErrorPtr();
}


static ErrorPtr deviceFromJson(JsonObjectPtr aDesc, Device &aDevice)
{
  if (!aDesc || !aDesc->isType(json_type_object)) {
    return Error::err<HomeError>(HomeError::InvalidValue, "device description must be an object");
  }
  ErrorPtr err;
  int id = 0;
  if (Error::notOK(err = checkIntParam(aDesc, "device_id", id, 1, INT32_MAX, true))) return err;
  string typeName;
  if (Error::notOK(err = checkStringParam(aDesc, "type", typeName, true))) return err;
  DeviceType type;
  if (!deviceTypeFromName(typeName, type)) {
    return Error::err<HomeError>(HomeError::InvalidValue, "unknown device type '%s'", typeName.c_str());
  }
  // attributes are either in "status" or inline, the lock code is never part of a status
  JsonObjectPtr attrs = aDesc;
  JsonObjectPtr st;
  if (aDesc->get("status", st) && st && st->isType(json_type_object)) {
    attrs = JsonObject::newObj();
    st->resetKeyIteration();
    string key;
    JsonObjectPtr v;
    while (st->nextKeyValue(key, v)) {
      attrs->add(key.c_str(), v);
    }
    JsonObjectPtr code;
    if (aDesc->get("code", code)) attrs->add("code", code);
  }
  Device dev;
  if (Error::notOK(err = Device::create(type, attrs, dev))) return err;
  if (type==devicetype_lock) {
    if (Error::notOK(err = checkIntParam(attrs, "failed_attempts", dev.mLock.mFailedAttempts, 0, INT32_MAX))) return err;
  }
  dev.mDeviceId = (DeviceId)id;
  aDevice = dev;
  return ErrorPtr();
}


static ErrorPtr roomFromJson(JsonObjectPtr aDesc, Room &aRoom)
{
  if (!aDesc || !aDesc->isType(json_type_object)) {
    return Error::err<HomeError>(HomeError::InvalidValue, "room description must be an object");
  }
  ErrorPtr err;
  int id = 0;
  if (Error::notOK(err = checkIntParam(aDesc, "room_id", id, 1, INT32_MAX, true))) return err;
  string name;
  if (Error::notOK(err = checkStringParam(aDesc, "name", name, true))) return err;
  Room room((RoomId)id, name);
  JsonObjectPtr o;
  vector<JsonObjectPtr> devs;
  aDesc->get("devices", o);
  if (Error::notOK(err = collectEntries(o, "devices", devs))) return err;
  for (vector<JsonObjectPtr>::iterator pos = devs.begin(); pos!=devs.end(); ++pos) {
    Device dev;
    if (Error::notOK(err = deviceFromJson(*pos, dev))) return err;
    if (Error::notOK(err = room.insertDevice(dev))) return err;
  }
  int nextId = 0;
  if (Error::notOK(err = checkIntParam(aDesc, "next_device_id", nextId, 1, INT32_MAX))) return err;
  if ((DeviceId)nextId>room.mNextDeviceId) room.mNextDeviceId = nextId;
  aRoom = room;
  return ErrorPtr();
}


ErrorPtr House::fromJson(JsonObjectPtr aDesc, int aDefaultThreshold, House &aHouse)
{
  if (!aDesc || !aDesc->isType(json_type_object)) {
    return Error::err<HomeError>(HomeError::InvalidValue, "house description must be an object");
  }
  ErrorPtr err;
  int id = 0;
  if (Error::notOK(err = checkIntParam(aDesc, "house_id", id, 1, INT32_MAX, true))) return err;
  string name;
  if (Error::notOK(err = checkStringParam(aDesc, "name", name, true))) return err;
  int threshold = aDefaultThreshold;
  AlarmState state = alarm_disarmed;
  JsonObjectPtr o;
  if (aDesc->get("alarm", o) && o) {
    if (Error::notOK(err = checkIntParam(o, "threshold", threshold, 1, INT32_MAX))) return err;
    string stateName;
    if (Error::notOK(err = checkStringParam(o, "state", stateName))) return err;
    if (!stateName.empty() && !alarmStateFromName(stateName, state)) {
      return Error::err<HomeError>(HomeError::InvalidValue, "unknown alarm state '%s'", stateName.c_str());
    }
  }
  House house((HouseId)id, name, threshold);
  house.mAlarm.mState = state;
  vector<JsonObjectPtr> rooms;
  o.reset();
  aDesc->get("rooms", o);
  if (Error::notOK(err = collectEntries(o, "rooms", rooms))) return err;
  for (vector<JsonObjectPtr>::iterator pos = rooms.begin(); pos!=rooms.end(); ++pos) {
    Room room;
    if (Error::notOK(err = roomFromJson(*pos, room))) return err;
    if (Error::notOK(err = house.insertRoom(room))) return err;
  }
  int nextId = 0;
  if (Error::notOK(err = checkIntParam(aDesc, "next_room_id", nextId, 1, INT32_MAX))) return err;
  if ((RoomId)nextId>house.mNextRoomId) house.mNextRoomId = nextId;
  FOCUSLOG("imported %s with %zu rooms", house.shortDesc().c_str(), house.mRooms.size());
  aHouse = house;
  return ErrorPtr();
}
