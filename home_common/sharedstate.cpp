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

#include "sharedstate.hpp"
#include "broadcaster.hpp"

using namespace p44home;


// MARK: - HouseSlot

HouseSlot::HouseSlot(const House &aHouse) :
  mHouse(aHouse)
{
  pthread_mutex_init(&mAccess, NULL);
}


HouseSlot::~HouseSlot()
{
  pthread_mutex_destroy(&mAccess);
}


// MARK: - SharedStateManager

SharedStateManager::SharedStateManager(int aDefaultAlarmThreshold) :
  mSecurityBroadcaster(NULL),
  mDefaultAlarmThreshold(aDefaultAlarmThreshold)
{
  if (mDefaultAlarmThreshold<1) mDefaultAlarmThreshold = P44HOME_DEFAULT_ALARM_THRESHOLD;
  pthread_mutex_init(&mRegistryAccess, NULL);
}


SharedStateManager::~SharedStateManager()
{
  for (HousesMap::iterator pos = mHouses.begin(); pos!=mHouses.end(); ++pos) {
    delete pos->second;
  }
  mHouses.clear();
  pthread_mutex_destroy(&mRegistryAccess);
}


static ErrorPtr houseNotFound(HouseId aHouseId)
{
  return Error::err<HomeError>(HomeError::NotFound, "house #%u does not exist", aHouseId);
}


static ErrorPtr roomNotFound(const House &aHouse, RoomId aRoomId)
{
  return Error::err<HomeError>(HomeError::NotFound, "room #%u does not exist in %s", aRoomId, aHouse.shortDesc().c_str());
}


static ErrorPtr deviceNotFound(const Room &aRoom, DeviceId aDeviceId)
{
  return Error::err<HomeError>(HomeError::NotFound, "device #%u does not exist in %s", aDeviceId, aRoom.shortDesc().c_str());
}


HouseSlot *SharedStateManager::lockHouse(HouseId aHouseId)
{
  HouseSlot *slot = NULL;
  pthread_mutex_lock(&mRegistryAccess);
  HousesMap::iterator pos = mHouses.find(aHouseId);
  if (pos!=mHouses.end()) slot = pos->second;
  pthread_mutex_unlock(&mRegistryAccess);
  if (slot) {
    pthread_mutex_lock(&slot->mAccess);
  }
  return slot;
}


void SharedStateManager::unlockHouse(HouseSlot *aSlot)
{
  pthread_mutex_unlock(&aSlot->mAccess);
}


ErrorPtr SharedStateManager::registerHouse(const House &aHouse)
{
  ErrorPtr err;
  pthread_mutex_lock(&mRegistryAccess);
  if (mHouses.find(aHouse.mHouseId)!=mHouses.end()) {
    err = Error::err<HomeError>(HomeError::Duplicate, "house #%u already exists", aHouse.mHouseId);
  }
  else {
    mHouses[aHouse.mHouseId] = new HouseSlot(aHouse);
  }
  pthread_mutex_unlock(&mRegistryAccess);
  if (Error::isOK(err)) {
    OLOG(LOG_NOTICE, "registered %s with %lu rooms", aHouse.shortDesc().c_str(), aHouse.mRooms.size());
  }
  return err;
}


ErrorPtr SharedStateManager::addHouse(HouseId aHouseId, const string &aName)
{
  if (aHouseId==0) {
    return Error::err<HomeError>(HomeError::InvalidValue, "house id must not be 0");
  }
  return registerHouse(House(aHouseId, aName, mDefaultAlarmThreshold));
}


ErrorPtr SharedStateManager::importHouse(JsonObjectPtr aDesc, HouseId &aHouseId)
{
  House house;
  ErrorPtr err = House::fromJson(aDesc, mDefaultAlarmThreshold, house);
  if (Error::notOK(err)) {
    OLOG(LOG_WARNING, "cannot import house: %s", err->text());
    return err;
  }
  err = registerHouse(house);
  if (Error::isOK(err)) aHouseId = house.mHouseId;
  return err;
}


HouseIdList SharedStateManager::houseIds()
{
  HouseIdList ids;
  pthread_mutex_lock(&mRegistryAccess);
  for (HousesMap::iterator pos = mHouses.begin(); pos!=mHouses.end(); ++pos) {
    ids.push_back(pos->first);
  }
  pthread_mutex_unlock(&mRegistryAccess);
  return ids;
}


// MARK: - snapshots

ErrorPtr SharedStateManager::getHouseSnapshot(HouseId aHouseId, House &aHouse)
{
  HouseSlot *slot = lockHouse(aHouseId);
  if (!slot) return houseNotFound(aHouseId);
  aHouse = slot->mHouse;
  unlockHouse(slot);
  return ErrorPtr();
}


ErrorPtr SharedStateManager::getRoomSnapshot(HouseId aHouseId, RoomId aRoomId, Room &aRoom)
{
  HouseSlot *slot = lockHouse(aHouseId);
  if (!slot) return houseNotFound(aHouseId);
  ErrorPtr err;
  const Room *room = slot->mHouse.getRoom(aRoomId);
  if (!room) err = roomNotFound(slot->mHouse, aRoomId);
  else aRoom = *room;
  unlockHouse(slot);
  return err;
}


ErrorPtr SharedStateManager::getDeviceSnapshot(HouseId aHouseId, RoomId aRoomId, DeviceId aDeviceId, Device &aDevice)
{
  HouseSlot *slot = lockHouse(aHouseId);
  if (!slot) return houseNotFound(aHouseId);
  ErrorPtr err;
  const Room *room = slot->mHouse.getRoom(aRoomId);
  if (!room) {
    err = roomNotFound(slot->mHouse, aRoomId);
  }
  else {
    const Device *dev = room->getDevice(aDeviceId);
    if (!dev) err = deviceNotFound(*room, aDeviceId);
    else aDevice = *dev;
  }
  unlockHouse(slot);
  return err;
}


ErrorPtr SharedStateManager::getGroupSnapshot(HouseId aHouseId, DeviceType aDeviceType, DeviceVector &aDevices)
{
  HouseSlot *slot = lockHouse(aHouseId);
  if (!slot) return houseNotFound(aHouseId);
  aDevices.clear();
  slot->mHouse.devicesOfType(aDeviceType, aDevices);
  unlockHouse(slot);
  return ErrorPtr();
}


// MARK: - device actions

ErrorPtr SharedStateManager::deviceActionLocked(House &aHouse, Device &aDevice, const string &aAction, JsonObjectPtr aParams, ChangeEventPtr &aEvent, ChangeEventPtr &aAlert)
{
  ErrorPtr err = mSecurityController.checkDeviceAction(aHouse, aDevice);
  if (Error::notOK(err)) {
    OLOG(LOG_INFO, "refused '%s' on %s: %s", aAction.c_str(), aDevice.shortDesc().c_str(), err->text());
    return err;
  }
  bool unlockAttempt = false;
  bool codeAccepted = false;
  err = performDeviceAction(aDevice, aAction, aParams, unlockAttempt, codeAccepted);
  if (Error::notOK(err)) return err;
  bool alarmTriggered = false;
  if (unlockAttempt) {
    alarmTriggered = mSecurityController.noteUnlockAttempt(aHouse, aDevice, codeAccepted);
  }
  aHouse.mChangeSeq++;
  aEvent = ChangeEvent::deviceEvent(event_device_update, aHouse.mHouseId, aHouse.mChangeSeq, aDevice, aAction);
  if (unlockAttempt) {
    aEvent->mStatus->add("code_accepted", JsonObject::newBool(codeAccepted));
  }
  OLOG(LOG_INFO, "%s: '%s' -> %s", aDevice.shortDesc().c_str(), aAction.c_str(), aEvent->mStatus->json_c_str());
  if (alarmTriggered) {
    // alarm state changed as well
    aHouse.mChangeSeq++;
    aAlert = ChangeEventPtr(new ChangeEvent(event_security_alert, aHouse.mHouseId, aHouse.mChangeSeq));
    aAlert->mRoomId = aDevice.mRoomId;
    aAlert->mDeviceId = aDevice.mDeviceId;
    aAlert->mDeviceType = aDevice.mType;
    aAlert->mAction = aAction;
    aAlert->mStatus = aHouse.mAlarm.status();
    aAlert->mStatus->add("failed_attempts", JsonObject::newInt32(aDevice.mLock.mFailedAttempts));
  }
  return ErrorPtr();
}


void SharedStateManager::broadcastAlert(ChangeEventPtr aAlert)
{
  if (!aAlert) return;
  if (mSecurityBroadcaster) {
    mSecurityBroadcaster->broadcast(aAlert);
  }
  else {
    OLOG(LOG_WARNING, "no broadcaster for security alert: %s", aAlert->text().c_str());
  }
}


ErrorPtr SharedStateManager::applyDeviceAction(HouseId aHouseId, RoomId aRoomId, DeviceId aDeviceId, const string &aAction, JsonObjectPtr aParams, ChangeEventPtr &aEvent, ChangeEventPtr *aAlertP)
{
  if (aAlertP) aAlertP->reset();
  HouseSlot *slot = lockHouse(aHouseId);
  if (!slot) return houseNotFound(aHouseId);
  ErrorPtr err;
  ChangeEventPtr alert;
  Room *room = slot->mHouse.getRoom(aRoomId);
  if (!room) {
    err = roomNotFound(slot->mHouse, aRoomId);
  }
  else {
    Device *dev = room->getDevice(aDeviceId);
    if (!dev) err = deviceNotFound(*room, aDeviceId);
    else err = deviceActionLocked(slot->mHouse, *dev, aAction, aParams, aEvent, alert);
  }
  unlockHouse(slot);
  if (aAlertP) *aAlertP = alert;
  else broadcastAlert(alert);
  return err;
}


ErrorPtr SharedStateManager::applyGroupAction(HouseId aHouseId, DeviceType aDeviceType, const string &aAction, JsonObjectPtr aParams, GroupActionResult &aResult, bool aBroadcastAlert)
{
  aResult.mDeviceType = aDeviceType;
  aResult.mAction = aAction;
  aResult.mOutcomes.clear();
  HouseSlot *slot = lockHouse(aHouseId);
  if (!slot) return houseNotFound(aHouseId);
  ChangeEventPtr alert;
  House &house = slot->mHouse;
  for (RoomsVector::iterator rpos = house.mRooms.begin(); rpos!=house.mRooms.end(); ++rpos) {
    for (Room::DevicesMap::iterator dpos = rpos->mDevices.begin(); dpos!=rpos->mDevices.end(); ++dpos) {
      if (dpos->second.mType!=aDeviceType) continue;
      GroupActionOutcome outcome;
      outcome.mRoomId = rpos->mRoomId;
      outcome.mDeviceId = dpos->first;
      outcome.mError = deviceActionLocked(house, dpos->second, aAction, aParams, outcome.mEvent, outcome.mSecurityAlert);
      if (outcome.mSecurityAlert) alert = outcome.mSecurityAlert; // alarm triggers only once
      aResult.mOutcomes.push_back(outcome);
    }
  }
  unlockHouse(slot);
  FOCUSLOG("group action '%s' on %s devices of house #%u: %d succeeded, %d failed", aAction.c_str(), deviceTypeName(aDeviceType), aHouseId, aResult.successes(), aResult.failures());
  if (aBroadcastAlert) broadcastAlert(alert);
  return ErrorPtr();
}


// MARK: - structure changes

ErrorPtr SharedStateManager::addRoom(HouseId aHouseId, const string &aName, RoomId &aNewRoomId, ChangeEventPtr &aEvent)
{
  HouseSlot *slot = lockHouse(aHouseId);
  if (!slot) return houseNotFound(aHouseId);
  House &house = slot->mHouse;
  ErrorPtr err = house.addRoom(aName, aNewRoomId);
  if (Error::isOK(err)) {
    house.mChangeSeq++;
    aEvent = ChangeEventPtr(new ChangeEvent(event_room_added, aHouseId, house.mChangeSeq));
    aEvent->mRoomId = aNewRoomId;
    aEvent->mAction = "add_room";
    aEvent->mStatus = JsonObject::newObj();
    aEvent->mStatus->add("name", JsonObject::newString(aName));
    OLOG(LOG_NOTICE, "%s: added room #%u '%s'", house.shortDesc().c_str(), aNewRoomId, aName.c_str());
  }
  unlockHouse(slot);
  return err;
}


ErrorPtr SharedStateManager::addDevice(HouseId aHouseId, RoomId aRoomId, DeviceType aDeviceType, JsonObjectPtr aAttributes, DeviceId &aNewDeviceId, ChangeEventPtr &aEvent)
{
  // validate attributes before taking the lock
  Device dev;
  ErrorPtr err = Device::create(aDeviceType, aAttributes, dev);
  if (Error::notOK(err)) return err;
  HouseSlot *slot = lockHouse(aHouseId);
  if (!slot) return houseNotFound(aHouseId);
  House &house = slot->mHouse;
  Room *room = house.getRoom(aRoomId);
  if (!room) {
    err = roomNotFound(house, aRoomId);
  }
  else {
    err = room->addDevice(dev);
    if (Error::isOK(err)) {
      aNewDeviceId = dev.mDeviceId;
      house.mChangeSeq++;
      aEvent = ChangeEvent::deviceEvent(event_device_added, aHouseId, house.mChangeSeq, dev, "add_device");
      OLOG(LOG_NOTICE, "%s: added %s", room->shortDesc().c_str(), dev.shortDesc().c_str());
    }
  }
  unlockHouse(slot);
  return err;
}


ErrorPtr SharedStateManager::delRoom(HouseId aHouseId, RoomId aRoomId, ChangeEventPtr &aEvent)
{
  HouseSlot *slot = lockHouse(aHouseId);
  if (!slot) return houseNotFound(aHouseId);
  House &house = slot->mHouse;
  size_t removedDevices = 0;
  ErrorPtr err = house.removeRoom(aRoomId, removedDevices);
  if (Error::isOK(err)) {
    house.mChangeSeq++;
    aEvent = ChangeEventPtr(new ChangeEvent(event_room_deleted, aHouseId, house.mChangeSeq));
    aEvent->mRoomId = aRoomId;
    aEvent->mAction = "del_room";
    aEvent->mStatus = JsonObject::newObj();
    aEvent->mStatus->add("removed_devices", JsonObject::newInt64((int64_t)removedDevices));
    OLOG(LOG_NOTICE, "%s: deleted room #%u along with %lu devices", house.shortDesc().c_str(), aRoomId, removedDevices);
  }
  unlockHouse(slot);
  return err;
}


ErrorPtr SharedStateManager::delDevice(HouseId aHouseId, RoomId aRoomId, DeviceId aDeviceId, ChangeEventPtr &aEvent)
{
  HouseSlot *slot = lockHouse(aHouseId);
  if (!slot) return houseNotFound(aHouseId);
  House &house = slot->mHouse;
  ErrorPtr err;
  Room *room = house.getRoom(aRoomId);
  if (!room) {
    err = roomNotFound(house, aRoomId);
  }
  else {
    const Device *dev = room->getDevice(aDeviceId);
    if (!dev) {
      err = deviceNotFound(*room, aDeviceId);
    }
    else {
      house.mChangeSeq++;
      aEvent = ChangeEventPtr(new ChangeEvent(event_device_deleted, aHouseId, house.mChangeSeq));
      aEvent->mRoomId = aRoomId;
      aEvent->mDeviceId = aDeviceId;
      aEvent->mDeviceType = dev->mType;
      aEvent->mAction = "del_device";
      OLOG(LOG_NOTICE, "%s: deleted %s", room->shortDesc().c_str(), dev->shortDesc().c_str());
      err = room->removeDevice(aDeviceId);
    }
  }
  unlockHouse(slot);
  return err;
}


ErrorPtr SharedStateManager::setAlarm(HouseId aHouseId, AlarmAction aAction, ChangeEventPtr &aEvent)
{
  HouseSlot *slot = lockHouse(aHouseId);
  if (!slot) return houseNotFound(aHouseId);
  House &house = slot->mHouse;
  bool changed = false;
  ErrorPtr err = mSecurityController.changeAlarm(house, aAction, changed);
  if (Error::isOK(err) && changed) {
    house.mChangeSeq++;
    aEvent = ChangeEventPtr(new ChangeEvent(event_alarm_update, aHouseId, house.mChangeSeq));
    aEvent->mAction = alarmActionName(aAction);
    aEvent->mStatus = house.mAlarm.status();
  }
  unlockHouse(slot);
  return err;
}
