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

#include "dispatcher.hpp"
#include "actionparams.hpp"

using namespace p44home;


// MARK: - ClientSession

ClientSession::ClientSession() :
  mClientId(NO_CLIENT),
  mHouseId(0),
  mRole(role_guest)
{
}


ClientSession::ClientSession(ClientId aClientId, const string &aUserName) :
  mClientId(aClientId),
  mUserName(aUserName),
  mHouseId(0),
  mRole(role_guest)
{
}


// MARK: - command field helpers

static ErrorPtr getId(JsonObjectPtr aCommand, const char *aFieldName, uint32_t &aId)
{
  int id = 0;
  ErrorPtr err = checkIntParam(aCommand, aFieldName, id, 1, INT32_MAX, true);
  if (Error::isOK(err)) aId = (uint32_t)id;
  return err;
}


static ErrorPtr getDeviceType(JsonObjectPtr aCommand, DeviceType &aDeviceType)
{
  string tn;
  ErrorPtr err = checkStringParam(aCommand, "device_type", tn, true);
  if (Error::notOK(err)) return err;
  if (!deviceTypeFromName(tn, aDeviceType)) {
    return Error::err<HomeError>(HomeError::InvalidValue, "unknown device type '%s'", tn.c_str());
  }
  return ErrorPtr();
}


static JsonObjectPtr devicesArray(const DeviceVector &aDevices, bool aWithStatus)
{
  JsonObjectPtr a = JsonObject::newArray();
  for (DeviceVector::const_iterator pos = aDevices.begin(); pos!=aDevices.end(); ++pos) {
    a->arrayAppend(aWithStatus ? pos->jsonObject() : pos->listingObject());
  }
  return a;
}


// MARK: - RequestDispatcher

RequestDispatcher::RequestDispatcher(SharedStateManager &aState, SubscriptionRegistry &aSubscriptions, Broadcaster &aBroadcaster, bool aEchoToOriginator) :
  mState(aState),
  mSubscriptions(aSubscriptions),
  mBroadcaster(aBroadcaster),
  mEchoToOriginator(aEchoToOriginator)
{
}


JsonObjectPtr RequestDispatcher::dispatchText(ClientSession &aSession, const string &aText)
{
  ErrorPtr err;
  JsonObjectPtr cmd = JsonObject::objFromText(aText.c_str(), -1, &err);
  if (Error::notOK(err) || !cmd) {
    if (Error::isOK(err)) err = Error::err<HomeError>(HomeError::InvalidValue, "empty message");
    JsonObjectPtr response = JsonObject::newObj();
    response->add("type", JsonObject::newString("error"));
    response->add("status", JsonObject::newString("error"));
    response->add("error", JsonObject::newString(HomeError::kindName(HomeError::InvalidValue)));
    response->add("message", JsonObject::newString(string_format("invalid JSON: %s", err->text())));
    OLOG(LOG_INFO, "client %llu sent invalid JSON", (unsigned long long)aSession.mClientId);
    return response;
  }
  return dispatch(aSession, cmd);
}


JsonObjectPtr RequestDispatcher::dispatch(ClientSession &aSession, JsonObjectPtr aCommand)
{
  JsonObjectPtr response = JsonObject::newObj();
  ErrorPtr err;
  string cmd;
  if (!aCommand || !aCommand->isType(json_type_object)) {
    err = Error::err<HomeError>(HomeError::InvalidValue, "command must be a JSON object");
  }
  else {
    err = checkStringParam(aCommand, "command", cmd, true);
  }
  if (Error::isOK(err)) {
    FOCUSOLOG("client %llu (%s): %s", (unsigned long long)aSession.mClientId, aSession.mUserName.c_str(), aCommand->json_c_str());
    response->add("type", JsonObject::newString(cmd+"_response"));
    if (cmd=="join_house") {
      err = joinHouse(aSession, aCommand, response);
    }
    else if (cmd=="leave_house") {
      err = leaveHouse(aSession, response);
    }
    else if (cmd=="logout") {
      err = logout(aSession, response);
    }
    else if (cmd=="query_house") {
      err = queryHouse(aSession, response);
    }
    else if (cmd=="query_room") {
      err = queryRoom(aSession, aCommand, response);
    }
    else if (cmd=="device_status") {
      err = deviceStatus(aSession, aCommand, response);
    }
    else if (cmd=="device_group_status") {
      err = groupDevices(aSession, aCommand, true, response);
    }
    else if (cmd=="list_house_devices") {
      err = listHouseDevices(aSession, response);
    }
    else if (cmd=="list_room_devices") {
      err = listRoomDevices(aSession, aCommand, response);
    }
    else if (cmd=="list_group_devices") {
      err = groupDevices(aSession, aCommand, false, response);
    }
    else if (cmd=="device_action") {
      err = deviceAction(aSession, aCommand, response);
    }
    else if (cmd=="device_group_action") {
      err = deviceGroupAction(aSession, aCommand, response);
    }
    else if (cmd=="alarm_action") {
      err = alarmAction(aSession, aCommand, response);
    }
    else if (cmd=="add_room") {
      err = addRoom(aSession, aCommand, response);
    }
    else if (cmd=="add_device") {
      err = addDevice(aSession, aCommand, response);
    }
    else if (cmd=="del_room") {
      err = delRoom(aSession, aCommand, response);
    }
    else if (cmd=="del_device") {
      err = delDevice(aSession, aCommand, response);
    }
    else {
      response->add("type", JsonObject::newString("error"));
      err = Error::err<HomeError>(HomeError::InvalidValue, "unknown command '%s'", cmd.c_str());
    }
  }
  else {
    response->add("type", JsonObject::newString("error"));
  }
  if (Error::isOK(err)) {
    response->add("status", JsonObject::newString("success"));
  }
  else {
    OLOG(LOG_INFO, "client %llu: command '%s' failed: %s", (unsigned long long)aSession.mClientId, cmd.c_str(), err->text());
    response->add("status", JsonObject::newString("error"));
    response->add("error", JsonObject::newString(HomeError::kindOf(err)));
    response->add("message", JsonObject::newString(err->text()));
  }
  return response;
}


void RequestDispatcher::clientDisconnected(ClientId aClientId)
{
  mSubscriptions.detach(aClientId);
  OLOG(LOG_INFO, "client %llu disconnected", (unsigned long long)aClientId);
}


ErrorPtr RequestDispatcher::checkRole(const ClientSession &aSession, UserRole aMinRole, const string &aCommand)
{
  if (!aSession.inHouse()) {
    return Error::err<HomeError>(HomeError::InvalidValue, "'%s' requires joining a house first", aCommand.c_str());
  }
  if (aSession.mRole<aMinRole) {
    return Error::err<HomeError>(HomeError::PermissionDenied, "user '%s' (%s) is not allowed to %s", aSession.mUserName.c_str(), userRoleName(aSession.mRole), aCommand.c_str());
  }
  return ErrorPtr();
}


void RequestDispatcher::fanOut(const ClientSession &aSession, ChangeEventPtr aEvent)
{
  if (!aEvent) return;
  mBroadcaster.broadcast(aEvent, mEchoToOriginator ? NO_CLIENT : aSession.mClientId);
}


// MARK: - session commands

ErrorPtr RequestDispatcher::joinHouse(ClientSession &aSession, JsonObjectPtr aCommand, JsonObjectPtr aResponse)
{
  HouseId houseId = 0;
  ErrorPtr err = getId(aCommand, "house_id", houseId);
  if (Error::notOK(err)) return err;
  ClientSession::HouseRolesMap::iterator pos = aSession.mHouseRoles.find(houseId);
  if (pos==aSession.mHouseRoles.end()) {
    return Error::err<HomeError>(HomeError::PermissionDenied, "user '%s' has no access to house #%u", aSession.mUserName.c_str(), houseId);
  }
  House house;
  err = mState.getHouseSnapshot(houseId, house);
  if (Error::notOK(err)) return err;
  mSubscriptions.join(houseId, aSession.mClientId);
  aSession.mHouseId = houseId;
  aSession.mRole = pos->second;
  aResponse->add("house_id", JsonObject::newInt64(houseId));
  aResponse->add("name", JsonObject::newString(house.mName));
  aResponse->add("role", JsonObject::newString(userRoleName(aSession.mRole)));
  aResponse->add("state", house.jsonObject());
  return ErrorPtr();
}


ErrorPtr RequestDispatcher::leaveHouse(ClientSession &aSession, JsonObjectPtr aResponse)
{
  if (!aSession.inHouse()) {
    return Error::err<HomeError>(HomeError::InvalidValue, "not in a house");
  }
  mSubscriptions.leave(aSession.mHouseId, aSession.mClientId);
  aResponse->add("house_id", JsonObject::newInt64(aSession.mHouseId));
  aSession.mHouseId = 0;
  aSession.mRole = role_guest;
  return ErrorPtr();
}


ErrorPtr RequestDispatcher::logout(ClientSession &aSession, JsonObjectPtr aResponse)
{
  mSubscriptions.detach(aSession.mClientId);
  OLOG(LOG_INFO, "user '%s' logged out from client %llu", aSession.mUserName.c_str(), (unsigned long long)aSession.mClientId);
  aSession.mHouseId = 0;
  aSession.mRole = role_guest;
  aSession.mHouseRoles.clear();
  aSession.mUserName.clear();
  return ErrorPtr();
}


// MARK: - queries

ErrorPtr RequestDispatcher::queryHouse(ClientSession &aSession, JsonObjectPtr aResponse)
{
  ErrorPtr err = checkRole(aSession, role_guest, "query_house");
  if (Error::notOK(err)) return err;
  House house;
  err = mState.getHouseSnapshot(aSession.mHouseId, house);
  if (Error::notOK(err)) return err;
  aResponse->add("house_id", JsonObject::newInt64(house.mHouseId));
  aResponse->add("state", house.jsonObject());
  return ErrorPtr();
}


ErrorPtr RequestDispatcher::queryRoom(ClientSession &aSession, JsonObjectPtr aCommand, JsonObjectPtr aResponse)
{
  ErrorPtr err = checkRole(aSession, role_guest, "query_room");
  if (Error::notOK(err)) return err;
  RoomId roomId = NO_ROOM;
  if (Error::notOK(err = getId(aCommand, "room_id", roomId))) return err;
  Room room;
  err = mState.getRoomSnapshot(aSession.mHouseId, roomId, room);
  if (Error::notOK(err)) return err;
  aResponse->add("room_id", JsonObject::newInt64(roomId));
  aResponse->add("state", room.jsonObject());
  return ErrorPtr();
}


ErrorPtr RequestDispatcher::deviceStatus(ClientSession &aSession, JsonObjectPtr aCommand, JsonObjectPtr aResponse)
{
  ErrorPtr err = checkRole(aSession, role_guest, "device_status");
  if (Error::notOK(err)) return err;
  RoomId roomId = NO_ROOM;
  DeviceId deviceId = NO_DEVICE;
  if (Error::notOK(err = getId(aCommand, "room_id", roomId))) return err;
  if (Error::notOK(err = getId(aCommand, "device_id", deviceId))) return err;
  Device dev;
  err = mState.getDeviceSnapshot(aSession.mHouseId, roomId, deviceId, dev);
  if (Error::notOK(err)) return err;
  aResponse->add("device", dev.jsonObject());
  return ErrorPtr();
}


ErrorPtr RequestDispatcher::groupDevices(ClientSession &aSession, JsonObjectPtr aCommand, bool aWithStatus, JsonObjectPtr aResponse)
{
  ErrorPtr err = checkRole(aSession, role_guest, aWithStatus ? "device_group_status" : "list_group_devices");
  if (Error::notOK(err)) return err;
  DeviceType type;
  if (Error::notOK(err = getDeviceType(aCommand, type))) return err;
  DeviceVector devices;
  err = mState.getGroupSnapshot(aSession.mHouseId, type, devices);
  if (Error::notOK(err)) return err;
  aResponse->add("device_type", JsonObject::newString(deviceTypeName(type)));
  aResponse->add("devices", devicesArray(devices, aWithStatus));
  return ErrorPtr();
}


ErrorPtr RequestDispatcher::listHouseDevices(ClientSession &aSession, JsonObjectPtr aResponse)
{
  ErrorPtr err = checkRole(aSession, role_guest, "list_house_devices");
  if (Error::notOK(err)) return err;
  House house;
  err = mState.getHouseSnapshot(aSession.mHouseId, house);
  if (Error::notOK(err)) return err;
  DeviceVector devices;
  house.allDevices(devices);
  aResponse->add("house_id", JsonObject::newInt64(house.mHouseId));
  aResponse->add("devices", devicesArray(devices, false));
  return ErrorPtr();
}


ErrorPtr RequestDispatcher::listRoomDevices(ClientSession &aSession, JsonObjectPtr aCommand, JsonObjectPtr aResponse)
{
  ErrorPtr err = checkRole(aSession, role_guest, "list_room_devices");
  if (Error::notOK(err)) return err;
  RoomId roomId = NO_ROOM;
  if (Error::notOK(err = getId(aCommand, "room_id", roomId))) return err;
  Room room;
  err = mState.getRoomSnapshot(aSession.mHouseId, roomId, room);
  if (Error::notOK(err)) return err;
  DeviceVector devices;
  room.allDevices(devices);
  aResponse->add("room_id", JsonObject::newInt64(roomId));
  aResponse->add("devices", devicesArray(devices, false));
  return ErrorPtr();
}


// MARK: - control

ErrorPtr RequestDispatcher::deviceAction(ClientSession &aSession, JsonObjectPtr aCommand, JsonObjectPtr aResponse)
{
  ErrorPtr err = checkRole(aSession, role_regular, "device_action");
  if (Error::notOK(err)) return err;
  RoomId roomId = NO_ROOM;
  DeviceId deviceId = NO_DEVICE;
  string action;
  if (Error::notOK(err = getId(aCommand, "room_id", roomId))) return err;
  if (Error::notOK(err = getId(aCommand, "device_id", deviceId))) return err;
  if (Error::notOK(err = checkStringParam(aCommand, "action", action, true))) return err;
  JsonObjectPtr params;
  aCommand->get("params", params);
  ChangeEventPtr ev;
  ChangeEventPtr alert;
  err = mState.applyDeviceAction(aSession.mHouseId, roomId, deviceId, action, params, ev, &alert);
  if (Error::notOK(err)) return err;
  aResponse->add("room_id", JsonObject::newInt64(roomId));
  aResponse->add("device_id", JsonObject::newInt64(deviceId));
  aResponse->add("device_type", JsonObject::newString(deviceTypeName(ev->mDeviceType)));
  aResponse->add("action", JsonObject::newString(action));
  aResponse->add("device_state", ev->mStatus);
  aResponse->add("seq", JsonObject::newInt64((int64_t)ev->mSeq));
  fanOut(aSession, ev);
  // alert goes to everyone, originator included
  if (alert) mBroadcaster.broadcast(alert);
  return ErrorPtr();
}


ErrorPtr RequestDispatcher::deviceGroupAction(ClientSession &aSession, JsonObjectPtr aCommand, JsonObjectPtr aResponse)
{
  ErrorPtr err = checkRole(aSession, role_regular, "device_group_action");
  if (Error::notOK(err)) return err;
  DeviceType type;
  string action;
  if (Error::notOK(err = getDeviceType(aCommand, type))) return err;
  if (Error::notOK(err = checkStringParam(aCommand, "action", action, true))) return err;
  JsonObjectPtr params;
  aCommand->get("params", params);
  GroupActionResult result;
  err = mState.applyGroupAction(aSession.mHouseId, type, action, params, result, false);
  if (Error::notOK(err)) return err;
  for (GroupActionOutcomes::iterator pos = result.mOutcomes.begin(); pos!=result.mOutcomes.end(); ++pos) {
    fanOut(aSession, pos->mEvent);
    if (pos->mSecurityAlert) mBroadcaster.broadcast(pos->mSecurityAlert);
  }
  aResponse->add("result", result.jsonObject());
  return ErrorPtr();
}


ErrorPtr RequestDispatcher::alarmAction(ClientSession &aSession, JsonObjectPtr aCommand, JsonObjectPtr aResponse)
{
  ErrorPtr err = checkRole(aSession, role_regular, "alarm_action");
  if (Error::notOK(err)) return err;
  string an;
  if (Error::notOK(err = checkStringParam(aCommand, "action", an, true))) return err;
  AlarmAction action;
  if (!alarmActionFromName(an, action)) {
    return Error::err<HomeError>(HomeError::InvalidValue, "unknown alarm action '%s'", an.c_str());
  }
  ChangeEventPtr ev;
  err = mState.setAlarm(aSession.mHouseId, action, ev);
  if (Error::notOK(err)) return err;
  aResponse->add("action", JsonObject::newString(alarmActionName(action)));
  aResponse->add("changed", JsonObject::newBool(ev.get()!=NULL));
  if (ev) {
    aResponse->add("alarm", ev->mStatus);
    fanOut(aSession, ev);
  }
  else {
    House house;
    if (Error::isOK(mState.getHouseSnapshot(aSession.mHouseId, house))) {
      aResponse->add("alarm", house.mAlarm.status());
    }
  }
  return ErrorPtr();
}


// MARK: - structure

ErrorPtr RequestDispatcher::addRoom(ClientSession &aSession, JsonObjectPtr aCommand, JsonObjectPtr aResponse)
{
  ErrorPtr err = checkRole(aSession, role_admin, "add_room");
  if (Error::notOK(err)) return err;
  string name;
  if (Error::notOK(err = checkStringParam(aCommand, "name", name, true))) return err;
  RoomId roomId = NO_ROOM;
  ChangeEventPtr ev;
  err = mState.addRoom(aSession.mHouseId, name, roomId, ev);
  if (Error::notOK(err)) return err;
  aResponse->add("room_id", JsonObject::newInt64(roomId));
  aResponse->add("name", JsonObject::newString(name));
  fanOut(aSession, ev);
  return ErrorPtr();
}


ErrorPtr RequestDispatcher::addDevice(ClientSession &aSession, JsonObjectPtr aCommand, JsonObjectPtr aResponse)
{
  ErrorPtr err = checkRole(aSession, role_admin, "add_device");
  if (Error::notOK(err)) return err;
  RoomId roomId = NO_ROOM;
  DeviceType type;
  if (Error::notOK(err = getId(aCommand, "room_id", roomId))) return err;
  if (Error::notOK(err = getDeviceType(aCommand, type))) return err;
  JsonObjectPtr attributes;
  aCommand->get("attributes", attributes);
  DeviceId deviceId = NO_DEVICE;
  ChangeEventPtr ev;
  err = mState.addDevice(aSession.mHouseId, roomId, type, attributes, deviceId, ev);
  if (Error::notOK(err)) return err;
  aResponse->add("room_id", JsonObject::newInt64(roomId));
  aResponse->add("device_id", JsonObject::newInt64(deviceId));
  aResponse->add("device_type", JsonObject::newString(deviceTypeName(type)));
  aResponse->add("device_state", ev->mStatus);
  fanOut(aSession, ev);
  return ErrorPtr();
}


ErrorPtr RequestDispatcher::delRoom(ClientSession &aSession, JsonObjectPtr aCommand, JsonObjectPtr aResponse)
{
  ErrorPtr err = checkRole(aSession, role_admin, "del_room");
  if (Error::notOK(err)) return err;
  RoomId roomId = NO_ROOM;
  if (Error::notOK(err = getId(aCommand, "room_id", roomId))) return err;
  ChangeEventPtr ev;
  err = mState.delRoom(aSession.mHouseId, roomId, ev);
  if (Error::notOK(err)) return err;
  aResponse->add("room_id", JsonObject::newInt64(roomId));
  fanOut(aSession, ev);
  return ErrorPtr();
}


ErrorPtr RequestDispatcher::delDevice(ClientSession &aSession, JsonObjectPtr aCommand, JsonObjectPtr aResponse)
{
  ErrorPtr err = checkRole(aSession, role_admin, "del_device");
  if (Error::notOK(err)) return err;
  RoomId roomId = NO_ROOM;
  DeviceId deviceId = NO_DEVICE;
  if (Error::notOK(err = getId(aCommand, "room_id", roomId))) return err;
  if (Error::notOK(err = getId(aCommand, "device_id", deviceId))) return err;
  ChangeEventPtr ev;
  err = mState.delDevice(aSession.mHouseId, roomId, deviceId, ev);
  if (Error::notOK(err)) return err;
  aResponse->add("room_id", JsonObject::newInt64(roomId));
  aResponse->add("device_id", JsonObject::newInt64(deviceId));
  fanOut(aSession, ev);
  return ErrorPtr();
}
