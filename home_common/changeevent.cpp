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

#include "changeevent.hpp"

using namespace p44home;


static const char *eventTypeNames[numEventTypes] = {
  "device_update",
  "room_added",
  "room_deleted",
  "device_added",
  "device_deleted",
  "alarm_update",
  "security_alert"
};


const char *p44home::eventTypeName(EventType aEventType)
{
  if (aEventType<0 || aEventType>=numEventTypes) return "unknown";
  return eventTypeNames[aEventType];
}


// MARK: - ChangeEvent

ChangeEvent::ChangeEvent(EventType aEventType, HouseId aHouseId, uint64_t aSeq) :
  mEventType(aEventType),
  mHouseId(aHouseId),
  mRoomId(NO_ROOM),
  mDeviceId(NO_DEVICE),
  mDeviceType(devicetype_lamp),
  mSeq(aSeq)
{
}


ChangeEventPtr ChangeEvent::deviceEvent(EventType aEventType, HouseId aHouseId, uint64_t aSeq, const Device &aDevice, const string &aAction)
{
  ChangeEventPtr ev = ChangeEventPtr(new ChangeEvent(aEventType, aHouseId, aSeq));
  ev->mRoomId = aDevice.mRoomId;
  ev->mDeviceId = aDevice.mDeviceId;
  ev->mDeviceType = aDevice.mType;
  ev->mAction = aAction;
  ev->mStatus = aDevice.status();
  return ev;
}


JsonObjectPtr ChangeEvent::jsonObject() const
{
  JsonObjectPtr e = JsonObject::newObj();
  e->add("type", JsonObject::newString(eventTypeName(mEventType)));
  e->add("house_id", JsonObject::newInt64(mHouseId));
  if (mRoomId!=NO_ROOM) e->add("room_id", JsonObject::newInt64(mRoomId));
  if (mDeviceId!=NO_DEVICE) {
    e->add("device_id", JsonObject::newInt64(mDeviceId));
    e->add("device_type", JsonObject::newString(deviceTypeName(mDeviceType)));
  }
  if (!mAction.empty()) e->add("action", JsonObject::newString(mAction));
  e->add("seq", JsonObject::newInt64((int64_t)mSeq));
  if (mStatus) e->add("status", mStatus);
  return e;
}


string ChangeEvent::text() const
{
  return jsonObject()->json_str();
}


// MARK: - GroupActionResult

GroupActionResult::GroupActionResult() :
  mDeviceType(devicetype_lamp)
{
}


int GroupActionResult::successes() const
{
  int n = 0;
  for (GroupActionOutcomes::const_iterator pos = mOutcomes.begin(); pos!=mOutcomes.end(); ++pos) {
    if (Error::isOK(pos->mError)) n++;
  }
  return n;
}


int GroupActionResult::failures() const
{
  return (int)mOutcomes.size()-successes();
}


JsonObjectPtr GroupActionResult::jsonObject() const
{
  JsonObjectPtr r = JsonObject::newObj();
  r->add("device_type", JsonObject::newString(deviceTypeName(mDeviceType)));
  r->add("action", JsonObject::newString(mAction));
  r->add("succeeded", JsonObject::newInt32(successes()));
  r->add("failed", JsonObject::newInt32(failures()));
  JsonObjectPtr results = JsonObject::newArray();
  for (GroupActionOutcomes::const_iterator pos = mOutcomes.begin(); pos!=mOutcomes.end(); ++pos) {
    JsonObjectPtr o = JsonObject::newObj();
    o->add("room_id", JsonObject::newInt64(pos->mRoomId));
    o->add("device_id", JsonObject::newInt64(pos->mDeviceId));
    if (Error::isOK(pos->mError)) {
      if (pos->mEvent && pos->mEvent->mStatus) o->add("status", pos->mEvent->mStatus);
    }
    else {
      o->add("error", JsonObject::newString(HomeError::kindOf(pos->mError)));
      o->add("message", JsonObject::newString(pos->mError->text()));
    }
    results->arrayAppend(o);
  }
  r->add("results", results);
  return r;
}
