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

#include "homecore.hpp"

using namespace p44home;


HomeCore::HomeCore(const HomeSettings &aSettings, ClientConnections &aConnections) :
  mSettings(aSettings),
  mState(aSettings.mAlarmThreshold),
  mBroadcaster(mSubscriptions, aConnections),
  mDispatcher(mState, mSubscriptions, mBroadcaster, aSettings.mEchoToOriginator)
{
  mSettings.applyLogLevel();
  mState.setSecurityBroadcaster(&mBroadcaster);
  LOG(LOG_NOTICE, "home state core ready, event format version %d, default alarm threshold %d", P44HOME_EVENT_FORMAT_VERSION, mSettings.mAlarmThreshold);
}


JsonObjectPtr HomeCore::status()
{
  JsonObjectPtr s = JsonObject::newObj();
  s->add("settings", mSettings.jsonObject());
  JsonObjectPtr houses = JsonObject::newArray();
  HouseIdList ids = mState.houseIds();
  for (HouseIdList::iterator pos = ids.begin(); pos!=ids.end(); ++pos) {
    houses->arrayAppend(JsonObject::newInt64(*pos));
  }
  s->add("houses", houses);
  s->add("delivery", mBroadcaster.statistics());
  return s;
}
