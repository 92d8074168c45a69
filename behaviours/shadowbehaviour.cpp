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

#include "shadowbehaviour.hpp"

using namespace p44home;


// MARK: - BlindsState

BlindsState::BlindsState() :
  mUp(true),
  mOpen(false)
{
}


// MARK: - shadow behaviour

ErrorPtr p44home::configureBlinds(BlindsState &aBlinds, JsonObjectPtr aAttributes)
{
  BlindsState newState = aBlinds;
  ErrorPtr err;
  if (Error::notOK(err = checkBoolParam(aAttributes, "up", newState.mUp))) return err;
  if (Error::notOK(err = checkBoolParam(aAttributes, "open", newState.mOpen))) return err;
  aBlinds = newState;
  return ErrorPtr();
}


ErrorPtr p44home::performBlindsAction(BlindsState &aBlinds, const string &aAction, JsonObjectPtr aParams)
{
  if (aAction=="up" || aAction=="down") {
    aBlinds.mUp = aAction=="up";
  }
  else if (aAction=="toggle") {
    aBlinds.mUp = !aBlinds.mUp;
  }
  else if (aAction=="open" || aAction=="close") {
    aBlinds.mOpen = aAction=="open";
  }
  else if (aAction=="shutter") {
    aBlinds.mOpen = !aBlinds.mOpen;
  }
  else {
    return Error::err<HomeError>(HomeError::InvalidValue, "unknown blinds action '%s'", aAction.c_str());
  }
  return ErrorPtr();
}


void p44home::addBlindsStatus(const BlindsState &aBlinds, JsonObjectPtr aStatus)
{
  aStatus->add("up", JsonObject::newBool(aBlinds.mUp));
  aStatus->add("open", JsonObject::newBool(aBlinds.mOpen));
}
