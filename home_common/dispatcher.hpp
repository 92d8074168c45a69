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

#ifndef __p44home__dispatcher__
#define __p44home__dispatcher__

#include "sharedstate.hpp"
#include "subscriptions.hpp"
#include "broadcaster.hpp"

using namespace std;

namespace p44home {

  /// per connection session data, owned by the client's worker thread
  /// @note user name and the roles per house are established by the authentication collaborator
  class ClientSession
  {
  public:
    typedef map<HouseId, UserRole> HouseRolesMap;

    ClientId mClientId;
    string mUserName;
    HouseRolesMap mHouseRoles; ///< houses this user has access to, with the user's role there
    HouseId mHouseId; ///< house currently joined, 0 if none
    UserRole mRole; ///< role in the currently joined house

    ClientSession();
    ClientSession(ClientId aClientId, const string &aUserName);

    /// @return true if a house is currently joined
    bool inHouse() const { return mHouseId!=0; };
  };


  /// decodes client commands, checks roles, calls the shared state manager and fans out the resulting change events
  class RequestDispatcher : public P44LoggingObj
  {
    typedef P44LoggingObj inherited;

    SharedStateManager &mState;
    SubscriptionRegistry &mSubscriptions;
    Broadcaster &mBroadcaster;
    bool mEchoToOriginator; ///< if set, change events are also sent to the client that caused them

  public:

    RequestDispatcher(SharedStateManager &aState, SubscriptionRegistry &aSubscriptions, Broadcaster &aBroadcaster, bool aEchoToOriginator);

    virtual string contextType() const P44_OVERRIDE { return "Dispatcher"; };

    /// process a command
    /// @param aSession the session of the client sending the command. join_house, leave_house and logout update it
    /// @param aCommand JSON object with "command" and command specific fields
    /// @return response object with "type", "status" ("success" or "error") and, in case of error,
    ///   "error" (kind) and "message"
    JsonObjectPtr dispatch(ClientSession &aSession, JsonObjectPtr aCommand);

    /// process a command in JSON text form
    /// @return response object, an "error" response with kind invalid-value when aText is not a JSON object
    JsonObjectPtr dispatchText(ClientSession &aSession, const string &aText);

    /// must be called by the transport when a client connection has gone away
    void clientDisconnected(ClientId aClientId);

  private:

    ErrorPtr checkRole(const ClientSession &aSession, UserRole aMinRole, const string &aCommand);
    void fanOut(const ClientSession &aSession, ChangeEventPtr aEvent);

    ErrorPtr joinHouse(ClientSession &aSession, JsonObjectPtr aCommand, JsonObjectPtr aResponse);
    ErrorPtr leaveHouse(ClientSession &aSession, JsonObjectPtr aResponse);
    ErrorPtr logout(ClientSession &aSession, JsonObjectPtr aResponse);
    ErrorPtr queryHouse(ClientSession &aSession, JsonObjectPtr aResponse);
    ErrorPtr queryRoom(ClientSession &aSession, JsonObjectPtr aCommand, JsonObjectPtr aResponse);
    ErrorPtr deviceStatus(ClientSession &aSession, JsonObjectPtr aCommand, JsonObjectPtr aResponse);
    ErrorPtr groupDevices(ClientSession &aSession, JsonObjectPtr aCommand, bool aWithStatus, JsonObjectPtr aResponse);
    ErrorPtr listHouseDevices(ClientSession &aSession, JsonObjectPtr aResponse);
    ErrorPtr listRoomDevices(ClientSession &aSession, JsonObjectPtr aCommand, JsonObjectPtr aResponse);
    ErrorPtr deviceAction(ClientSession &aSession, JsonObjectPtr aCommand, JsonObjectPtr aResponse);
    ErrorPtr deviceGroupAction(ClientSession &aSession, JsonObjectPtr aCommand, JsonObjectPtr aResponse);
    ErrorPtr alarmAction(ClientSession &aSession, JsonObjectPtr aCommand, JsonObjectPtr aResponse);
    ErrorPtr addRoom(ClientSession &aSession, JsonObjectPtr aCommand, JsonObjectPtr aResponse);
    ErrorPtr addDevice(ClientSession &aSession, JsonObjectPtr aCommand, JsonObjectPtr aResponse);
    ErrorPtr delRoom(ClientSession &aSession, JsonObjectPtr aCommand, JsonObjectPtr aResponse);
    ErrorPtr delDevice(ClientSession &aSession, JsonObjectPtr aCommand, JsonObjectPtr aResponse);

  };

} // namespace p44home

#endif /* defined(__p44home__dispatcher__) */
