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

#ifndef __p44home__hometestutils__
#define __p44home__hometestutils__

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "clientconnections.hpp"
#include "homeerror.hpp"

#include <pthread.h>

using namespace p44home;

namespace p44home {
namespace test {

  /// parse JSON text, fails the test if it is not valid
  inline JsonObjectPtr J(const char *aText)
  {
    ErrorPtr err;
    JsonObjectPtr j = JsonObject::objFromText(aText, -1, &err);
    EXPECT_TRUE(Error::isOK(err)) << "invalid test JSON: " << aText;
    return j;
  }

  inline string kindOf(ErrorPtr aErr)
  {
    return HomeError::kindOf(aErr);
  }

  inline int intField(JsonObjectPtr aObj, const char *aKey)
  {
    JsonObjectPtr o;
    if (!aObj || !aObj->get(aKey, o)) return -1;
    return o->int32Value();
  }

  inline bool boolField(JsonObjectPtr aObj, const char *aKey)
  {
    JsonObjectPtr o;
    if (!aObj || !aObj->get(aKey, o)) return false;
    return o->boolValue();
  }

  inline string stringField(JsonObjectPtr aObj, const char *aKey)
  {
    JsonObjectPtr o;
    if (!aObj || !aObj->get(aKey, o)) return "";
    return o->stringValue();
  }

  inline JsonObjectPtr objField(JsonObjectPtr aObj, const char *aKey)
  {
    JsonObjectPtr o;
    if (!aObj || !aObj->get(aKey, o)) return JsonObjectPtr();
    return o;
  }


  /// connection table that records what was sent, as the transport would
  class RecordingConnections : public ClientConnections
  {
    pthread_mutex_t mAccess;
    map<ClientId, vector<string> > mSent;

  public:

    set<ClientId> mConnected;
    set<ClientId> mBroken; ///< sending to these fails

    RecordingConnections() { pthread_mutex_init(&mAccess, NULL); };
    virtual ~RecordingConnections() { pthread_mutex_destroy(&mAccess); };

    virtual ErrorPtr sendToClient(ClientId aClientId, const string &aMessage) P44_OVERRIDE
    {
      if (mBroken.count(aClientId)) {
        return TextError::err("client %llu: connection broken", (unsigned long long)aClientId);
      }
      pthread_mutex_lock(&mAccess);
      mSent[aClientId].push_back(aMessage);
      pthread_mutex_unlock(&mAccess);
      return ErrorPtr();
    }

    virtual ClientIdList connectedClients() P44_OVERRIDE
    {
      return ClientIdList(mConnected.begin(), mConnected.end());
    }

    vector<string> sentTo(ClientId aClientId)
    {
      pthread_mutex_lock(&mAccess);
      vector<string> msgs = mSent[aClientId];
      pthread_mutex_unlock(&mAccess);
      return msgs;
    }

    /// @return parsed messages sent to a client that have the given "type"
    vector<JsonObjectPtr> eventsTo(ClientId aClientId, const string &aType)
    {
      vector<JsonObjectPtr> evs;
      vector<string> msgs = sentTo(aClientId);
      for (vector<string>::iterator pos = msgs.begin(); pos!=msgs.end(); ++pos) {
        JsonObjectPtr m = JsonObject::objFromText(pos->c_str());
        if (m && stringField(m, "type")==aType) evs.push_back(m);
      }
      return evs;
    }

  };


  class MockConnections : public ClientConnections
  {
  public:
    MOCK_METHOD(ErrorPtr, sendToClient, (ClientId aClientId, const string &aMessage), (override));
    MOCK_METHOD(ClientIdList, connectedClients, (), (override));
  };

} // namespace test
} // namespace p44home

#endif /* defined(__p44home__hometestutils__) */
