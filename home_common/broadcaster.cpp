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

#include "broadcaster.hpp"

#include <stdexcept>

using namespace p44home;


Broadcaster::Broadcaster(SubscriptionRegistry &aSubscriptions, ClientConnections &aConnections) :
  mSubscriptions(aSubscriptions),
  mConnections(aConnections),
  mDelivered(0),
  mFailed(0)
{
  pthread_mutex_init(&mStatsAccess, NULL);
}


Broadcaster::~Broadcaster()
{
  pthread_mutex_destroy(&mStatsAccess);
}


int Broadcaster::deliver(const ClientIdList &aClients, const string &aMessage, ClientId aExcludeClient)
{
  int delivered = 0;
  int failed = 0;
  for (ClientIdList::const_iterator pos = aClients.begin(); pos!=aClients.end(); ++pos) {
    ClientId client = *pos;
    if (aExcludeClient!=NO_CLIENT && client==aExcludeClient) continue;
    ErrorPtr err;
    try {
      err = mConnections.sendToClient(client, aMessage);
    }
    catch (std::exception &e) {
      err = TextError::err("exception while sending: %s", e.what());
    }
    if (Error::isOK(err)) {
      FOCUSOLOG("delivered to client %llu", (unsigned long long)client);
      delivered++;
    }
    else {
      OLOG(LOG_WARNING, "delivery to client %llu failed: %s", (unsigned long long)client, err->text());
      failed++;
    }
  }
  pthread_mutex_lock(&mStatsAccess);
  mDelivered += delivered;
  mFailed += failed;
  pthread_mutex_unlock(&mStatsAccess);
  return delivered;
}


int Broadcaster::broadcast(HouseId aHouseId, const string &aMessage, ClientId aExcludeClient)
{
  ClientIdList clients = mSubscriptions.subscribersOf(aHouseId);
  OLOG(LOG_DEBUG, "broadcasting to %lu subscribers of house #%u: %s", clients.size(), aHouseId, aMessage.c_str());
  return deliver(clients, aMessage, aExcludeClient);
}


int Broadcaster::broadcast(ChangeEventPtr aEvent, ClientId aExcludeClient)
{
  if (!aEvent) return 0;
  return broadcast(aEvent->mHouseId, aEvent->text(), aExcludeClient);
}


int Broadcaster::broadcastToAll(const string &aMessage)
{
  ClientIdList clients = mConnections.connectedClients();
  OLOG(LOG_DEBUG, "broadcasting to all %lu connected clients: %s", clients.size(), aMessage.c_str());
  return deliver(clients, aMessage, NO_CLIENT);
}


uint64_t Broadcaster::deliveredCount()
{
  pthread_mutex_lock(&mStatsAccess);
  uint64_t n = mDelivered;
  pthread_mutex_unlock(&mStatsAccess);
  return n;
}


uint64_t Broadcaster::failedCount()
{
  pthread_mutex_lock(&mStatsAccess);
  uint64_t n = mFailed;
  pthread_mutex_unlock(&mStatsAccess);
  return n;
}


JsonObjectPtr Broadcaster::statistics()
{
  JsonObjectPtr s = JsonObject::newObj();
  s->add("delivered", JsonObject::newInt64((int64_t)deliveredCount()));
  s->add("failed", JsonObject::newInt64((int64_t)failedCount()));
  return s;
}
