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

#ifndef __p44home__broadcaster__
#define __p44home__broadcaster__

#include "subscriptions.hpp"
#include "clientconnections.hpp"
#include "changeevent.hpp"

using namespace std;

namespace p44home {

  /// delivers messages to the subscribers of a house, or to all connected clients
  /// @note delivery failures are logged and counted, but never reported to the caller.
  ///   Failed clients stay subscribed, detaching is up to the transport (via the dispatcher).
  class Broadcaster : public P44LoggingObj
  {
    typedef P44LoggingObj inherited;

    SubscriptionRegistry &mSubscriptions;
    ClientConnections &mConnections;

    pthread_mutex_t mStatsAccess;
    uint64_t mDelivered;
    uint64_t mFailed;

  public:

    Broadcaster(SubscriptionRegistry &aSubscriptions, ClientConnections &aConnections);
    virtual ~Broadcaster();

    virtual string contextType() const P44_OVERRIDE { return "Broadcast"; };

    /// send a message to all subscribers of a house
    /// @param aHouseId the house
    /// @param aMessage the message text
    /// @param aExcludeClient client not to send the message to (usually the originator), NO_CLIENT for none
    /// @return number of clients the message was delivered to
    int broadcast(HouseId aHouseId, const string &aMessage, ClientId aExcludeClient = NO_CLIENT);

    /// send a change event to all subscribers of its house
    int broadcast(ChangeEventPtr aEvent, ClientId aExcludeClient = NO_CLIENT);

    /// send a message to every connected client (system wide notices)
    /// @return number of clients the message was delivered to
    int broadcastToAll(const string &aMessage);

    /// @name delivery statistics
    /// @{
    uint64_t deliveredCount();
    uint64_t failedCount();
    /// @return statistics as JSON object with "delivered" and "failed"
    JsonObjectPtr statistics();
    /// @}

  private:

    int deliver(const ClientIdList &aClients, const string &aMessage, ClientId aExcludeClient);

  };

} // namespace p44home

#endif /* defined(__p44home__broadcaster__) */
