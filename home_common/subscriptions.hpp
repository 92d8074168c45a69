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

#ifndef __p44home__subscriptions__
#define __p44home__subscriptions__

#include "homedefs.hpp"

#include <pthread.h>

using namespace std;

namespace p44home {

  /// which client is subscribed to which house
  /// @note a client is subscribed to at most one house at a time. The registry has its own mutex,
  ///   independent from the house mutexes of SharedStateManager.
  class SubscriptionRegistry : public P44LoggingObj
  {
    typedef P44LoggingObj inherited;

    typedef set<ClientId> ClientSet;
    typedef map<HouseId, ClientSet> SubscribersMap;
    typedef map<ClientId, HouseId> MembershipMap;

    pthread_mutex_t mAccess;
    SubscribersMap mSubscribers;
    MembershipMap mMembership;

  public:

    SubscriptionRegistry();
    virtual ~SubscriptionRegistry();

    virtual string contextType() const P44_OVERRIDE { return "Subscriptions"; };

    /// subscribe a client to a house
    /// @note if the client was subscribed to another house, it is moved
    void join(HouseId aHouseId, ClientId aClientId);

    /// unsubscribe a client from a house
    /// @return false if the client was not subscribed to that house
    bool leave(HouseId aHouseId, ClientId aClientId);

    /// remove all subscriptions of a client (disconnect)
    void detach(ClientId aClientId);

    /// @return point-in-time copy of the subscribers of a house
    ClientIdList subscribersOf(HouseId aHouseId);

    /// @param aHouseId will be set to the house the client is subscribed to
    /// @return false if the client is not subscribed to any house
    bool houseOf(ClientId aClientId, HouseId &aHouseId);

  private:

    void removeLocked(ClientId aClientId, HouseId aHouseId);

  };

} // namespace p44home

#endif /* defined(__p44home__subscriptions__) */
