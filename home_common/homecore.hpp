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

#ifndef __p44home__homecore__
#define __p44home__homecore__

#include "homesettings.hpp"
#include "dispatcher.hpp"

using namespace std;

namespace p44home {

  /// the assembled home state core: shared state, subscriptions, broadcaster and dispatcher.
  /// One instance is created by the server and passed by reference to all client handlers.
  class HomeCore
  {
    HomeSettings mSettings;
    SharedStateManager mState;
    SubscriptionRegistry mSubscriptions;
    Broadcaster mBroadcaster;
    RequestDispatcher mDispatcher;

  public:

    /// @param aSettings the settings, log level is applied on construction
    /// @param aConnections the connection table of the transport, must outlive the core
    HomeCore(const HomeSettings &aSettings, ClientConnections &aConnections);

    const HomeSettings &settings() const { return mSettings; };
    SharedStateManager &state() { return mState; };
    SubscriptionRegistry &subscriptions() { return mSubscriptions; };
    Broadcaster &broadcaster() { return mBroadcaster; };
    RequestDispatcher &dispatcher() { return mDispatcher; };

    /// @return diagnostic status: settings, registered houses and delivery statistics
    JsonObjectPtr status();

  };

} // namespace p44home

#endif /* defined(__p44home__homecore__) */
