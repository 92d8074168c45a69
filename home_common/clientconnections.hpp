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

#ifndef __p44home__clientconnections__
#define __p44home__clientconnections__

#include "homedefs.hpp"

using namespace std;

namespace p44home {

  /// the connection table of the transport, as seen by the home state core
  /// @note implementations must be callable from any client worker thread
  class ClientConnections
  {
  public:

    virtual ~ClientConnections() {};

    /// send a message to a connected client
    /// @param aClientId the client
    /// @param aMessage the message text (a JSON object)
    /// @return error if the message could not be delivered (e.g. client disconnected meanwhile)
    virtual ErrorPtr sendToClient(ClientId aClientId, const string &aMessage) = 0;

    /// @return all currently connected clients
    virtual ClientIdList connectedClients() = 0;

  };

} // namespace p44home

#endif /* defined(__p44home__clientconnections__) */
