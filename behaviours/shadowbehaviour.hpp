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

#ifndef __p44home__shadowbehaviour__
#define __p44home__shadowbehaviour__

#include "actionparams.hpp"

using namespace std;

namespace p44home {

  /// state of blinds
  class BlindsState
  {
  public:

    bool mUp; ///< blinds are pulled up
    bool mOpen; ///< slats are open

    BlindsState();

  };

  /// configure new blinds from creation attributes "up", "open"
  ErrorPtr configureBlinds(BlindsState &aBlinds, JsonObjectPtr aAttributes);

  /// perform a blinds action: "up", "down", "toggle", "open", "close", "shutter"
  ErrorPtr performBlindsAction(BlindsState &aBlinds, const string &aAction, JsonObjectPtr aParams);

  void addBlindsStatus(const BlindsState &aBlinds, JsonObjectPtr aStatus);

} // namespace p44home

#endif /* defined(__p44home__shadowbehaviour__) */
