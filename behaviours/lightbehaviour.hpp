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

#ifndef __p44home__lightbehaviour__
#define __p44home__lightbehaviour__

#include "actionparams.hpp"

using namespace std;

namespace p44home {

  /// state of a light (Lamp or CeilingLight)
  class LightState
  {
  public:

    bool mOn; ///< light is on
    int mBrightness; ///< brightness 0..100
    string mColor; ///< one of the supported color names, lowercase

    LightState();

  };


  /// @return true if aColor (case insensitive) is a supported light color
  bool isLightColor(const string &aColor);

  /// @return comma separated list of supported colors, for messages
  string lightColorList();

  /// configure a newly created light from creation attributes
  /// @param aLight the light state to configure (must be in default state)
  /// @param aAttributes object with optional "on", "brightness", "color"
  /// @return InvalidValue if any attribute is out of its domain. aLight is not modified in this case
  ErrorPtr configureLight(LightState &aLight, JsonObjectPtr aAttributes);

  /// perform a light action
  /// @param aLight the light state
  /// @param aAction one of "on", "off", "toggle", "dim" (param "level"), "color" (param "color"),
  ///   "set" (any of "on", "brightness", "color")
  /// @param aParams action parameters, may be NULL for actions without parameters
  /// @return InvalidValue for unknown actions or bad parameters. aLight is not modified in this case
  ErrorPtr performLightAction(LightState &aLight, const string &aAction, JsonObjectPtr aParams);

  /// add light status attributes to aStatus
  void addLightStatus(const LightState &aLight, JsonObjectPtr aStatus);

} // namespace p44home

#endif /* defined(__p44home__lightbehaviour__) */
