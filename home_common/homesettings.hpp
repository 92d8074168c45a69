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

#ifndef __p44home__homesettings__
#define __p44home__homesettings__

#include "homeerror.hpp"

using namespace std;

namespace p44home {

  /// runtime settings of the home state core
  class HomeSettings
  {
  public:

    int mAlarmThreshold; ///< default alarm threshold for houses that do not specify one (>=1)
    bool mEchoToOriginator; ///< if set, change events are also sent to the client that caused them
    int mLogLevel; ///< log level (0..7)

    HomeSettings();

    /// load settings from a JSON object
    /// @param aSettings object with optional "alarmThreshold", "echoToOriginator", "logLevel". Unknown keys are ignored
    /// @return InvalidValue if a value is out of range. Settings are unchanged in case of error
    ErrorPtr loadFromJson(JsonObjectPtr aSettings);

    /// load settings from a JSON file
    ErrorPtr loadFromFile(const string &aFilePath);

    /// apply the log level to the global logger
    void applyLogLevel() const;

    /// @return current settings as JSON object
    JsonObjectPtr jsonObject() const;

  };

} // namespace p44home

#endif /* defined(__p44home__homesettings__) */
