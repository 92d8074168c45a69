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

#ifndef __p44home__homeerror__
#define __p44home__homeerror__

#include "homedefs.hpp"

using namespace std;

namespace p44home {

  /// errors reported by the home state core
  /// @note none of these is fatal, they are always returned to the caller of the operation
  class HomeError : public Error
  {
  public:
    // Errors
    typedef enum {
      OK,
      NotFound, ///< house/room/device does not exist
      InvalidValue, ///< attribute, parameter or action out of the allowed domain
      Duplicate, ///< id collision, or second instance of a per-room unique device type
      AlarmActive, ///< action refused because the house alarm is triggered
      PermissionDenied, ///< caller's role does not allow the operation
      numErrorCodes
    } ErrorCodes;

    static const char *domain() { return "Home"; }
    virtual const char *getErrorDomain() const P44_OVERRIDE { return HomeError::domain(); };
    HomeError(ErrorCodes aError) : Error(ErrorCode(aError)) {};

    /// @return kind name of an error code, as used on the wire ("not-found", "invalid-value"...)
    static const char *kindName(ErrorCodes aErrorCode);

    /// @return kind name for any error: "ok" for no error, "internal" for errors from other domains
    static const char *kindOf(ErrorPtr aError);

    /// @return true if aError is a HomeError with the given code
    static bool isKind(ErrorPtr aError, ErrorCodes aErrorCode) { return Error::isError(aError, domain(), aErrorCode); }

    #if ENABLE_NAMED_ERRORS
  protected:
    virtual const char* errorName() const P44_OVERRIDE { return errNames[getErrorCode()]; };
  private:
    static constexpr const char* const errNames[numErrorCodes] = {
      "OK",
      "NotFound",
      "InvalidValue",
      "Duplicate",
      "AlarmActive",
      "PermissionDenied",
    };
    #endif // ENABLE_NAMED_ERRORS
  };

} // namespace p44home

#endif /* defined(__p44home__homeerror__) */
