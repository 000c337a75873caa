//
//  Copyright (c) 2013-2016 plan44.ch / Lukas Zeller, Zurich, Switzerland
//
//  Author: Lukas Zeller <luz@plan44.ch>
//
//  This file is part of dprobe.
//
//  dprobe is free software: you can redistribute it and/or modify
//  it under the terms of the GNU General Public License as published by
//  the Free Software Foundation, either version 3 of the License, or
//  (at your option) any later version.
//
//  dprobe is distributed in the hope that it will be useful,
//  but WITHOUT ANY WARRANTY; without even the implied warranty of
//  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//  GNU General Public License for more details.
//
//  You should have received a copy of the GNU General Public License
//  along with dprobe. If not, see <http://www.gnu.org/licenses/>.
//


#ifndef __dprobe__utils__
#define __dprobe__utils__

#include <string>
#include <stdarg.h>
#include <stdint.h>
#include <time.h>

using namespace std;

namespace dprobe {

  /// printf-style format into a new string
  std::string string_format(const char *aFormat, ...);

  /// printf-style format appended to aStringToAppendTo
  void string_format_append(std::string &aStringToAppendTo, const char *aFormat, ...);

  /// va_list variant of string_format
  /// @param aAppend if set, output is appended to aStringObj, otherwise aStringObj is replaced
  void string_format_v(std::string &aStringObj, bool aAppend, const char *aFormat, va_list aArgs);

  /// @return aNULLOrCStr, or an empty string for NULL
  const char *nonNullCStr(const char *aNULLOrCStr);

  string trimWhiteSpace(const string &aString, bool aLeading = true, bool aTrailing = true);

  /// @return aString padded with spaces to aMinLength, longer strings unmodified
  string padToMinLength(const string &aString, size_t aMinLength);

  /// @return true if aString begins with aPrefix, always true for an empty prefix
  bool hasPrefix(const string &aString, const string &aPrefix);

  /// split "host" or "host:port"
  /// @param aHostSpec host name or IPv4 address, optionally followed by a colon and a port number
  /// @param aHostName set to the host part
  /// @param aPortNumber set to the port if aHostSpec has one, left unchanged otherwise
  /// @return false if the host is empty or the port is not a number in 1..65535
  bool splitHost(const string &aHostSpec, string &aHostName, uint16_t &aPortNumber);

  /// @return aTime in local time, formatted by strftime()
  string localTimeString(const char *aFormat, time_t aTime);

} // namespace dprobe

#endif /* defined(__dprobe__utils__) */
