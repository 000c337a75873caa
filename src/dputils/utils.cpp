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


#include "utils.hpp"

#include <stdio.h>
#include <stdlib.h>
#include <ctype.h>
#include <vector>

using namespace dprobe;


void dprobe::string_format_v(std::string &aStringObj, bool aAppend, const char *aFormat, va_list aArgs)
{
  if (!aAppend) aStringObj.clear();
  std::vector<char> buf(256);
  while (true) {
    // vsnprintf consumes the va_list, each attempt needs its own copy
    va_list args;
    va_copy(args, aArgs);
    int n = vsnprintf(&buf[0], buf.size(), aFormat, args);
    va_end(args);
    if (n<0) return; // format error, nothing to add
    if ((size_t)n<buf.size()) {
      aStringObj.append(&buf[0], (size_t)n);
      return;
    }
    buf.resize((size_t)n+1);
  }
}


std::string dprobe::string_format(const char *aFormat, ...)
{
  va_list args;
  va_start(args, aFormat);
  std::string s;
  string_format_v(s, false, aFormat, args);
  va_end(args);
  return s;
}


void dprobe::string_format_append(std::string &aStringToAppendTo, const char *aFormat, ...)
{
  va_list args;
  va_start(args, aFormat);
  string_format_v(aStringToAppendTo, true, aFormat, args);
  va_end(args);
}


const char *dprobe::nonNullCStr(const char *aNULLOrCStr)
{
  return aNULLOrCStr ? aNULLOrCStr : "";
}


string dprobe::trimWhiteSpace(const string &aString, bool aLeading, bool aTrailing)
{
  size_t b = 0;
  size_t e = aString.size();
  if (aLeading) while (b<e && isspace((unsigned char)aString[b])) b++;
  if (aTrailing) while (e>b && isspace((unsigned char)aString[e-1])) e--;
  return aString.substr(b, e-b);
}


string dprobe::padToMinLength(const string &aString, size_t aMinLength)
{
  string s = aString;
  if (s.size()<aMinLength) s.resize(aMinLength, ' ');
  return s;
}


bool dprobe::hasPrefix(const string &aString, const string &aPrefix)
{
  return aString.size()>=aPrefix.size() && aString.compare(0, aPrefix.size(), aPrefix)==0;
}


bool dprobe::splitHost(const string &aHostSpec, string &aHostName, uint16_t &aPortNumber)
{
  size_t colon = aHostSpec.find(':');
  if (colon==string::npos) {
    if (aHostSpec.empty()) return false;
    aHostName = aHostSpec;
    return true;
  }
  // one colon only, no IPv6 literals
  if (aHostSpec.find(':', colon+1)!=string::npos) return false;
  string portText = aHostSpec.substr(colon+1);
  if (portText.empty() || portText.find_first_not_of("0123456789")!=string::npos || portText.size()>5) return false;
  long port = strtol(portText.c_str(), NULL, 10);
  if (port<1 || port>0xFFFF) return false;
  if (colon==0) return false;
  aHostName = aHostSpec.substr(0, colon);
  aPortNumber = (uint16_t)port;
  return true;
}


string dprobe::localTimeString(const char *aFormat, time_t aTime)
{
  struct tm tim;
  char buf[80];
  localtime_r(&aTime, &tim);
  size_t n = strftime(buf, sizeof(buf), aFormat, &tim);
  return string(buf, n);
}
