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


#include "error.hpp"

#include <string.h>
#include <errno.h>

#include "utils.hpp"

using namespace dprobe;


string Error::description() const
{
  string d = errorMessage.empty() ? "Error" : errorMessage;
  string_format_append(d, " (%s:%ld)", getErrorDomain(), errorCode);
  return d;
}


bool Error::isDomain(const char *aDomain) const
{
  return aDomain && strcmp(aDomain, getErrorDomain())==0;
}


string Error::text(ErrorPtr aError)
{
  return isOK(aError) ? "OK" : aError->description();
}


SysError::SysError(int aErrNo, const char *aContextMessage) :
  Error(aErrNo, string_format("%s%s", nonNullCStr(aContextMessage), nonNullCStr(strerror(aErrNo))))
{
}


ErrorPtr SysError::errNo(const char *aContextMessage)
{
  return err(errno, aContextMessage);
}


ErrorPtr SysError::err(int aErrNo, const char *aContextMessage)
{
  if (aErrNo==0) return ErrorPtr();
  return ErrorPtr(new SysError(aErrNo, aContextMessage));
}


ErrorPtr TextError::err(const char *aFormat, ...)
{
  va_list args;
  va_start(args, aFormat);
  string msg;
  string_format_v(msg, false, aFormat, args);
  va_end(args);
  return ErrorPtr(new TextError(msg));
}
