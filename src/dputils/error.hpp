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

#ifndef __dprobe__error__
#define __dprobe__error__

#include <string>
#include <stdint.h>
#include "dpobj.hpp"

using namespace std;

namespace dprobe {

  typedef long ErrorCode;

  /// codes of the base domain, subclasses define their own with 0 meaning OK
  typedef enum {
    ErrorOK,
    ErrorNotOK
  } CommonErrors;


  class Error;
  typedef boost::intrusive_ptr<Error> ErrorPtr;

  /// error with a code that is unique within its domain, and an optional message
  /// @note an empty ErrorPtr and an error with code 0 both mean OK
  class Error : public DpObj
  {
    ErrorCode errorCode;
    string errorMessage;

  public:

    Error(ErrorCode aErrorCode, const std::string &aErrorMessage = "") :
      errorCode(aErrorCode),
      errorMessage(aErrorMessage)
    {};

    static const char *domain() { return "Error"; };

    /// @return domain of the actual error class, compared by content
    virtual const char *getErrorDomain() const { return Error::domain(); };

    ErrorCode getErrorCode() const { return errorCode; };

    /// @return message, or "Error" when none was set, followed by domain and code
    virtual std::string description() const;

    bool isDomain(const char *aDomain) const;

    /// @param aDomain NULL matches any domain
    bool isError(const char *aDomain, ErrorCode aErrorCode) const { return aErrorCode==errorCode && (aDomain==NULL || isDomain(aDomain)); };
    static bool isError(ErrorPtr aError, const char *aDomain, ErrorCode aErrorCode) { return aError && aError->isError(aDomain, aErrorCode); };

    static bool isOK(ErrorPtr aError) { return !aError || aError->errorCode==0; };

    /// @return description, "OK" for an OK error
    static string text(ErrorPtr aError);
  };


  /// errno based error, message is the context followed by strerror()
  class SysError : public Error
  {
  public:
    static const char *domain() { return "System"; };
    virtual const char *getErrorDomain() const { return SysError::domain(); };

    SysError(int aErrNo, const char *aContextMessage);

    /// @return error for the current errno, empty if errno is 0
    static ErrorPtr errNo(const char *aContextMessage = NULL);

    /// @return error for aErrNo, empty if aErrNo is 0
    static ErrorPtr err(int aErrNo, const char *aContextMessage = NULL);
  };


  /// error consisting of a message only
  class TextError : public Error
  {
  public:
    static const char *domain() { return "TextError"; }
    virtual const char *getErrorDomain() const { return TextError::domain(); };
    TextError(const std::string &aErrorMessage) : Error(ErrorNotOK, aErrorMessage) {};

    /// printf style factory
    static ErrorPtr err(const char *aFormat, ...);
  };


} // namespace dprobe


#endif /* defined(__dprobe__error__) */
