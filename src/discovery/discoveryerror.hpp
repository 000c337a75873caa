//
//  Copyright (c) 2016 the dprobe authors
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


#ifndef __dprobe__discoveryerror__
#define __dprobe__discoveryerror__

#include "dp_common.hpp"

using namespace std;

namespace dprobe {

  // Errors
  typedef enum {
    DiscoveryErrorOK,
    DiscoveryErrorInvalidModel, ///< empty or otherwise unusable model identifier
    DiscoveryErrorCatalogMiss, ///< catalog has no candidate properties for the model
    DiscoveryErrorMalformedEntry, ///< catalog file or entry cannot be used
    DiscoveryErrorStoreFailed, ///< report could not be persisted
  } DiscoveryErrors;

  class DiscoveryError : public Error
  {
  public:
    static const char *domain() { return "Discovery"; }
    virtual const char *getErrorDomain() const { return DiscoveryError::domain(); };
    DiscoveryError(DiscoveryErrors aError) : Error(ErrorCode(aError)) {};
    DiscoveryError(DiscoveryErrors aError, std::string aErrorMessage) : Error(ErrorCode(aError), aErrorMessage) {};
  };

} // namespace dprobe

#endif /* defined(__dprobe__discoveryerror__) */
