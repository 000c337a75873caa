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


#ifndef __dprobe__responsecorrelator__
#define __dprobe__responsecorrelator__

#include "dp_common.hpp"

#include "probesession.hpp"
#include "reportassembler.hpp"

using namespace std;

namespace dprobe {

  /// matches incoming responses against the active batch of a probe session
  /// @note not thread safe, owner must serialize access
  class ResponseCorrelator
  {
    ProbeSession &session;
    ReportAssembler &assembler;

  public:

    ResponseCorrelator(ProbeSession &aSession, ReportAssembler &aAssembler);

    /// process a response, whoever sent the command
    /// @param aResponse the response
    /// @return true if this response completed the active batch (report has been finalized)
    bool onResponse(const ProbeResponse &aResponse);

    /// finalize the active batch with what has been collected so far, report exactly once
    /// @note also produces an (empty) report for a batch that never became active
    void finalizeBatch();

    /// @param aIsError device reported an error
    /// @param aRawResult compact JSON text of the result
    /// @return true if the result shows the property is supported
    static bool isSupportedResult(bool aIsError, const string &aRawResult);

    /// @param aRawResult compact JSON text of an identity probe result
    /// @return the identity with authentication token and network identifiers removed.
    ///   Results that are not JSON objects are returned unchanged
    static string sanitizedIdentity(const string &aRawResult);

  };

} // namespace dprobe

#endif /* defined(__dprobe__responsecorrelator__) */
