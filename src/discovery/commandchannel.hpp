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


#ifndef __dprobe__commandchannel__
#define __dprobe__commandchannel__

#include "dp_common.hpp"

using namespace std;

namespace dprobe {

  /// the identity probe command
  #define IDENTITY_COMMAND "miIO.info"
  /// the property read command
  #define GETPROP_COMMAND "get_prop"

  typedef enum {
    CommandKindInfo, ///< identity probe
    CommandKindGetProp, ///< property read
    CommandKindOther, ///< anything else
  } CommandKind;


  /// a response delivered by a command channel
  typedef struct {
    int requestId; ///< identifier of the request this response answers
    CommandKind kind; ///< kind of the command that was sent
    bool isError; ///< device reported an error
    string rawResult; ///< result (or error) payload as compact JSON text, empty if none
    string commandString; ///< the command as it was sent
    string responseText; ///< the full response as received
  } ProbeResponse;

  /// response handler
  typedef boost::function<void (const ProbeResponse &aResponse)> ProbeResponseCB;


  class CommandChannel;
  typedef boost::intrusive_ptr<CommandChannel> CommandChannelPtr;

  /// sends commands to a device and delivers the responses asynchronously
  /// @note implementations must never call the response handler from within sendCommand()
  class CommandChannel : public DpObj
  {
    ProbeResponseCB responseHandler;

  public:

    virtual ~CommandChannel() {};

    /// send a command
    /// @param aCommand command string of the form method[params]
    /// @param aError set when the command could not be sent
    /// @return the request identifier assigned to the command (monotonically increasing), -1 on failure
    virtual int sendCommand(const string &aCommand, ErrorPtr &aError) = 0;

    /// set the handler to be called for every response, regardless of who sent the command
    void setResponseHandler(ProbeResponseCB aResponseHandler) { responseHandler = aResponseHandler; };

    /// @param aCommand command string
    /// @return kind of the command, derived from its method name
    static CommandKind kindOfCommand(const string &aCommand);

  protected:

    /// to be called by implementations for every response received
    void deliverResponse(const ProbeResponse &aResponse);

  };

} // namespace dprobe

#endif /* defined(__dprobe__commandchannel__) */
