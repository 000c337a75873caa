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


#ifndef __dprobe__jsonrpcchannel__
#define __dprobe__jsonrpcchannel__

#include "dp_common.hpp"

#include "commandchannel.hpp"
#include "datagramcomm.hpp"
#include "jsonobject.hpp"

using namespace std;

namespace dprobe {

  #define JSONRPC_DEFAULT_PORT 54321
  #define JSONRPC_MAX_OUTSTANDING 256 ///< unanswered commands remembered, oldest are forgotten beyond that

  class JsonRpcChannel;
  typedef boost::intrusive_ptr<JsonRpcChannel> JsonRpcChannelPtr;

  /// command channel sending plaintext JSON-RPC style requests as UDP datagrams
  class JsonRpcChannel : public CommandChannel
  {
    typedef CommandChannel inherited;

    DatagramCommPtr comm;
    int nextRequestId;
    typedef std::map<int, string> SentCommandsMap;
    SentCommandsMap sentCommands; ///< request id -> command string, until answered
    size_t maxOutstanding;

  public:

    JsonRpcChannel(MainLoop &aMainLoop);
    virtual ~JsonRpcChannel();

    /// set the device address
    /// @param aHost host name or IP address
    /// @param aPort UDP port
    void setDeviceAddress(const string &aHost, uint16_t aPort = JSONRPC_DEFAULT_PORT);

    /// open the socket
    ErrorPtr open();

    /// close the socket
    void close();

    virtual int sendCommand(const string &aCommand, ErrorPtr &aError);

    /// @param aMaxOutstanding number of unanswered commands to remember. Replies to forgotten ones are still
    ///   delivered, but without their command string
    void setMaxOutstanding(size_t aMaxOutstanding);

    /// @return number of commands sent but not yet answered
    size_t numOutstanding() { return sentCommands.size(); };

    /// build the request for a command string
    /// @param aRequestId the request id
    /// @param aCommand command of the form method[params] (params default to [])
    /// @param aRequest will receive the request object
    /// @return error if the command has no method name
    static ErrorPtr buildRequest(int aRequestId, const string &aCommand, JsonObjectPtr &aRequest);

    /// parse a reply
    /// @param aReplyText the datagram received
    /// @param aResponse requestId, isError, rawResult and responseText will be set
    /// @return error if the reply is not a JSON object with an id
    static ErrorPtr parseReply(const string &aReplyText, ProbeResponse &aResponse);

  private:

    void datagramHandler(DatagramComm *aCommP, ErrorPtr aError);

  };

} // namespace dprobe

#endif /* defined(__dprobe__jsonrpcchannel__) */
