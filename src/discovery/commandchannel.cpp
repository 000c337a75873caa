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


#include "commandchannel.hpp"

using namespace dprobe;


CommandKind CommandChannel::kindOfCommand(const string &aCommand)
{
  string method = trimWhiteSpace(aCommand.substr(0, aCommand.find('[')));
  if (method==IDENTITY_COMMAND) return CommandKindInfo;
  if (method==GETPROP_COMMAND) return CommandKindGetProp;
  return CommandKindOther;
}


void CommandChannel::deliverResponse(const ProbeResponse &aResponse)
{
  if (responseHandler) {
    responseHandler(aResponse);
  }
  else {
    DBGLOG(LOG_DEBUG, "CommandChannel: no handler for response to request %d", aResponse.requestId);
  }
}
