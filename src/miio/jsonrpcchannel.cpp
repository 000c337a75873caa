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


#include "jsonrpcchannel.hpp"

using namespace dprobe;


JsonRpcChannel::JsonRpcChannel(MainLoop &aMainLoop) :
  comm(new DatagramComm(aMainLoop)),
  nextRequestId(1),
  maxOutstanding(JSONRPC_MAX_OUTSTANDING)
{
  comm->setReceiveHandler(boost::bind(&JsonRpcChannel::datagramHandler, this, _1, _2));
}


JsonRpcChannel::~JsonRpcChannel()
{
  close();
  comm->setReceiveHandler(DatagramCommCB());
}


void JsonRpcChannel::setDeviceAddress(const string &aHost, uint16_t aPort)
{
  comm->setConnectionParams(aHost.c_str(), string_format("%hu", aPort).c_str());
}


ErrorPtr JsonRpcChannel::open()
{
  return comm->open();
}


void JsonRpcChannel::close()
{
  comm->close();
  sentCommands.clear();
}


ErrorPtr JsonRpcChannel::buildRequest(int aRequestId, const string &aCommand, JsonObjectPtr &aRequest)
{
  string method;
  string params;
  size_t n = aCommand.find('[');
  if (n==string::npos) {
    method = trimWhiteSpace(aCommand);
    params = "[]";
  }
  else {
    method = trimWhiteSpace(aCommand.substr(0, n));
    params = trimWhiteSpace(aCommand.substr(n));
  }
  if (method.empty()) {
    return TextError::err("command '%s' has no method", aCommand.c_str());
  }
  JsonObjectPtr paramsObj = JsonObject::objFromText(params.c_str());
  if (!paramsObj || !(paramsObj->isType(json_type_array) || paramsObj->isType(json_type_object))) {
    // not JSON, like [power,mode]: send as array of strings
    paramsObj = JsonObject::newArray();
    string inner = params;
    if (!inner.empty() && inner[0]=='[') inner.erase(0, 1);
    if (!inner.empty() && inner[inner.size()-1]==']') inner.erase(inner.size()-1);
    size_t start = 0;
    while (start<=inner.size()) {
      size_t e = inner.find(',', start);
      if (e==string::npos) e = inner.size();
      string item = trimWhiteSpace(inner.substr(start, e-start));
      if (item.size()>=2 && item[0]=='"' && item[item.size()-1]=='"') item = item.substr(1, item.size()-2);
      if (!item.empty()) paramsObj->arrayAppend(JsonObject::newString(item));
      start = e+1;
    }
  }
  aRequest = JsonObject::newObj();
  aRequest->add("id", JsonObject::newInt32(aRequestId));
  aRequest->add("method", JsonObject::newString(method));
  aRequest->add("params", paramsObj);
  return ErrorPtr();
}


ErrorPtr JsonRpcChannel::parseReply(const string &aReplyText, ProbeResponse &aResponse)
{
  ErrorPtr err;
  JsonObjectPtr reply = JsonObject::objFromText(aReplyText.c_str(), (ssize_t)aReplyText.size(), &err);
  if (!Error::isOK(err)) return err;
  JsonObjectPtr id;
  if (!reply || !reply->isType(json_type_object) || !reply->get("id", id) || !id || !id->isType(json_type_int)) {
    return TextError::err("reply has no numeric id");
  }
  aResponse.requestId = id->int32Value();
  aResponse.responseText = reply->json_str();
  JsonObjectPtr payload;
  bool hasPayload;
  aResponse.isError = reply->get("error", payload);
  if (aResponse.isError)
    hasPayload = true;
  else
    hasPayload = reply->get("result", payload);
  // absent payload stays empty, a JSON null payload is "null"
  aResponse.rawResult = hasPayload ? JsonObject::text(payload) : "";
  return ErrorPtr();
}


int JsonRpcChannel::sendCommand(const string &aCommand, ErrorPtr &aError)
{
  JsonObjectPtr request;
  aError = buildRequest(nextRequestId, aCommand, request);
  if (!Error::isOK(aError)) return -1;
  aError = comm->open(); // NOP if already open
  if (!Error::isOK(aError)) return -1;
  string datagram = request->json_str();
  aError = comm->transmitString(datagram);
  if (!Error::isOK(aError)) {
    LOG(LOG_INFO, "JsonRpcChannel: cannot send '%s': %s", aCommand.c_str(), aError->description().c_str());
    return -1;
  }
  int id = nextRequestId++;
  sentCommands[id] = aCommand;
  // ids increase, so the oldest unanswered commands come first
  while (sentCommands.size()>maxOutstanding) {
    DBGLOG(LOG_DEBUG, "JsonRpcChannel: forgetting unanswered #%d", sentCommands.begin()->first);
    sentCommands.erase(sentCommands.begin());
  }
  DBGLOG(LOG_DEBUG, "JsonRpcChannel: sent #%d: %s", id, datagram.c_str());
  return id;
}


void JsonRpcChannel::setMaxOutstanding(size_t aMaxOutstanding)
{
  maxOutstanding = aMaxOutstanding>0 ? aMaxOutstanding : 1;
  while (sentCommands.size()>maxOutstanding) sentCommands.erase(sentCommands.begin());
}


void JsonRpcChannel::datagramHandler(DatagramComm *aCommP, ErrorPtr aError)
{
  if (!Error::isOK(aError)) {
    LOG(LOG_INFO, "JsonRpcChannel: socket error: %s", aError->description().c_str());
    return;
  }
  string datagram;
  ErrorPtr err = aCommP->receiveDatagram(datagram);
  if (!Error::isOK(err)) {
    LOG(LOG_WARNING, "JsonRpcChannel: receive error: %s", err->description().c_str());
    return;
  }
  if (datagram.empty()) return;
  ProbeResponse response;
  err = parseReply(datagram, response);
  if (!Error::isOK(err)) {
    LOG(LOG_INFO, "JsonRpcChannel: ignoring invalid reply '%s': %s", datagram.c_str(), err->description().c_str());
    return;
  }
  SentCommandsMap::iterator pos = sentCommands.find(response.requestId);
  if (pos!=sentCommands.end()) {
    response.commandString = pos->second;
    sentCommands.erase(pos);
  }
  response.kind = kindOfCommand(response.commandString);
  DBGLOG(LOG_DEBUG, "JsonRpcChannel: reply #%d: %s", response.requestId, response.responseText.c_str());
  deliverResponse(response);
}
