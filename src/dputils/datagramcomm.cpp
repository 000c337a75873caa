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


#include "datagramcomm.hpp"

#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <string.h>
#include <sys/ioctl.h>

using namespace dprobe;

#define MAX_DATAGRAM_SIZE 65536


DatagramComm::DatagramComm(MainLoop &aMainLoop) :
  mainLoop(aMainLoop),
  dataFd(-1)
{
}


DatagramComm::~DatagramComm()
{
  close();
}


void DatagramComm::setConnectionParams(const char *aHostNameOrAddress, const char *aServiceOrPort)
{
  close();
  hostNameOrAddress = nonNullCStr(aHostNameOrAddress);
  serviceOrPortNo = nonNullCStr(aServiceOrPort);
}


ErrorPtr DatagramComm::open()
{
  if (dataFd>=0) return ErrorPtr(); // already open
  if (hostNameOrAddress.empty() || serviceOrPortNo.empty()) {
    return ErrorPtr(new SocketCommError(SocketCommErrorNoParams, "Missing connection parameters"));
  }
  struct addrinfo hint;
  memset(&hint, 0, sizeof(addrinfo));
  hint.ai_family = AF_UNSPEC;
  hint.ai_socktype = SOCK_DGRAM;
  struct addrinfo *addressInfoList = NULL;
  int res = getaddrinfo(hostNameOrAddress.c_str(), serviceOrPortNo.c_str(), &hint, &addressInfoList);
  if (res!=0) {
    ErrorPtr err = ErrorPtr(new SocketCommError(SocketCommErrorCannotResolve, string_format("getaddrinfo error %d: %s", res, gai_strerror(res))));
    DBGLOG(LOG_DEBUG, "DatagramComm: getaddrinfo failed: %s", err->description().c_str());
    return err;
  }
  // try addresses until one works
  ErrorPtr err;
  for (struct addrinfo *ai = addressInfoList; ai && dataFd<0; ai = ai->ai_next) {
    err.reset();
    int socketFD = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (socketFD==-1) {
      err = SysError::errNo("Cannot create datagram socket: ");
      continue;
    }
    // connected UDP socket only receives from the peer, send() needs no address
    if (connect(socketFD, ai->ai_addr, ai->ai_addrlen)!=0) {
      err = SysError::errNo("Cannot set datagram peer address: ");
      ::close(socketFD);
      continue;
    }
    int flags = fcntl(socketFD, F_GETFL, 0);
    if (flags<0 || fcntl(socketFD, F_SETFL, flags | O_NONBLOCK)<0) {
      err = SysError::errNo("Cannot make datagram socket non-blocking: ");
      ::close(socketFD);
      continue;
    }
    dataFd = socketFD;
    LOG(LOG_DEBUG, "DatagramComm: socket open to %s:%s, address family = %d", hostNameOrAddress.c_str(), serviceOrPortNo.c_str(), ai->ai_family);
  }
  freeaddrinfo(addressInfoList);
  if (dataFd<0) {
    if (Error::isOK(err)) err = ErrorPtr(new SocketCommError(SocketCommErrorNoConnection, "No socket could be opened"));
    LOG(LOG_WARNING, "DatagramComm: cannot open socket to %s:%s: %s", hostNameOrAddress.c_str(), serviceOrPortNo.c_str(), err->description().c_str());
    return err;
  }
  mainLoop.registerPollHandler(dataFd, POLLIN, boost::bind(&DatagramComm::dataMonitorHandler, this, _1, _2, _3));
  return ErrorPtr();
}


void DatagramComm::close()
{
  if (dataFd>=0) {
    mainLoop.unregisterPollHandler(dataFd);
    ::close(dataFd);
    dataFd = -1;
  }
}


void DatagramComm::setReceiveHandler(DatagramCommCB aReceiveHandler)
{
  receiveHandler = aReceiveHandler;
}


ErrorPtr DatagramComm::transmitString(const string &aDatagram)
{
  if (dataFd<0) {
    return ErrorPtr(new SocketCommError(SocketCommErrorClosed, "Socket not open"));
  }
  ssize_t res = send(dataFd, aDatagram.c_str(), aDatagram.size(), 0);
  if (res<0) {
    return SysError::errNo("DatagramComm::transmitString: ");
  }
  if ((size_t)res!=aDatagram.size()) {
    return ErrorPtr(new SocketCommError(SocketCommErrorFDErr, string_format("datagram truncated, %zd of %zu bytes sent", res, aDatagram.size())));
  }
  return ErrorPtr();
}


ErrorPtr DatagramComm::receiveDatagram(string &aDatagram)
{
  aDatagram.clear();
  if (dataFd<0) {
    return ErrorPtr(new SocketCommError(SocketCommErrorClosed, "Socket not open"));
  }
  std::vector<char> buf(MAX_DATAGRAM_SIZE);
  ssize_t res = recv(dataFd, &buf[0], buf.size(), 0);
  if (res<0) {
    if (errno==EWOULDBLOCK || errno==EAGAIN) return ErrorPtr(); // nothing there
    return SysError::errNo("DatagramComm::receiveDatagram: ");
  }
  aDatagram.assign(buf.begin(), buf.begin()+res);
  return ErrorPtr();
}


ErrorPtr DatagramComm::socketError(int aSocketFd)
{
  int result;
  socklen_t result_len = sizeof(result);
  if (getsockopt(aSocketFd, SOL_SOCKET, SO_ERROR, &result, &result_len)<0) {
    return SysError::errNo("Cant get socket error status: ");
  }
  return SysError::err(result, "Socket Error status: ");
}


bool DatagramComm::dataMonitorHandler(MLMicroSeconds aCycleStartTime, int aFd, int aPollFlags)
{
  FOCUSLOG("DatagramComm: poll flags = 0x%X", aPollFlags);
  if (aPollFlags & POLLIN) {
    if (receiveHandler) {
      receiveHandler(this, ErrorPtr());
    }
    else {
      // nobody interested, drain
      string dummy;
      ErrorPtr err = receiveDatagram(dummy);
      if (!Error::isOK(err)) LOG(LOG_DEBUG, "DatagramComm: dropping datagram failed: %s", err->description().c_str());
    }
  }
  else if (aPollFlags & (POLLERR|POLLHUP|POLLNVAL)) {
    // typically ICMP port unreachable reported on connected UDP sockets
    ErrorPtr err = socketError(aFd);
    if (Error::isOK(err)) err = ErrorPtr(new SocketCommError(SocketCommErrorFDErr, string_format("poll flags 0x%X", aPollFlags)));
    LOG(LOG_INFO, "DatagramComm: socket error: %s", err->description().c_str());
    if (receiveHandler) receiveHandler(this, err);
  }
  return true;
}
