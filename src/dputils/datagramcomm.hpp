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


#ifndef __dprobe__datagramcomm__
#define __dprobe__datagramcomm__

#include "dp_common.hpp"

#include <sys/socket.h>
#include <netdb.h>

using namespace std;

namespace dprobe {

  // Errors
  typedef enum {
    SocketCommErrorOK,
    SocketCommErrorNoParams, ///< parameters missing to even try opening the socket
    SocketCommErrorCannotResolve, ///< host or service name cannot be resolved
    SocketCommErrorNoConnection, ///< no socket could be opened (none of the addresses worked)
    SocketCommErrorClosed, ///< socket is not open
    SocketCommErrorFDErr, ///< error on file descriptor
  } SocketCommErrors;

  class SocketCommError : public Error
  {
  public:
    static const char *domain() { return "SocketComm"; }
    virtual const char *getErrorDomain() const { return SocketCommError::domain(); };
    SocketCommError(SocketCommErrors aError) : Error(ErrorCode(aError)) {};
    SocketCommError(SocketCommErrors aError, std::string aErrorMessage) : Error(ErrorCode(aError), aErrorMessage) {};
  };


  class DatagramComm;

  typedef boost::intrusive_ptr<DatagramComm> DatagramCommPtr;

  /// callback for signalling a received datagram or a socket error
  typedef boost::function<void (DatagramComm *aCommP, ErrorPtr aError)> DatagramCommCB;


  /// connected UDP socket to a single peer, polled from the mainloop
  class DatagramComm : public DpObj
  {
    MainLoop &mainLoop;

    string hostNameOrAddress;
    string serviceOrPortNo;
    int dataFd;
    DatagramCommCB receiveHandler;

  public:

    DatagramComm(MainLoop &aMainLoop);
    virtual ~DatagramComm();

    /// Set peer address
    /// @param aHostNameOrAddress host name/address (1.2.3.4 or xxx.yy)
    /// @param aServiceOrPort port number or service name
    void setConnectionParams(const char *aHostNameOrAddress, const char *aServiceOrPort);

    /// resolve the peer and open the socket
    /// @return error if no socket could be opened. Opening an already open socket is a NOP
    ErrorPtr open();

    /// close the socket, if open
    void close();

    /// set handler to be called from the mainloop when a datagram is ready to be received
    /// @param aReceiveHandler handler, should call receiveDatagram() to fetch the data
    void setReceiveHandler(DatagramCommCB aReceiveHandler);

    /// send one datagram
    /// @param aDatagram the data to send
    /// @return error, if any
    ErrorPtr transmitString(const string &aDatagram);

    /// receive one pending datagram
    /// @param aDatagram will receive the datagram's data
    /// @return error, if any. A SocketCommErrorClosed error when the socket is not open
    ErrorPtr receiveDatagram(string &aDatagram);

  private:

    bool dataMonitorHandler(MLMicroSeconds aCycleStartTime, int aFd, int aPollFlags);
    ErrorPtr socketError(int aSocketFd);

  };

} // namespace dprobe


#endif /* defined(__dprobe__datagramcomm__) */
